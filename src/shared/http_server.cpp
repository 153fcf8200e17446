#include "shared/http_server.hpp"
#include <memory>

namespace mazegen
{
namespace http
{

std::string target_path(const std::string& target)
    {
    auto pos = target.find('?');
    return pos == std::string::npos ? target : target.substr(0, pos);
    }

// One request per connection, then shutdown.
class Server::Session : public std::enable_shared_from_this<Server::Session>
    {
    public:
        Session(tcp::socket socket, const Server* server)
            : socket_(std::move(socket))
            , server_(server)
            {}

        void run()
            {
            do_read();
            }

    private:
        void do_read()
            {
            auto self = shared_from_this();
            beast::http::async_read(socket_, buffer_, req_,
                [self](beast::error_code ec, std::size_t)
                {
                if (!ec)
                    {
                    self->handle_request();
                    }
                });
            }

        void handle_request()
            {
            res_ = Response{ beast::http::status::not_found, req_.version() };
            res_.set(beast::http::field::server, "mazegen");
            res_.set(beast::http::field::content_type, "application/json");
            res_.keep_alive(false);

            server_->handle_request(req_, res_);

            do_write();
            }

        void do_write()
            {
            auto self = shared_from_this();
            beast::http::async_write(socket_, res_,
                [self](beast::error_code ec, std::size_t)
                {
                self->socket_.shutdown(tcp::socket::shutdown_send, ec);
                });
            }

        tcp::socket socket_;
        beast::flat_buffer buffer_;
        Request req_;
        Response res_;
        const Server* server_;
    };

Server::Server(net::io_context& ioc, unsigned short port)
    : ioc_(ioc)
    , acceptor_(ioc, tcp::endpoint(tcp::v4(), port))
    , running_(false)
    {}

void Server::get(const std::string& pattern, Handler handler)
    {
    routes_.push_back({ beast::http::verb::get, std::regex(pattern), std::move(handler) });
    }

void Server::post(const std::string& pattern, Handler handler)
    {
    routes_.push_back({ beast::http::verb::post, std::regex(pattern), std::move(handler) });
    }

void Server::run()
    {
    running_ = true;
    do_accept();
    }

void Server::stop()
    {
    running_ = false;
    beast::error_code ec;
    acceptor_.close(ec);
    }

unsigned short Server::port() const
    {
    return acceptor_.local_endpoint().port();
    }

void Server::do_accept()
    {
    if (!running_) return;

    acceptor_.async_accept(net::make_strand(ioc_),
        [this](beast::error_code ec, tcp::socket socket)
        {
        if (!ec)
            {
            std::make_shared<Session>(std::move(socket), this)->run();
            }
        do_accept();
        });
    }

void Server::handle_request(const Request& req, Response& res) const
    {
    std::string path = target_path(std::string(req.target()));

    for (const auto& route : routes_)
        {
        if (route.method == req.method())
            {
            std::smatch matches;
            if (std::regex_match(path, matches, route.pattern))
                {
                route.handler(req, res, matches);
                return;
                }
            }
        }

    res.result(beast::http::status::not_found);
    res.body() = R"({"error":"not found"})";
    res.prepare_payload();
    }

} // namespace http
} // namespace mazegen
