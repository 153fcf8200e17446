#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <functional>
#include <string>
#include <regex>
#include <vector>

namespace mazegen {
namespace http {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// HTTP request and response types
using Request = beast::http::request<beast::http::string_body>;
using Response = beast::http::response<beast::http::string_body>;

// Route handler function type. Matches are taken against the path only;
// the query string stays available through req.target().
using Handler = std::function<void(const Request&, Response&, const std::smatch&)>;

struct Route {
    beast::http::verb method;
    std::regex pattern;
    Handler handler;
};

// Path component of a request target, without "?query".
std::string target_path(const std::string& target);

class Server {
public:
    Server(net::io_context& ioc, unsigned short port);

    void get(const std::string& pattern, Handler handler);
    void post(const std::string& pattern, Handler handler);

    // Start accepting connections; the caller runs the io_context.
    void run();
    void stop();

    unsigned short port() const;

    // Routes a request exactly as a connection would.
    void handle_request(const Request& req, Response& res) const;

private:
    class Session;

    void do_accept();

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::vector<Route> routes_;
    bool running_;
};

} // namespace http
} // namespace mazegen
