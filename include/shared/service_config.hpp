#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

namespace mazegen::config
{

// YAML config lookups using yaml-cpp. Keys use dot notation
// ("maze.width"); every getter takes the value to use when the key is
// missing or does not convert.
class ServiceConfig
    {
    public:
        static ServiceConfig& instance()
            {
            static ServiceConfig config;
            return config;
            }

        // Load config from file. The default path also tries ../config/mazegen.yaml
        bool load(const std::string& config_file = "config/mazegen.yaml")
            {
            try
                {
                try
                    {
                    root_.reset(YAML::LoadFile(config_file));
                    }
                    catch (const YAML::BadFile&)
                        {
                        if (config_file != "config/mazegen.yaml") throw;
                        root_.reset(YAML::LoadFile("../config/mazegen.yaml"));
                        }
                    loaded_ = true;
                }
                catch (const YAML::Exception&)
                    {
                    root_.reset();
                    loaded_ = false;
                    }
            return loaded_;
            }

        bool load_string(const std::string& yaml)
            {
            try
                {
                root_.reset(YAML::Load(yaml));
                loaded_ = true;
                }
                catch (const YAML::Exception&)
                    {
                    root_.reset();
                    loaded_ = false;
                    }
            return loaded_;
            }

        bool loaded() const { return loaded_; }

        std::string get_string(const std::string& key, const std::string& default_val = "") const
            {
            return get<std::string>(key, default_val);
            }

        int get_int(const std::string& key, int default_val = 0) const
            {
            return get<int>(key, default_val);
            }

        unsigned long long get_ulonglong(const std::string& key, unsigned long long default_val = 0) const
            {
            return get<unsigned long long>(key, default_val);
            }

        bool get_bool(const std::string& key, bool default_val = false) const
            {
            return get<bool>(key, default_val);
            }

        double get_double(const std::string& key, double default_val = 0.0) const
            {
            return get<double>(key, default_val);
            }

    private:
        ServiceConfig() = default;

        template <typename T>
        T get(const std::string& key, const T& default_val) const
            {
            if (!loaded_) return default_val;

            YAML::Node node = navigate_to_key(key);
            if (node && node.IsScalar())
                {
                // as<T>(fallback) yields the fallback on a failed conversion
                return node.as<T>(default_val);
                }
            return default_val;
            }

        // Navigate to a key using dot notation (e.g., "section.subsection.key")
        YAML::Node navigate_to_key(const std::string& key) const
            {
            // reset() rebinds; operator= would write into root_
            YAML::Node node;
            node.reset(root_);

            size_t start = 0;
            size_t end = key.find('.');

            while (end != std::string::npos)
                {
                const YAML::Node& current = node;
                if (!current.IsMap()) return YAML::Node();
                YAML::Node child = current[key.substr(start, end - start)];
                if (!child) return YAML::Node();
                node.reset(child);
                start = end + 1;
                end = key.find('.', start);
                }

            const YAML::Node& current = node;
            if (!current.IsMap()) return YAML::Node();
            return current[key.substr(start)];
            }

        YAML::Node root_;
        bool loaded_ = false;
    };

} // namespace mazegen::config
