// C++ Standard Library
#include <algorithm>
#include <initializer_list>
#include <string_view>
#include <utility>

// TOML++
#include <toml++/toml.hpp>

// Project
#include <ts/query/config.hpp>

namespace env
{

    namespace
    {
        // Walk a dotted key path. nullptr when any segment is missing.
        const toml::node* find_node(const toml::table& root, std::initializer_list<std::string_view> keys)
        {
            const toml::node* node = &root;
            for (auto key : keys)
            {
                const auto* table_ptr = node->as_table();
                if (!table_ptr)
                    return nullptr;
                node = table_ptr->get(key);
                if (!node)
                    return nullptr;
            }
            return node;
        }

        std::string dotted(std::initializer_list<std::string_view> keys)
        {
            std::string out;
            for (auto key : keys)
            {
                if (!out.empty())
                    out.push_back('.');
                out.append(key);
            }
            return out;
        }

        // Return a non-empty string at dotted key path or throw EnvError.
        std::string fetch_string(const toml::table& root,
                                 std::initializer_list<std::string_view> keys,
                                 const std::string& path_str)
        {
            const auto* node = find_node(root, keys);
            if (!node)
                throw EnvError("Missing key '" + dotted(keys) + "' in " + path_str);

            if (auto opt = node->value<std::string>(); opt && !opt->empty())
                return *opt;

            throw EnvError("Invalid value for '" + dotted(keys) + "' in " + path_str);
        }

        // Return optional string if present and non-empty.
        std::optional<std::string> fetch_optional_string(const toml::table& root,
                                                         std::initializer_list<std::string_view> keys)
        {
            if (const auto* node = find_node(root, keys))
            {
                if (auto opt = node->value<std::string>(); opt && !opt->empty())
                    return *opt;
            }
            return std::nullopt;
        }

        bool fetch_bool(const toml::table& root,
                        std::initializer_list<std::string_view> keys,
                        const std::string& path_str)
        {
            const auto* node = find_node(root, keys);
            if (!node)
                throw EnvError("Missing key '" + dotted(keys) + "' in " + path_str);
            if (auto opt = node->value<bool>())
                return *opt;
            throw EnvError("Expected boolean for '" + dotted(keys) + "' in " + path_str);
        }

        std::optional<std::int64_t> fetch_optional_int(const toml::table& root,
                                                        std::initializer_list<std::string_view> keys,
                                                        const std::string& path_str)
        {
            const auto* node = find_node(root, keys);
            if (!node)
                return std::nullopt;
            if (auto opt = node->value<std::int64_t>(); opt && *opt >= 0)
                return *opt;
            throw EnvError("Expected non-negative integer for '" + dotted(keys) + "' in " + path_str);
        }

        // monitor_id accepts a single integer or an array of integers.
        std::vector<std::int64_t> fetch_ids(const toml::table& root, const std::string& path_str)
        {
            const auto* node = find_node(root, { "monitor_id" });
            if (!node)
                throw EnvError("Missing key 'monitor_id' in " + path_str);

            std::vector<std::int64_t> ids;
            if (auto single = node->value<std::int64_t>())
            {
                ids.push_back(*single);
            }
            else if (const auto* arr = node->as_array())
            {
                ids.reserve(arr->size());
                for (const auto& element : *arr)
                {
                    auto id = element.value<std::int64_t>();
                    if (!id)
                        throw EnvError("'monitor_id' must only contain integers in " + path_str);
                    ids.push_back(*id);
                }
            }
            else
            {
                throw EnvError("'monitor_id' must be an integer or an array of integers in " + path_str);
            }

            if (ids.empty())
                throw EnvError("'monitor_id' must not be empty in " + path_str);
            return ids;
        }

        std::vector<std::chrono::minutes> fetch_backoff(const toml::table& root, const std::string& path_str)
        {
            const auto* node = find_node(root, { "monitor", "backoff" });
            if (!node)
                return MonitorConfig{}.backoff;

            const auto* arr = node->as_array();
            if (!arr || arr->empty())
                throw EnvError("'monitor.backoff' must be a non-empty array of minutes in " + path_str);

            std::vector<std::chrono::minutes> tiers;
            tiers.reserve(arr->size());
            for (const auto& element : *arr)
            {
                auto minutes = element.value<std::int64_t>();
                if (!minutes || *minutes <= 0)
                    throw EnvError("'monitor.backoff' entries must be positive integers in " + path_str);
                tiers.emplace_back(*minutes);
            }
            return tiers;
        }

        EndpointConfig fetch_endpoint(const toml::table& root,
                                      std::string_view section,
                                      EndpointConfig defaults,
                                      const std::string& path_str)
        {
            if (auto host = fetch_optional_string(root, { section, "host" }))
                defaults.host = std::move(*host);
            if (auto port = fetch_optional_int(root, { section, "port" }, path_str))
            {
                if (*port == 0 || *port > 65535)
                    throw EnvError("Port out of range for '" + std::string{ section } + ".port' in " + path_str);
                defaults.port = std::to_string(*port);
            }
            if (auto password = fetch_optional_string(root, { section, "password" }))
                defaults.password = std::move(*password);
            return defaults;
        }
    } // namespace

    // Read, validate and convert the TOML file at path.
    Config Config::parse_config(const std::filesystem::path& path)
    {
        const auto path_str = path.string();
        toml::table tbl;

        try
        {
            tbl = toml::parse_file(path_str);
        }
        catch (const toml::parse_error& e)
        {
            throw EnvError("TOML parse error in '" + path_str + "': " + std::string{ e.what() });
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw EnvError("Cannot read config file '" + path_str + "': " + std::string{ e.what() });
        }

        Config cfg;
        cfg.path_ = std::filesystem::absolute(path);
        cfg.api_key_ = fetch_string(tbl, { "api_key" }, path_str);
        cfg.monitor_ids_ = fetch_ids(tbl, path_str);
        if (const auto* node = find_node(tbl, { "need_disconnect" }))
        {
            auto flag = node->value<bool>();
            if (!flag)
                throw EnvError("Expected boolean for 'need_disconnect' in " + path_str);
            cfg.need_disconnect_ = *flag;
        }

        cfg.server_.address = fetch_string(tbl, { "server", "address" }, path_str);
        cfg.server_.channel = fetch_string(tbl, { "server", "channel" }, path_str);
        cfg.server_.password = fetch_optional_string(tbl, { "server", "password" });
        if (auto timeout = fetch_optional_int(tbl, { "server", "timeout" }, path_str))
            cfg.server_.timeout = std::chrono::seconds{ std::max<std::int64_t>(*timeout, 3) };
        if (auto wait = fetch_optional_int(tbl, { "server", "switch_wait" }, path_str))
            cfg.server_.switch_wait = std::chrono::milliseconds{ std::max<std::int64_t>(*wait, 500) };

        cfg.monitor_.web_enabled = fetch_bool(tbl, { "monitor", "web" }, path_str);
        cfg.monitor_.username = fetch_string(tbl, { "monitor", "username" }, path_str);
        if (cfg.monitor_.web_enabled)
            cfg.monitor_.backend = fetch_string(tbl, { "monitor", "backend" }, path_str);
        else
            cfg.monitor_.backend = fetch_optional_string(tbl, { "monitor", "backend" }).value_or(std::string{});
        if (auto interval = fetch_optional_int(tbl, { "monitor", "interval" }, path_str))
            cfg.monitor_.interval = std::chrono::minutes{ *interval == 0 ? 1 : *interval };
        if (auto tick = fetch_optional_int(tbl, { "monitor", "tick" }, path_str))
            cfg.monitor_.tick = std::chrono::milliseconds{ *tick };
        cfg.monitor_.backoff = fetch_backoff(tbl, path_str);

        cfg.query_ = fetch_endpoint(tbl, "query", EndpointConfig{ .host = "localhost", .port = "25639", .password = {} }, path_str);
        cfg.player_ = fetch_endpoint(tbl, "player", EndpointConfig{ .host = "localhost", .port = "4212", .password = "1" }, path_str);

        return cfg;
    }

    Config Config::load_file(const std::filesystem::path& path)
    {
        if (path.string().empty())
            throw EnvError("Config file path must not be empty");
        return parse_config(path);
    }

    Config Config::load()
    {
        const auto default_path = std::filesystem::current_path() / "config.toml";
        if (!std::filesystem::exists(default_path))
            throw EnvError("Config file not found at '" + default_path.string() + "'");
        return parse_config(default_path);
    }

    EnvError::EnvError(const std::string& msg) noexcept :
        std::runtime_error{ msg }
    {
    }

} // namespace env
