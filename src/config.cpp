#include "warden/config.hpp"
#include "warden/cache_codec.hpp"
#include <toml++/toml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace warden
{
    namespace
    {
        std::string lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        std::string trim(const std::string &value)
        {
            auto start = value.find_first_not_of(" \t\r\n");
            if (start == std::string::npos)
                return {};
            auto end = value.find_last_not_of(" \t\r\n");
            return value.substr(start, end - start + 1);
        }

        bool env_truthy(const char *value)
        {
            auto v = lower(value);
            return v == "1" || v == "true" || v == "yes";
        }

        bool env_not_falsy(const char *value)
        {
            auto v = lower(value);
            return v != "0" && v != "false" && v != "no";
        }

        int clamp_hours(long long hours)
        {
            return static_cast<int>(std::clamp<long long>(hours, 1, kMaxConfiguredHours));
        }

        Result<int> parse_hours(const std::string &name, const std::string &value)
        {
            try
            {
                std::size_t consumed = 0;
                long long hours = std::stoll(value, &consumed);
                if (consumed != trim(value).size())
                    return std::unexpected(WardenError::config(name + " must be an integer: " + value));
                return clamp_hours(hours);
            }
            catch (const std::exception &)
            {
                return std::unexpected(WardenError::config(name + " must be an integer: " + value));
            }
        }

        void parse_toml(const toml::table &tbl, ClientConfig &cfg)
        {
            if (auto url = tbl["server"]["url"].value<std::string>())
                cfg.server.url = *url;
            if (auto verify = tbl["server"]["verify_tls"].value<bool>())
                cfg.server.verify_tls = *verify;
            if (auto insecure = tbl["server"]["allow_insecure"].value<bool>())
                cfg.server.allow_insecure = *insecure;
            if (auto no_https = tbl["server"]["disable_https_fallback"].value<bool>())
                cfg.server.disable_https_fallback = *no_https;
            if (auto no_http = tbl["server"]["disable_http_fallback"].value<bool>())
                cfg.server.disable_http_fallback = *no_http;

            if (auto hours = tbl["cache"]["max_hours"].value<int64_t>())
                cfg.cache.max_hours = clamp_hours(*hours);
            if (auto grace = tbl["cache"]["offline_grace_hours"].value<int64_t>())
                cfg.cache.offline_grace_hours = clamp_hours(*grace);
            if (auto dir = tbl["cache"]["directory"].value<std::string>())
                cfg.cache.directory = *dir;

            if (auto version = tbl["app"]["version"].value<std::string>())
                cfg.app_version = *version;
            if (auto level = tbl["log"]["level"].value<std::string>())
                cfg.log_level = *level;
        }
    } // namespace

    ResolverOptions ClientConfig::resolver_options() const
    {
        ResolverOptions options;
        options.server_url = server.url;
        options.verify_tls = server.verify_tls;
        options.allow_insecure = server.allow_insecure;
        options.disable_https_fallback = server.disable_https_fallback;
        options.disable_http_fallback = server.disable_http_fallback;
        return options;
    }

    std::filesystem::path ClientConfig::cache_file() const
    {
        std::filesystem::path dir = cache.directory.empty() ? default_data_directory()
                                                            : std::filesystem::path(cache.directory);
        return dir / "license.json";
    }

    Result<ClientConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(WardenError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<ClientConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        ClientConfig cfg{};
        try
        {
            auto tbl = toml::parse(toml_content);
            parse_toml(tbl, cfg);
        }
        catch (const std::exception &e)
        {
            return std::unexpected(WardenError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        auto env = apply_env_overrides(cfg);
        if (!env)
            return std::unexpected(env.error());
        return cfg;
    }

    Result<ClientConfig> ConfigLoader::from_environment()
    {
        ClientConfig cfg{};
        auto env = apply_env_overrides(cfg);
        if (!env)
            return std::unexpected(env.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(ClientConfig &cfg)
    {
        if (const char *server = std::getenv("LICENSE_SERVER"))
            cfg.server.url = server;
        if (const char *verify = std::getenv("LICENSE_VERIFY_SSL"))
            cfg.server.verify_tls = env_not_falsy(verify);
        if (const char *insecure = std::getenv("ALLOW_INSECURE_LICENSE_SERVER"))
            cfg.server.allow_insecure = env_truthy(insecure);
        if (const char *no_https = std::getenv("LICENSE_DISABLE_HTTPS_FALLBACK"))
            cfg.server.disable_https_fallback = env_truthy(no_https);
        if (const char *no_http = std::getenv("LICENSE_DISABLE_HTTP_FALLBACK"))
            cfg.server.disable_http_fallback = env_truthy(no_http);

        if (const char *hours = std::getenv("LICENSE_CACHE_MAX_HOURS"))
        {
            auto parsed = parse_hours("LICENSE_CACHE_MAX_HOURS", hours);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg.cache.max_hours = *parsed;
        }
        if (const char *grace = std::getenv("LICENSE_OFFLINE_GRACE_HOURS"))
        {
            auto parsed = parse_hours("LICENSE_OFFLINE_GRACE_HOURS", grace);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg.cache.offline_grace_hours = *parsed;
        }
        if (const char *dir = std::getenv("WARDEN_DATA_DIR"))
            cfg.cache.directory = dir;

        if (const char *version = std::getenv("APP_VERSION"); version && *version)
            cfg.app_version = version;
        if (const char *level = std::getenv("WARDEN_LOG_LEVEL"))
            cfg.log_level = level;

        // Trailing slashes are insignificant; an empty URL means the default
        while (!cfg.server.url.empty() && cfg.server.url.back() == '/')
            cfg.server.url.pop_back();
        if (cfg.server.url.empty())
            cfg.server.url = kDefaultLicenseServer;
        return {};
    }

    Result<std::size_t> ConfigLoader::load_dotenv(const std::filesystem::path &path)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            return std::size_t{0};

        std::ifstream file(path);
        if (!file.is_open())
            return std::unexpected(WardenError::io("Unable to open " + path.string()));

        std::size_t applied = 0;
        std::string line;
        while (std::getline(file, line))
        {
            auto trimmed = trim(line);
            if (trimmed.empty() || trimmed.front() == '#')
                continue;
            auto eq = trimmed.find('=');
            if (eq == std::string::npos)
                continue;

            std::string key = trim(trimmed.substr(0, eq));
            std::string value = trim(trimmed.substr(eq + 1));
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
                value = value.substr(1, value.size() - 2);
            if (key.empty() || std::getenv(key.c_str()))
                continue;
            if (::setenv(key.c_str(), value.c_str(), 0) == 0)
                ++applied;
        }
        return applied;
    }

    nlohmann::json ConfigLoader::to_json(const ClientConfig &cfg)
    {
        nlohmann::json j;
        j["server"] = {
            {"url", cfg.server.url},
            {"verify_tls", cfg.server.verify_tls},
            {"allow_insecure", cfg.server.allow_insecure},
            {"disable_https_fallback", cfg.server.disable_https_fallback},
            {"disable_http_fallback", cfg.server.disable_http_fallback}};
        j["cache"] = {
            {"max_hours", cfg.cache.max_hours},
            {"offline_grace_hours", cfg.cache.offline_grace_hours},
            {"directory", cfg.cache.directory}};
        j["app_version"] = cfg.app_version ? nlohmann::json(*cfg.app_version) : nlohmann::json(nullptr);
        j["log_level"] = cfg.log_level;
        return j;
    }

} // namespace warden
