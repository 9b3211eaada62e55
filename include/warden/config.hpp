#pragma once

#include "types.hpp"
#include "candidate_resolver.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace warden
{
    inline constexpr const char *kDefaultLicenseServer = "https://license.daywinlabs.com";

    struct ServerConfig
    {
        std::string url{kDefaultLicenseServer};
        bool verify_tls{true};
        bool allow_insecure{false};
        bool disable_https_fallback{false};
        bool disable_http_fallback{false};
    };

    /** Upper bound for any configured hour count (ten years) */
    constexpr int kMaxConfiguredHours = 24 * 365 * 10;

    struct CacheConfig
    {
        int max_hours{72};
        int offline_grace_hours{12}; // reserved
        std::string directory;       // empty: per-user data directory
    };

    struct ClientConfig
    {
        ServerConfig server{};
        CacheConfig cache{};
        std::optional<std::string> app_version;
        std::string log_level{"info"};

        ResolverOptions resolver_options() const;

        /** license.json inside the configured or default data directory */
        std::filesystem::path cache_file() const;
    };

    /**
     * ConfigLoader builds a ClientConfig from defaults, an optional TOML file
     * and environment variables (environment wins). A .env file can seed the
     * environment beforehand without overriding variables already set.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<ClientConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<ClientConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment overrides only */
        static Result<ClientConfig> from_environment();

        /** Serialize config to JSON for inspection */
        static nlohmann::json to_json(const ClientConfig &cfg);

        /**
         * Read KEY=VALUE lines into the environment, skipping variables that are
         * already set. Returns the number of variables set; a missing file is 0.
         */
        static Result<std::size_t> load_dotenv(const std::filesystem::path &path);

    private:
        static Result<void> apply_env_overrides(ClientConfig &cfg);
    };

} // namespace warden
