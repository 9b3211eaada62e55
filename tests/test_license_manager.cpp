#include <catch2/catch_test_macros.hpp>
#include "warden/license_manager.hpp"
#include "fakes.hpp"
#include <filesystem>
#include <random>
#include <unistd.h>

using namespace warden;
using namespace warden::testing;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace
{
    const std::string kServer = "https://license.example.com";

    DeviceAttributes test_device()
    {
        DeviceAttributes attrs;
        attrs.hostname = "build-07";
        attrs.os_family = "Linux";
        attrs.architecture = "x86_64";
        attrs.os_version = "#1 SMP";
        attrs.os_release = "6.8.0";
        attrs.mac_token = "0x0242ac110002";
        attrs.system_uuid = "uuid-unknown";
        return attrs;
    }

    json server_license()
    {
        return {
            {"client_name", "Acme"},
            {"email", "billing@acme.example"},
            {"activation_count", 1},
            {"max_activations", 3},
            {"plan", "pro"}};
    }

    /** One manager wired to a fake transport, scripted prompt and temp cache */
    struct Harness
    {
        fs::path dir;
        std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
        std::shared_ptr<ScriptedPrompt> prompt = std::make_shared<ScriptedPrompt>();
        AppliedLicense applied;
        std::optional<LicenseManager> manager;

        explicit Harness(const std::string &url = kServer)
        {
            std::random_device rd;
            dir = fs::temp_directory_path() / ("warden-manager-" + std::to_string(::getpid()) + "-" +
                                               std::to_string(rd()));
            fs::create_directories(dir);

            ResolverOptions options;
            options.server_url = url;
            ManagerSettings settings;
            settings.app_version = "2.4.0";
            manager.emplace(dir / "license.json",
                            test_device(),
                            VerificationClient(CandidateResolver::create(options).value(), transport),
                            prompt,
                            applied,
                            settings);
        }

        ~Harness()
        {
            std::error_code ec;
            fs::remove_all(dir, ec);
        }

        std::string fingerprint() const { return FingerprintGenerator::digest(test_device()); }

        /** Seed the cache file with a valid activation for key */
        LicensePayload seed_cache(const std::string &key, std::chrono::hours remaining = std::chrono::hours(48))
        {
            auto now = now_utc();
            LicensePayload payload;
            payload.license_key = key;
            payload.email = "ops@acme.example";
            payload.client_name = "Acme";
            payload.activation_count = 1;
            payload.max_activations = 3;
            payload.machine_fingerprint = fingerprint();
            payload.verified_at = now - std::chrono::hours(1);
            payload.cache_expires_at = now + remaining;
            REQUIRE(manager->cache().store(payload).has_value());
            return payload;
        }

        bool cache_exists() const { return fs::exists(dir / "license.json"); }
    };
}

TEST_CASE("First activation prompts, verifies and persists", "[manager]")
{
    Harness h;
    h.prompt->push("ABCD-EFGH-IJKL-MNOP", "ops@acme.example");
    h.transport->reply_json(kServer, 200, ok_response(server_license()));

    auto result = h.manager->ensure_valid_license();
    REQUIRE(result.has_value());
    REQUIRE(result->license_key == "ABCD-EFGH-IJKL-MNOP");
    REQUIRE(result->email == std::optional<std::string>("ops@acme.example"));
    REQUIRE(result->client_name == std::optional<std::string>("Acme"));
    REQUIRE(result->machine_fingerprint == h.fingerprint());
    REQUIRE_FALSE(result->offline_mode);
    REQUIRE(result->verified_at.has_value());
    REQUIRE(result->cache_expires_at.has_value());
    auto lifetime = *result->cache_expires_at - *result->verified_at;
    REQUIRE(lifetime == std::chrono::hours(72));
    REQUIRE(result->extra["plan"] == "pro");

    REQUIRE(h.prompt->prompts() == 1);
    REQUIRE(h.transport->calls.size() == 1);
    const auto &body = h.transport->calls[0].body;
    REQUIRE(body["license_key"] == "ABCD-EFGH-IJKL-MNOP");
    REQUIRE(body["machine_fingerprint"] == h.fingerprint());
    REQUIRE(body["email"] == "ops@acme.example");
    REQUIRE(body["hostname"] == "build-07");
    REQUIRE(body["platform"] == "Linux-6.8.0-x86_64");
    REQUIRE(body["app_version"] == "2.4.0");

    auto cached = h.manager->load_cached_license();
    REQUIRE(cached.has_value());
    REQUIRE(*cached == *result);

    REQUIRE(h.applied.current().has_value());
    REQUIRE(h.applied.current()->license_key == "ABCD-EFGH-IJKL-MNOP");
}

TEST_CASE("Server email is kept when none was entered", "[manager]")
{
    Harness h;
    h.prompt->push("ABCD-EFGH-IJKL-MNOP");
    h.transport->reply_json(kServer, 200, ok_response(server_license()));

    auto result = h.manager->ensure_valid_license();
    REQUIRE(result.has_value());
    REQUIRE(result->email == std::optional<std::string>("billing@acme.example"));
    REQUIRE(h.transport->calls[0].body["email"].is_null());
}

TEST_CASE("Cached key is re-verified without prompting", "[manager]")
{
    Harness h;
    h.seed_cache("ABCD-EFGH-IJKL-MNOP");
    h.transport->reply_json(kServer, 200, ok_response(server_license()));

    auto result = h.manager->ensure_valid_license();
    REQUIRE(result.has_value());
    REQUIRE(h.prompt->prompts() == 0);
    REQUIRE(h.transport->calls[0].body["license_key"] == "ABCD-EFGH-IJKL-MNOP");
    REQUIRE(h.transport->calls[0].body["email"] == "ops@acme.example");
    REQUIRE_FALSE(result->offline_mode);
}

TEST_CASE("Unreachable server falls back to the cached activation", "[manager]")
{
    Harness h;
    auto seeded = h.seed_cache("ABCD-EFGH-IJKL-MNOP");
    auto before = fs::last_write_time(h.dir / "license.json");

    auto result = h.manager->ensure_valid_license();
    REQUIRE(result.has_value());
    REQUIRE(result->offline_mode);
    REQUIRE(result->license_key == seeded.license_key);
    REQUIRE(h.prompt->prompts() == 0);
    REQUIRE(h.prompt->errors.empty());

    // The cache is not rewritten in offline mode
    REQUIRE(fs::last_write_time(h.dir / "license.json") == before);
    auto cached = h.manager->load_cached_license();
    REQUIRE(cached.has_value());
    REQUIRE_FALSE(cached->offline_mode);
    REQUIRE(*cached == seeded);

    REQUIRE(h.applied.current().has_value());
    REQUIRE(h.applied.current()->offline_mode);
}

TEST_CASE("Garbage server responses also allow offline fallback", "[manager]")
{
    Harness h;
    h.seed_cache("ABCD-EFGH-IJKL-MNOP");
    h.transport->reply(kServer, 502, "<html>Bad Gateway</html>");

    auto result = h.manager->ensure_valid_license();
    REQUIRE(result.has_value());
    REQUIRE(result->offline_mode);
}

TEST_CASE("A rejected key never falls back to the cache", "[manager]")
{
    Harness h;
    h.seed_cache("ABCD-EFGH-IJKL-MNOP");
    h.transport->reply_json(kServer, 401, error_response("invalid_license"));

    auto result = h.manager->ensure_valid_license();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::Cancelled);
    REQUIRE(h.prompt->prompts() == 1);
    REQUIRE(h.prompt->defaults_seen[0] == std::optional<std::string>("ops@acme.example"));
    REQUIRE(h.prompt->errors.size() == 2);
    REQUIRE(h.prompt->errors[0] ==
            "The license key you entered is not recognized. Please verify and try again.");
    REQUIRE(h.prompt->errors[1] == "License verification is required to continue.");
    REQUIRE(h.manager->last_failure() == LicenseErrorKind::InvalidLicense);
    REQUIRE_FALSE(h.applied.current().has_value());
}

TEST_CASE("Offline fallback requires the attempted key to match the cache", "[manager]")
{
    Harness h;
    h.seed_cache("ABCD-EFGH-IJKL-MNOP");
    h.transport->reply_json(kServer, 401, error_response("invalid_license"));
    h.transport->fail(kServer);
    h.prompt->push("ZZZZ-YYYY-XXXX-WWWW");

    auto result = h.manager->ensure_valid_license({.quiet = true});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(h.manager->last_failure() == LicenseErrorKind::NetworkError);
}

TEST_CASE("Expired cache is neither reused nor a fallback", "[manager]")
{
    Harness h;
    h.seed_cache("ABCD-EFGH-IJKL-MNOP", std::chrono::hours(-1));

    auto result = h.manager->ensure_valid_license({.quiet = true});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::Cancelled);
    REQUIRE(h.transport->calls.empty());
    REQUIRE(h.prompt->defaults_seen[0] == std::nullopt);
}

TEST_CASE("Retry budget is exactly three attempts", "[manager]")
{
    Harness h;
    h.transport->reply_json(kServer, 401, error_response("invalid_license"));
    h.prompt->push("KEY-ONE");
    h.prompt->push("KEY-TWO");
    h.prompt->push("KEY-THREE");
    h.prompt->push("KEY-FOUR");

    auto result = h.manager->ensure_valid_license();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::LicenseError);
    REQUIRE(h.transport->calls.size() == 3);
    REQUIRE(h.prompt->prompts() == 3);
    REQUIRE(h.prompt->errors.size() == 3);
    REQUIRE(h.transport->calls[2].body["license_key"] == "KEY-THREE");
    REQUIRE(h.manager->last_failure() == LicenseErrorKind::InvalidLicense);
    REQUIRE_FALSE(h.cache_exists());
}

TEST_CASE("A later attempt can still succeed", "[manager]")
{
    Harness h;
    h.transport->reply_json(kServer, 401, error_response("email_mismatch"));
    h.transport->reply_json(kServer, 200, ok_response(server_license()));
    h.prompt->push("KEY-ONE", "wrong@acme.example");
    h.prompt->push("KEY-ONE", "ops@acme.example");

    auto result = h.manager->ensure_valid_license();
    REQUIRE(result.has_value());
    REQUIRE(result->email == std::optional<std::string>("ops@acme.example"));
    REQUIRE(h.prompt->errors ==
            std::vector<std::string>{"The license key does not match the provided email address."});
    REQUIRE(h.prompt->defaults_seen[1] == std::optional<std::string>("wrong@acme.example"));
}

TEST_CASE("Cancelled prompt fails immediately", "[manager]")
{
    Harness h;
    auto result = h.manager->ensure_valid_license();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::Cancelled);
    REQUIRE(h.transport->calls.empty());
    REQUIRE(h.prompt->errors == std::vector<std::string>{"License verification is required to continue."});
}

TEST_CASE("Quiet mode shows no errors", "[manager]")
{
    Harness h;
    h.transport->reply_json(kServer, 401, error_response("license_revoked"));
    h.prompt->push("KEY-ONE");

    auto result = h.manager->ensure_valid_license({.quiet = true});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(h.prompt->errors.empty());
}

TEST_CASE("Force prompt ignores the cache", "[manager]")
{
    Harness h;
    h.seed_cache("ABCD-EFGH-IJKL-MNOP");
    h.transport->reply_json(kServer, 200, ok_response(server_license()));
    h.prompt->push("NEW-KEY-0001");

    auto result = h.manager->ensure_valid_license({.force_prompt = true});
    REQUIRE(result.has_value());
    REQUIRE(result->license_key == "NEW-KEY-0001");
    REQUIRE(h.prompt->defaults_seen[0] == std::nullopt);
    REQUIRE(h.manager->load_cached_license()->license_key == "NEW-KEY-0001");
}

TEST_CASE("Skip cache never reuses the cached key or falls back", "[manager]")
{
    Harness h;
    h.seed_cache("ABCD-EFGH-IJKL-MNOP");
    h.prompt->push("ABCD-EFGH-IJKL-MNOP");

    auto result = h.manager->ensure_valid_license({.quiet = true, .skip_cache = true});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(h.prompt->prompts() == 2);
    REQUIRE(h.prompt->defaults_seen[0] == std::optional<std::string>("ops@acme.example"));
    REQUIRE(h.transport->calls.size() == 1);
}

TEST_CASE("Disabled persistence deletes the cache", "[manager]")
{
    Harness h;
    h.seed_cache("ABCD-EFGH-IJKL-MNOP");
    h.transport->reply_json(kServer, 200, ok_response(server_license()));

    auto result = h.manager->ensure_valid_license({.persist_cache = false});
    REQUIRE(result.has_value());
    REQUIRE(h.prompt->prompts() == 0);
    REQUIRE_FALSE(result->offline_mode);
    REQUIRE_FALSE(h.cache_exists());
}

TEST_CASE("Disabled persistence still falls back to the activation read at entry", "[manager]")
{
    Harness h;
    auto seeded = h.seed_cache("ABCD-EFGH-IJKL-MNOP", std::chrono::hours(10));

    auto result = h.manager->ensure_valid_license({.quiet = true, .persist_cache = false});
    REQUIRE(result.has_value());
    REQUIRE(result->offline_mode);
    REQUIRE(result->license_key == seeded.license_key);
    REQUIRE(h.prompt->prompts() == 0);
    REQUIRE_FALSE(h.cache_exists());
}

TEST_CASE("Keys that are not valid UTF-8 are sent and rejected like any other", "[manager]")
{
    Harness h;
    h.prompt->push("\xff\xfe-KEY");
    h.transport->reply_json(kServer, 403, error_response("invalid_license"));

    auto result = h.manager->ensure_valid_license({.quiet = true});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::Cancelled);
    REQUIRE(h.manager->last_failure() == LicenseErrorKind::InvalidLicense);
    REQUIRE(h.transport->calls.size() == 1);
    REQUIRE(h.transport->calls[0].body["license_key"] == "\xEF\xBF\xBD\xEF\xBF\xBD-KEY");
}

TEST_CASE("Activations with non UTF-8 credentials can still be cached", "[manager]")
{
    Harness h;
    h.prompt->push("ABCD-\xff-KEY", "ops\xfe@acme.example");
    h.transport->reply_json(kServer, 200, ok_response(server_license()));

    auto result = h.manager->ensure_valid_license({.quiet = true});
    REQUIRE(result.has_value());
    REQUIRE(h.cache_exists());
    REQUIRE(h.transport->calls[0].body["email"] == "ops\xEF\xBF\xBD@acme.example");
}

TEST_CASE("Applied license is returned for later calls in the process", "[manager]")
{
    Harness h;
    h.prompt->push("ABCD-EFGH-IJKL-MNOP");
    h.transport->reply_json(kServer, 200, ok_response(server_license()));

    auto first = h.manager->ensure_valid_license();
    REQUIRE(first.has_value());

    auto second = h.manager->ensure_valid_license();
    REQUIRE(second.has_value());
    REQUIRE(*second == *first);
    REQUIRE(h.transport->calls.size() == 1);

    // A stateless run verifies again but does not replace the applied payload
    h.prompt->push("OTHER-KEY-0002");
    auto third = h.manager->ensure_valid_license({.force_prompt = true, .skip_cache = true, .persist_cache = false});
    REQUIRE(third.has_value());
    REQUIRE(third->license_key == "OTHER-KEY-0002");
    REQUIRE(h.transport->calls.size() == 2);
    REQUIRE(h.applied.current()->license_key == "ABCD-EFGH-IJKL-MNOP");
}

TEST_CASE("Manager keeps the promoted candidate between flows", "[manager]")
{
    Harness h("https://localhost:8443");
    h.transport->reply_json("https://localhost:8443", 200, ok_response(server_license()));
    h.prompt->push("KEY-ONE");
    h.prompt->push("KEY-TWO");

    REQUIRE(h.manager->ensure_valid_license({.skip_cache = true, .persist_cache = false}).has_value());
    REQUIRE(h.transport->calls.size() == 2);

    REQUIRE(h.manager->ensure_valid_license({.skip_cache = true, .persist_cache = false}).has_value());
    REQUIRE(h.transport->calls.size() == 3);
    REQUIRE(h.transport->calls[2].url == "https://localhost:8443/api/license/verify");
}

TEST_CASE("Direct verification does not touch cache or applied state", "[manager]")
{
    Harness h;
    h.transport->reply_json(kServer, 200, ok_response(server_license()));

    auto outcome = h.manager->verify_direct("ABCD-EFGH-IJKL-MNOP", std::nullopt);
    REQUIRE(outcome.ok);
    REQUIRE(outcome.license["client_name"] == "Acme");
    REQUIRE_FALSE(h.cache_exists());
    REQUIRE_FALSE(h.applied.current().has_value());

    auto missing = h.manager->verify_direct("", std::nullopt);
    REQUIRE(missing.kind() == LicenseErrorKind::MissingLicenseKey);
    REQUIRE(h.transport->calls.size() == 1);
}

TEST_CASE("Manager creation rejects insecure remote servers", "[manager]")
{
    ClientConfig cfg;
    cfg.server.url = "http://license.example.com";
    AppliedLicense applied;

    auto manager = LicenseManager::create(cfg, std::make_shared<FakeTransport>(), nullptr, applied);
    REQUIRE_FALSE(manager.has_value());
    REQUIRE(manager.error().code == ErrorCode::ConfigError);
}
