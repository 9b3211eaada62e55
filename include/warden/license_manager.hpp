#pragma once

#include "types.hpp"
#include "applied_license.hpp"
#include "cache_codec.hpp"
#include "config.hpp"
#include "fingerprint.hpp"
#include "license_errors.hpp"
#include "license_payload.hpp"
#include "prompt_provider.hpp"
#include "verification_client.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace warden
{
    struct VerifyOptions
    {
        bool force_prompt{false};  // ignore any cached activation at entry
        bool quiet{false};         // no user-facing error output
        bool skip_cache{false};    // never reuse the cached key or fall back offline
        bool persist_cache{true};  // write the refreshed payload to disk
    };

    struct ManagerSettings
    {
        std::optional<std::string> app_version;
        std::chrono::hours cache_lifetime{72};
    };

    /**
     * Drives one license verification flow for this installation.
     *
     * The cached activation (if any) is tried first, then the prompt provider
     * is asked for credentials, for at most kMaxAttempts verification rounds.
     * A cached activation stands in for the server only when the server could
     * not be reached or answered garbage.
     */
    class LicenseManager
    {
    public:
        static constexpr int kMaxAttempts = 3;

        /**
         * Build a manager from configuration. Probes the device fingerprint and
         * resolves the candidate servers; a bad server URL is a ConfigError.
         */
        static Result<LicenseManager> create(const ClientConfig &config,
                                             std::shared_ptr<HttpTransport> transport,
                                             std::shared_ptr<PromptProvider> prompt,
                                             AppliedLicense &applied = AppliedLicense::process());

        LicenseManager(std::filesystem::path cache_file,
                       DeviceAttributes device,
                       VerificationClient client,
                       std::shared_ptr<PromptProvider> prompt,
                       AppliedLicense &applied,
                       ManagerSettings settings = {});

        /**
         * Return a verified payload, or an error once the attempt budget is spent
         * (LicenseError) or the prompt provider yields nothing (Cancelled).
         */
        Result<LicensePayload> ensure_valid_license(const VerifyOptions &options = {});

        /** Cached activation if intact, bound to this device and unexpired */
        std::optional<LicensePayload> load_cached_license() const;

        /** One verification round with explicit credentials; no prompt, cache or apply */
        VerificationOutcome verify_direct(const std::string &license_key,
                                          const std::optional<std::string> &email);

        /** Kind of the most recent failed verification round, if any */
        std::optional<LicenseErrorKind> last_failure() const { return last_failure_; }

        const std::string &fingerprint() const { return fingerprint_; }
        const LicenseCache &cache() const { return cache_; }

    private:
        VerificationRequest make_request(const std::string &license_key,
                                         const std::optional<std::string> &email) const;

        Result<LicensePayload> build_verified_payload(const nlohmann::json &license,
                                                      const std::string &license_key,
                                                      const std::optional<std::string> &email) const;

        bool offline_fallback_allowed(const std::optional<LicensePayload> &cached,
                                      const std::string &attempted_key,
                                      LicenseErrorKind failure,
                                      const VerifyOptions &options) const;

        void discard_cache() const;
        void report(const std::string &message, const VerifyOptions &options) const;

        DeviceAttributes device_;
        std::string fingerprint_;
        LicenseCache cache_;
        VerificationClient client_;
        std::shared_ptr<PromptProvider> prompt_;
        AppliedLicense *applied_;
        ManagerSettings settings_;
        std::optional<LicenseErrorKind> last_failure_;
    };

} // namespace warden
