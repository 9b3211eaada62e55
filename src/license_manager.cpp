#include "warden/license_manager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace warden
{

    Result<LicenseManager> LicenseManager::create(const ClientConfig &config,
                                                  std::shared_ptr<HttpTransport> transport,
                                                  std::shared_ptr<PromptProvider> prompt,
                                                  AppliedLicense &applied)
    {
        auto resolver = CandidateResolver::create(config.resolver_options());
        if (!resolver)
        {
            return std::unexpected(resolver.error());
        }
        if (!transport)
        {
            return std::unexpected(WardenError::config("No HTTP transport configured"));
        }
        if (!prompt)
        {
            prompt = std::make_shared<NullPromptProvider>();
        }

        std::string user_agent = "warden";
        if (config.app_version)
            user_agent += "/" + *config.app_version;

        ManagerSettings settings;
        settings.app_version = config.app_version;
        settings.cache_lifetime = std::chrono::hours(std::clamp(config.cache.max_hours, 1, kMaxConfiguredHours));

        return LicenseManager(config.cache_file(),
                              FingerprintGenerator::collect(),
                              VerificationClient(std::move(*resolver), std::move(transport), user_agent),
                              std::move(prompt),
                              applied,
                              settings);
    }

    LicenseManager::LicenseManager(std::filesystem::path cache_file,
                                   DeviceAttributes device,
                                   VerificationClient client,
                                   std::shared_ptr<PromptProvider> prompt,
                                   AppliedLicense &applied,
                                   ManagerSettings settings)
        : device_(std::move(device)),
          fingerprint_(FingerprintGenerator::digest(device_)),
          cache_(std::move(cache_file), CacheCodec(fingerprint_)),
          client_(std::move(client)),
          prompt_(prompt ? std::move(prompt) : std::make_shared<NullPromptProvider>()),
          applied_(&applied),
          settings_(std::move(settings))
    {
    }

    std::optional<LicensePayload> LicenseManager::load_cached_license() const
    {
        return cache_.load();
    }

    VerificationRequest LicenseManager::make_request(const std::string &license_key,
                                                     const std::optional<std::string> &email) const
    {
        VerificationRequest request;
        request.license_key = license_key;
        request.machine_fingerprint = fingerprint_;
        request.email = email;
        request.hostname = device_.hostname;
        request.platform = FingerprintGenerator::platform_string(device_);
        request.app_version = settings_.app_version;
        return request;
    }

    VerificationOutcome LicenseManager::verify_direct(const std::string &license_key,
                                                      const std::optional<std::string> &email)
    {
        if (license_key.empty())
        {
            last_failure_ = LicenseErrorKind::MissingLicenseKey;
            return VerificationOutcome::failure(LicenseErrorKind::MissingLicenseKey);
        }
        if (fingerprint_.empty())
        {
            last_failure_ = LicenseErrorKind::MissingMachineFingerprint;
            return VerificationOutcome::failure(LicenseErrorKind::MissingMachineFingerprint);
        }

        auto outcome = client_.verify(make_request(license_key, email));
        if (outcome.ok)
            last_failure_.reset();
        else
            last_failure_ = outcome.kind();
        return outcome;
    }

    Result<LicensePayload> LicenseManager::build_verified_payload(const nlohmann::json &license,
                                                                  const std::string &license_key,
                                                                  const std::optional<std::string> &email) const
    {
        auto parsed = LicensePayload::from_json(license);
        if (!parsed)
        {
            return std::unexpected(parsed.error());
        }

        LicensePayload payload = std::move(*parsed);
        auto now = now_utc();
        payload.license_key = license_key;
        if (email && !email->empty())
            payload.email = email;
        payload.machine_fingerprint = fingerprint_;
        payload.verified_at = now;
        payload.cache_expires_at = now + std::chrono::duration_cast<std::chrono::microseconds>(settings_.cache_lifetime);
        payload.offline_mode = false;
        return payload;
    }

    bool LicenseManager::offline_fallback_allowed(const std::optional<LicensePayload> &cached,
                                                  const std::string &attempted_key,
                                                  LicenseErrorKind failure,
                                                  const VerifyOptions &options) const
    {
        return !options.skip_cache &&
               cached.has_value() &&
               cached->license_key == attempted_key &&
               cached->machine_fingerprint == fingerprint_ &&
               !cached->is_expired(now_utc()) &&
               permits_offline_fallback(failure);
    }

    void LicenseManager::discard_cache() const
    {
        auto removed = cache_.remove();
        if (!removed)
        {
            spdlog::warn("Unable to remove license cache: {}", removed.error().what());
        }
    }

    void LicenseManager::report(const std::string &message, const VerifyOptions &options) const
    {
        if (!options.quiet)
            prompt_->show_error(message);
    }

    Result<LicensePayload> LicenseManager::ensure_valid_license(const VerifyOptions &options)
    {
        if (!options.skip_cache)
        {
            if (auto applied = applied_->current())
            {
                return *applied;
            }
        }

        std::optional<LicensePayload> cached;
        if (!options.force_prompt)
            cached = cache_.load();

        std::optional<std::string> email = cached ? cached->email : std::nullopt;
        if (!options.persist_cache)
            discard_cache();

        std::string license_key;
        if (cached && !options.skip_cache)
            license_key = cached->license_key;

        int attempts = 0;
        while (attempts < kMaxAttempts)
        {
            if (license_key.empty())
            {
                auto credentials = prompt_->prompt(email);
                if (!credentials || credentials->license_key.empty())
                {
                    report("License verification is required to continue.", options);
                    return std::unexpected(WardenError::cancelled("License entry was cancelled"));
                }
                license_key = credentials->license_key;
                if (!credentials->email.empty())
                    email = credentials->email;
                else
                    email.reset();
            }

            auto outcome = verify_direct(license_key, email);
            LicenseErrorKind failure = outcome.kind();
            if (outcome.ok)
            {
                auto payload = build_verified_payload(outcome.license, license_key, email);
                if (payload)
                {
                    if (options.persist_cache)
                    {
                        auto stored = cache_.store(*payload);
                        if (!stored)
                            spdlog::warn("Unable to persist license cache: {}", stored.error().what());
                    }
                    else
                    {
                        discard_cache();
                    }
                    applied_->apply(*payload);

                    spdlog::info("License verified ({}) [activation {}/{}]",
                                 mask_license_key(license_key),
                                 payload->activation_count,
                                 payload->max_activations);
                    return *payload;
                }

                spdlog::warn("Server license record rejected: {}", payload.error().what());
                failure = LicenseErrorKind::InvalidServerResponse;
                last_failure_ = failure;
            }

            if (offline_fallback_allowed(cached, license_key, failure, options))
            {
                LicensePayload offline = *cached;
                offline.offline_mode = true;
                applied_->apply(offline);
                spdlog::warn("License server unreachable; proceeding in offline mode with cached activation.");
                return offline;
            }

            ++attempts;
            spdlog::info("License verification attempt {}/{} failed: {}",
                         attempts, kMaxAttempts,
                         outcome.ok ? to_wire_code(failure) : outcome.error_code);
            report(outcome.ok ? humanize_error(failure) : humanize_error(outcome.error_code), options);
            license_key.clear();
        }

        return std::unexpected(WardenError::license(
            "License verification failed after " + std::to_string(kMaxAttempts) +
            " attempts (" + to_wire_code(last_failure_.value_or(LicenseErrorKind::Unknown)) + ")"));
    }

} // namespace warden
