#include "warden/verification_client.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace warden
{

    json VerificationRequest::to_json() const
    {
        return json{
            {"license_key", license_key},
            {"machine_fingerprint", machine_fingerprint},
            {"email", email ? json(*email) : json(nullptr)},
            {"hostname", hostname},
            {"platform", platform},
            {"app_version", app_version ? json(*app_version) : json(nullptr)}};
    }

    VerificationOutcome VerificationOutcome::success(json license)
    {
        VerificationOutcome outcome;
        outcome.ok = true;
        outcome.license = std::move(license);
        return outcome;
    }

    VerificationOutcome VerificationOutcome::failure(LicenseErrorKind kind)
    {
        return failure(to_wire_code(kind));
    }

    VerificationOutcome VerificationOutcome::failure(std::string code)
    {
        VerificationOutcome outcome;
        outcome.error_code = std::move(code);
        return outcome;
    }

    VerificationClient::VerificationClient(CandidateResolver resolver,
                                           std::shared_ptr<HttpTransport> transport,
                                           std::string user_agent)
        : resolver_(std::move(resolver)),
          transport_(std::move(transport)),
          user_agent_(std::move(user_agent))
    {
    }

    VerificationOutcome VerificationClient::interpret(const HttpResponse &response)
    {
        json data = json::parse(response.body, nullptr, false);
        if (data.is_discarded() || !data.is_object())
        {
            return VerificationOutcome::failure(LicenseErrorKind::InvalidServerResponse);
        }

        auto ok = data.find("ok");
        if (ok == data.end() || !ok->is_boolean())
        {
            return VerificationOutcome::failure(LicenseErrorKind::InvalidServerResponse);
        }

        if (ok->get<bool>())
        {
            auto license = data.find("license");
            if (response.status >= 400 || license == data.end() || !license->is_object())
            {
                return VerificationOutcome::failure(LicenseErrorKind::InvalidServerResponse);
            }
            return VerificationOutcome::success(*license);
        }

        auto error = data.find("error");
        if (error == data.end() || !error->is_string())
        {
            return VerificationOutcome::failure(LicenseErrorKind::InvalidServerResponse);
        }
        return VerificationOutcome::failure(error->get<std::string>());
    }

    VerificationOutcome VerificationClient::verify(const VerificationRequest &request)
    {
        // Keys and emails arrive unvalidated; invalid UTF-8 is replaced, not thrown
        const std::string body = request.to_json().dump(-1, ' ', false, json::error_handler_t::replace);
        std::optional<WardenError> last_error;

        // Copy: promotion reorders the list while we iterate
        const auto candidates = resolver_.candidates();
        for (const auto &candidate : candidates)
        {
            spdlog::info("Attempting license verification via {}", candidate.base_url);

            HttpRequestOptions options;
            options.verify_tls = candidate.verify_tls;
            options.timeout = kTimeout;
            options.user_agent = user_agent_;

            auto response = transport_->post_json(candidate.base_url + kVerifyPath, body, options);
            if (!response)
            {
                spdlog::warn("License server {} unreachable: {}", candidate.base_url, response.error().what());
                last_error = response.error();
                continue;
            }

            auto outcome = interpret(*response);
            if (outcome.kind() == LicenseErrorKind::InvalidServerResponse)
            {
                spdlog::warn("Unexpected response from {} (HTTP {})", candidate.base_url, response->status);
                return outcome;
            }

            if (candidate.base_url != resolver_.candidates().front().base_url)
            {
                spdlog::debug("Promoting license server candidate {}", candidate.base_url);
            }
            resolver_.promote(candidate.base_url);
            return outcome;
        }

        if (last_error)
        {
            spdlog::error("Failed to reach license server: {}", last_error->what());
        }
        return VerificationOutcome::failure(LicenseErrorKind::NetworkError);
    }

} // namespace warden
