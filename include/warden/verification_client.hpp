#pragma once

#include "types.hpp"
#include "candidate_resolver.hpp"
#include "http_transport.hpp"
#include "license_errors.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

namespace warden
{
    struct VerificationRequest
    {
        std::string license_key;
        std::string machine_fingerprint;
        std::optional<std::string> email;
        std::string hostname;
        std::string platform;
        std::optional<std::string> app_version;

        nlohmann::json to_json() const;
    };

    /**
     * Normalized server answer: either {ok:true, license:{...}} or
     * {ok:false, error:<code>}. Transport problems arrive here as
     * network_error, malformed bodies as invalid_server_response.
     */
    struct VerificationOutcome
    {
        bool ok{false};
        nlohmann::json license;
        std::string error_code;

        LicenseErrorKind kind() const { return ok ? LicenseErrorKind::Unknown : kind_from_wire_code(error_code); }

        static VerificationOutcome success(nlohmann::json license);
        static VerificationOutcome failure(LicenseErrorKind kind);
        static VerificationOutcome failure(std::string code);
    };

    class VerificationClient
    {
    public:
        static constexpr const char *kVerifyPath = "/api/license/verify";
        static constexpr std::chrono::seconds kTimeout{15};

        VerificationClient(CandidateResolver resolver,
                           std::shared_ptr<HttpTransport> transport,
                           std::string user_agent = "warden");

        /**
         * Try candidates in order. The first parseable response wins and its
         * candidate is promoted; transport failures move on to the next one.
         */
        VerificationOutcome verify(const VerificationRequest &request);

        const CandidateResolver &resolver() const { return resolver_; }

        /** Map one HTTP exchange to an outcome */
        static VerificationOutcome interpret(const HttpResponse &response);

    private:
        CandidateResolver resolver_;
        std::shared_ptr<HttpTransport> transport_;
        std::string user_agent_;
    };

} // namespace warden
