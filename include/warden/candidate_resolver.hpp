#pragma once

#include "types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace warden
{
    /**
     * Minimal absolute URL split used for license server addresses.
     * host is lower-cased with IPv6 brackets removed; netloc keeps the
     * original authority text.
     */
    struct Url
    {
        std::string scheme;
        std::string netloc;
        std::string host;
        std::uint16_t port{0};
        std::string path; // path, query and fragment; may be empty

        bool is_https() const { return scheme == "https"; }
    };

    Result<Url> parse_url(const std::string &text);

    /** localhost, 127.0.0.1 or ::1 */
    bool is_loopback_host(const std::string &host);

    struct Candidate
    {
        std::string base_url;
        bool verify_tls{true};

        bool operator==(const Candidate &other) const = default;
    };

    struct ResolverOptions
    {
        std::string server_url;
        bool verify_tls{true};
        bool allow_insecure{false};
        bool disable_https_fallback{false};
        bool disable_http_fallback{false};
    };

    /**
     * Ordered, de-duplicated list of license server base URLs derived from a
     * single configured URL. The order is the try order; a candidate that
     * answers is moved to the front for the rest of the process lifetime.
     */
    class CandidateResolver
    {
    public:
        /** Fails with ConfigError for unsupported schemes or insecure remote http */
        static Result<CandidateResolver> create(const ResolverOptions &options);

        const std::vector<Candidate> &candidates() const { return candidates_; }

        /** The configured URL, normalized */
        const std::string &primary() const { return primary_; }

        /** Add a candidate; an existing entry is only moved when priority is set */
        void add(const Candidate &candidate, bool priority = false);

        /** Move the candidate with this base URL to the front */
        void promote(const std::string &base_url);

    private:
        CandidateResolver() = default;

        std::string primary_;
        std::vector<Candidate> candidates_;
    };

} // namespace warden
