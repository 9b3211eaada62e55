#pragma once

#include "types.hpp"
#include <chrono>
#include <string>

namespace warden
{
    struct HttpResponse
    {
        unsigned status{0};
        std::string body;
    };

    struct HttpRequestOptions
    {
        bool verify_tls{true};
        std::chrono::milliseconds timeout{std::chrono::seconds(15)};
        std::string user_agent{"warden"};
    };

    /**
     * One blocking JSON POST. Any status code is a successful exchange;
     * resolve, connect, TLS, I/O failures and timeouts are NetworkError.
     */
    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        virtual Result<HttpResponse> post_json(
            const std::string &url,
            const std::string &body,
            const HttpRequestOptions &options) = 0;
    };

    /**
     * Boost.Beast client for http:// and https:// URLs. Each call runs its own
     * io_context until the response arrives or the timeout elapses.
     */
    class BeastHttpTransport : public HttpTransport
    {
    public:
        Result<HttpResponse> post_json(
            const std::string &url,
            const std::string &body,
            const HttpRequestOptions &options) override;
    };

} // namespace warden
