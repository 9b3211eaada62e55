#include "warden/candidate_resolver.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace warden
{
    namespace
    {
        std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        std::string strip_trailing_slashes(std::string value)
        {
            while (!value.empty() && value.back() == '/')
                value.pop_back();
            return value;
        }

        std::string rebuild(const std::string &scheme, const Url &url)
        {
            return strip_trailing_slashes(scheme + "://" + url.netloc + url.path);
        }
    } // namespace

    Result<Url> parse_url(const std::string &text)
    {
        auto sep = text.find("://");
        if (sep == std::string::npos || sep == 0)
        {
            return std::unexpected(WardenError::config("Invalid license server URL: " + text));
        }

        Url url;
        url.scheme = to_lower(text.substr(0, sep));
        auto rest = text.substr(sep + 3);
        auto path_pos = rest.find_first_of("/?#");
        url.netloc = rest.substr(0, path_pos);
        url.path = path_pos == std::string::npos ? std::string() : rest.substr(path_pos);

        std::string hostport = url.netloc;
        if (auto at = hostport.rfind('@'); at != std::string::npos)
            hostport = hostport.substr(at + 1);

        std::string port_text;
        if (!hostport.empty() && hostport.front() == '[')
        {
            auto close = hostport.find(']');
            if (close == std::string::npos)
                return std::unexpected(WardenError::config("Invalid IPv6 host in URL: " + text));
            url.host = hostport.substr(1, close - 1);
            auto after = hostport.substr(close + 1);
            if (!after.empty())
            {
                if (after.front() != ':')
                    return std::unexpected(WardenError::config("Invalid host in URL: " + text));
                port_text = after.substr(1);
            }
        }
        else
        {
            auto colon = hostport.rfind(':');
            url.host = hostport.substr(0, colon);
            if (colon != std::string::npos)
                port_text = hostport.substr(colon + 1);
        }
        url.host = to_lower(url.host);

        if (url.host.empty())
        {
            return std::unexpected(WardenError::config("License server URL has no host: " + text));
        }

        if (port_text.empty())
        {
            url.port = url.scheme == "https" ? 443 : 80;
        }
        else
        {
            if (port_text.size() > 5 || !std::all_of(port_text.begin(), port_text.end(),
                                                     [](unsigned char c) { return std::isdigit(c); }))
                return std::unexpected(WardenError::config("Invalid port in URL: " + text));
            unsigned long port = std::stoul(port_text);
            if (port == 0 || port > 65535)
                return std::unexpected(WardenError::config("Invalid port in URL: " + text));
            url.port = static_cast<std::uint16_t>(port);
        }
        return url;
    }

    bool is_loopback_host(const std::string &host)
    {
        std::string normalized = host;
        if (normalized.size() >= 2 && normalized.front() == '[' && normalized.back() == ']')
            normalized = normalized.substr(1, normalized.size() - 2);
        normalized = to_lower(normalized);
        return normalized == "localhost" || normalized == "127.0.0.1" || normalized == "::1";
    }

    Result<CandidateResolver> CandidateResolver::create(const ResolverOptions &options)
    {
        auto parsed = parse_url(options.server_url);
        if (!parsed)
            return std::unexpected(parsed.error());

        const Url &url = *parsed;
        if (url.scheme != "http" && url.scheme != "https")
        {
            return std::unexpected(WardenError::config("Unsupported LICENSE_SERVER scheme: " + url.scheme));
        }

        const bool loopback = is_loopback_host(url.host);
        if (url.scheme == "http" && !(options.allow_insecure || loopback))
        {
            return std::unexpected(WardenError::config(
                "LICENSE_SERVER must use HTTPS for remote servers. "
                "Set ALLOW_INSECURE_LICENSE_SERVER=1 to permit HTTP or use localhost."));
        }

        // An http configuration turns TLS verification off for every candidate
        const bool verify_tls = options.verify_tls && url.scheme == "https";

        CandidateResolver resolver;
        resolver.primary_ = rebuild(url.scheme, url);
        resolver.add({resolver.primary_, verify_tls});

        if (url.scheme == "https" && loopback && !options.disable_http_fallback)
        {
            resolver.add({rebuild("http", url), false}, true);
        }
        else if (url.scheme == "http" && loopback && !options.disable_https_fallback)
        {
            resolver.add({rebuild("https", url), verify_tls});
        }

        if (url.scheme == "http" && !loopback)
        {
            spdlog::warn("Using insecure license server {}; TLS verification disabled", resolver.primary_);
        }
        return resolver;
    }

    void CandidateResolver::add(const Candidate &candidate, bool priority)
    {
        Candidate normalized{strip_trailing_slashes(candidate.base_url), candidate.verify_tls};
        if (normalized.base_url.empty())
            return;

        auto it = std::find_if(candidates_.begin(), candidates_.end(),
                               [&](const Candidate &c) { return c.base_url == normalized.base_url; });
        if (it != candidates_.end())
        {
            if (priority)
                promote(normalized.base_url);
            return;
        }
        if (priority)
            candidates_.insert(candidates_.begin(), normalized);
        else
            candidates_.push_back(normalized);
    }

    void CandidateResolver::promote(const std::string &base_url)
    {
        auto it = std::find_if(candidates_.begin(), candidates_.end(),
                               [&](const Candidate &c) { return c.base_url == base_url; });
        if (it == candidates_.end() || it == candidates_.begin())
            return;
        std::rotate(candidates_.begin(), it, it + 1);
    }

} // namespace warden
