#include "warden/prompt_provider.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace warden
{
    namespace
    {
        std::string trim(const std::string &value)
        {
            auto start = value.find_first_not_of(" \t\r\n");
            if (start == std::string::npos)
                return {};
            auto end = value.find_last_not_of(" \t\r\n");
            return value.substr(start, end - start + 1);
        }
    } // namespace

    std::string normalize_license_key(const std::string &raw)
    {
        std::string key = trim(raw);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return key;
    }

    ConsolePromptProvider::ConsolePromptProvider(std::istream &in, std::ostream &out, std::ostream &err)
        : in_(in), out_(out), err_(err)
    {
    }

    std::optional<Credentials> ConsolePromptProvider::prompt(const std::optional<std::string> &default_email)
    {
        out_ << "\n=== License Verification ===\n";
        out_ << "License key: " << std::flush;

        std::string line;
        if (!std::getline(in_, line))
            return std::nullopt;
        std::string license_key = normalize_license_key(line);
        if (license_key.empty())
            return std::nullopt;

        out_ << "Registered email [" << (default_email ? *default_email : std::string("optional")) << "]: "
             << std::flush;
        if (!std::getline(in_, line))
            return std::nullopt;

        std::string email = trim(line);
        if (email.empty() && default_email)
            email = *default_email;
        return Credentials{license_key, email};
    }

    void ConsolePromptProvider::show_error(const std::string &message)
    {
        err_ << "ERROR: " << message << std::endl;
    }

    StaticPromptProvider::StaticPromptProvider(Credentials credentials)
        : credentials_(std::move(credentials))
    {
        credentials_.license_key = normalize_license_key(credentials_.license_key);
    }

    std::optional<Credentials> StaticPromptProvider::prompt(const std::optional<std::string> &default_email)
    {
        if (credentials_.license_key.empty())
            return std::nullopt;
        Credentials out = credentials_;
        if (out.email.empty() && default_email)
            out.email = *default_email;
        return out;
    }

    void StaticPromptProvider::show_error(const std::string &message)
    {
        spdlog::error("{}", message);
    }

} // namespace warden
