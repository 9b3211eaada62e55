#pragma once

#include <iosfwd>
#include <optional>
#include <string>

namespace warden
{
    struct Credentials
    {
        std::string license_key;
        std::string email;
    };

    /**
     * Interactive input capability. The license flow never knows how the
     * credentials were collected; nullopt means cancelled or unavailable.
     */
    class PromptProvider
    {
    public:
        virtual ~PromptProvider() = default;

        virtual std::optional<Credentials> prompt(const std::optional<std::string> &default_email) = 0;

        /** Surface a user-facing error (humanized) */
        virtual void show_error(const std::string &message) = 0;
    };

    /** Reads from an input stream, writes prompts to an output stream */
    class ConsolePromptProvider : public PromptProvider
    {
    public:
        ConsolePromptProvider(std::istream &in, std::ostream &out, std::ostream &err);

        std::optional<Credentials> prompt(const std::optional<std::string> &default_email) override;
        void show_error(const std::string &message) override;

    private:
        std::istream &in_;
        std::ostream &out_;
        std::ostream &err_;
    };

    /** No interactive surface: always cancels */
    class NullPromptProvider : public PromptProvider
    {
    public:
        std::optional<Credentials> prompt(const std::optional<std::string> &) override { return std::nullopt; }
        void show_error(const std::string &) override {}
    };

    /** Supplies one fixed credential pair on every prompt */
    class StaticPromptProvider : public PromptProvider
    {
    public:
        explicit StaticPromptProvider(Credentials credentials);

        std::optional<Credentials> prompt(const std::optional<std::string> &default_email) override;
        void show_error(const std::string &message) override;

    private:
        Credentials credentials_;
    };

    /** Trim surrounding whitespace and upper-case a typed license key */
    std::string normalize_license_key(const std::string &raw);

} // namespace warden
