#include "warden/timestamp.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>

namespace warden
{
    namespace
    {
        bool read_digits(const std::string &s, std::size_t &pos, std::size_t count, int &out)
        {
            if (pos + count > s.size())
                return false;
            int value = 0;
            for (std::size_t i = 0; i < count; ++i)
            {
                char c = s[pos + i];
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    return false;
                value = value * 10 + (c - '0');
            }
            pos += count;
            out = value;
            return true;
        }

        bool expect(const std::string &s, std::size_t &pos, char c)
        {
            if (pos >= s.size() || s[pos] != c)
                return false;
            ++pos;
            return true;
        }
    } // namespace

    Timestamp now_utc()
    {
        return std::chrono::floor<std::chrono::microseconds>(Clock::now());
    }

    std::string format_iso8601(Timestamp ts)
    {
        auto secs = std::chrono::floor<std::chrono::seconds>(ts);
        auto micros = (ts - secs).count();
        // Not Clock::to_time_t: that goes through nanoseconds and overflows past 2262
        std::time_t t = static_cast<std::time_t>(secs.time_since_epoch().count());
        std::tm tm_buf;
        gmtime_r(&t, &tm_buf);

        char buf[64];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                      tm_buf.tm_year + 1900,
                      tm_buf.tm_mon + 1,
                      tm_buf.tm_mday,
                      tm_buf.tm_hour,
                      tm_buf.tm_min,
                      tm_buf.tm_sec,
                      static_cast<long long>(micros));
        return buf;
    }

    Result<Timestamp> parse_iso8601(const std::string &text)
    {
        auto invalid = [&text]() {
            return std::unexpected(WardenError::parsing("Invalid ISO 8601 timestamp: " + text));
        };

        std::tm tm_buf{};
        std::size_t pos = 0;
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
            !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
            !read_digits(text, pos, 2, day))
            return invalid();
        if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' '))
            return invalid();
        ++pos;
        if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, second))
            return invalid();
        if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
            return invalid();

        long long micros = 0;
        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            std::size_t digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
            {
                if (digits < 6)
                    micros = micros * 10 + (text[pos] - '0');
                ++digits;
                ++pos;
            }
            if (digits == 0)
                return invalid();
            for (std::size_t i = digits; i < 6; ++i)
                micros *= 10;
        }

        int offset_minutes = 0;
        if (pos < text.size())
        {
            char sign = text[pos];
            if (sign == 'Z' || sign == 'z')
            {
                ++pos;
            }
            else if (sign == '+' || sign == '-')
            {
                ++pos;
                int oh = 0, om = 0;
                if (!read_digits(text, pos, 2, oh))
                    return invalid();
                if (pos < text.size() && text[pos] == ':')
                    ++pos;
                if (!read_digits(text, pos, 2, om))
                    return invalid();
                offset_minutes = (oh * 60 + om) * (sign == '-' ? -1 : 1);
            }
            else
            {
                return invalid();
            }
        }
        if (pos != text.size())
            return invalid();

        tm_buf.tm_year = year - 1900;
        tm_buf.tm_mon = month - 1;
        tm_buf.tm_mday = day;
        tm_buf.tm_hour = hour;
        tm_buf.tm_min = minute;
        tm_buf.tm_sec = second;
        std::time_t t = timegm(&tm_buf);

        Timestamp base{std::chrono::seconds(t)};
        return base + std::chrono::microseconds(micros) - std::chrono::minutes(offset_minutes);
    }

} // namespace warden
