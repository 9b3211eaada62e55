#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace warden::crypto
{

    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);

        static SHA256Hash hash(const std::string &data);

        /**
         * Convert hash to lower-case hex string
         */
        static std::string to_hex(const SHA256Hash &hash);
    };

    /**
     * Base64 encoding/decoding. The license cache uses the URL-safe alphabet
     * with '=' padding; decoding rejects non-canonical input.
     */
    class Base64
    {
    public:
        static std::string encode_url_safe(const Bytes &data);

        static Result<Bytes> decode_url_safe(const std::string &encoded);
    };

    /** Constant-time comparison of two equal-length strings */
    bool constant_time_equals(const std::string &a, const std::string &b);

} // namespace warden::crypto
