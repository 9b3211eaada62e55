#include "warden/crypto.hpp"
#include <sodium.h>
#include <cstdio>
#include <cstring>

namespace warden::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(const std::string &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        std::string hex(hash.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), hash.data(), hash.size());
        hex.resize(hash.size() * 2);
        return hex;
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    std::string Base64::encode_url_safe(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_URLSAFE);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_URLSAFE);

        // Remove null terminator
        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode_url_safe(const std::string &encoded)
    {
        Bytes decoded(encoded.size()); // Worst case size
        size_t decoded_len;
        const char *end = nullptr;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                nullptr, // ignore characters
                &decoded_len,
                &end,
                sodium_base64_VARIANT_URLSAFE) != 0)
        {
            return std::unexpected(WardenError::crypto("Invalid base64url encoding"));
        }
        if (end != encoded.c_str() + encoded.size())
        {
            return std::unexpected(WardenError::crypto("Trailing data after base64url payload"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    bool constant_time_equals(const std::string &a, const std::string &b)
    {
        if (a.size() != b.size())
            return false;
        return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
    }

} // namespace warden::crypto
