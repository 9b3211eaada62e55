#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include "license_payload.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace warden
{

    /** Encrypted blob stored under "data" in the cache envelope */
    struct CipherBlob
    {
        std::string cipher; // URL-safe base64
        std::string sig;    // hex SHA-256 over plaintext || key
        std::string algo{"xor-sha256"};

        nlohmann::json to_json() const;
        static Result<CipherBlob> from_json(const nlohmann::json &j);
    };

    /**
     * Encodes license payloads into the on-disk envelope:
     *
     *   { "_format": "license-cache", "version": 2, "encrypted": true,
     *     "data": { "cipher": ..., "sig": ..., "algo": "xor-sha256" } }
     *
     * The key is SHA-256 of the device fingerprint. The XOR stream only
     * deters casual local edits; it is not a confidentiality boundary.
     */
    class CacheCodec
    {
    public:
        static constexpr const char *kFormatTag = "license-cache";
        static constexpr int kFormatVersion = 2;
        static constexpr const char *kAlgorithm = "xor-sha256";

        explicit CacheCodec(std::string fingerprint);

        const std::string &fingerprint() const { return fingerprint_; }

        CipherBlob encrypt(const std::string &plaintext) const;

        /** Fails on bad base64, unknown algorithm or signature mismatch */
        Result<std::string> decrypt(const CipherBlob &blob) const;

        /** Full envelope for a payload */
        nlohmann::json encode(const LicensePayload &payload) const;

        /**
         * Parse envelope (or legacy plaintext payload) text. Returns the payload
         * only if it is intact, bound to this fingerprint and unexpired.
         */
        std::optional<LicensePayload> decode(const std::string &text, Timestamp now) const;

    private:
        crypto::Bytes xor_stream(const crypto::Bytes &data) const;
        std::string signature(const crypto::Bytes &plaintext) const;

        std::string fingerprint_;
        crypto::SHA256Hash key_;
    };

    /**
     * The cache file for one installation. Reads never fail: any problem is
     * logged and reported as "no cache". Writes replace the file atomically.
     */
    class LicenseCache
    {
    public:
        LicenseCache(std::filesystem::path path, CacheCodec codec);

        const std::filesystem::path &path() const { return path_; }

        std::optional<LicensePayload> load() const;

        /** Write via a temp file in the same directory, then rename; mode 0600 */
        Result<void> store(const LicensePayload &payload) const;

        Result<void> remove() const;

    private:
        std::filesystem::path path_;
        CacheCodec codec_;
    };

    /**
     * Per-user application data directory ($XDG_DATA_HOME/warden or
     * ~/.local/share/warden). Falls back to the working directory when it
     * cannot be created.
     */
    std::filesystem::path default_data_directory();

} // namespace warden
