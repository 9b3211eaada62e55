#include "warden/cache_codec.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace warden
{

    // ============================================================================
    // CipherBlob
    // ============================================================================

    json CipherBlob::to_json() const
    {
        return json{{"cipher", cipher}, {"sig", sig}, {"algo", algo}};
    }

    Result<CipherBlob> CipherBlob::from_json(const json &j)
    {
        if (!j.is_object())
            return std::unexpected(WardenError::parsing("Missing license payload"));

        auto cipher = j.find("cipher");
        auto sig = j.find("sig");
        if (cipher == j.end() || sig == j.end() || !cipher->is_string() || !sig->is_string() ||
            cipher->get<std::string>().empty() || sig->get<std::string>().empty())
        {
            return std::unexpected(WardenError::parsing("Incomplete license payload"));
        }

        CipherBlob blob;
        blob.cipher = cipher->get<std::string>();
        blob.sig = sig->get<std::string>();
        if (auto algo = j.find("algo"); algo != j.end() && algo->is_string())
            blob.algo = algo->get<std::string>();
        return blob;
    }

    // ============================================================================
    // CacheCodec
    // ============================================================================

    CacheCodec::CacheCodec(std::string fingerprint)
        : fingerprint_(std::move(fingerprint)),
          key_(crypto::SHA256::hash(fingerprint_))
    {
    }

    crypto::Bytes CacheCodec::xor_stream(const crypto::Bytes &data) const
    {
        crypto::Bytes out(data.size());
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            out[i] = data[i] ^ key_[i % key_.size()];
        }
        return out;
    }

    std::string CacheCodec::signature(const crypto::Bytes &plaintext) const
    {
        crypto::Bytes material(plaintext);
        material.insert(material.end(), key_.begin(), key_.end());
        return crypto::SHA256::to_hex(crypto::SHA256::hash(material));
    }

    CipherBlob CacheCodec::encrypt(const std::string &plaintext) const
    {
        crypto::Bytes raw(plaintext.begin(), plaintext.end());
        CipherBlob blob;
        blob.cipher = crypto::Base64::encode_url_safe(xor_stream(raw));
        blob.sig = signature(raw);
        blob.algo = kAlgorithm;
        return blob;
    }

    Result<std::string> CacheCodec::decrypt(const CipherBlob &blob) const
    {
        if (blob.algo != kAlgorithm)
        {
            return std::unexpected(WardenError::crypto("Unsupported license cache algorithm: " + blob.algo));
        }

        auto cipher = crypto::Base64::decode_url_safe(blob.cipher);
        if (!cipher)
            return std::unexpected(cipher.error());

        crypto::Bytes raw = xor_stream(*cipher);
        if (!crypto::constant_time_equals(signature(raw), blob.sig))
        {
            return std::unexpected(WardenError::crypto("License payload integrity check failed"));
        }
        return std::string(raw.begin(), raw.end());
    }

    json CacheCodec::encode(const LicensePayload &payload) const
    {
        std::string serialized = payload.to_json().dump(2, ' ', false, json::error_handler_t::replace);
        return json{
            {"_format", kFormatTag},
            {"version", kFormatVersion},
            {"encrypted", true},
            {"data", encrypt(serialized).to_json()}};
    }

    std::optional<LicensePayload> CacheCodec::decode(const std::string &text, Timestamp now) const
    {
        try
        {
            json document = json::parse(text);
            if (!document.is_object())
            {
                spdlog::warn("Existing license cache is invalid and will be ignored.");
                return std::nullopt;
            }

            json payload_json;
            if (document.value("_format", std::string()) == kFormatTag)
            {
                if (document.value("version", 0) > kFormatVersion)
                {
                    spdlog::warn("License cache version {} is not supported; ignoring it.",
                                 document.value("version", 0));
                    return std::nullopt;
                }
                auto blob = CipherBlob::from_json(document.value("data", json()));
                if (!blob)
                {
                    spdlog::warn("Existing license cache is invalid and will be ignored: {}", blob.error().what());
                    return std::nullopt;
                }
                auto plaintext = decrypt(*blob);
                if (!plaintext)
                {
                    spdlog::warn("Existing license cache is invalid and will be ignored: {}", plaintext.error().what());
                    return std::nullopt;
                }
                payload_json = json::parse(*plaintext);
            }
            else
            {
                // Plaintext payload written by older clients
                payload_json = std::move(document);
            }

            auto payload = LicensePayload::from_json(payload_json);
            if (!payload)
            {
                spdlog::warn("Existing license cache is invalid and will be ignored: {}", payload.error().what());
                return std::nullopt;
            }
            if (payload->machine_fingerprint != fingerprint_)
            {
                spdlog::info("Cached license belongs to a different device; ignoring it.");
                return std::nullopt;
            }
            if (payload->is_expired(now))
            {
                spdlog::info("Cached license expired; re-verification required.");
                return std::nullopt;
            }
            return std::move(*payload);
        }
        catch (const json::exception &e)
        {
            spdlog::warn("Existing license cache is invalid and will be ignored: {}", e.what());
            return std::nullopt;
        }
    }

    // ============================================================================
    // LicenseCache
    // ============================================================================

    LicenseCache::LicenseCache(fs::path path, CacheCodec codec)
        : path_(std::move(path)), codec_(std::move(codec))
    {
    }

    std::optional<LicensePayload> LicenseCache::load() const
    {
        std::error_code ec;
        if (!fs::exists(path_, ec))
            return std::nullopt;

        std::ifstream file(path_);
        if (!file.is_open())
        {
            spdlog::warn("Unable to read license cache {}; ignoring it.", path_.string());
            return std::nullopt;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return codec_.decode(buffer.str(), now_utc());
    }

    Result<void> LicenseCache::store(const LicensePayload &payload) const
    {
        std::error_code ec;
        if (path_.has_parent_path())
        {
            fs::create_directories(path_.parent_path(), ec);
            if (ec)
                return std::unexpected(WardenError::io("Failed to create cache directory: " + ec.message()));
        }

        fs::path tmp_path = path_;
        tmp_path.replace_extension(".tmp");
        {
            std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
            if (!out.is_open())
                return std::unexpected(WardenError::io("Unable to open " + tmp_path.string()));
            out << codec_.encode(payload).dump(2);
            out.flush();
            if (!out)
            {
                out.close();
                fs::remove(tmp_path, ec);
                return std::unexpected(WardenError::io("Failed writing " + tmp_path.string()));
            }
        }

        fs::permissions(tmp_path, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (ec)
            spdlog::debug("Could not restrict permissions on {}: {}", tmp_path.string(), ec.message());

        fs::rename(tmp_path, path_, ec);
        if (ec)
        {
            std::error_code ignored;
            fs::remove(tmp_path, ignored);
            return std::unexpected(WardenError::io("Failed to replace license cache: " + ec.message()));
        }
        return {};
    }

    Result<void> LicenseCache::remove() const
    {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec)
            return std::unexpected(WardenError::io("Failed to delete cached license: " + ec.message()));
        return {};
    }

    fs::path default_data_directory()
    {
        fs::path base;
        if (const char *xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
            base = fs::path(xdg) / "warden";
        else if (const char *home = std::getenv("HOME"); home && *home)
            base = fs::path(home) / ".local" / "share" / "warden";

        std::error_code ec;
        if (!base.empty())
        {
            fs::create_directories(base, ec);
            if (!ec)
                return base;
        }
        auto cwd = fs::current_path(ec);
        return ec ? fs::path(".") : cwd;
    }

} // namespace warden
