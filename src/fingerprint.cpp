#include "warden/fingerprint.hpp"
#include "warden/crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <climits>
#include <filesystem>
#include <fstream>
#include <vector>
#include <sys/utsname.h>
#include <unistd.h>

namespace fs = std::filesystem;

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

        std::string read_first_line(const fs::path &path)
        {
            std::ifstream file(path);
            if (!file.is_open())
                return {};
            std::string line;
            std::getline(file, line);
            return trim(line);
        }
    } // namespace

    DeviceAttributes FingerprintGenerator::collect()
    {
        DeviceAttributes attrs;

        struct utsname uts;
        if (uname(&uts) == 0)
        {
            attrs.hostname = uts.nodename;
            attrs.os_family = uts.sysname;
            attrs.architecture = uts.machine;
            attrs.os_version = uts.version;
            attrs.os_release = uts.release;
        }
        if (attrs.hostname.empty())
        {
            char hostname[HOST_NAME_MAX + 1];
            if (gethostname(hostname, sizeof(hostname)) == 0)
            {
                hostname[HOST_NAME_MAX] = '\0';
                attrs.hostname = hostname;
            }
        }

        attrs.mac_token = read_mac_token();
        attrs.system_uuid = read_system_uuid();
        return attrs;
    }

    std::string FingerprintGenerator::digest(const DeviceAttributes &attrs)
    {
        // os_release is reported to the server but is not part of the identity
        const std::string *components[] = {
            &attrs.hostname,
            &attrs.os_family,
            &attrs.architecture,
            &attrs.os_version,
            &attrs.mac_token,
            &attrs.system_uuid,
        };

        std::string raw;
        for (const auto *component : components)
        {
            if (component->empty())
                continue;
            if (!raw.empty())
                raw += '|';
            raw += *component;
        }
        return crypto::SHA256::to_hex(crypto::SHA256::hash(raw));
    }

    std::string FingerprintGenerator::current()
    {
        return digest(collect());
    }

    std::string FingerprintGenerator::platform_string(const DeviceAttributes &attrs)
    {
        std::string out = attrs.os_family.empty() ? "unknown" : attrs.os_family;
        if (!attrs.os_release.empty())
            out += "-" + attrs.os_release;
        if (!attrs.architecture.empty())
            out += "-" + attrs.architecture;
        return out;
    }

    std::string FingerprintGenerator::read_mac_token()
    {
        const fs::path net_dir{"/sys/class/net"};
        std::error_code ec;
        if (!fs::is_directory(net_dir, ec))
            return "mac-unknown";

        std::vector<std::string> interfaces;
        for (const auto &entry : fs::directory_iterator(net_dir, ec))
        {
            interfaces.push_back(entry.path().filename().string());
        }
        std::sort(interfaces.begin(), interfaces.end());

        for (const auto &name : interfaces)
        {
            if (name == "lo")
                continue;
            std::string mac = read_first_line(net_dir / name / "address");
            mac.erase(std::remove(mac.begin(), mac.end(), ':'), mac.end());
            if (mac.empty() || mac.find_first_not_of('0') == std::string::npos)
                continue;
            std::transform(mac.begin(), mac.end(), mac.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return "0x" + mac;
        }
        spdlog::debug("No hardware address found for fingerprint; using placeholder");
        return "mac-unknown";
    }

    std::string FingerprintGenerator::read_system_uuid()
    {
        static const char *sources[] = {
            "/sys/class/dmi/id/product_uuid",
            "/etc/machine-id",
            "/var/lib/dbus/machine-id",
        };
        for (const char *source : sources)
        {
            std::string id = read_first_line(source);
            if (!id.empty())
                return id;
        }
        spdlog::debug("No system UUID readable for fingerprint; using placeholder");
        return "uuid-unknown";
    }

} // namespace warden
