#include "device_locator.hpp"
#include "logger.hpp"
#include <gio/gio.h>
#include <gio/gunixmounts.h>
#include <filesystem>
#include <cctype>
#include <cstdlib>
#include <unistd.h>
#include <pwd.h>

namespace fs = std::filesystem;

namespace koboshelf {

std::vector<std::string> DeviceLocator::mounted_paths() {
    std::vector<std::string> paths;
    GList* mounts = g_unix_mounts_get(nullptr);
    for (GList* it = mounts; it != nullptr; it = it->next) {
        auto* entry = static_cast<GUnixMountEntry*>(it->data);
        const char* path = g_unix_mount_get_mount_path(entry);
        if (path) {
            paths.emplace_back(path);
        }
    }
    g_list_free_full(mounts, reinterpret_cast<GDestroyNotify>(g_unix_mount_free));
    Logger::debug("[DeviceLocator] " + std::to_string(paths.size()) + " mounts listed");
    return paths;
}

bool DeviceLocator::looks_like_volume_serial(const std::string& name) {
    if (name.size() != 9 || name[4] != '-') return false;
    for (size_t i = 0; i < name.size(); ++i) {
        if (i == 4) continue;
        if (!std::isxdigit(static_cast<unsigned char>(name[i]))) return false;
    }
    return true;
}

std::string DeviceLocator::pick_device_root(const std::vector<std::string>& mounts) {
    for (const auto& mount : mounts) {
        if (fs::path(mount).filename() == DEVICE_LABEL) {
            return mount;
        }
        std::error_code ec;
        if (fs::exists(fs::path(mount) / ".kobo" / "KoboReader.sqlite", ec)) {
            return mount;
        }
    }
    return "";
}

std::string DeviceLocator::pick_sdcard_root(const std::vector<std::string>& mounts, const std::string& user) {
    if (user.empty()) return "";
    const std::string prefixes[] = {"/run/media/" + user + "/", "/media/" + user + "/"};
    for (const auto& mount : mounts) {
        for (const auto& prefix : prefixes) {
            if (mount.compare(0, prefix.size(), prefix) != 0) continue;
            std::string name = mount.substr(prefix.size());
            if (name.find('/') == std::string::npos && looks_like_volume_serial(name)) {
                return mount;
            }
        }
    }
    return "";
}

std::string DeviceLocator::find_device_root() {
    std::string root = pick_device_root(mounted_paths());
    if (root.empty()) {
        Logger::debug("[DeviceLocator] No Kobo device mounted");
    } else {
        Logger::info("[DeviceLocator] Found Kobo device at " + root);
    }
    return root;
}

std::string DeviceLocator::find_sdcard_root(const std::string& user) {
    std::string root = pick_sdcard_root(mounted_paths(), user);
    if (root.empty()) {
        Logger::debug("[DeviceLocator] No SD card mounted");
    } else {
        Logger::info("[DeviceLocator] Found SD card at " + root);
    }
    return root;
}

std::string DeviceLocator::current_user() {
    const char* user = std::getenv("USER");
    if (user && *user) {
        return user;
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_name) {
        return pw->pw_name;
    }
    return "";
}

} // namespace koboshelf
