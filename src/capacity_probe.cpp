#include "capacity_probe.hpp"
#include "logger.hpp"
#include <sys/statvfs.h>
#include <cerrno>
#include <cmath>
#include <cstring>

namespace koboshelf {

StatvfsCapacityProbe::StatvfsCapacityProbe(const std::string& mount_path)
    : mount_path_(mount_path) {
}

uint64_t StatvfsCapacityProbe::available_bytes() {
    struct statvfs stat;
    if (statvfs(mount_path_.c_str(), &stat) != 0) {
        if (errno == ENOENT) {
            Logger::error("[Capacity] SD card path not found: " + mount_path_);
        } else {
            Logger::error("[Capacity] Error getting available space on " + mount_path_ +
                          ": " + std::strerror(errno));
        }
        return 0;
    }

    uint64_t available = static_cast<uint64_t>(stat.f_bavail) * static_cast<uint64_t>(stat.f_frsize);
    Logger::debug("[Capacity] Available space on SD card: " + std::to_string(bytes_to_mb(available)) + " MB");
    return available;
}

double bytes_to_mb(uint64_t bytes) {
    return std::round(static_cast<double>(bytes) / (1024.0 * 1024.0) * 100.0) / 100.0;
}

} // namespace koboshelf
