#pragma once

#include <string>
#include <cstdint>

namespace koboshelf {

/**
 * Free space on the removable storage, in bytes.
 *
 * The transfer engine measures capacity at several points of a run; keeping
 * the measurement behind this interface lets tests drive it.
 */
class CapacityProbe {
public:
    virtual ~CapacityProbe() = default;
    virtual uint64_t available_bytes() = 0;
};

// statvfs(2) on a mount point: f_bavail * f_frsize. Returns 0 on error.
class StatvfsCapacityProbe : public CapacityProbe {
public:
    explicit StatvfsCapacityProbe(const std::string& mount_path);
    uint64_t available_bytes() override;

private:
    std::string mount_path_;
};

double bytes_to_mb(uint64_t bytes);

} // namespace koboshelf
