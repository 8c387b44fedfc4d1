#ifndef KOBOSHELF_DEVICE_LOCATOR_HPP
#define KOBOSHELF_DEVICE_LOCATOR_HPP

#include <string>
#include <vector>

namespace koboshelf {

/**
 * DeviceLocator - finds the reader and its SD card among mounted volumes
 *
 * Problem: udisks mounts the reader's internal storage as
 * /run/media/<user>/KOBOeReader, but the SD card gets its FAT volume serial
 * (e.g. 23E1-32E8) as mount name, which differs per card.
 *
 * Solution: list mounts through GIO and pick them by name pattern. Only used
 * to fill defaults when a configuration file is first generated.
 */
class DeviceLocator {
public:
    static constexpr const char* DEVICE_LABEL = "KOBOeReader";

    // Mount paths from the system mount table (g_unix_mounts_get)
    static std::vector<std::string> mounted_paths();

    // Empty string when nothing matches
    static std::string find_device_root();
    static std::string find_sdcard_root(const std::string& user);

    // Pure selection over a list of mount paths, in mount table order
    static std::string pick_device_root(const std::vector<std::string>& mounts);
    static std::string pick_sdcard_root(const std::vector<std::string>& mounts, const std::string& user);

    // XXXX-XXXX, hex digits
    static bool looks_like_volume_serial(const std::string& name);

    // $USER, falling back to getpwuid()
    static std::string current_user();
};

} // namespace koboshelf

#endif // KOBOSHELF_DEVICE_LOCATOR_HPP
