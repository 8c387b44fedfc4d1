#pragma once

#include <string>
#include <vector>
#include <set>
#include <map>
#include <chrono>

namespace koboshelf {

/**
 * Configuration
 *
 * Flat JSON object stored in <config_dir>/settings.json:
 *   {
 *     "device.path": "/run/media/me/KOBOeReader",
 *     "library.paths": ["~/Documents", "~/Comics"],
 *     "transfer.settle_delay_ms": 1000,
 *     ...
 *   }
 * Values are strings, numbers, booleans or arrays of strings. A missing file
 * is generated from defaults (mounted reader and SD card if they can be found).
 */
class Config {
public:
    explicit Config(const std::string& config_dir);

    // Read the file; generate and write defaults when it does not exist
    bool load();
    bool save() const;

    // All required keys present and non-empty
    bool validate() const;

    // Parse a settings document into this object (existing keys overwritten)
    bool parse(const std::string& content);
    std::string serialize() const;

    // Typed accessors
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    void set_string(const std::string& key, const std::string& value);

    int get_int(const std::string& key, int default_value = 0) const;
    void set_int(const std::string& key, int value);

    bool get_bool(const std::string& key, bool default_value = false) const;
    void set_bool(const std::string& key, bool value);

    std::vector<std::string> get_list(const std::string& key) const;
    void set_list(const std::string& key, const std::vector<std::string>& values);

    bool has(const std::string& key) const;

    // Convenience views, paths with ~ expanded
    std::string device_path() const;
    std::string device_db() const;
    std::string sdcard_path() const;
    std::string library_db() const;
    std::vector<std::string> library_paths() const;
    std::set<std::string> transferable_formats() const;
    std::set<std::string> container_formats() const;
    std::chrono::milliseconds settle_delay() const;
    bool verify_copies() const;

    const std::string& config_dir() const { return config_dir_; }
    std::string config_path() const;

    // ~ and ~/... against $HOME
    static std::string expand_user(const std::string& path);
    static std::string default_config_dir();

private:
    void ensure_defaults();

    std::string config_dir_;
    std::map<std::string, std::string> settings_;
    std::map<std::string, std::vector<std::string>> lists_;
};

} // namespace koboshelf
