#include "config.hpp"
#include "device_locator.hpp"
#include "library_catalog.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace koboshelf {

static const char* const REQUIRED_KEYS[] = {
    "device.path", "device.db", "device.sdcard", "library.db"
};

static const char* const REQUIRED_LISTS[] = {
    "library.paths", "library.transferable_formats"
};

Config::Config(const std::string& config_dir)
    : config_dir_(expand_user(config_dir)) {
}

std::string Config::config_path() const {
    return (fs::path(config_dir_) / "settings.json").string();
}

std::string Config::expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;  // ~otheruser is left alone
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

std::string Config::default_config_dir() {
    return expand_user("~/.config/koboshelf");
}

void Config::ensure_defaults() {
    const std::string user = DeviceLocator::current_user();

    if (settings_.find("device.path") == settings_.end()) {
        std::string found = DeviceLocator::find_device_root();
        settings_["device.path"] = found.empty() ? "/run/media/" + user + "/KOBOeReader" : found;
    }
    if (settings_.find("device.db") == settings_.end())
        settings_["device.db"] = ".kobo/KoboReader.sqlite";
    if (settings_.find("device.sdcard") == settings_.end()) {
        std::string found = DeviceLocator::find_sdcard_root(user);
        settings_["device.sdcard"] = found.empty() ? "/run/media/" + user + "/23E1-32E8" : found;
    }
    if (settings_.find("library.db") == settings_.end())
        settings_["library.db"] = "~/.config/koboshelf/koboshelf.sqlite";
    if (lists_.find("library.paths") == lists_.end())
        lists_["library.paths"] = {"~/Documents"};
    if (lists_.find("library.transferable_formats") == lists_.end())
        lists_["library.transferable_formats"] = {"epub", "mobi", "azw3", "cbz", "pdf"};
    if (lists_.find("transfer.container_formats") == lists_.end())
        lists_["transfer.container_formats"] = {"zip", "rar"};
    if (settings_.find("transfer.settle_delay_ms") == settings_.end())
        settings_["transfer.settle_delay_ms"] = "1000";
    if (settings_.find("transfer.verify_copies") == settings_.end())
        settings_["transfer.verify_copies"] = "false";
}

bool Config::load() {
    std::ifstream file(config_path());
    if (!file.is_open()) {
        Logger::info("[Config] No settings file at " + config_path() + ", writing defaults");
        ensure_defaults();
        return save();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!parse(buffer.str())) {
        Logger::error("[Config] Malformed settings file: " + config_path());
        return false;
    }

    ensure_defaults();
    Logger::info("[Config] Loaded " + std::to_string(settings_.size() + lists_.size()) +
                 " settings from " + config_path());
    return true;
}

bool Config::save() const {
    std::error_code ec;
    fs::create_directories(config_dir_, ec);
    if (ec) {
        Logger::error("[Config] Cannot create " + config_dir_ + ": " + ec.message());
        return false;
    }

    std::ofstream file(config_path());
    if (!file.is_open()) {
        Logger::error("[Config] Failed to open settings file for writing: " + config_path());
        return false;
    }
    file << serialize();
    if (!file) {
        Logger::error("[Config] Failed to write " + config_path());
        return false;
    }
    Logger::info("[Config] Saved settings to " + config_path());
    return true;
}

bool Config::validate() const {
    bool ok = true;
    for (const char* key : REQUIRED_KEYS) {
        if (get_string(key).empty()) {
            Logger::error(std::string("[Config] Missing required setting: ") + key);
            ok = false;
        }
    }
    for (const char* key : REQUIRED_LISTS) {
        if (get_list(key).empty()) {
            Logger::error(std::string("[Config] Missing required setting: ") + key);
            ok = false;
        }
    }
    return ok;
}

// ---- Parsing ----

namespace {

class Reader {
public:
    explicit Reader(const std::string& text) : text_(text) {}

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) pos_++;
    }

    bool consume(char c) {
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == c) {
            pos_++;
            return true;
        }
        return false;
    }

    bool peek(char c) {
        skip_ws();
        return pos_ < text_.size() && text_[pos_] == c;
    }

    bool at_end() {
        skip_ws();
        return pos_ >= text_.size();
    }

    bool read_string(std::string& out) {
        if (!consume('"')) return false;
        out.clear();
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') return true;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) return false;
            char e = text_[pos_++];
            switch (e) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                default: return false;
            }
        }
        return false;
    }

    // Number, true, false or null as raw text
    bool read_scalar(std::string& out) {
        skip_ws();
        size_t start = pos_;
        while (pos_ < text_.size() && text_[pos_] != ',' && text_[pos_] != '}' && text_[pos_] != ']' &&
               !std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            pos_++;
        }
        out = text_.substr(start, pos_ - start);
        return !out.empty();
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
};

std::string escape(const std::string& value) {
    std::string out;
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default: out += c;
        }
    }
    return out;
}

} // namespace

bool Config::parse(const std::string& content) {
    Reader in(content);
    if (!in.consume('{')) return false;
    if (in.consume('}')) return in.at_end();

    do {
        std::string key;
        if (!in.read_string(key) || !in.consume(':')) return false;

        if (in.peek('"')) {
            std::string value;
            if (!in.read_string(value)) return false;
            settings_[key] = value;
            lists_.erase(key);
        } else if (in.consume('[')) {
            std::vector<std::string> values;
            if (!in.consume(']')) {
                do {
                    std::string item;
                    if (!in.read_string(item)) return false;
                    values.push_back(item);
                } while (in.consume(','));
                if (!in.consume(']')) return false;
            }
            lists_[key] = values;
            settings_.erase(key);
        } else {
            std::string value;
            if (!in.read_scalar(value)) return false;
            settings_[key] = value;
            lists_.erase(key);
        }
    } while (in.consume(','));

    return in.consume('}') && in.at_end();
}

std::string Config::serialize() const {
    std::map<std::string, std::string> lines;
    for (const auto& [key, value] : settings_) {
        bool is_numeric = !value.empty() &&
            value.find_first_not_of("-0123456789") == std::string::npos && value != "-";
        bool is_bool = (value == "true" || value == "false");
        if (is_numeric || is_bool) {
            lines[key] = value;
        } else {
            lines[key] = "\"" + escape(value) + "\"";
        }
    }
    for (const auto& [key, values] : lists_) {
        std::string line = "[";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) line += ", ";
            line += "\"" + escape(values[i]) + "\"";
        }
        lines[key] = line + "]";
    }

    std::string out = "{\n";
    bool first = true;
    for (const auto& [key, value] : lines) {
        if (!first) out += ",\n";
        first = false;
        out += "  \"" + escape(key) + "\": " + value;
    }
    out += "\n}\n";
    return out;
}

// ---- Accessors ----

bool Config::has(const std::string& key) const {
    return settings_.count(key) > 0 || lists_.count(key) > 0;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto it = settings_.find(key);
    if (it != settings_.end()) {
        return it->second;
    }
    return default_value;
}

void Config::set_string(const std::string& key, const std::string& value) {
    settings_[key] = value;
}

int Config::get_int(const std::string& key, int default_value) const {
    std::string str = get_string(key, "");
    if (str.empty()) return default_value;
    try {
        return std::stoi(str);
    } catch (const std::exception&) {
        Logger::warn("[Config] Not a number for " + key + ": " + str);
        return default_value;
    }
}

void Config::set_int(const std::string& key, int value) {
    set_string(key, std::to_string(value));
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    std::string str = get_string(key, "");
    if (str.empty()) return default_value;
    return (str == "true" || str == "1" || str == "yes");
}

void Config::set_bool(const std::string& key, bool value) {
    set_string(key, value ? "true" : "false");
}

std::vector<std::string> Config::get_list(const std::string& key) const {
    auto it = lists_.find(key);
    if (it != lists_.end()) {
        return it->second;
    }
    return {};
}

void Config::set_list(const std::string& key, const std::vector<std::string>& values) {
    lists_[key] = values;
}

std::string Config::device_path() const {
    return expand_user(get_string("device.path"));
}

std::string Config::device_db() const {
    return get_string("device.db", ".kobo/KoboReader.sqlite");
}

std::string Config::sdcard_path() const {
    return expand_user(get_string("device.sdcard"));
}

std::string Config::library_db() const {
    return expand_user(get_string("library.db"));
}

std::vector<std::string> Config::library_paths() const {
    std::vector<std::string> paths;
    for (const auto& path : get_list("library.paths")) {
        paths.push_back(expand_user(path));
    }
    return paths;
}

static std::set<std::string> to_extension_set(const std::vector<std::string>& values) {
    std::set<std::string> out;
    for (auto value : values) {
        if (!value.empty() && value[0] == '.') value.erase(0, 1);
        if (!value.empty()) out.insert(LibraryCatalog::to_lower(value));
    }
    return out;
}

std::set<std::string> Config::transferable_formats() const {
    return to_extension_set(get_list("library.transferable_formats"));
}

std::set<std::string> Config::container_formats() const {
    if (!has("transfer.container_formats")) return {"zip", "rar"};
    return to_extension_set(get_list("transfer.container_formats"));
}

std::chrono::milliseconds Config::settle_delay() const {
    int ms = get_int("transfer.settle_delay_ms", 1000);
    return std::chrono::milliseconds(ms < 0 ? 0 : ms);
}

bool Config::verify_copies() const {
    return get_bool("transfer.verify_copies", false);
}

} // namespace koboshelf
