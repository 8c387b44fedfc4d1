#include "device_catalog.hpp"
#include "content_id.hpp"
#include "logger.hpp"
#include <sqlite3.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace koboshelf {

static bool dc_safe_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

const char* to_string(DeviceReadState state) {
    switch (state) {
        case DeviceReadState::Absent:  return "absent";
        case DeviceReadState::Unread:  return "unread";
        case DeviceReadState::Read:    return "read";
        case DeviceReadState::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(ReconcileOutcome outcome) {
    switch (outcome) {
        case ReconcileOutcome::NotOnDevice:      return "not-on-device";
        case ReconcileOutcome::StillUnread:      return "still-unread";
        case ReconcileOutcome::MarkedRead:       return "marked-read";
        case ReconcileOutcome::NotInLibraryRoot: return "not-in-library-root";
        case ReconcileOutcome::StorageError:     return "storage-error";
    }
    return "unknown";
}

DeviceCatalog::DeviceCatalog(const std::string& device_root, const std::string& db_relative_path)
    : device_root_(device_root), db_relative_path_(db_relative_path) {
}

DeviceCatalog::~DeviceCatalog() {
    if (db_) {
        Logger::warn("[DeviceCatalog] Destroyed while still connected - closing database");
        disconnect();
    }
}

std::string DeviceCatalog::database_path() const {
    return (fs::path(device_root_) / db_relative_path_).string();
}

bool DeviceCatalog::check_device_path() const {
    if (!dc_safe_exists(device_root_)) {
        Logger::error("[DeviceCatalog] Kobo device not found at: " + device_root_);
        return false;
    }
    return true;
}

bool DeviceCatalog::check_database() const {
    if (!dc_safe_exists(database_path())) {
        Logger::error("[DeviceCatalog] Incompatible Kobo device. Database not found at: " + database_path());
        return false;
    }
    return true;
}

bool DeviceCatalog::connect() {
    if (db_) return true;

    if (!check_database()) {
        last_error_ = SyncError::DeviceUnavailable;
        return false;
    }

    // The device database must already exist; never create one
    std::string path = database_path();
    int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE, nullptr);
    if (rc != SQLITE_OK) {
        Logger::error("[DeviceCatalog] Failed to open device database: " +
                      std::string(db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc)));
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        last_error_ = SyncError::DeviceUnavailable;
        return false;
    }
    sqlite3_busy_timeout(db_, 5000);

    last_error_ = SyncError::None;
    Logger::info("[DeviceCatalog] Connected to database: " + path);
    return true;
}

bool DeviceCatalog::disconnect() {
    if (!db_) return false;

    int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
        Logger::error("[DeviceCatalog] Failed to close database: " + std::string(sqlite3_errmsg(db_)));
        return false;
    }
    db_ = nullptr;
    Logger::info("[DeviceCatalog] Disconnected from database");
    return true;
}

std::optional<std::string> DeviceCatalog::content_id_for(const std::vector<std::string>& library_roots,
                                                         const std::string& directory,
                                                         const std::string& name,
                                                         const std::string& extension) const {
    auto id = content_id::make(library_roots, directory, name, extension);
    if (!id) {
        Logger::error("[DeviceCatalog] File path " + directory + " is not in any library path");
    }
    return id;
}

bool DeviceCatalog::lookup_read_status(const std::string& content_id, int& status, bool& found) const {
    found = false;
    if (!db_) {
        Logger::error("[DeviceCatalog] Not connected to device database");
        return false;
    }

    const char* sql = "SELECT ReadStatus FROM content WHERE ContentID = ?";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("[DeviceCatalog] Error executing query: " + std::string(sqlite3_errmsg(db_)));
        return false;
    }
    sqlite3_bind_text(stmt, 1, content_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        found = true;
        status = sqlite3_column_int(stmt, 0);
    } else if (rc != SQLITE_DONE) {
        Logger::error("[DeviceCatalog] Error executing query: " + std::string(sqlite3_errmsg(db_)));
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

DeviceReadState DeviceCatalog::read_state(const std::string& content_id) const {
    int status = 0;
    bool found = false;
    if (!lookup_read_status(content_id, status, found)) {
        return DeviceReadState::Unknown;
    }
    if (!found) {
        Logger::info("[DeviceCatalog] Book " + content_id + " does not exist in Kobo database");
        return DeviceReadState::Absent;
    }
    Logger::info("[DeviceCatalog] Book " + content_id + " exists in Kobo database. Read status: " +
                 std::to_string(status));
    return status == READ_STATUS_UNREAD ? DeviceReadState::Unread : DeviceReadState::Read;
}

bool DeviceCatalog::is_unread_on_device(const std::vector<std::string>& library_roots,
                                        const std::string& directory,
                                        const std::string& name,
                                        const std::string& extension) const {
    auto id = content_id_for(library_roots, directory, name, extension);
    if (!id) return false;
    return read_state(*id) == DeviceReadState::Unread;
}

ReconcileOutcome DeviceCatalog::reconcile_read_book(LibraryCatalog& library,
                                                    const std::vector<std::string>& library_roots,
                                                    const BookRecord& book,
                                                    const std::string& working_root) {
    auto id = content_id_for(library_roots, book.directory, book.name, book.extension);
    if (!id) {
        return ReconcileOutcome::NotInLibraryRoot;
    }

    DeviceReadState state = read_state(*id);
    if (state == DeviceReadState::Absent || state == DeviceReadState::Unknown) {
        Logger::debug("[DeviceCatalog] Book " + *id + " not found in Kobo database");
        return ReconcileOutcome::NotOnDevice;
    }
    if (state == DeviceReadState::Unread) {
        Logger::info("[DeviceCatalog] Book " + *id + " is not marked as read in Kobo database");
        return ReconcileOutcome::StillUnread;
    }

    Logger::info("[DeviceCatalog] Book " + *id +
                 " is marked as read in Kobo database. Updating local library and deleting file from sdcard.");

    if (!library.mark_read(book.directory, book.name, book.extension)) {
        // SD card copy stays until the read flag is stored
        Logger::error("[DeviceCatalog] Could not record " + LibraryCatalog::full_path(book) +
                      " as read; keeping SD card copy");
        return ReconcileOutcome::StorageError;
    }

    auto destination = content_id::destination_directory(library_roots, book.directory, working_root);
    std::string file_to_delete = *destination + "/" + book.name + "." + book.extension;

    std::error_code ec;
    if (!fs::exists(file_to_delete, ec)) {
        Logger::warn("[DeviceCatalog] File not found on SD card: " + file_to_delete);
        return ReconcileOutcome::MarkedRead;
    }
    if (!fs::remove(file_to_delete, ec) || ec) {
        Logger::error("[DeviceCatalog] Error deleting file " + file_to_delete + ": " +
                      (ec ? ec.message() : std::string("not removed")));
        return ReconcileOutcome::MarkedRead;
    }
    Logger::info("[DeviceCatalog] Deleted file from SD card: " + file_to_delete);
    return ReconcileOutcome::MarkedRead;
}

std::vector<std::pair<std::string, int>> DeviceCatalog::list_managed_content() const {
    std::vector<std::pair<std::string, int>> results;
    if (!db_) {
        Logger::error("[DeviceCatalog] Not connected to device database");
        return results;
    }

    const char* sql = R"(
        SELECT ContentID, ReadStatus
        FROM content
        WHERE ContentType IN (1, 6, 14, 15, 16, 19) AND ContentID LIKE ?
        ORDER BY ContentID
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("[DeviceCatalog] Error executing query: " + std::string(sqlite3_errmsg(db_)));
        return results;
    }
    std::string pattern = std::string(content_id::DEVICE_PREFIX) + "%";
    sqlite3_bind_text(stmt, 1, pattern.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        results.emplace_back(id ? id : "", sqlite3_column_int(stmt, 1));
    }
    sqlite3_finalize(stmt);
    return results;
}

} // namespace koboshelf
