#include "library_catalog.hpp"
#include "logger.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <map>

namespace fs = std::filesystem;

namespace koboshelf {

// Safe filesystem helpers using error_code to prevent exceptions on I/O errors
static bool lc_safe_is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

static std::string column_text(sqlite3_stmt* stmt, int column) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? text : "";
}

static BookRecord read_book_row(sqlite3_stmt* stmt) {
    BookRecord book;
    book.directory = column_text(stmt, 0);
    book.name = column_text(stmt, 1);
    book.extension = column_text(stmt, 2);
    book.read = sqlite3_column_int(stmt, 3) != 0;
    book.deleted = sqlite3_column_int(stmt, 4) != 0;
    book.transferable = sqlite3_column_int(stmt, 5) != 0;
    return book;
}

LibraryCatalog::LibraryCatalog(const std::string& db_path)
    : db_path_(db_path) {
}

LibraryCatalog::~LibraryCatalog() {
    if (db_) {
        Logger::warn("[LibraryCatalog] Destroyed while still connected - closing database");
        disconnect();
    }
}

bool LibraryCatalog::connect() {
    if (db_) return true;  // Already connected

    Logger::info("[LibraryCatalog] Opening library database at: " + db_path_);

    fs::path db_dir = fs::path(db_path_).parent_path();
    if (!db_dir.empty() && !lc_safe_is_directory(db_dir.string())) {
        std::error_code ec;
        fs::create_directories(db_dir, ec);
        if (ec) {
            Logger::error("[LibraryCatalog] Cannot create database directory " + db_dir.string() +
                          ": " + ec.message());
            last_error_ = SyncError::StorageUnavailable;
            return false;
        }
    }

    int rc = sqlite3_open_v2(db_path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        Logger::error("[LibraryCatalog] Failed to open database: " +
                      std::string(db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc)));
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        last_error_ = SyncError::StorageUnavailable;
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        last_error_ = SyncError::StorageUnavailable;
        return false;
    }

    last_error_ = SyncError::None;
    Logger::info("[LibraryCatalog] Connected to library database");
    return true;
}

bool LibraryCatalog::disconnect() {
    if (!db_) return false;

    int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
        Logger::error("[LibraryCatalog] Failed to close database: " + std::string(sqlite3_errmsg(db_)));
        return false;
    }
    db_ = nullptr;
    Logger::info("[LibraryCatalog] Disconnected from library database");
    return true;
}

bool LibraryCatalog::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        Logger::error("[LibraryCatalog] SQL failed: " + std::string(err ? err : sqlite3_errmsg(db_)));
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

bool LibraryCatalog::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS books (
            file_path TEXT,
            file_name TEXT,
            file_extension TEXT,
            read BOOLEAN DEFAULT FALSE,
            deleted BOOLEAN DEFAULT FALSE,
            transferable BOOLEAN DEFAULT FALSE,
            UNIQUE(file_path, file_name, file_extension)
        );

        CREATE INDEX IF NOT EXISTS idx_books_read ON books(read);
        CREATE INDEX IF NOT EXISTS idx_books_path_name ON books(file_path, file_name);
        CREATE INDEX IF NOT EXISTS idx_books_deleted ON books(deleted);
        CREATE INDEX IF NOT EXISTS idx_books_transferable ON books(transferable);
    )";

    if (!exec(sql)) {
        Logger::error("[LibraryCatalog] Failed to create schema");
        return false;
    }
    return true;
}

LibraryCatalog::BookKey LibraryCatalog::book_key(const std::string& directory, const std::string& name) {
    return BookKey(directory, name);
}

std::string LibraryCatalog::to_lower(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

const std::set<std::string>& LibraryCatalog::supported_formats() {
    static const std::set<std::string> formats = {
        "epub", "mobi", "pdf", "azw3", "cbz", "zip", "rar"
    };
    return formats;
}

std::string LibraryCatalog::full_path(const std::string& directory,
                                      const std::string& name,
                                      const std::string& extension) {
    return directory + "/" + name + "." + extension;
}

std::string LibraryCatalog::full_path(const BookRecord& book) {
    return full_path(book.directory, book.name, book.extension);
}

uint64_t LibraryCatalog::book_size(const std::string& directory,
                                   const std::string& name,
                                   const std::string& extension) {
    std::error_code ec;
    auto size = fs::file_size(full_path(directory, name, extension), ec);
    if (ec) return 0;
    return static_cast<uint64_t>(size);
}

uint64_t LibraryCatalog::book_size(const BookRecord& book) {
    return book_size(book.directory, book.name, book.extension);
}

bool LibraryCatalog::insert_or_restore(const std::string& directory,
                                       const std::string& name,
                                       const std::string& extension,
                                       bool transferable) {
    const char* insert_sql = R"(
        INSERT OR IGNORE INTO books (file_path, file_name, file_extension, deleted, transferable)
        VALUES (?, ?, ?, 0, ?)
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("[LibraryCatalog] Failed to prepare insert: " + std::string(sqlite3_errmsg(db_)));
        return false;
    }
    sqlite3_bind_text(stmt, 1, directory.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, extension.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, transferable ? 1 : 0);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        Logger::error("[LibraryCatalog] Insert failed for " + full_path(directory, name, extension) +
                      ": " + sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_changes(db_) > 0) {
        Logger::info("[LibraryCatalog] Added book to library: " + full_path(directory, name, extension));
        return true;
    }

    // Row already known: report a restore, then clear deleted and refresh transferable
    const char* select_sql = "SELECT deleted FROM books WHERE file_path = ? AND file_name = ?";
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("[LibraryCatalog] Failed to prepare lookup: " + std::string(sqlite3_errmsg(db_)));
        return false;
    }
    sqlite3_bind_text(stmt, 1, directory.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    bool was_deleted = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        was_deleted = sqlite3_column_int(stmt, 0) != 0;
    }
    sqlite3_finalize(stmt);

    if (was_deleted) {
        Logger::info("[LibraryCatalog] Book restored: " + full_path(directory, name, extension));
    }

    const char* update_sql = "UPDATE books SET deleted = 0, transferable = ? WHERE file_path = ? AND file_name = ?";
    if (sqlite3_prepare_v2(db_, update_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("[LibraryCatalog] Failed to prepare update: " + std::string(sqlite3_errmsg(db_)));
        return false;
    }
    sqlite3_bind_int(stmt, 1, transferable ? 1 : 0);
    sqlite3_bind_text(stmt, 2, directory.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, name.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        Logger::error("[LibraryCatalog] Update failed for " + full_path(directory, name, extension) +
                      ": " + sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool LibraryCatalog::mark_deleted(const BookKey& key) {
    const char* sql = "UPDATE books SET deleted = 1 WHERE file_path = ? AND file_name = ?";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("[LibraryCatalog] Failed to prepare delete mark: " + std::string(sqlite3_errmsg(db_)));
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.first.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, key.second.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        Logger::error("[LibraryCatalog] Failed to mark deleted: " + key.first + "/" + key.second +
                      ": " + sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool LibraryCatalog::scan(const std::vector<std::string>& roots,
                          const std::set<std::string>& supported_extensions,
                          const std::set<std::string>& transferable_extensions) {
    if (!db_) {
        Logger::error("[LibraryCatalog] Not connected to library database");
        last_error_ = SyncError::StorageError;
        return false;
    }

    Logger::info("[LibraryCatalog] Scanning library paths for ebook files...");

    std::set<std::string> supported;
    for (const auto& ext : supported_extensions) supported.insert(to_lower(ext));
    std::set<std::string> transferable;
    for (const auto& ext : transferable_extensions) transferable.insert(to_lower(ext));

    // Every cataloged key, mapped to whether any of its rows is still active
    std::map<BookKey, bool> remaining;
    {
        const char* sql = "SELECT file_path, file_name, deleted FROM books";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            Logger::error("[LibraryCatalog] Failed to read catalog: " + std::string(sqlite3_errmsg(db_)));
            last_error_ = SyncError::StorageError;
            return false;
        }
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            BookKey key = book_key(column_text(stmt, 0), column_text(stmt, 1));
            bool active = sqlite3_column_int(stmt, 2) == 0;
            remaining[key] = remaining[key] || active;
        }
        sqlite3_finalize(stmt);
    }

    if (!exec("BEGIN TRANSACTION;")) {
        last_error_ = SyncError::StorageError;
        return false;
    }

    auto abort_scan = [this]() {
        exec("ROLLBACK;");
        last_error_ = SyncError::StorageError;
        Logger::error("[LibraryCatalog] Scan aborted, catalog left unchanged");
        return false;
    };

    std::set<BookKey> processed;
    int added_or_updated = 0;

    try {
        for (const auto& root : roots) {
            if (!lc_safe_is_directory(root)) {
                Logger::warn("[LibraryCatalog] Library path does not exist: " + root);
                continue;
            }

            std::vector<fs::path> files;
            std::error_code ec;
            fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
            if (ec) {
                Logger::warn("[LibraryCatalog] Cannot walk library path " + root + ": " + ec.message());
                continue;
            }
            for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (ec) {
                    Logger::warn("[LibraryCatalog] Walk error under " + root + ": " + ec.message());
                    ec.clear();
                    continue;
                }
                std::error_code type_ec;
                if (it->is_regular_file(type_ec)) {
                    files.push_back(it->path());
                }
            }
            if (ec) {
                Logger::warn("[LibraryCatalog] Walk of " + root + " ended early: " + ec.message());
            }

            std::sort(files.begin(), files.end());

            for (const auto& file : files) {
                std::string ext = file.extension().string();
                if (ext.size() < 2) continue;
                ext = ext.substr(1);
                if (supported.find(to_lower(ext)) == supported.end()) continue;

                std::string directory = file.parent_path().string();
                std::string name = file.stem().string();
                BookKey key = book_key(directory, name);

                // First file observed for a key wins within one pass
                if (processed.count(key)) continue;

                remaining.erase(key);
                bool is_transferable = transferable.count(to_lower(ext)) > 0;
                if (!insert_or_restore(directory, name, ext, is_transferable)) {
                    return abort_scan();
                }
                processed.insert(key);
                added_or_updated++;
            }
        }

        // Keys not observed this pass are gone from disk
        for (const auto& entry : remaining) {
            if (entry.second) {
                Logger::warn("[LibraryCatalog] Book not found on disk: " +
                             entry.first.first + "/" + entry.first.second);
            }
            if (!mark_deleted(entry.first)) {
                return abort_scan();
            }
        }
    } catch (const std::exception& e) {
        Logger::error("[LibraryCatalog] Scan failed: " + std::string(e.what()));
        return abort_scan();
    }

    if (!exec("COMMIT;")) {
        return abort_scan();
    }

    last_error_ = SyncError::None;
    Logger::info("[LibraryCatalog] Finished scanning library paths: " + std::to_string(added_or_updated) +
                 " books present, " + std::to_string(remaining.size()) + " missing");
    return true;
}

std::vector<BookRecord> LibraryCatalog::query_books(const char* sql) const {
    std::vector<BookRecord> results;
    if (!db_) {
        Logger::error("[LibraryCatalog] Not connected to library database");
        return results;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("[LibraryCatalog] Query failed: " + std::string(sqlite3_errmsg(db_)));
        return results;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(read_book_row(stmt));
    }

    sqlite3_finalize(stmt);
    return results;
}

std::vector<BookRecord> LibraryCatalog::list_active(bool transferable_only) const {
    if (transferable_only) {
        return query_books(R"(
            SELECT file_path, file_name, file_extension, read, deleted, transferable
            FROM books
            WHERE deleted = 0 AND transferable = 1
            ORDER BY rowid
        )");
    }
    return query_books(R"(
        SELECT file_path, file_name, file_extension, read, deleted, transferable
        FROM books
        WHERE deleted = 0
        ORDER BY rowid
    )");
}

std::vector<BookRecord> LibraryCatalog::list_all() const {
    return query_books(R"(
        SELECT file_path, file_name, file_extension, read, deleted, transferable
        FROM books
        ORDER BY rowid
    )");
}

std::optional<BookRecord> LibraryCatalog::find(const std::string& directory,
                                               const std::string& name,
                                               const std::string& extension) const {
    if (!db_) return std::nullopt;

    const char* sql = R"(
        SELECT file_path, file_name, file_extension, read, deleted, transferable
        FROM books
        WHERE file_path = ? AND file_name = ? AND file_extension = ?
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("[LibraryCatalog] Lookup failed: " + std::string(sqlite3_errmsg(db_)));
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, directory.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, extension.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<BookRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_book_row(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool LibraryCatalog::mark_read(const std::string& directory,
                               const std::string& name,
                               const std::string& extension) {
    if (!db_) {
        Logger::error("[LibraryCatalog] Not connected to library database");
        last_error_ = SyncError::StorageError;
        return false;
    }

    const char* sql = "UPDATE books SET read = 1 WHERE file_path = ? AND file_name = ? AND file_extension = ?";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("[LibraryCatalog] Failed to prepare mark_read: " + std::string(sqlite3_errmsg(db_)));
        last_error_ = SyncError::StorageError;
        return false;
    }
    sqlite3_bind_text(stmt, 1, directory.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, extension.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        Logger::error("[LibraryCatalog] Failed to mark read: " + full_path(directory, name, extension) +
                      ": " + sqlite3_errmsg(db_));
        last_error_ = SyncError::StorageError;
        return false;
    }

    Logger::debug("[LibraryCatalog] Marked read: " + full_path(directory, name, extension));
    return true;
}

CatalogStats LibraryCatalog::stats() const {
    CatalogStats stats;
    if (!db_) return stats;

    const char* sql = R"(
        SELECT
            COUNT(*),
            SUM(CASE WHEN deleted = 0 THEN 1 ELSE 0 END),
            SUM(CASE WHEN deleted = 1 THEN 1 ELSE 0 END),
            SUM(CASE WHEN read = 1 THEN 1 ELSE 0 END),
            SUM(CASE WHEN transferable = 1 THEN 1 ELSE 0 END)
        FROM books
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            stats.total = sqlite3_column_int64(stmt, 0);
            stats.active = sqlite3_column_int64(stmt, 1);
            stats.deleted = sqlite3_column_int64(stmt, 2);
            stats.read = sqlite3_column_int64(stmt, 3);
            stats.transferable = sqlite3_column_int64(stmt, 4);
        }
        sqlite3_finalize(stmt);
    }
    return stats;
}

} // namespace koboshelf
