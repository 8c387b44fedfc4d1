#ifndef KOBOSHELF_LIBRARY_CATALOG_HPP
#define KOBOSHELF_LIBRARY_CATALOG_HPP

#include "sync_error.hpp"

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <utility>
#include <cstdint>

struct sqlite3;

namespace koboshelf {

/**
 * LibraryCatalog - SQLite-backed inventory of the books found on the host
 *
 * Features:
 * - Records every book file ever seen under the configured library roots
 * - Never removes rows; books missing from disk are soft-deleted and
 *   restored (read flag intact) when they reappear
 * - Tracks the read flag reported back from the device and whether the
 *   format is configured as transferable
 *
 * Usage:
 *   LibraryCatalog library("~/.config/koboshelf/koboshelf.sqlite");
 *   library.connect();
 *   library.scan(roots, LibraryCatalog::supported_formats(), transferable);
 *   auto books = library.list_active(true);
 */

struct BookRecord {
    std::string directory;      // Absolute path of the containing folder
    std::string name;           // File name without extension
    std::string extension;      // Extension as found on disk, no dot
    bool read = false;
    bool deleted = false;
    bool transferable = false;
};

struct CatalogStats {
    int64_t total = 0;
    int64_t active = 0;
    int64_t deleted = 0;
    int64_t read = 0;
    int64_t transferable = 0;
};

class LibraryCatalog {
public:
    // (directory, name) - extension is not part of the scan/lookup identity
    using BookKey = std::pair<std::string, std::string>;

    explicit LibraryCatalog(const std::string& db_path);
    ~LibraryCatalog();

    LibraryCatalog(const LibraryCatalog&) = delete;
    LibraryCatalog& operator=(const LibraryCatalog&) = delete;

    // Open the store, creating its directory and schema on first use
    bool connect();
    bool disconnect();
    bool is_connected() const { return db_ != nullptr; }

    // Walk every root (in order) and bring the catalog in line with disk.
    // Extensions are compared case-insensitively and given without the dot.
    bool scan(const std::vector<std::string>& roots,
              const std::set<std::string>& supported_extensions,
              const std::set<std::string>& transferable_extensions);

    // Non-deleted books in insertion order
    std::vector<BookRecord> list_active(bool transferable_only = false) const;

    std::vector<BookRecord> list_all() const;

    std::optional<BookRecord> find(const std::string& directory,
                                   const std::string& name,
                                   const std::string& extension) const;

    // Sets read=1 for the exact (directory, name, extension) row
    bool mark_read(const std::string& directory,
                   const std::string& name,
                   const std::string& extension);

    CatalogStats stats() const;

    SyncError last_error() const { return last_error_; }
    const std::string& db_path() const { return db_path_; }

    // The one place the identity key policy lives
    static BookKey book_key(const std::string& directory, const std::string& name);

    static std::string full_path(const std::string& directory,
                                 const std::string& name,
                                 const std::string& extension);
    static std::string full_path(const BookRecord& book);

    // Size in bytes, 0 if the file is absent
    static uint64_t book_size(const std::string& directory,
                              const std::string& name,
                              const std::string& extension);
    static uint64_t book_size(const BookRecord& book);

    // epub, mobi, pdf, azw3, cbz, zip, rar
    static const std::set<std::string>& supported_formats();

    static std::string to_lower(const std::string& value);

private:
    bool create_tables();
    bool exec(const char* sql);
    bool insert_or_restore(const std::string& directory,
                           const std::string& name,
                           const std::string& extension,
                           bool transferable);
    bool mark_deleted(const BookKey& key);
    std::vector<BookRecord> query_books(const char* sql) const;

    sqlite3* db_ = nullptr;
    std::string db_path_;
    SyncError last_error_ = SyncError::None;
};

} // namespace koboshelf

#endif // KOBOSHELF_LIBRARY_CATALOG_HPP
