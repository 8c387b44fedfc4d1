#ifndef KOBOSHELF_DEVICE_CATALOG_HPP
#define KOBOSHELF_DEVICE_CATALOG_HPP

#include "library_catalog.hpp"
#include "sync_error.hpp"

#include <string>
#include <vector>
#include <optional>
#include <utility>

struct sqlite3;

namespace koboshelf {

/**
 * DeviceCatalog - view over the Kobo's own content database
 *
 * Problem: the reader keeps its own record of every book it has indexed,
 * keyed by a file:// URI, with a ReadStatus column. The library only knows
 * host paths.
 *
 * Solution: derive the reader's content identifier from the host path (see
 * content_id.hpp), look up ReadStatus, and once a book is finished record it
 * as read locally and delete the copy from the SD card.
 *
 * Rows in the device database are never written.
 */

// Three-way view of a content row; Unknown means the lookup itself failed
enum class DeviceReadState {
    Absent,
    Unread,     // ReadStatus == 0
    Read,       // any other ReadStatus (finished or in progress)
    Unknown
};

enum class ReconcileOutcome {
    NotOnDevice,
    StillUnread,
    MarkedRead,
    NotInLibraryRoot,
    StorageError
};

const char* to_string(DeviceReadState state);
const char* to_string(ReconcileOutcome outcome);

class DeviceCatalog {
public:
    static constexpr int READ_STATUS_UNREAD = 0;

    DeviceCatalog(const std::string& device_root, const std::string& db_relative_path);
    ~DeviceCatalog();

    DeviceCatalog(const DeviceCatalog&) = delete;
    DeviceCatalog& operator=(const DeviceCatalog&) = delete;

    // Preflight checks, logged on failure
    bool check_device_path() const;
    bool check_database() const;

    bool connect();
    bool disconnect();
    bool is_connected() const { return db_ != nullptr; }

    std::optional<std::string> content_id_for(const std::vector<std::string>& library_roots,
                                              const std::string& directory,
                                              const std::string& name,
                                              const std::string& extension) const;

    DeviceReadState read_state(const std::string& content_id) const;

    // True only if the row exists and ReadStatus is 0
    bool is_unread_on_device(const std::vector<std::string>& library_roots,
                             const std::string& directory,
                             const std::string& name,
                             const std::string& extension) const;

    // If the device reports the book as read: mark it read in `library` and
    // delete <working_root>/<relative path>/<name>.<extension>
    ReconcileOutcome reconcile_read_book(LibraryCatalog& library,
                                         const std::vector<std::string>& library_roots,
                                         const BookRecord& book,
                                         const std::string& working_root);

    // (ContentID, ReadStatus) for every book row inside the kobomanager folder
    std::vector<std::pair<std::string, int>> list_managed_content() const;

    std::string database_path() const;
    const std::string& device_root() const { return device_root_; }
    SyncError last_error() const { return last_error_; }

private:
    bool lookup_read_status(const std::string& content_id, int& status, bool& found) const;

    sqlite3* db_ = nullptr;
    std::string device_root_;
    std::string db_relative_path_;
    SyncError last_error_ = SyncError::None;
};

} // namespace koboshelf

#endif // KOBOSHELF_DEVICE_CATALOG_HPP
