#ifndef KOBOSHELF_SYNC_ERROR_HPP
#define KOBOSHELF_SYNC_ERROR_HPP

namespace koboshelf {

/**
 * Failure categories shared by the catalogs and the transfer engine.
 *
 * StorageUnavailable, StorageError and DeviceUnavailable abort a run.
 * The rest are contained to one book or one destination directory.
 */
enum class SyncError {
    None,
    StorageUnavailable,     // library catalog cannot be opened/created
    StorageError,           // library catalog write/read failed mid-run
    DeviceUnavailable,      // device content database missing or unopenable
    PathNotInLibraryRoot,   // book directory matches no configured root
    InsufficientSpace,
    ArchiveCorrupt,
    IOError
};

const char* to_string(SyncError error);

} // namespace koboshelf

#endif // KOBOSHELF_SYNC_ERROR_HPP
