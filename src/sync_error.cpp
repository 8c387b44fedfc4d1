#include "sync_error.hpp"

namespace koboshelf {

const char* to_string(SyncError error) {
    switch (error) {
        case SyncError::None:                 return "None";
        case SyncError::StorageUnavailable:   return "StorageUnavailable";
        case SyncError::StorageError:         return "StorageError";
        case SyncError::DeviceUnavailable:    return "DeviceUnavailable";
        case SyncError::PathNotInLibraryRoot: return "PathNotInLibraryRoot";
        case SyncError::InsufficientSpace:    return "InsufficientSpace";
        case SyncError::ArchiveCorrupt:       return "ArchiveCorrupt";
        case SyncError::IOError:              return "IOError";
    }
    return "Unknown";
}

} // namespace koboshelf
