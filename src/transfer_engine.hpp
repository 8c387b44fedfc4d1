#ifndef KOBOSHELF_TRANSFER_ENGINE_HPP
#define KOBOSHELF_TRANSFER_ENGINE_HPP

#include "library_catalog.hpp"
#include "device_catalog.hpp"
#include "capacity_probe.hpp"

#include <string>
#include <vector>
#include <set>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace koboshelf {

/**
 * TransferEngine - copies eligible library books to the SD card
 *
 * Books are grouped by destination directory
 * (<working root>/<path relative to its library root>) and each directory
 * goes through two space gates before any book in it is attempted:
 *   1. total size of its books vs. a capacity snapshot taken once per run
 *   2. smallest book vs. capacity re-measured on entering the directory
 * Each book is then checked against the device (already there and unread
 * means skip), its format, and the latest capacity figure. After a
 * successful copy the engine waits `settle_delay` and measures again.
 *
 * Every failure is contained to its book or directory. A stop flag, when
 * set, is checked before each directory, before each book and during the
 * settle delay; the pass then ends with `stopped` set in its stats.
 */

enum class TransferOutcome {
    Copied,
    SkippedUnreadOnDevice,
    SkippedNotTransferable,
    InsufficientSpace,
    ArchiveCorrupt,
    IOError,
    PathNotInLibraryRoot
};

const char* to_string(TransferOutcome outcome);

struct TransferOptions {
    std::set<std::string> transferable_formats;                 // lowercase, no dot
    std::set<std::string> container_formats = {"zip", "rar"};   // expanded, not copied
    std::chrono::milliseconds settle_delay{1000};
    bool verify_copies = false;                                  // SHA-256 compare after plain copies
};

struct TransferRecord {
    std::string source_path;
    std::string destination_dir;
    TransferOutcome outcome;
};

struct TransferStats {
    uint64_t books_copied = 0;
    uint64_t books_skipped_unread = 0;
    uint64_t books_skipped_format = 0;
    uint64_t books_skipped_space = 0;
    uint64_t books_failed = 0;              // ArchiveCorrupt + IOError
    uint64_t books_unresolved = 0;          // PathNotInLibraryRoot
    uint64_t directories_skipped = 0;
    uint64_t bytes_copied = 0;
    bool stopped = false;                   // pass ended early on a stop request
    std::vector<TransferRecord> records;    // one per book considered, in order
};

class TransferEngine {
public:
    TransferEngine(LibraryCatalog& library,
                   DeviceCatalog& device,
                   const std::vector<std::string>& library_roots,
                   const std::string& working_root,
                   const TransferOptions& options,
                   CapacityProbe& capacity);

    // Polled between units of work; nullptr disables stopping
    void set_stop_flag(const std::atomic<bool>* stop) { stop_ = stop; }

    TransferStats transfer_all();

    // Copy or expand one book into destination_dir; no space checks
    TransferOutcome transfer_book(const BookRecord& book, const std::string& destination_dir);

    bool is_container(const std::string& extension) const;
    bool is_transferable(const std::string& extension) const;

private:
    struct DirectoryGroup {
        std::string destination_dir;
        std::vector<BookRecord> books;
    };

    std::vector<DirectoryGroup> group_by_destination(const std::vector<BookRecord>& books,
                                                     TransferStats& stats) const;
    TransferOutcome copy_plain(const BookRecord& book, const std::string& destination_dir);
    TransferOutcome expand_container(const BookRecord& book, const std::string& destination_dir);
    void record(TransferStats& stats, const BookRecord& book,
                const std::string& destination_dir, TransferOutcome outcome) const;
    bool stop_requested() const { return stop_ && stop_->load(); }
    void settle();

    LibraryCatalog& library_;
    DeviceCatalog& device_;
    std::vector<std::string> library_roots_;
    std::string working_root_;
    TransferOptions options_;
    CapacityProbe& capacity_;
    const std::atomic<bool>* stop_ = nullptr;
};

} // namespace koboshelf

#endif // KOBOSHELF_TRANSFER_ENGINE_HPP
