#include "transfer_engine.hpp"
#include "archive_extractor.hpp"
#include "checksum.hpp"
#include "content_id.hpp"
#include "logger.hpp"

#include <filesystem>
#include <algorithm>
#include <thread>
#include <map>
#include <sstream>
#include <iomanip>

namespace fs = std::filesystem;

namespace koboshelf {

const char* to_string(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::Copied: return "copied";
        case TransferOutcome::SkippedUnreadOnDevice: return "skipped (unread on device)";
        case TransferOutcome::SkippedNotTransferable: return "skipped (not transferable)";
        case TransferOutcome::InsufficientSpace: return "insufficient space";
        case TransferOutcome::ArchiveCorrupt: return "archive corrupt";
        case TransferOutcome::IOError: return "I/O error";
        case TransferOutcome::PathNotInLibraryRoot: return "not in a library root";
    }
    return "unknown";
}

static std::string format_mb(uint64_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << bytes_to_mb(bytes);
    return out.str();
}

TransferEngine::TransferEngine(LibraryCatalog& library,
                               DeviceCatalog& device,
                               const std::vector<std::string>& library_roots,
                               const std::string& working_root,
                               const TransferOptions& options,
                               CapacityProbe& capacity)
    : library_(library)
    , device_(device)
    , library_roots_(library_roots)
    , working_root_(working_root)
    , options_(options)
    , capacity_(capacity) {
    // Membership checks are case-insensitive
    std::set<std::string> lowered;
    for (const auto& ext : options_.transferable_formats) lowered.insert(LibraryCatalog::to_lower(ext));
    options_.transferable_formats = lowered;
    lowered.clear();
    for (const auto& ext : options_.container_formats) lowered.insert(LibraryCatalog::to_lower(ext));
    options_.container_formats = lowered;
}

bool TransferEngine::is_container(const std::string& extension) const {
    return options_.container_formats.count(LibraryCatalog::to_lower(extension)) > 0;
}

bool TransferEngine::is_transferable(const std::string& extension) const {
    return options_.transferable_formats.count(LibraryCatalog::to_lower(extension)) > 0;
}

void TransferEngine::record(TransferStats& stats, const BookRecord& book,
                            const std::string& destination_dir, TransferOutcome outcome) const {
    switch (outcome) {
        case TransferOutcome::Copied: stats.books_copied++; break;
        case TransferOutcome::SkippedUnreadOnDevice: stats.books_skipped_unread++; break;
        case TransferOutcome::SkippedNotTransferable: stats.books_skipped_format++; break;
        case TransferOutcome::InsufficientSpace: stats.books_skipped_space++; break;
        case TransferOutcome::ArchiveCorrupt:
        case TransferOutcome::IOError: stats.books_failed++; break;
        case TransferOutcome::PathNotInLibraryRoot: stats.books_unresolved++; break;
    }
    stats.records.push_back({LibraryCatalog::full_path(book), destination_dir, outcome});
}

std::vector<TransferEngine::DirectoryGroup>
TransferEngine::group_by_destination(const std::vector<BookRecord>& books, TransferStats& stats) const {
    std::vector<DirectoryGroup> groups;
    std::map<std::string, size_t> index;

    for (const auto& book : books) {
        auto destination = content_id::destination_directory(library_roots_, book.directory, working_root_);
        if (!destination) {
            Logger::error("[Transfer] Book path not in any library root: " + LibraryCatalog::full_path(book));
            record(stats, book, "", TransferOutcome::PathNotInLibraryRoot);
            continue;
        }
        auto it = index.find(*destination);
        if (it == index.end()) {
            index.emplace(*destination, groups.size());
            groups.push_back({*destination, {book}});
        } else {
            groups[it->second].books.push_back(book);
        }
    }
    return groups;
}

TransferStats TransferEngine::transfer_all() {
    TransferStats stats;

    std::vector<BookRecord> books = library_.list_active(true);
    Logger::info("[Transfer] " + std::to_string(books.size()) + " transferable books in library");

    std::vector<DirectoryGroup> groups = group_by_destination(books, stats);

    // Coarse baseline, only used by the whole-directory gate
    const uint64_t snapshot = capacity_.available_bytes();

    for (const auto& group : groups) {
        if (stop_requested()) {
            stats.stopped = true;
            break;
        }

        uint64_t required = 0;
        uint64_t smallest = UINT64_MAX;
        for (const auto& book : group.books) {
            uint64_t size = LibraryCatalog::book_size(book);
            required += size;
            smallest = std::min(smallest, size);
        }

        if (required > snapshot) {
            Logger::warn("[Transfer] Not enough space for directory " + group.destination_dir +
                         ": required " + format_mb(required) + " MB, available " + format_mb(snapshot) + " MB");
            stats.directories_skipped++;
            for (const auto& book : group.books) {
                record(stats, book, group.destination_dir, TransferOutcome::InsufficientSpace);
            }
            continue;
        }

        uint64_t available = capacity_.available_bytes();
        if (smallest > available) {
            Logger::warn("[Transfer] Not enough space for any book in " + group.destination_dir +
                         ": smallest " + format_mb(smallest) + " MB, available " + format_mb(available) + " MB");
            stats.directories_skipped++;
            for (const auto& book : group.books) {
                record(stats, book, group.destination_dir, TransferOutcome::InsufficientSpace);
            }
            continue;
        }

        for (const auto& book : group.books) {
            if (stop_requested()) {
                stats.stopped = true;
                break;
            }
            const std::string source = LibraryCatalog::full_path(book);

            if (device_.is_unread_on_device(library_roots_, book.directory, book.name, book.extension)) {
                Logger::debug("[Transfer] Already on device and unread: " + source);
                record(stats, book, group.destination_dir, TransferOutcome::SkippedUnreadOnDevice);
                continue;
            }

            if (!is_transferable(book.extension)) {
                Logger::debug("[Transfer] Format not transferable: " + source);
                record(stats, book, group.destination_dir, TransferOutcome::SkippedNotTransferable);
                continue;
            }

            uint64_t size = LibraryCatalog::book_size(book);
            if (size > available) {
                Logger::warn("[Transfer] Not enough space for " + source + ": required " +
                             format_mb(size) + " MB, available " + format_mb(available) + " MB");
                record(stats, book, group.destination_dir, TransferOutcome::InsufficientSpace);
                continue;
            }

            TransferOutcome outcome = transfer_book(book, group.destination_dir);
            record(stats, book, group.destination_dir, outcome);
            if (outcome != TransferOutcome::Copied) {
                continue;
            }
            stats.bytes_copied += size;

            settle();
            if (stop_requested()) {
                stats.stopped = true;
                break;
            }
            available = capacity_.available_bytes();
        }
        if (stats.stopped) {
            break;
        }
    }

    if (stats.stopped) {
        Logger::warn("[Transfer] Stopped on request");
    }

    Logger::info("[Transfer] Finished: " + std::to_string(stats.books_copied) + " copied, " +
                 std::to_string(stats.books_skipped_unread) + " already on device, " +
                 std::to_string(stats.books_skipped_space) + " skipped for space, " +
                 std::to_string(stats.books_failed) + " failed");
    return stats;
}

// Sleeps in short slices so a stop request cuts the wait short
void TransferEngine::settle() {
    constexpr std::chrono::milliseconds slice(50);
    auto remaining = options_.settle_delay;
    while (remaining.count() > 0 && !stop_requested()) {
        auto step = std::min(remaining, slice);
        std::this_thread::sleep_for(step);
        remaining -= step;
    }
}

TransferOutcome TransferEngine::transfer_book(const BookRecord& book, const std::string& destination_dir) {
    try {
        std::error_code ec;
        fs::create_directories(destination_dir, ec);
        if (ec) {
            Logger::error("[Transfer] Cannot create " + destination_dir + ": " + ec.message());
            return TransferOutcome::IOError;
        }
        if (is_container(book.extension)) {
            return expand_container(book, destination_dir);
        }
        return copy_plain(book, destination_dir);
    } catch (const std::exception& e) {
        Logger::error("[Transfer] Error transferring " + LibraryCatalog::full_path(book) + ": " + e.what());
        return TransferOutcome::IOError;
    }
}

TransferOutcome TransferEngine::copy_plain(const BookRecord& book, const std::string& destination_dir) {
    const std::string source = LibraryCatalog::full_path(book);
    const fs::path target = fs::path(destination_dir) / (book.name + "." + book.extension);

    std::error_code ec;
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        Logger::error("[Transfer] Error copying " + source + " to " + target.string() + ": " + ec.message());
        fs::remove(target, ec);
        return TransferOutcome::IOError;
    }

    auto mtime = fs::last_write_time(source, ec);
    if (!ec) {
        fs::last_write_time(target, mtime, ec);
        if (ec) {
            Logger::debug("[Transfer] Could not preserve mtime on " + target.string() + ": " + ec.message());
        }
    }

    if (options_.verify_copies && !checksum::files_match(source, target.string())) {
        Logger::error("[Transfer] Checksum mismatch after copying " + source);
        fs::remove(target, ec);
        return TransferOutcome::IOError;
    }

    Logger::info("[Transfer] Copied " + source + " to " + target.string());
    return TransferOutcome::Copied;
}

TransferOutcome TransferEngine::expand_container(const BookRecord& book, const std::string& destination_dir) {
    const std::string source = LibraryCatalog::full_path(book);
    ArchiveExtractor extractor;
    switch (extractor.extract(source, destination_dir)) {
        case ArchiveExtractor::Result::Ok:
            return TransferOutcome::Copied;
        case ArchiveExtractor::Result::Corrupt:
            return TransferOutcome::ArchiveCorrupt;
        case ArchiveExtractor::Result::WriteFailed:
            return TransferOutcome::IOError;
    }
    return TransferOutcome::IOError;
}

} // namespace koboshelf
