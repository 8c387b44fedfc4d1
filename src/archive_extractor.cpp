#include "archive_extractor.hpp"
#include "logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

namespace koboshelf {

bool ArchiveExtractor::is_safe_member_path(const std::string& member) {
    if (member.empty()) return false;
    fs::path p(member);
    if (p.is_absolute() || p.has_root_name()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

static ArchiveExtractor::Result write_entry_data(struct archive* reader, const fs::path& target) {
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        Logger::error("[Archive] Cannot create " + target.string());
        return ArchiveExtractor::Result::WriteFailed;
    }

    const void* block = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;
    for (;;) {
        int r = archive_read_data_block(reader, &block, &size, &offset);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            Logger::error("[Archive] Read error in member " + target.filename().string() + ": " +
                          (archive_error_string(reader) ? archive_error_string(reader) : "unknown"));
            return ArchiveExtractor::Result::Corrupt;
        }
        out.seekp(static_cast<std::streamoff>(offset));
        out.write(static_cast<const char*>(block), static_cast<std::streamsize>(size));
        if (!out) {
            Logger::error("[Archive] Write error on " + target.string());
            return ArchiveExtractor::Result::WriteFailed;
        }
    }
    return ArchiveExtractor::Result::Ok;
}

ArchiveExtractor::Result ArchiveExtractor::extract(const std::string& archive_path,
                                                   const std::string& destination_dir) {
    extracted_.clear();

    std::unique_ptr<struct archive, decltype(&archive_read_free)> reader(archive_read_new(), archive_read_free);
    if (!reader) {
        Logger::error("[Archive] Failed to allocate archive reader");
        return Result::Corrupt;
    }
    archive_read_support_format_zip(reader.get());
    archive_read_support_format_rar(reader.get());
    archive_read_support_format_rar5(reader.get());
    archive_read_support_filter_all(reader.get());

    if (archive_read_open_filename(reader.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        const char* err = archive_error_string(reader.get());
        Logger::error("[Archive] Error extracting archive " + archive_path + ": " + (err ? err : "cannot open"));
        return Result::Corrupt;
    }

    const fs::path destination(destination_dir);
    struct archive_entry* entry = nullptr;
    for (;;) {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            const char* err = archive_error_string(reader.get());
            Logger::error("[Archive] Error extracting archive " + archive_path + ": " + (err ? err : "bad header"));
            return Result::Corrupt;
        }
        if (r == ARCHIVE_WARN) {
            const char* err = archive_error_string(reader.get());
            Logger::warn("[Archive] " + archive_path + ": " + (err ? err : "warning"));
        }

        const char* raw_name = archive_entry_pathname(entry);
        std::string member = raw_name ? raw_name : "";
        if (!is_safe_member_path(member)) {
            Logger::error("[Archive] Refusing unsafe member '" + member + "' in " + archive_path);
            return Result::Corrupt;
        }

        fs::path target = destination / fs::path(member).lexically_normal();
        std::error_code ec;

        if (archive_entry_filetype(entry) == AE_IFDIR) {
            fs::create_directories(target, ec);
            if (ec) {
                Logger::error("[Archive] Cannot create directory " + target.string() + ": " + ec.message());
                return Result::WriteFailed;
            }
            continue;
        }

        if (archive_entry_filetype(entry) != AE_IFREG) {
            Logger::debug("[Archive] Skipping non-regular member '" + member + "'");
            if (archive_read_data_skip(reader.get()) < ARCHIVE_WARN) {
                Logger::error("[Archive] Error skipping member '" + member + "' in " + archive_path);
                return Result::Corrupt;
            }
            continue;
        }

        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            Logger::error("[Archive] Cannot create directory " + target.parent_path().string() + ": " + ec.message());
            return Result::WriteFailed;
        }

        Result written = write_entry_data(reader.get(), target);
        if (written != Result::Ok) {
            return written;
        }
        extracted_.push_back(fs::path(member).lexically_normal().string());
    }

    Logger::info("[Archive] Extracted archive: " + archive_path + " to " + destination_dir +
                 " (" + std::to_string(extracted_.size()) + " files)");
    return Result::Ok;
}

} // namespace koboshelf
