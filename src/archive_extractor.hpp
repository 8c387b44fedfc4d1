#pragma once

#include <string>
#include <vector>

namespace koboshelf {

/**
 * Expands zip/rar containers with libarchive.
 *
 * Every member is written beneath the destination directory, recreating its
 * sub-path. Members with absolute paths or ".." components are refused and
 * make the whole archive count as corrupt.
 */
class ArchiveExtractor {
public:
    enum class Result {
        Ok,
        Corrupt,    // unreadable container or unsafe member path
        WriteFailed
    };

    Result extract(const std::string& archive_path, const std::string& destination_dir);

    // Relative paths of the regular files written by the last extract()
    const std::vector<std::string>& extracted_files() const { return extracted_; }

    static bool is_safe_member_path(const std::string& member);

private:
    std::vector<std::string> extracted_;
};

} // namespace koboshelf
