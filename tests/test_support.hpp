// test_support.hpp - helpers shared by the unit tests
// Temporary trees live under unit_tmp/ in the test working directory.

#pragma once

#include "capacity_probe.hpp"
#include "logger.hpp"
#include <sqlite3.h>
#include <archive.h>
#include <archive_entry.h>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace testing_support {

inline fs::path make_temp_dir(const std::string& name) {
    fs::path p = fs::absolute(fs::path("unit_tmp") / name);
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

inline void write_file(const fs::path& p, const std::string& c) {
    fs::create_directories(p.parent_path());
    std::ofstream o(p, std::ios::binary);
    o << c;
}

inline std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void quiet_logging(const std::string& test_name) {
    fs::create_directories("unit_tmp");
    koboshelf::Logger::init(koboshelf::LogLevel::DEBUG, "unit_tmp/" + test_name + ".log", false);
}

// Zip archive with the given (member path, contents) entries
inline void write_zip(const fs::path& p, const std::vector<std::pair<std::string, std::string>>& members) {
    fs::create_directories(p.parent_path());
    struct archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    int rc = archive_write_open_filename(a, p.string().c_str());
    assert(rc == ARCHIVE_OK);
    for (const auto& m : members) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, m.first.c_str());
        archive_entry_set_size(entry, static_cast<la_int64_t>(m.second.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        rc = archive_write_header(a, entry);
        assert(rc == ARCHIVE_OK);
        la_ssize_t written = archive_write_data(a, m.second.data(), m.second.size());
        assert(written == static_cast<la_ssize_t>(m.second.size()));
        (void)written;
        archive_entry_free(entry);
    }
    archive_write_close(a);
    archive_write_free(a);
    (void)rc;
}

// Minimal Kobo device: <root>/.kobo/KoboReader.sqlite with a content table
class FakeKobo {
public:
    explicit FakeKobo(const fs::path& root) : root_(root) {
        fs::create_directories(root_ / ".kobo");
        int rc = sqlite3_open((root_ / ".kobo" / "KoboReader.sqlite").string().c_str(), &db_);
        assert(rc == SQLITE_OK);
        rc = sqlite3_exec(db_,
            "CREATE TABLE IF NOT EXISTS content ("
            " ContentID TEXT PRIMARY KEY,"
            " ContentType INTEGER,"
            " ReadStatus INTEGER);",
            nullptr, nullptr, nullptr);
        assert(rc == SQLITE_OK);
        (void)rc;
    }
    ~FakeKobo() { sqlite3_close(db_); }

    FakeKobo(const FakeKobo&) = delete;
    FakeKobo& operator=(const FakeKobo&) = delete;

    void set_content(const std::string& content_id, int read_status, int content_type = 6) {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_,
            "INSERT OR REPLACE INTO content (ContentID, ContentType, ReadStatus) VALUES (?, ?, ?)",
            -1, &stmt, nullptr);
        assert(rc == SQLITE_OK);
        sqlite3_bind_text(stmt, 1, content_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, content_type);
        sqlite3_bind_int(stmt, 3, read_status);
        rc = sqlite3_step(stmt);
        assert(rc == SQLITE_DONE);
        (void)rc;
        sqlite3_finalize(stmt);
    }

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
    sqlite3* db_ = nullptr;
};

// Fixed capacity minus whatever has been written beneath `watched`
class SimulatedCapacity : public koboshelf::CapacityProbe {
public:
    SimulatedCapacity(uint64_t capacity, fs::path watched)
        : capacity_(capacity), watched_(std::move(watched)) {}

    uint64_t available_bytes() override {
        calls++;
        uint64_t used = 0;
        std::error_code ec;
        if (fs::exists(watched_, ec)) {
            for (auto& e : fs::recursive_directory_iterator(watched_)) {
                if (e.is_regular_file()) used += e.file_size();
            }
        }
        return used >= capacity_ ? 0 : capacity_ - used;
    }

    int calls = 0;

private:
    uint64_t capacity_;
    fs::path watched_;
};

// Returns queued values in order, then repeats the last one
class ScriptedCapacity : public koboshelf::CapacityProbe {
public:
    explicit ScriptedCapacity(std::deque<uint64_t> values) : values_(std::move(values)) {}

    uint64_t available_bytes() override {
        calls++;
        if (values_.size() > 1) {
            uint64_t v = values_.front();
            values_.pop_front();
            return v;
        }
        return values_.empty() ? 0 : values_.front();
    }

    int calls = 0;

private:
    std::deque<uint64_t> values_;
};

// Plenty of space; raises a stop flag when the given reading is taken
class StopAtReading : public koboshelf::CapacityProbe {
public:
    StopAtReading(std::atomic<bool>& stop, int reading) : stop_(stop), reading_(reading) {}

    uint64_t available_bytes() override {
        calls++;
        if (calls == reading_) {
            stop_.store(true);
        }
        return 1024 * 1024;
    }

    int calls = 0;

private:
    std::atomic<bool>& stop_;
    int reading_;
};

} // namespace testing_support
