// unit_archive.cpp - container expansion with libarchive

#include "archive_extractor.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <iostream>

using namespace koboshelf;
using namespace testing_support;

static void test_extracts_members_with_subpaths() {
    auto dir = make_temp_dir("archive_members");
    write_zip(dir / "pack.zip", {
        {"cover.jpg", "COVER"},
        {"chapters/01.html", "<p>one</p>"},
        {"chapters/deep/02.html", "<p>two</p>"},
    });

    ArchiveExtractor extractor;
    auto result = extractor.extract((dir / "pack.zip").string(), (dir / "out").string());
    assert(result == ArchiveExtractor::Result::Ok);
    assert(read_file(dir / "out" / "cover.jpg") == "COVER");
    assert(read_file(dir / "out" / "chapters" / "01.html") == "<p>one</p>");
    assert(read_file(dir / "out" / "chapters" / "deep" / "02.html") == "<p>two</p>");

    auto files = extractor.extracted_files();
    std::sort(files.begin(), files.end());
    assert(files.size() == 3);
    assert(files[0] == "chapters/01.html");
    assert(files[2] == "cover.jpg");
}

static void test_rejects_garbage() {
    auto dir = make_temp_dir("archive_garbage");
    write_file(dir / "fake.zip", "definitely not an archive");
    ArchiveExtractor extractor;
    assert(extractor.extract((dir / "fake.zip").string(), (dir / "out").string()) ==
           ArchiveExtractor::Result::Corrupt);
    assert(extractor.extracted_files().empty());

    assert(extractor.extract((dir / "missing.zip").string(), (dir / "out").string()) ==
           ArchiveExtractor::Result::Corrupt);
}

static void test_rejects_escaping_members() {
    auto dir = make_temp_dir("archive_escape");
    write_zip(dir / "evil.zip", {{"ok.txt", "OK"}, {"../escaped.txt", "BAD"}});
    ArchiveExtractor extractor;
    assert(extractor.extract((dir / "evil.zip").string(), (dir / "out").string()) ==
           ArchiveExtractor::Result::Corrupt);
    assert(!fs::exists(dir / "escaped.txt"));
}

static void test_member_path_safety() {
    assert(ArchiveExtractor::is_safe_member_path("a.txt"));
    assert(ArchiveExtractor::is_safe_member_path("dir/sub/a.txt"));
    assert(ArchiveExtractor::is_safe_member_path("./a.txt"));
    assert(!ArchiveExtractor::is_safe_member_path(""));
    assert(!ArchiveExtractor::is_safe_member_path("/etc/passwd"));
    assert(!ArchiveExtractor::is_safe_member_path("../a.txt"));
    assert(!ArchiveExtractor::is_safe_member_path("dir/../../a.txt"));
}

static void test_write_failure() {
    auto dir = make_temp_dir("archive_write_fail");
    write_zip(dir / "pack.zip", {{"sub/file.txt", "DATA"}});
    write_file(dir / "out" / "sub", "a file where a directory is needed");
    ArchiveExtractor extractor;
    assert(extractor.extract((dir / "pack.zip").string(), (dir / "out").string()) ==
           ArchiveExtractor::Result::WriteFailed);
}

int main() {
    quiet_logging("unit_archive");
    test_extracts_members_with_subpaths();
    test_rejects_garbage();
    test_rejects_escaping_members();
    test_member_path_safety();
    test_write_failure();
    Logger::shutdown();
    std::cout << "Archive tests passed" << std::endl;
    return 0;
}
