// unit_library_catalog.cpp - scan, soft-delete and restore behaviour of the library catalog

#include "library_catalog.hpp"
#include "test_support.hpp"
#include <iostream>

using namespace koboshelf;
using namespace testing_support;

static const std::set<std::string> TRANSFERABLE = {"epub", "mobi", "azw3", "cbz", "pdf"};

static std::vector<std::string> roots_of(const fs::path& p) { return {p.string()}; }

static void test_connect_creates_schema_and_directory() {
    auto dir = make_temp_dir("lib_connect");
    fs::path db = dir / "nested" / "library.sqlite";
    LibraryCatalog library(db.string());
    assert(library.connect());
    assert(library.is_connected());
    assert(fs::exists(db));
    assert(library.list_all().empty());
    assert(library.disconnect());
    assert(!library.is_connected());

    // Second open of the same store is idempotent
    LibraryCatalog again(db.string());
    assert(again.connect());
    assert(again.disconnect());
}

static void test_connect_fails_when_directory_cannot_be_created() {
    auto dir = make_temp_dir("lib_connect_fail");
    write_file(dir / "blocker", "not a directory");
    LibraryCatalog library((dir / "blocker" / "library.sqlite").string());
    assert(!library.connect());
    assert(library.last_error() == SyncError::StorageUnavailable);
}

static void test_scan_filters_supported_formats() {
    auto dir = make_temp_dir("lib_scan_formats");
    fs::path root = dir / "books";
    write_file(root / "novel.epub", "EPUB");
    write_file(root / "scan.PDF", "PDF");
    write_file(root / "comics" / "issue1.cbz", "CBZ");
    write_file(root / "bundle.zip", "ZIP");
    write_file(root / "notes.txt", "TXT");
    write_file(root / "noext", "X");

    LibraryCatalog library((dir / "library.sqlite").string());
    assert(library.connect());
    assert(library.scan(roots_of(root), LibraryCatalog::supported_formats(), TRANSFERABLE));

    auto all = library.list_active();
    assert(all.size() == 4);

    auto pdf = library.find(root.string(), "scan", "PDF");
    assert(pdf && pdf->transferable && !pdf->read && !pdf->deleted);

    auto zip = library.find(root.string(), "bundle", "zip");
    assert(zip && !zip->transferable);

    auto transferable = library.list_active(true);
    assert(transferable.size() == 3);
    for (const auto& b : transferable) assert(b.transferable);

    auto comic = library.find((root / "comics").string(), "issue1", "cbz");
    assert(comic);
    assert(LibraryCatalog::full_path(*comic) == (root / "comics" / "issue1.cbz").string());
    assert(LibraryCatalog::book_size(*comic) == 3);
    library.disconnect();
}

static void test_scan_is_idempotent() {
    auto dir = make_temp_dir("lib_scan_idem");
    fs::path root = dir / "books";
    write_file(root / "a.epub", "A");
    write_file(root / "b.mobi", "BB");

    LibraryCatalog library((dir / "library.sqlite").string());
    assert(library.connect());
    assert(library.scan(roots_of(root), LibraryCatalog::supported_formats(), TRANSFERABLE));
    auto first = library.list_all();
    assert(library.scan(roots_of(root), LibraryCatalog::supported_formats(), TRANSFERABLE));
    auto second = library.list_all();

    assert(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        assert(first[i].directory == second[i].directory);
        assert(first[i].name == second[i].name);
        assert(first[i].extension == second[i].extension);
        assert(first[i].read == second[i].read);
        assert(first[i].deleted == second[i].deleted);
        assert(first[i].transferable == second[i].transferable);
    }
    library.disconnect();
}

static void test_soft_delete_and_restore_keeps_read_flag() {
    auto dir = make_temp_dir("lib_restore");
    fs::path root = dir / "books";
    write_file(root / "keep.epub", "K");
    write_file(root / "gone.epub", "G");

    LibraryCatalog library((dir / "library.sqlite").string());
    assert(library.connect());
    assert(library.scan(roots_of(root), LibraryCatalog::supported_formats(), TRANSFERABLE));
    assert(library.mark_read(root.string(), "gone", "epub"));
    assert(library.mark_read(root.string(), "gone", "epub"));  // idempotent

    fs::path moved_away = dir / "gone.epub";
    fs::rename(root / "gone.epub", moved_away);
    assert(library.scan(roots_of(root), LibraryCatalog::supported_formats(), TRANSFERABLE));

    auto gone = library.find(root.string(), "gone", "epub");
    assert(gone && gone->deleted && gone->read);
    assert(library.list_active().size() == 1);
    assert(library.list_all().size() == 2);

    // Deleted rows stay deleted across repeated scans
    assert(library.scan(roots_of(root), LibraryCatalog::supported_formats(), TRANSFERABLE));
    gone = library.find(root.string(), "gone", "epub");
    assert(gone && gone->deleted);

    fs::rename(moved_away, root / "gone.epub");
    assert(library.scan(roots_of(root), LibraryCatalog::supported_formats(), TRANSFERABLE));
    gone = library.find(root.string(), "gone", "epub");
    assert(gone && !gone->deleted && gone->read);

    auto stats = library.stats();
    assert(stats.total == 2 && stats.active == 2 && stats.deleted == 0 && stats.read == 1);
    library.disconnect();
}

static void test_transferable_refreshed_on_rescan() {
    auto dir = make_temp_dir("lib_transferable");
    fs::path root = dir / "books";
    write_file(root / "manual.pdf", "P");

    LibraryCatalog library((dir / "library.sqlite").string());
    assert(library.connect());
    assert(library.scan(roots_of(root), LibraryCatalog::supported_formats(), TRANSFERABLE));
    assert(library.find(root.string(), "manual", "pdf")->transferable);

    assert(library.scan(roots_of(root), LibraryCatalog::supported_formats(), {"epub"}));
    assert(!library.find(root.string(), "manual", "pdf")->transferable);
    assert(library.list_active(true).empty());
    library.disconnect();
}

static void test_missing_root_is_skipped() {
    auto dir = make_temp_dir("lib_missing_root");
    fs::path root = dir / "books";
    write_file(root / "a.epub", "A");

    LibraryCatalog library((dir / "library.sqlite").string());
    assert(library.connect());
    std::vector<std::string> roots = {(dir / "does-not-exist").string(), root.string()};
    assert(library.scan(roots, LibraryCatalog::supported_formats(), TRANSFERABLE));
    assert(library.list_active().size() == 1);
    library.disconnect();
}

static void test_move_between_roots() {
    auto dir = make_temp_dir("lib_move_roots");
    fs::path first = dir / "first";
    fs::path second = dir / "second";
    write_file(first / "wander.epub", "W");
    fs::create_directories(second);
    std::vector<std::string> roots = {first.string(), second.string()};

    LibraryCatalog library((dir / "library.sqlite").string());
    assert(library.connect());
    assert(library.scan(roots, LibraryCatalog::supported_formats(), TRANSFERABLE));

    fs::rename(first / "wander.epub", second / "wander.epub");
    assert(library.scan(roots, LibraryCatalog::supported_formats(), TRANSFERABLE));

    auto old_row = library.find(first.string(), "wander", "epub");
    auto new_row = library.find(second.string(), "wander", "epub");
    assert(old_row && old_row->deleted);
    assert(new_row && !new_row->deleted);
    library.disconnect();
}

static void test_same_name_different_extension_shares_key() {
    auto dir = make_temp_dir("lib_same_name");
    fs::path root = dir / "books";
    write_file(root / "twin.epub", "E");
    write_file(root / "twin.pdf", "P");

    LibraryCatalog library((dir / "library.sqlite").string());
    assert(library.connect());
    assert(library.scan(roots_of(root), LibraryCatalog::supported_formats(), TRANSFERABLE));

    // Only the first file observed for (directory, name) is recorded
    auto active = library.list_active();
    assert(active.size() == 1);
    assert(active[0].extension == "epub");
    assert(LibraryCatalog::book_key(root.string(), "twin") == LibraryCatalog::book_key(active[0].directory, active[0].name));
    library.disconnect();
}

static void test_operations_require_connection() {
    auto dir = make_temp_dir("lib_disconnected");
    LibraryCatalog library((dir / "library.sqlite").string());
    assert(!library.scan({dir.string()}, LibraryCatalog::supported_formats(), TRANSFERABLE));
    assert(library.last_error() == SyncError::StorageError);
    assert(!library.mark_read(dir.string(), "x", "epub"));
    assert(library.list_active().empty());
    assert(!library.find(dir.string(), "x", "epub"));
    assert(LibraryCatalog::book_size(dir.string(), "absent", "epub") == 0);
}

int main() {
    quiet_logging("unit_library_catalog");
    test_connect_creates_schema_and_directory();
    test_connect_fails_when_directory_cannot_be_created();
    test_scan_filters_supported_formats();
    test_scan_is_idempotent();
    test_soft_delete_and_restore_keeps_read_flag();
    test_transferable_refreshed_on_rescan();
    test_missing_root_is_skipped();
    test_move_between_roots();
    test_same_name_different_extension_shares_key();
    test_operations_require_connection();
    Logger::shutdown();
    std::cout << "Library catalog tests passed" << std::endl;
    return 0;
}
