// unit_session.cpp - full runs: preflight, scan, transfer and read reconciliation

#include "sync_session.hpp"
#include "content_id.hpp"
#include "test_support.hpp"
#include <iostream>
#include <memory>

using namespace koboshelf;
using namespace testing_support;

struct Setup {
    fs::path dir;
    fs::path lib;
    fs::path sdcard;
    std::unique_ptr<FakeKobo> kobo;
    std::unique_ptr<Config> config;

    explicit Setup(const std::string& name) {
        dir = make_temp_dir(name);
        lib = dir / "Documents";
        sdcard = dir / "23E1-32E8";
        fs::create_directories(lib);
        fs::create_directories(sdcard);
        kobo = std::make_unique<FakeKobo>(dir / "KOBOeReader");

        config = std::make_unique<Config>((dir / "config").string());
        config->set_string("device.path", kobo->root().string());
        config->set_string("device.db", ".kobo/KoboReader.sqlite");
        config->set_string("device.sdcard", sdcard.string());
        config->set_string("library.db", (dir / "config" / "koboshelf.sqlite").string());
        config->set_list("library.paths", {lib.string()});
        config->set_list("library.transferable_formats", {"epub", "pdf"});
        config->set_int("transfer.settle_delay_ms", 0);
        assert(config->validate());
    }

    fs::path working() const { return sdcard / content_id::WORKING_DIR_NAME; }
};

static void test_full_run() {
    Setup s("session_full");
    write_file(s.lib / "book.epub", "FRESH");
    write_file(s.lib / "Series" / "finished.epub", "DONE");
    write_file(s.lib / "waiting.epub", "WAIT");
    write_file(s.lib / "notes.mobi", "MOBI");
    s.kobo->set_content("file:///mnt/sd/kobomanager/Series/finished.epub", 2);
    s.kobo->set_content("file:///mnt/sd/kobomanager/waiting.epub", 0);

    SyncSession session(*s.config);
    session.set_capacity_probe(std::make_shared<SimulatedCapacity>(1024 * 1024, s.working()));
    assert(session.run() == SyncSession::EXIT_CODE_OK);

    assert(fs::is_directory(s.working()));
    assert(read_file(s.working() / "book.epub") == "FRESH");
    // Copied during transfer, then retired because the reader reports it finished
    assert(!fs::exists(s.working() / "Series" / "finished.epub"));
    assert(!fs::exists(s.working() / "waiting.epub"));
    assert(!fs::exists(s.working() / "notes.mobi"));
    assert(session.books_reconciled() == 1);
    assert(session.last_transfer_stats().books_skipped_unread == 1);

    LibraryCatalog library(s.config->library_db());
    assert(library.connect());
    auto finished = library.find((s.lib / "Series").string(), "finished", "epub");
    assert(finished && finished->read);
    auto book = library.find(s.lib.string(), "book", "epub");
    assert(book && !book->read);
    auto mobi = library.find(s.lib.string(), "notes", "mobi");
    assert(mobi && !mobi->transferable);
    library.disconnect();
}

static void test_preflight_failures() {
    {
        Setup s("session_no_device");
        s.config->set_string("device.path", (s.dir / "unplugged").string());
        SyncSession session(*s.config);
        assert(session.run() == SyncSession::EXIT_CODE_FAILURE);
    }
    {
        Setup s("session_no_db");
        s.config->set_string("device.db", ".kobo/Missing.sqlite");
        SyncSession session(*s.config);
        assert(session.run() == SyncSession::EXIT_CODE_FAILURE);
        assert(!fs::exists(s.kobo->root() / ".kobo" / "Missing.sqlite"));
    }
    {
        Setup s("session_no_sdcard");
        s.config->set_string("device.sdcard", (s.dir / "no-card").string());
        SyncSession session(*s.config);
        assert(session.run() == SyncSession::EXIT_CODE_FAILURE);
        assert(!fs::exists(s.dir / "no-card"));
    }
    {
        Setup s("session_bad_library_db");
        write_file(s.dir / "blocker", "file");
        s.config->set_string("library.db", (s.dir / "blocker" / "lib.sqlite").string());
        SyncSession session(*s.config);
        assert(session.run() == SyncSession::EXIT_CODE_FAILURE);
    }
}

static void test_stop_before_scan() {
    Setup s("session_stop");
    write_file(s.lib / "book.epub", "B");
    SyncSession session(*s.config);
    session.set_capacity_probe(std::make_shared<SimulatedCapacity>(1024 * 1024, s.working()));
    session.request_stop();
    assert(session.stop_requested());
    assert(session.run() == SyncSession::EXIT_CODE_STOPPED);
    assert(!fs::exists(s.working() / "book.epub"));

    // Both connections were released and nothing was cataloged
    LibraryCatalog library(s.config->library_db());
    assert(library.connect());
    assert(library.list_all().empty());
    library.disconnect();
}

// Stop arrives while the transfer pass is underway
class StopSessionAtReading : public CapacityProbe {
public:
    StopSessionAtReading(SyncSession& session, int reading) : session_(session), reading_(reading) {}

    uint64_t available_bytes() override {
        if (++calls_ == reading_) {
            session_.request_stop();
        }
        return 1024 * 1024;
    }

private:
    SyncSession& session_;
    int reading_;
    int calls_ = 0;
};

static void test_stop_during_transfer() {
    Setup s("session_stop_transfer");
    for (const char* name : {"a", "b", "c", "d", "e"}) {
        write_file(s.lib / (std::string(name) + ".epub"), "BOOK");
    }
    s.config->set_int("transfer.settle_delay_ms", 200);
    s.kobo->set_content("file:///mnt/sd/kobomanager/a.epub", 2);

    SyncSession session(*s.config);
    session.set_capacity_probe(std::make_shared<StopSessionAtReading>(session, 2));
    assert(session.run() == SyncSession::EXIT_CODE_STOPPED);
    assert(session.last_transfer_stats().stopped);
    assert(session.last_transfer_stats().books_copied == 0);
    assert(session.books_reconciled() == 0);
    for (const char* name : {"a", "b", "c", "d", "e"}) {
        assert(!fs::exists(s.working() / (std::string(name) + ".epub")));
    }

    // The scan finished before the stop, so the catalog is complete and nothing is read yet
    LibraryCatalog library(s.config->library_db());
    assert(library.connect());
    assert(library.list_all().size() == 5);
    auto a = library.find(s.lib.string(), "a", "epub");
    assert(a && !a->read);
    library.disconnect();
}

static void test_second_run_is_stable() {
    Setup s("session_rerun");
    write_file(s.lib / "book.epub", "B");
    {
        SyncSession session(*s.config);
        session.set_capacity_probe(std::make_shared<SimulatedCapacity>(1024 * 1024, s.working()));
        assert(session.run() == SyncSession::EXIT_CODE_OK);
    }
    // The reader has now indexed the copy and it is still unread
    s.kobo->set_content("file:///mnt/sd/kobomanager/book.epub", 0);
    SyncSession session(*s.config);
    session.set_capacity_probe(std::make_shared<SimulatedCapacity>(1024 * 1024, s.working()));
    assert(session.run() == SyncSession::EXIT_CODE_OK);
    assert(session.last_transfer_stats().books_copied == 0);
    assert(session.last_transfer_stats().books_skipped_unread == 1);
    assert(fs::exists(s.working() / "book.epub"));
}

int main() {
    quiet_logging("unit_session");
    test_full_run();
    test_preflight_failures();
    test_stop_before_scan();
    test_stop_during_transfer();
    test_second_run_is_stable();
    Logger::shutdown();
    std::cout << "Session tests passed" << std::endl;
    return 0;
}
