#include "sync_session.hpp"
#include "capacity_probe.hpp"
#include "content_id.hpp"
#include "logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace koboshelf {

namespace {

// Disconnects a catalog when the run leaves scope, whatever the exit path
template <typename Catalog>
class ScopedConnection {
public:
    explicit ScopedConnection(Catalog& catalog) : catalog_(catalog) {
        connected_ = catalog_.connect();
    }
    ~ScopedConnection() {
        if (connected_) {
            catalog_.disconnect();
        }
    }
    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    bool connected() const { return connected_; }

private:
    Catalog& catalog_;
    bool connected_ = false;
};

} // namespace

SyncSession::SyncSession(const Config& config)
    : config_(config) {
}

void SyncSession::set_capacity_probe(std::shared_ptr<CapacityProbe> probe) {
    capacity_ = std::move(probe);
}

std::string SyncSession::working_root() const {
    return (fs::path(config_.sdcard_path()) / content_id::WORKING_DIR_NAME).string();
}

bool SyncSession::preflight(const DeviceCatalog& device) const {
    if (!device.check_device_path()) return false;
    if (!device.check_database()) return false;

    std::error_code ec;
    if (!fs::is_directory(config_.sdcard_path(), ec)) {
        Logger::error("[Session] SD card path not found: " + config_.sdcard_path());
        return false;
    }

    fs::create_directories(working_root(), ec);
    if (ec) {
        Logger::error("[Session] Cannot create working directory " + working_root() + ": " + ec.message());
        return false;
    }
    return true;
}

int SyncSession::reconcile(DeviceCatalog& device, LibraryCatalog& library) {
    const std::vector<std::string> roots = config_.library_paths();
    const std::string working = working_root();

    books_reconciled_ = 0;
    for (const auto& book : library.list_active()) {
        if (stop_requested()) {
            return EXIT_CODE_STOPPED;
        }
        ReconcileOutcome outcome = device.reconcile_read_book(library, roots, book, working);
        if (outcome == ReconcileOutcome::MarkedRead) {
            books_reconciled_++;
        } else if (outcome == ReconcileOutcome::StorageError) {
            Logger::error("[Session] Could not record read state for " + LibraryCatalog::full_path(book));
            return EXIT_CODE_FAILURE;
        }
    }
    Logger::info("[Session] " + std::to_string(books_reconciled_) + " books finished on device");
    return EXIT_CODE_OK;
}

int SyncSession::run() {
    transfer_stats_ = TransferStats();
    books_reconciled_ = 0;

    DeviceCatalog device(config_.device_path(), config_.device_db());
    if (!preflight(device)) {
        return EXIT_CODE_FAILURE;
    }

    ScopedConnection<DeviceCatalog> device_connection(device);
    if (!device_connection.connected()) {
        Logger::error("[Session] Device database unavailable: " + std::string(to_string(device.last_error())));
        return EXIT_CODE_FAILURE;
    }
    Logger::debug("[Session] " + std::to_string(device.list_managed_content().size()) +
                  " books on device inside " + content_id::WORKING_DIR_NAME);

    LibraryCatalog library(config_.library_db());
    ScopedConnection<LibraryCatalog> library_connection(library);
    if (!library_connection.connected()) {
        Logger::error("[Session] Library catalog unavailable: " + std::string(to_string(library.last_error())));
        return EXIT_CODE_FAILURE;
    }

    if (stop_requested()) return EXIT_CODE_STOPPED;

    const std::vector<std::string> roots = config_.library_paths();
    if (!library.scan(roots, LibraryCatalog::supported_formats(), config_.transferable_formats())) {
        Logger::error("[Session] Library scan failed: " + std::string(to_string(library.last_error())));
        return EXIT_CODE_FAILURE;
    }

    if (stop_requested()) return EXIT_CODE_STOPPED;

    TransferOptions options;
    options.transferable_formats = config_.transferable_formats();
    options.container_formats = config_.container_formats();
    options.settle_delay = config_.settle_delay();
    options.verify_copies = config_.verify_copies();

    std::shared_ptr<CapacityProbe> capacity = capacity_;
    if (!capacity) {
        capacity = std::make_shared<StatvfsCapacityProbe>(config_.sdcard_path());
    }

    TransferEngine engine(library, device, roots, working_root(), options, *capacity);
    engine.set_stop_flag(&stop_requested_);
    transfer_stats_ = engine.transfer_all();

    if (transfer_stats_.stopped || stop_requested()) return EXIT_CODE_STOPPED;

    int code = reconcile(device, library);
    if (code != EXIT_CODE_OK) {
        return code;
    }

    CatalogStats stats = library.stats();
    Logger::info("[Session] Library: " + std::to_string(stats.active) + " active, " +
                 std::to_string(stats.deleted) + " deleted, " +
                 std::to_string(stats.read) + " read");
    return EXIT_CODE_OK;
}

} // namespace koboshelf
