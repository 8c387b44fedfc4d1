#pragma once

#include "config.hpp"
#include "transfer_engine.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace koboshelf {

class CapacityProbe;

/**
 * SyncSession - one complete run against a connected reader
 *
 * Order of work:
 *   preflight (device, device database, SD card, working directory)
 *   -> connect device, connect library
 *   -> scan library roots
 *   -> transfer eligible books
 *   -> reconcile every active book with the device's read status
 *   -> disconnect
 *
 * Connections are released on every exit path. A stop request is honoured
 * between phases, between transfer directories and books, and between
 * reconciled books.
 */
class SyncSession {
public:
    static constexpr int EXIT_CODE_OK = 0;
    static constexpr int EXIT_CODE_FAILURE = 1;
    static constexpr int EXIT_CODE_STOPPED = 130;

    explicit SyncSession(const Config& config);

    // Capacity measurement for the transfer pass; statvfs on the SD card when unset
    void set_capacity_probe(std::shared_ptr<CapacityProbe> probe);

    int run();

    // Async-signal-safe
    void request_stop() { stop_requested_.store(true); }
    bool stop_requested() const { return stop_requested_.load(); }

    const TransferStats& last_transfer_stats() const { return transfer_stats_; }
    int books_reconciled() const { return books_reconciled_; }

    std::string working_root() const;

private:
    bool preflight(const DeviceCatalog& device) const;
    int reconcile(DeviceCatalog& device, LibraryCatalog& library);

    Config config_;
    std::shared_ptr<CapacityProbe> capacity_;
    std::atomic<bool> stop_requested_{false};
    TransferStats transfer_stats_;
    int books_reconciled_ = 0;
};

} // namespace koboshelf
