/**
 * koboshelf - keeps a Kobo reader's SD card stocked from a local library
 *
 * One invocation is one sync run:
 * - scan the library folders into the catalog
 * - copy unread, transferable books to <sdcard>/kobomanager
 * - retire books the reader reports as finished
 */

#include "config.hpp"
#include "logger.hpp"
#include "sync_session.hpp"
#include <glib.h>
#include <glib-unix.h>
#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <filesystem>
#include <signal.h>
#include <execinfo.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sqlite3.h>
#include <openssl/opensslv.h>
#include <archive.h>

namespace fs = std::filesystem;
using namespace koboshelf;

static char crash_log_path[512] = "/tmp/koboshelf-crash.log";

// Fatal signal: append the signal name and raw frames to crash.log, then re-raise
static void crash_handler(int sig) {
    int fd = open(crash_log_path, O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd < 0) fd = STDERR_FILENO;

    char header[128];
    int n = snprintf(header, sizeof(header), "\n--- koboshelf crash: signal %d (%s) ---\n", sig, strsignal(sig));
    if (n > 0) {
        ssize_t written = write(fd, header, static_cast<size_t>(n));
        (void)written;
    }

    void* frames[64];
    int depth = backtrace(frames, 64);
    backtrace_symbols_fd(frames, depth, fd);

    if (fd != STDERR_FILENO) {
        close(fd);
        fprintf(stderr, "\n*** koboshelf crashed (signal %d), backtrace in %s ***\n", sig, crash_log_path);
    }

    signal(sig, SIG_DFL);
    raise(sig);
}

// Resolves the crash log location up front; the handler itself only uses the buffer
static void install_crash_handlers() {
    const char* home = getenv("HOME");
    if (home) {
        std::string dir = std::string(home) + "/.cache/koboshelf";
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (!ec) {
            snprintf(crash_log_path, sizeof(crash_log_path), "%s/crash.log", dir.c_str());
        }
    }

    struct rlimit core_limit;
    core_limit.rlim_cur = RLIM_INFINITY;
    core_limit.rlim_max = RLIM_INFINITY;
    setrlimit(RLIMIT_CORE, &core_limit);

    for (int sig : {SIGSEGV, SIGABRT, SIGFPE, SIGBUS, SIGILL}) {
        signal(sig, crash_handler);
    }
}

struct RunContext {
    SyncSession* session = nullptr;
    GMainLoop* loop = nullptr;
    int exit_code = SyncSession::EXIT_CODE_FAILURE;
};

static gboolean shutdown_handler_glib(gpointer user_data) {
    auto* ctx = static_cast<RunContext*>(user_data);
    Logger::info("Closing app...");
    ctx->session->request_stop();
    return G_SOURCE_CONTINUE;
}

static gboolean quit_loop(gpointer user_data) {
    g_main_loop_quit(static_cast<GMainLoop*>(user_data));
    return G_SOURCE_REMOVE;
}

static void print_usage() {
    std::cout << "koboshelf - sync a local e-book library with a Kobo reader\n\n"
              << "Usage: koboshelf [options]\n\n"
              << "Options:\n"
              << "  --config DIR        Configuration directory (default ~/.config/koboshelf)\n"
              << "  --log-level LEVEL   DEBUG, INFO, WARNING, ERROR or CRITICAL (default INFO)\n"
              << "  --debug             Same as --log-level DEBUG\n"
              << "  --help              Show this help message\n";
}

int main(int argc, char* argv[]) {
    install_crash_handlers();

    std::string config_dir = Config::default_config_dir();
    LogLevel level = LogLevel::INFO;

    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        if (arg == "--debug") {
            level = LogLevel::DEBUG;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            if (!Logger::parse_level(argv[++i], level)) {
                std::cerr << "Unknown log level: " << argv[i] << "\n";
                return 2;
            }
        } else {
            std::cerr << "Unknown option: " << arg << "\n\n";
            print_usage();
            return 2;
        }
    }

    const char* home = std::getenv("HOME");
    std::string log_dir = home ? std::string(home) + "/.cache/koboshelf" : "/tmp";
    std::error_code ec;
    fs::create_directories(log_dir, ec);

    Logger::init(level, ec ? std::string() : log_dir + "/koboshelf.log");
    Logger::info("koboshelf - Starting...");
    Logger::debug(std::string("[Init] SQLite ") + sqlite3_libversion() + ", " + OPENSSL_VERSION_TEXT +
                  ", " + archive_version_string());

    Config config(config_dir);
    if (!config.load() || !config.validate()) {
        Logger::critical("[Init] Unusable configuration in " + config.config_path());
        Logger::shutdown();
        return 1;
    }

    SyncSession session(config);
    RunContext ctx;
    ctx.session = &session;
    ctx.loop = g_main_loop_new(nullptr, FALSE);

    guint sigint_id = g_unix_signal_add(SIGINT, shutdown_handler_glib, &ctx);
    guint sigterm_id = g_unix_signal_add(SIGTERM, shutdown_handler_glib, &ctx);

    // The run is synchronous; the main loop only dispatches signals meanwhile
    std::thread worker([&ctx]() {
        try {
            ctx.exit_code = ctx.session->run();
        } catch (const std::exception& e) {
            Logger::critical(std::string("[Session] Unhandled error: ") + e.what());
            ctx.exit_code = SyncSession::EXIT_CODE_FAILURE;
        }
        g_idle_add(quit_loop, ctx.loop);
    });

    g_main_loop_run(ctx.loop);
    worker.join();

    g_source_remove(sigint_id);
    g_source_remove(sigterm_id);
    g_main_loop_unref(ctx.loop);

    if (ctx.exit_code == SyncSession::EXIT_CODE_STOPPED) {
        Logger::warn("Sync interrupted");
    }
    Logger::info("koboshelf - Finished with exit code " + std::to_string(ctx.exit_code));
    Logger::shutdown();
    return ctx.exit_code;
}
