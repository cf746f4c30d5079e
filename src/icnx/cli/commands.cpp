// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/cli/commands.hpp>
#include <icnx/cli/session_view.hpp>
#include <icnx/core/error.hpp>
#include <icnx/core/events.hpp>
#include <icnx/core/http_session.hpp>
#include <icnx/core/registry.hpp>
#include <icnx/core/retry.hpp>
#include <icnx/core/session.hpp>
#include <icnx/log.hpp>
#include <icnx/store/error.hpp>
#include <icnx/store/history_store.hpp>
#include <icnx/store/migration.hpp>
#include <icnx/store/paths.hpp>
#include <icnx/store/persistence.hpp>
#include <icnx/store/progress_store.hpp>
#include <icnx/store/scrape_store.hpp>
#include <icnx/version.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>

using namespace icnx::core;

namespace fs = std::filesystem;
namespace chrono = std::chrono;

namespace icnx::cli {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_sigint(int) {
    g_interrupted = 1;
}

// curl global state for the lifetime of a command
struct CurlGlobal {
    CurlGlobal() noexcept { HttpSession::global_init(); }
    ~CurlGlobal() { HttpSession::global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

template<typename T>
std::optional<T> parse_number(const char* text) {
    char* end = nullptr;
    errno = 0;
    auto value = std::strtoll(text, &end, 10);
    if (end == text || end == nullptr || *end != '\0' || errno != 0 || value < 0) {
        return std::nullopt;
    }
    return static_cast<T>(value);
}

fs::path destination_of(const CliArgs& args) {
    return args.directory.empty() ? fs::current_path() : fs::path(args.directory);
}

store::StorePaths store_paths(const EngineConfig& cfg) {
    return store::StorePaths(resolve_app_data_dir(cfg));
}

// Shared history store for the read/maintenance commands
store::HistoryStore open_history(const CliArgs& args, const EngineConfig& cfg) {
    return store::HistoryStore(store_paths(cfg).history_db(destination_of(args)));
}

std::string dump(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto take_value = [&](int& i, std::string_view flag) -> const char* {
        if (i + 1 >= argc) {
            args.error = fmt::format("option {} needs a value", flag);
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
            continue;
        }
        if (arg == "-d" || arg == "--directory") {
            if (const char* v = take_value(i, arg)) args.directory = v;
            continue;
        }
        if (arg == "--config") {
            if (const char* v = take_value(i, arg)) args.config_file = v;
            continue;
        }
        if (arg == "-c" || arg == "--concurrency") {
            if (const char* v = take_value(i, arg)) {
                args.concurrency = parse_number<std::uint32_t>(v);
                if (!args.concurrency || *args.concurrency == 0) {
                    args.error = fmt::format("invalid concurrency: {}", v);
                }
            }
            continue;
        }
        if (arg == "-r" || arg == "--retries") {
            if (const char* v = take_value(i, arg)) {
                args.retries = parse_number<std::uint32_t>(v);
                if (!args.retries) {
                    args.error = fmt::format("invalid retry count: {}", v);
                }
            }
            continue;
        }
        if (arg == "--older-than") {
            if (const char* v = take_value(i, arg)) {
                args.older_than = parse_number<std::int64_t>(v);
                if (!args.older_than) {
                    args.error = fmt::format("invalid timestamp: {}", v);
                }
            }
            continue;
        }
        if (arg.starts_with("-") && arg.size() > 1) {
            args.error = "unknown option: " + arg;
            continue;
        }

        if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }

    return args;
}

EngineConfig effective_config(const CliArgs& args) {
    EngineConfig cfg = args.config_file.empty() ? EngineConfig{} : load_config(args.config_file);
    if (args.concurrency) cfg.max_concurrent = *args.concurrency;
    if (args.retries) cfg.retries = *args.retries;
    if (args.verbose) cfg.log_level = "debug";
    return cfg;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) {
    if (args.positional.empty()) {
        std::cerr << "Error: No items file specified" << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::invalid_item));
    }

    const fs::path items_path = args.positional.front();
    std::ifstream in(items_path, std::ios::binary);
    if (!in) {
        std::cerr << "Error: Cannot read " << items_path.string() << std::endl;
        return std::unexpected(make_error_code(store::StoreErrc::io_error));
    }
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

    auto items = nlohmann::json::parse(text, nullptr, false);
    if (items.is_discarded() || !items.is_array()) {
        std::cerr << "Error: " << items_path.string() << " is not a JSON array" << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::invalid_item));
    }

    const EngineConfig cfg = effective_config(args);
    const fs::path destination = destination_of(args);

    CurlGlobal curl;
    HttpSession transport;
    SystemClock clock;
    OrchestrationContext context;
    SessionView view(args.verbose, args.quiet);
    LoggingEventSink log_sink;
    CallbackEventSink sink([&view, &log_sink](std::string_view name, const nlohmann::json& payload) {
        log_sink.emit(name, payload);
        view.on_event(name, payload);
    });
    store::Persistence persistence(store_paths(cfg), destination);

    std::optional<SessionReport> report;
    {
        SessionOrchestrator orchestrator(context, transport, sink, clock, cfg, &persistence);

        auto session_id = orchestrator.start_session(items, destination);
        if (!session_id) {
            std::cerr << "Error: Failed to start session: " << session_id.error().message() << std::endl;
            return std::unexpected(session_id.error());
        }
        if (args.verbose) {
            std::cout << "Session " << *session_id << " -> " << destination.string() << std::endl;
        }

        g_interrupted = 0;
        auto previous = std::signal(SIGINT, on_sigint);

        bool cancelled = false;
        while (orchestrator.is_running(*session_id)) {
            if (g_interrupted && !cancelled) {
                cancelled = orchestrator.cancel_session(*session_id);
            }
            std::this_thread::sleep_for(chrono::milliseconds(100));
        }
        report = orchestrator.wait(*session_id);

        std::signal(SIGINT, previous);
    }
    persistence.flush();
    view.finish();

    if (!report) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    if (!args.quiet) {
        std::cout << fmt::format("Session {}: {} completed, {} failed, {} cancelled, {} skipped ({})",
                                 report->session_id, report->completed, report->failed,
                                 report->cancelled, report->skipped, report->status())
                  << std::endl;
    }

    if (report->was_cancelled) {
        std::cout << "Download cancelled" << std::endl;
        return 1;
    }
    return report->completed == report->submitted ? 0 : 1;
}

CliResult history(const CliArgs& args) {
    const EngineConfig cfg = effective_config(args);
    auto db = open_history(args, cfg);

    auto records = db.read_all();
    if (!records) {
        std::cerr << "Error: Cannot read history: " << records.error().message() << std::endl;
        return std::unexpected(records.error());
    }

    auto summaries = store::summarize_history(*records);
    if (summaries.empty()) {
        std::cout << "No download history" << std::endl;
        return 0;
    }

    for (const auto& s : summaries) {
        std::cout << fmt::format("{}  {:<10} {:>10}  {}\n    {}\n",
                                 s.session_id, s.status, s.total_size, s.title, s.subtitle);
    }
    std::cout << std::flush;
    return 0;
}

CliResult session(const CliArgs& args) {
    if (args.positional.empty()) {
        std::cerr << "Error: No session id specified" << std::endl;
        return std::unexpected(make_error_code(store::StoreErrc::not_found));
    }

    const EngineConfig cfg = effective_config(args);
    store::ProgressStore progress(store_paths(cfg));

    auto rows = progress.read(args.positional.front(), destination_of(args));
    if (!rows) {
        std::cerr << "Error: Cannot read session: " << rows.error().message() << std::endl;
        return std::unexpected(rows.error());
    }

    std::cout << dump(nlohmann::json(*rows)) << std::endl;
    return 0;
}

CliResult scrape(const CliArgs& args) {
    if (args.positional.empty()) {
        std::cerr << "Error: No scrape key specified" << std::endl;
        return std::unexpected(make_error_code(store::StoreErrc::not_found));
    }

    const EngineConfig cfg = effective_config(args);
    store::ScrapeStore db(store_paths(cfg).scrape_db(destination_of(args)));

    auto rows = db.read(args.positional.front());
    if (!rows) {
        std::cerr << "Error: Cannot read scrape results: " << rows.error().message() << std::endl;
        return std::unexpected(rows.error());
    }

    std::cout << dump(nlohmann::json(*rows)) << std::endl;
    return 0;
}

CliResult migrate(const CliArgs& args) {
    if (args.positional.empty()) {
        std::cerr << "Error: No legacy history file specified" << std::endl;
        return std::unexpected(make_error_code(store::StoreErrc::not_found));
    }

    const EngineConfig cfg = effective_config(args);
    auto db = open_history(args, cfg);

    auto migrated = store::migrate_json_history(args.positional.front(), db);
    if (!migrated) {
        std::cerr << "Error: Migration failed: " << migrated.error().message() << std::endl;
        return std::unexpected(migrated.error());
    }

    std::cout << "Migrated " << *migrated << " record(s) into " << db.path().string() << std::endl;
    return 0;
}

CliResult purge(const CliArgs& args) {
    const EngineConfig cfg = effective_config(args);
    auto db = open_history(args, cfg);

    db.purge(args.older_than);
    db.flush();

    if (args.older_than) {
        std::cout << "Purged history older than " << *args.older_than << std::endl;
    } else {
        std::cout << "Purged all history" << std::endl;
    }
    return 0;
}

CliResult run(const CliArgs& args) {
    init_logging(effective_config(args).log_level);

    if (args.command == "download") return download(args);
    if (args.command == "history") return history(args);
    if (args.command == "session") return session(args);
    if (args.command == "scrape") return scrape(args);
    if (args.command == "migrate") return migrate(args);
    if (args.command == "purge") return purge(args);

    std::cerr << "Error: Unknown command: " << args.command << std::endl;
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "ICNX " << program_name << " - batch download orchestrator\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " <COMMAND> [OPTIONS] [ARGS]\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  download <ITEMS.json>   Download a JSON array of items\n";
    std::cout << "  history                 List download sessions\n";
    std::cout << "  session <ID>            Show progress rows of a session\n";
    std::cout << "  scrape <KEY>            Show cached scrape results\n";
    std::cout << "  migrate <FILE>          Import a legacy JSON history file\n";
    std::cout << "  purge                   Delete download history\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -d, --directory <DIR>   Destination directory (default: current)\n";
    std::cout << "  -c, --concurrency <N>   Maximum parallel transfers (default: 3)\n";
    std::cout << "  -r, --retries <N>       Retries per transfer (default: 3)\n";
    std::cout << "      --config <FILE>     JSON settings file\n";
    std::cout << "      --older-than <TS>   purge: only rows created before this Unix time\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " download -d ~/Downloads items.json\n";
    std::cout << "  " << program_name << " history\n";
    std::cout << "  " << program_name << " purge --older-than 1700000000\n";
}

void print_version() noexcept {
    std::cout << "ICNX " << icnx::version.to_string() << std::endl;
    std::cout << "Built " << icnx::BUILD_DATE << " " << icnx::BUILD_TIME << "\n";
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, SQLite\n";
}

} // namespace icnx::cli
