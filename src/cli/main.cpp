// =============================================================================
// gridsync CLI - Table editor core command-line interface
// =============================================================================
//
// Usage:
//   gridsync [global options] <command> [options]
//
// Commands:
//   init          Apply the database schema
//   ingest        Append synthetic rows to a table
//   page          Read one keyset page of a table
//   views         List a table's views
//   patch         Apply a patch to a view
//   delete-view   Delete a view
//   version       Show version information
//
// Examples:
//   gridsync -d gridsync init
//   gridsync --as u1 ingest --table t1 --count 70001
//   gridsync --as u1 page --table t1 --limit 100
//   gridsync --as u1 patch --table t1 --view v1 --path search --value '"alpha"'
//
// =============================================================================

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/json.hpp>

#include "gridsync/api/table_api.hpp"
#include "gridsync/config.hpp"
#include "gridsync/db/connection.hpp"
#include "gridsync/db/operations.hpp"
#include "gridsync/db/schema.hpp"
#include "gridsync/error.hpp"
#include "gridsync/ingest/pipeline.hpp"
#include "gridsync/ingest/row_writer.hpp"
#include "gridsync/logging.hpp"
#include "gridsync/read/pagination.hpp"
#include "gridsync/store/pg_table_store.hpp"
#include "gridsync/store/pg_view_store.hpp"
#include "gridsync/store/session.hpp"
#include "gridsync/sync/asio_scheduler.hpp"
#include "gridsync/sync/local_view_service.hpp"
#include "gridsync/sync/view_sync_coordinator.hpp"

namespace gridsync::cli {
    int cmd_init(int argc, char* argv[]);
    int cmd_ingest(int argc, char* argv[]);
    int cmd_page(int argc, char* argv[]);
    int cmd_views(int argc, char* argv[]);
    int cmd_patch(int argc, char* argv[]);
    int cmd_delete_view(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define GRIDSYNC_VERSION_MAJOR 0
#define GRIDSYNC_VERSION_MINOR 3
#define GRIDSYNC_VERSION_PATCH 0
#define GRIDSYNC_VERSION_STRING "0.3.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"init",        "Apply the database schema", gridsync::cli::cmd_init},
    {"ingest",      "Append synthetic rows to a table", gridsync::cli::cmd_ingest},
    {"page",        "Read one keyset page of a table", gridsync::cli::cmd_page},
    {"views",       "List a table's views", gridsync::cli::cmd_views},
    {"patch",       "Apply a patch to a view", gridsync::cli::cmd_patch},
    {"delete-view", "Delete a view", gridsync::cli::cmd_delete_view},
    {"version",     "Show version information", gridsync::cli::cmd_version},
    {"help",        "Show this help message", gridsync::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    gridsync::db::ConnectionConfig db;
    std::string user;           // acting user id
    std::string config_file = "gridsync.env";
    bool db_overridden = false;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

namespace {

// Everything a data command needs, built from the loaded Config.
struct Services {
    gridsync::db::ConnectionPool pool;
    gridsync::store::PgTableStore tables;
    gridsync::store::PgViewStore views;
    gridsync::ingest::StreamingRowWriter writer;
    gridsync::ingest::BulkIngestionPipeline pipeline;
    gridsync::read::PaginationEngine pages;
    gridsync::store::FixedSession session;
    gridsync::api::TableApi api;

    explicit Services(const gridsync::Config& config)
        : pool(connection_config(config),
               std::max<size_t>(config.get<size_t>("ingest.max_concurrency", 2), 1) + 1),
          tables(pool),
          views(pool),
          writer(pool, config.get<size_t>("ingest.index_drop_cell_threshold", 1000000)),
          pipeline(tables, writer, gridsync::ingest::IngestOptions::from_config(config)),
          pages(tables, gridsync::read::PageOptions::from_config(config)),
          session(g_options.user),
          api(session, tables, views, pipeline, pages) {}

    static gridsync::db::ConnectionConfig connection_config(const gridsync::Config& config) {
        if (g_options.db_overridden) return g_options.db;
        return gridsync::db::ConnectionConfig::from_config(config);
    }
};

std::unique_ptr<Services> make_services() {
    return std::make_unique<Services>(gridsync::Config::getInstance());
}

// Value of "--name <value>" style options; nullopt when absent.
std::optional<std::string> find_option(int argc, char* argv[], const char* name) {
    for (int i = 0; i < argc; ++i) {
        if (std::strcmp(argv[i], name) == 0 && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

std::string require_option(int argc, char* argv[], const char* name) {
    auto value = find_option(argc, argv, name);
    if (!value || value->empty()) {
        throw gridsync::InvalidArgumentError(std::string("missing ") + name, "cli");
    }
    return *value;
}

int64_t parse_int(const std::string& text, const char* what) {
    try {
        size_t used = 0;
        long long v = std::stoll(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return v;
    } catch (const std::exception&) {
        throw gridsync::InvalidArgumentError(std::string(what) + " must be an integer, got '" + text + "'", "cli");
    }
}

boost::json::value parse_json(const std::string& text) {
    boost::system::error_code ec;
    boost::json::value v = boost::json::parse(text, ec);
    if (ec) {
        throw gridsync::InvalidArgumentError("--value is not valid JSON: " + ec.message(), "cli",
                                             "Quote strings, e.g. --value '\"alpha\"'");
    }
    return v;
}

void print_json(const boost::json::value& v) {
    std::cout << boost::json::serialize(v) << "\n";
}

boost::json::object row_to_json(const gridsync::Row& row) {
    boost::json::object cache;
    for (const auto& [column_id, value] : row.cache) {
        if (gridsync::is_text(value)) {
            cache[column_id] = std::get<std::string>(value);
        } else if (gridsync::is_number(value)) {
            cache[column_id] = std::get<double>(value);
        } else {
            cache[column_id] = nullptr;
        }
    }
    boost::json::object o;
    o["id"] = row.id;
    o["createdAt"] = row.created_at_us;
    o["cache"] = std::move(cache);
    return o;
}

} // anonymous namespace

// =============================================================================
// Commands
// =============================================================================

namespace gridsync::cli {

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "gridsync - Tabular data editor core\n";
    std::cout << "Version " << GRIDSYNC_VERSION_STRING << "\n\n";
    std::cout << "Usage: gridsync [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 14; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nCommand Options:\n";
    std::cout << "  ingest       --table <id> --count <n>\n";
    std::cout << "  page         --table <id> [--cursor <c>] [--limit <n>]\n";
    std::cout << "  views        --table <id>\n";
    std::cout << "  patch        --view <id> --path <filters|sort|columns|search> --value <json>\n";
    std::cout << "               [--op set|merge] (--version <n> | --table <id>)\n";
    std::cout << "  delete-view  --view <id>\n";
    std::cout << "\nGlobal Options:\n";
    std::cout << "  -d, --dbname <name>     Database name (default: gridsync)\n";
    std::cout << "  -U, --user <user>       Database user (default: postgres)\n";
    std::cout << "  -W, --password <pw>     Database password\n";
    std::cout << "  -h, --host <host>       Database host (default: localhost)\n";
    std::cout << "  -p, --port <port>       Database port (default: 5432)\n";
    std::cout << "  --as <user-id>          Acting application user\n";
    std::cout << "  --config <file>         key=value config file (default: gridsync.env)\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Errors only\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  GS_DB_HOST, GS_DB_PORT, GS_DB_USER, GS_DB_PASS, GS_DB_NAME\n";
    std::cout << "  GS_USER                 Acting application user\n";
    std::cout << "  GS_LOG_LEVEL            debug|info|warn|error|fatal\n";

    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "gridsync " << GRIDSYNC_VERSION_STRING << "\n";
    std::cout << "libpq: " << PQlibVersion() << "\n";
    return 0;
}

int cmd_init([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    auto services = make_services();
    auto conn = services->pool.acquire();
    db::ensure_schema(conn);
    if (!g_options.quiet) std::cerr << "Schema is up to date\n";
    return 0;
}

int cmd_ingest(int argc, char* argv[]) {
    std::string table_id = require_option(argc, argv, "--table");
    int64_t count = parse_int(require_option(argc, argv, "--count"), "--count");

    auto services = make_services();
    auto start = std::chrono::steady_clock::now();

    auto progress = [](size_t done, size_t total) {
        if (g_options.quiet) return;
        std::cerr << "\r[INGEST] " << done << " / " << total << " rows" << std::flush;
    };
    ingest::IngestResult result = services->api.ingest_rows(table_id, count, progress);
    if (!g_options.quiet && count > 0) std::cerr << "\n";

    auto secs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count() / 1000.0;

    boost::json::object out;
    out["success"] = result.success;
    out["rowsAdded"] = result.rows_added;
    out["batchesCommitted"] = result.batches_committed;
    out["batchesFailed"] = result.batches_failed;
    out["seconds"] = secs;
    if (!result.errors.empty()) {
        boost::json::array errors;
        for (const auto& e : result.errors) {
            boost::json::object err;
            err["batch"] = e.batch_index;
            err["rows"] = e.rows;
            err["message"] = e.message;
            errors.push_back(std::move(err));
        }
        out["errors"] = std::move(errors);
    }
    print_json(out);

    if (g_options.verbose) {
        LOG_DEBUG("COPY drain waits: ", services->writer.drain_waits());
    }
    return result.success ? 0 : 2;
}

int cmd_page(int argc, char* argv[]) {
    std::string table_id = require_option(argc, argv, "--table");
    std::optional<std::string> cursor = find_option(argc, argv, "--cursor");
    std::optional<size_t> limit;
    if (auto l = find_option(argc, argv, "--limit")) {
        int64_t n = parse_int(*l, "--limit");
        if (n <= 0) throw InvalidArgumentError("--limit must be positive", "cli");
        limit = static_cast<size_t>(n);
    }

    auto services = make_services();
    read::Page page = services->api.get_page(table_id, cursor, limit);

    boost::json::array rows;
    for (const auto& row : page.rows) rows.push_back(row_to_json(row));

    boost::json::object out;
    out["rows"] = std::move(rows);
    out["hasMore"] = page.has_more;
    out["totalCount"] = page.total_count;
    if (page.next_cursor) {
        out["nextCursor"] = *page.next_cursor;
    } else {
        out["nextCursor"] = nullptr;
    }
    print_json(out);
    return 0;
}

int cmd_views(int argc, char* argv[]) {
    std::string table_id = require_option(argc, argv, "--table");
    auto services = make_services();

    boost::json::array out;
    for (const auto& v : services->api.list_views(table_id)) {
        out.push_back(view::view_to_json(v));
    }
    print_json(out);
    return 0;
}

// Drive one edit through the coordinator: debounce, send, conflict retry.
static int patch_through_coordinator(Services& services, const std::string& table_id,
                                     const std::string& view_id, view::PatchOp op,
                                     view::PatchPath path, boost::json::value value) {
    boost::asio::io_context io;
    auto work = boost::asio::make_work_guard(io);

    sync::AsioScheduler scheduler(io);
    sync::LocalViewService service(services.api, scheduler);
    sync::ViewSyncCoordinator coordinator(service, scheduler,
                                          sync::SyncOptions::from_config(Config::getInstance()));

    int rc = 1;
    sync::ViewSyncCoordinator::Listener listener;
    listener.on_synced = [&](const view::View& v) {
        print_json(view::view_to_json(v));
        rc = 0;
        io.stop();
    };
    listener.on_error = [&](const std::string& id, std::exception_ptr error) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            std::cerr << "Patch on " << id << " failed: " << e.what() << "\n";
        }
        rc = 1;
        io.stop();
    };
    listener.on_retries_exhausted = [&](const std::string& id) {
        std::cerr << "Patch on " << id << " gave up after repeated conflicts\n";
        rc = 3;
        io.stop();
    };
    coordinator.set_listener(std::move(listener));

    scheduler.post([&]() {
        try {
            auto columns = services.api.columns(table_id);
            auto views = services.api.list_views(table_id);
            coordinator.switch_table(table_id, std::move(columns), std::move(views));
            coordinator.select_view(view_id);
            coordinator.add_patch(op, path, std::move(value));
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            rc = 1;
            io.stop();
        }
    });

    io.run();
    return rc;
}

int cmd_patch(int argc, char* argv[]) {
    std::string view_id = require_option(argc, argv, "--view");
    view::PatchPath path = view::parse_patch_path(require_option(argc, argv, "--path"));
    view::PatchOp op = view::PatchOp::Set;
    if (auto o = find_option(argc, argv, "--op")) op = view::parse_patch_op(*o);
    boost::json::value value = parse_json(require_option(argc, argv, "--value"));

    auto services = make_services();

    auto version = find_option(argc, argv, "--version");
    if (!version) {
        std::string table_id = require_option(argc, argv, "--table");
        return patch_through_coordinator(*services, table_id, view_id, op, path, std::move(value));
    }

    view::Patch patch;
    patch.op = op;
    patch.path = path;
    patch.value = std::move(value);
    patch.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    try {
        view::View v = services->api.apply_view_patches(view_id, parse_int(*version, "--version"), {patch});
        print_json(view::view_to_json(v));
        return 0;
    } catch (const VersionConflictError& e) {
        std::cerr << e.message() << "\n";
        if (e.current_version()) {
            std::cerr << "Retry with --version " << *e.current_version() << "\n";
        }
        return 3;
    }
}

int cmd_delete_view(int argc, char* argv[]) {
    std::string view_id = require_option(argc, argv, "--view");
    auto services = make_services();
    services->api.delete_view(view_id);
    if (!g_options.quiet) std::cerr << "Deleted view " << view_id << "\n";
    return 0;
}

}  // namespace gridsync::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    if (const char* user = std::getenv("GS_USER")) {
        g_options.user = user;
    }

    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if (g_options.db.parse_arg(argc, argv, i)) {
            g_options.db_overridden = true;
        } else if (arg == "--as" && i + 1 < argc) {
            g_options.user = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    // Shift argv to point to command
    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        gridsync::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    if (!gridsync::init_config(g_options.config_file)) {
        std::cerr << "Invalid configuration\n";
        return 1;
    }
    if (g_options.verbose) {
        gridsync::set_log_level(gridsync::LogLevel::DEBUG);
        gridsync::Config::getInstance().print();
    }
    if (g_options.quiet) gridsync::set_log_level(gridsync::LogLevel::ERROR);

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const gridsync::GridsyncException& e) {
                std::cerr << e.what() << "\n";
                return e.code() == gridsync::ErrorCode::INVALID_ARGUMENT ? 64 : 1;
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'gridsync help' for usage.\n";
    return 1;
}
