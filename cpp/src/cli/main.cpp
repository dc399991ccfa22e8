#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "sqlcas/address/resolver.hpp"
#include "sqlcas/bindings/http.hpp"
#include "sqlcas/cli/commands.hpp"
#include "sqlcas/cli/config.hpp"
#include "sqlcas/cli/options.hpp"
#include "sqlcas/core/errors.hpp"
#include "sqlcas/registry/connection_cache.hpp"
#include "sqlcas/registry/registry.hpp"
#include "sqlcas/server/http_server.hpp"

namespace {

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    std::fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, sqlcas::core::Status s, const std::string& detail = {}) {
    std::fprintf(stderr,
                 "error: %s failed (code=%s, domain=%s, aux=%u)\n",
                 context,
                 sqlcas::core::status_code_name(s.code),
                 sqlcas::core::status_domain_name(s.domain),
                 s.aux);
    if (!detail.empty()) {
        std::fprintf(stderr, "error: %s: %s\n", context, detail.c_str());
    }
    if (s.code == sqlcas::core::StatusCode::Io && s.aux != 0) {
        std::fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    std::printf("usage: sqlcas [command] [options] [args]\n\n");
    std::printf("Commands (default: serve):\n");
    for (const auto& c : sqlcas::cli::kCommandSpecs) {
        std::printf("  %-10s %s\n", c.name, c.usage);
    }
    std::printf("\nOptions:\n");
    for (const auto& o : sqlcas::cli::kOptionSpecs) {
        std::printf("  -%c, --%-10s %s\n", o.short_name, o.long_name, o.help);
    }
    std::printf("\nEnvironment: SQLCAS_ROOT, SQLCAS_SNAPSHOT, SQLCAS_HOST, SQLCAS_PORT\n");
}

int build_registry(sqlcas::registry::Registry& registry, bool force, bool verbose) {
    sqlcas::registry::BuildReport report;
    const sqlcas::core::Status s = registry.build(force, &report);
    if (!sqlcas::core::is_ok(s)) {
        print_status_error("build", s, report.detail);
        return EXIT_FAILURE;
    }
    if (verbose || force) {
        std::fprintf(stderr, "info: %s %u database(s)\n",
                     report.reused_snapshot ? "loaded snapshot with" : "indexed",
                     report.database_count);
    }
    return EXIT_SUCCESS;
}

int handle_list(sqlcas::registry::Registry& registry) {
    const sqlcas::registry::RegistrySnapshot snap = registry.snapshot();
    for (const auto& [name, rec] : *snap) {
        const sqlcas::core::CanonicalAddress addr{name, sqlcas::core::hash_prefix_of(rec)};
        std::printf("%s  %s  %s\n", sqlcas::address::canonical_path(addr).c_str(), rec.digest.c_str(),
                    rec.file_path.c_str());
        for (const auto& [table, count] : rec.tables) {
            std::printf("    %s  %lld\n", table.c_str(), static_cast<long long>(count));
        }
    }
    return EXIT_SUCCESS;
}

int handle_resolve(sqlcas::registry::Registry& registry, const sqlcas::cli::CliArgs& args) {
    if (args.argc < 1 || args.argc > 2) {
        print_error("resolve: expected <name[-hash]> [table]");
        return EXIT_FAILURE;
    }
    std::string table;
    if (args.argc == 2) {
        table = args.argv[1];
    }

    sqlcas::address::Resolution res;
    const sqlcas::core::Status s = sqlcas::address::resolve_address(
        *registry.snapshot(), args.argv[0], args.argc == 2 ? &table : nullptr, &res);
    if (!sqlcas::core::is_ok(s)) {
        print_status_error("resolve", s, res.message);
        return EXIT_FAILURE;
    }
    if (res.redirect) {
        std::printf("redirect %s\n", res.redirect_target.c_str());
    } else {
        std::printf("canonical %s\n", sqlcas::address::canonical_path(res.address).c_str());
    }
    return EXIT_SUCCESS;
}

int handle_serve(const sqlcas::cli::AppConfig& cfg, sqlcas::registry::Registry& registry) {
    sqlcas::registry::ConnectionCache connections(registry);
    sqlcas::bindings::http::ServiceContext ctx{registry, connections};

    sqlcas::server::ServerConfig server_cfg;
    server_cfg.host = cfg.host;
    server_cfg.port = cfg.port;
    server_cfg.verbose = cfg.verbose;
    sqlcas::server::HttpServer server(server_cfg, ctx);

    std::string detail;
    sqlcas::core::Status s = server.listen(&detail);
    if (!sqlcas::core::is_ok(s)) {
        print_status_error("listen", s, detail);
        return EXIT_FAILURE;
    }
    std::fprintf(stderr, "info: serving %s on http://%s:%u/\n",
                 cfg.root.c_str(), cfg.host.c_str(), static_cast<unsigned>(server.port()));

    s = server.run();
    if (!sqlcas::core::is_ok(s)) {
        print_status_error("serve", s);
        return EXIT_FAILURE;
    }
    std::fprintf(stderr, "info: stopped\n");
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    const sqlcas::cli::CliArgs all{argv + 1, static_cast<sqlcas::core::u32>(argc > 0 ? argc - 1 : 0)};

    sqlcas::cli::CommandInvocation cmd;
    sqlcas::core::u32 consumed = 0;
    sqlcas::core::Status s = sqlcas::cli::parse_command(all, sqlcas::cli::kCommandSpecs,
                                                        sqlcas::cli::kCommandSpecCount,
                                                        sqlcas::cli::CommandId::Serve, &cmd, &consumed);
    if (!sqlcas::core::is_ok(s)) {
        std::fprintf(stderr, "error: unknown command %s\n", all.argv[0]);
        handle_help();
        return EXIT_FAILURE;
    }

    sqlcas::cli::ParsedOption storage[32];
    sqlcas::cli::ParsedOptions opts{storage, 0, 32};
    s = sqlcas::cli::parse_options(cmd.args, sqlcas::cli::kOptionSpecs, sqlcas::cli::kOptionSpecCount,
                                   &opts, &consumed);
    if (!sqlcas::core::is_ok(s)) {
        print_error("invalid option; see --help");
        return EXIT_FAILURE;
    }
    const sqlcas::cli::CliArgs rest{cmd.args.argv + consumed, cmd.args.argc - consumed};

    sqlcas::cli::AppConfig cfg;
    std::string detail;
    const sqlcas::cli::EnvLookup env = [](const char* name) -> const char* { return std::getenv(name); };
    s = sqlcas::cli::load_config(env, opts, &cfg, &detail);
    if (!sqlcas::core::is_ok(s)) {
        print_status_error("configuration", s, detail);
        return EXIT_FAILURE;
    }

    if (cfg.help || cmd.id == sqlcas::cli::CommandId::Help) {
        handle_help();
        return EXIT_SUCCESS;
    }
    if (cmd.id != sqlcas::cli::CommandId::Resolve && rest.argc > 0) {
        std::fprintf(stderr, "error: unexpected argument %s\n", rest.argv[0]);
        return EXIT_FAILURE;
    }

    sqlcas::registry::Registry registry(sqlcas::registry::RegistryConfig{cfg.root, cfg.snapshot_path});

    const bool force = cmd.id == sqlcas::cli::CommandId::Build;
    const int rc = build_registry(registry, force, cfg.verbose);
    if (rc != EXIT_SUCCESS) {
        return rc;
    }

    switch (cmd.id) {
        case sqlcas::cli::CommandId::Build:
            return EXIT_SUCCESS;
        case sqlcas::cli::CommandId::List:
            return handle_list(registry);
        case sqlcas::cli::CommandId::Resolve:
            return handle_resolve(registry, rest);
        case sqlcas::cli::CommandId::Serve:
            return handle_serve(cfg, registry);
        default:
            handle_help();
            return EXIT_FAILURE;
    }
}
