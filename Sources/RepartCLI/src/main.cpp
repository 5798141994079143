#include <RepartCore.hpp>
#include <nlohmann/json.hpp>
#include <getopt.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace {

enum exit_code {
    exit_ok = 0,
    exit_migration = 1,
    exit_usage = 2
};

void usage() {
    std::printf("Usage: repartctl [options] <plan.json | ->\n");
    std::printf("   -d| --database <path>, SQLite database file, overrides the plan's \"database\"\n");
    std::printf("   -l| --log-level <level>, off, error, warn (default), info or debug\n");
    std::printf("   -h| --help, print this help\n");
    std::printf("\n");
    std::printf("The plan names a table, a target scheme and the steps to run in order:\n");
    std::printf("   build, catch_up, cut_over, open_bridge, close_bridge, finalize, roll_back, gates,\n");
    std::printf("   swap_oldest_slice\n");
    std::printf("A plan of gates steps only opens the database read-only.\n");
    std::printf("Events are written to stdout as JSON lines.\n");
}

json read_plan(const std::string& path) {
    if (path == "-") {
        return json::parse(std::cin);
    }
    std::ifstream in(path);
    if (!in) {
        throw repart::configuration_error("Cannot open plan " + path);
    }
    return json::parse(in);
}

repart::partition_method parse_method(const std::string& name) {
    auto upper = repart::to_upper(name);
    if (upper.empty() || upper == "NONE") return repart::partition_method::none;
    if (upper == "RANGE") return repart::partition_method::range;
    if (upper == "INTERVAL") return repart::partition_method::interval;
    if (upper == "LIST") return repart::partition_method::list;
    if (upper == "HASH") return repart::partition_method::hash;
    throw repart::configuration_error("Unknown partition method " + name);
}

repart::partition_scheme parse_scheme(const json& j) {
    repart::partition_scheme scheme;
    if (j.is_null()) return scheme;
    scheme.method = parse_method(j.value("method", "none"));
    scheme.columns = j.value("columns", std::vector<std::string>{});
    scheme.interval = j.value("interval", "");
    scheme.initial_upper_bound = j.value("initial_upper_bound", "");
    scheme.partition_count = j.value("partition_count", 0);
    scheme.subpartition_method = parse_method(j.value("subpartition_method", "none"));
    scheme.subpartition_columns = j.value("subpartition_columns", std::vector<std::string>{});
    scheme.subpartition_count = j.value("subpartition_count", 0);
    scheme.tablespace = j.value("tablespace", "");
    return scheme;
}

repart::physical_table parse_table(const json& j, const std::string& default_schema) {
    repart::physical_table table;
    table.schema = j.value("schema", default_schema);
    table.name = j.at("name").get<std::string>();
    return table;
}

repart::configuration parse_config(const json& j) {
    repart::configuration config;
    if (j.is_null()) return config;
    config.shadow_suffix = j.value("shadow_suffix", config.shadow_suffix);
    config.retired_suffix = j.value("retired_suffix", config.retired_suffix);
    config.bridge_suffix = j.value("bridge_suffix", config.bridge_suffix);
    config.shadow_index_suffix = j.value("shadow_index_suffix", config.shadow_index_suffix);
    config.history_partition_prefix = j.value("history_partition_prefix", config.history_partition_prefix);
    config.backfill_batch_rows = j.value("backfill_batch_rows", config.backfill_batch_rows);
    config.parallel_degree = j.value("parallel_degree", config.parallel_degree);
    config.open_bridge_after_cutover = j.value("open_bridge_after_cutover", config.open_bridge_after_cutover);

    if (j.contains("step_timeout_ms")) {
        config.step_timeout = std::chrono::milliseconds(j.at("step_timeout_ms").get<int64_t>());
    }
    if (j.contains("gate_timeout_ms")) {
        config.gate_timeout = std::chrono::milliseconds(j.at("gate_timeout_ms").get<int64_t>());
    }
    if (j.contains("validation_window_seconds")) {
        config.validation_window = std::chrono::seconds(j.at("validation_window_seconds").get<int64_t>());
    }

    auto router = j.value("router", std::string(repart::to_string(config.router)));
    if (router == "trigger") {
        config.router = repart::router_kind::trigger;
    } else if (router == "proxy") {
        config.router = repart::router_kind::proxy;
    } else {
        throw repart::configuration_error("Unknown router " + router);
    }

    auto policy = j.value("disabled_constraints", std::string(repart::to_string(config.disabled_constraints)));
    if (policy == "enable") {
        config.disabled_constraints = repart::constraint_policy::enable;
    } else if (policy == "proceed") {
        config.disabled_constraints = repart::constraint_policy::proceed;
    } else if (policy == "abort") {
        config.disabled_constraints = repart::constraint_policy::abort;
    } else {
        throw repart::configuration_error("Unknown constraint policy " + policy);
    }
    return config;
}

// Runs the plan's steps in order over one run. Returns the exit code.
int run_plan(const json& plan, const std::string& database) {
    auto config = parse_config(plan.value("config", json()));
    auto steps = plan.value("steps", std::vector<std::string>{});
    if (steps.empty()) {
        throw repart::configuration_error("The plan has no steps");
    }

    bool checks_only = std::all_of(steps.begin(), steps.end(), [](const std::string& s) { return s == "gates"; });
    repart::sqlite_gateway db(database, checks_only ? repart::sqlite_gateway::open_mode::read_only
                                                    : repart::sqlite_gateway::open_mode::read_write);
    repart::migration_engine engine(db, config);
    engine.events().subscribe(repart::json_lines_sink(std::cout));

    std::optional<repart::migration_run> run;
    auto require_run = [&](const std::string& step) -> repart::migration_run& {
        if (!run) {
            const auto& table = plan.at("table");
            repart::table_identity identity{table.value("schema", "main"), table.at("name").get<std::string>()};
            run = engine.prepare(identity, parse_scheme(plan.value("scheme", json())));
            LOG_INFO("repartctl", "Run %s prepared for %s", run->id.to_string().c_str(), step.c_str());
        }
        return *run;
    };

    for (const auto& step : steps) {
        if (step == "build") {
            engine.build(require_run(step));
        } else if (step == "catch_up") {
            auto changed = engine.catch_up(require_run(step));
            LOG_INFO("repartctl", "catch_up changed %lld rows", static_cast<long long>(changed));
        } else if (step == "cut_over") {
            engine.cut_over(require_run(step));
        } else if (step == "open_bridge") {
            engine.open_bridge(require_run(step));
        } else if (step == "close_bridge") {
            engine.close_bridge(require_run(step));
        } else if (step == "finalize") {
            repart::finalize_options options;
            options.operator_confirmed = plan.value("operator_confirmed", false);
            engine.finalize(require_run(step), options);
        } else if (step == "roll_back") {
            repart::rollback_options options;
            options.operator_confirmed = plan.value("operator_confirmed", false);
            engine.roll_back(require_run(step), options);
        } else if (step == "gates") {
            auto& r = require_run(step);
            auto results = engine.run_gates({
                repart::gate_request::existence(r.source, true),
                repart::gate_request::constraint_state(r.source),
                repart::gate_request::active_writers(r.identity.schema, r.identity.logical_name),
            });
            if (!repart::none_failed(results)) {
                std::fprintf(stderr, "Gates failed: %s\n", repart::summarize(results).c_str());
                return exit_migration;
            }
        } else if (step == "swap_oldest_slice") {
            const auto& cycle = plan.at("cycle");
            auto schema = cycle.value("schema", "main");
            repart::archive_cycle ac{parse_table(cycle.at("active"), schema),
                                     parse_table(cycle.at("staging"), schema),
                                     parse_table(cycle.at("history"), schema)};
            engine.swap_oldest_slice(ac);
        } else {
            throw repart::configuration_error("Unknown step " + step);
        }
    }
    return exit_ok;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string database;
    std::string level;

    struct option longopts[] = {{"database", 1, nullptr, 'd'},
                                {"log-level", 1, nullptr, 'l'},
                                {"help", 0, nullptr, 'h'},
                                {nullptr, 0, nullptr, 0}};
    const char* opt_string = "d:l:h";
    int opt = 0;
    while (-1 != (opt = getopt_long(argc, argv, opt_string, longopts, nullptr))) {
        switch (opt) {
            case 'd':
                database = optarg;
                break;
            case 'l':
                level = optarg;
                break;
            case 'h':
                usage();
                return exit_ok;
            default:
                usage();
                return exit_usage;
        }
    }
    if (optind + 1 != argc) {
        fprintf(stderr, "Exactly one plan file is required.\n");
        usage();
        return exit_usage;
    }

    json plan;
    try {
        plan = read_plan(argv[optind]);
    } catch (const json::exception& e) {
        fprintf(stderr, "Invalid plan: %s\n", e.what());
        return exit_usage;
    } catch (const repart::configuration_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return exit_usage;
    }

    if (level.empty()) {
        level = plan.value("log_level", "warn");
    }
    repart::set_log_level(repart::parse_log_level(level.c_str()));
    if (database.empty()) {
        database = plan.value("database", "");
    }
    if (database.empty()) {
        fprintf(stderr, "No database given.\n");
        usage();
        return exit_usage;
    }

    try {
        return run_plan(plan, database);
    } catch (const json::exception& e) {
        fprintf(stderr, "Invalid plan: %s\n", e.what());
        return exit_usage;
    } catch (const repart::configuration_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return exit_usage;
    } catch (const repart::migration_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return exit_migration;
    } catch (const repart::db_error& e) {
        fprintf(stderr, "Database error: %s\n", e.what());
        return exit_migration;
    }
}
