#include <RepartCore.hpp>
#include <nlohmann/json.hpp>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>

#include "TestSupport.hpp"
#include "SimulatedOracle.hpp"
#include "GateTests.hpp"
#include "ShadowTests.hpp"
#include "CutoverTests.hpp"
#include "BridgeTests.hpp"
#include "FinalizerTests.hpp"
#include "ExchangeTests.hpp"
#include "EngineTests.hpp"

using namespace repart;
using namespace repart_test;

// ============================================================================
// Test: Core types
// ============================================================================

void test_uuid() {
    std::cout << "Testing run ids..." << std::endl;

    auto a = uuid_t::generate();
    auto b = uuid_t::generate();
    assert(a != b);

    auto s = a.to_string();
    assert(s.size() == 36);
    assert(s[8] == '-' && s[13] == '-' && s[18] == '-' && s[23] == '-');
    assert(s[14] == '4');
    assert(s[19] == '8' || s[19] == '9' || s[19] == 'a' || s[19] == 'b');

    std::cout << "  Run id tests passed!" << std::endl;
}

void test_partition_scheme() {
    std::cout << "Testing partition schemes..." << std::endl;

    partition_scheme none;
    none.validate();
    assert(!none.is_partitioned());
    assert(none.describe() == "NONE");

    partition_scheme interval;
    interval.method = partition_method::interval;
    interval.columns = {"created_at"};
    interval.interval = "NUMTOYMINTERVAL(1, 'MONTH')";
    interval.initial_upper_bound = "DATE '2020-01-01'";
    interval.subpartition_method = partition_method::hash;
    interval.subpartition_columns = {"customer_id"};
    interval.subpartition_count = 8;
    interval.validate();
    assert(interval.describe() == "INTERVAL(created_at) + HASH(customer_id) x8");

    auto expect_invalid = [](const partition_scheme& scheme) {
        bool threw = false;
        try {
            scheme.validate();
        } catch (const configuration_error& e) {
            threw = true;
            assert(e.kind() == error_kind::configuration);
        }
        assert(threw);
    };

    partition_scheme no_columns;
    no_columns.method = partition_method::list;
    expect_invalid(no_columns);

    partition_scheme no_bound;
    no_bound.method = partition_method::range;
    no_bound.columns = {"created_at"};
    expect_invalid(no_bound);

    partition_scheme no_interval = interval;
    no_interval.interval.clear();
    expect_invalid(no_interval);

    partition_scheme no_count;
    no_count.method = partition_method::hash;
    no_count.columns = {"id"};
    expect_invalid(no_count);

    partition_scheme list_sub = interval;
    list_sub.subpartition_method = partition_method::list;
    expect_invalid(list_sub);

    partition_scheme orphan_sub;
    orphan_sub.subpartition_method = partition_method::hash;
    expect_invalid(orphan_sub);

    std::cout << "  Partition scheme tests passed!" << std::endl;
}

void test_configuration() {
    std::cout << "Testing configuration..." << std::endl;

    configuration defaults;
    defaults.validate();
    assert(defaults.shadow_suffix == "_NEW");
    assert(defaults.retired_suffix == "_OLD");
    assert(defaults.bridge_suffix == "_BRIDGE");
    assert(defaults.router == router_kind::trigger);
    assert(defaults.disabled_constraints == constraint_policy::enable);
    assert(defaults.validation_window == std::chrono::hours(24 * 7));

    auto expect_invalid = [](const configuration& config) {
        bool threw = false;
        try {
            config.validate();
        } catch (const configuration_error&) {
            threw = true;
        }
        assert(threw);
    };

    configuration same_suffix;
    same_suffix.bridge_suffix = "_NEW";
    expect_invalid(same_suffix);

    configuration empty_suffix;
    empty_suffix.retired_suffix.clear();
    expect_invalid(empty_suffix);

    configuration negative_batch;
    negative_batch.backfill_batch_rows = -1;
    expect_invalid(negative_batch);

    configuration no_parallelism;
    no_parallelism.parallel_degree = 0;
    expect_invalid(no_parallelism);

    configuration negative_window;
    negative_window.validation_window = std::chrono::seconds(-1);
    expect_invalid(negative_window);

    assert(parse_log_level("debug") == log_level::debug);
    assert(parse_log_level("off") == log_level::off);
    assert(parse_log_level("loud") == log_level::warn);
    assert(parse_log_level(nullptr) == log_level::warn);

    std::cout << "  Configuration tests passed!" << std::endl;
}

void test_rows_and_errors() {
    std::cout << "Testing rows and errors..." << std::endl;

    row_t row;
    row["N"] = int64_t{42};
    row["NUM_ROWS"] = 12.0;
    row["HIGH_VALUE"] = std::string("DATE '2024-01-01'");
    row["LAST_ANALYZED"] = nullptr;
    row["TEXT_NUMBER"] = std::string("17");

    assert(row_int(row, "n") == 42);
    assert(row_int(row, "num_rows") == 12);
    assert(row_int(row, "text_number") == 17);
    assert(row_text(row, "high_value") == "DATE '2024-01-01'");
    assert(row_text(row, "N") == "42");
    assert(!row_optional_int(row, "last_analyzed"));
    assert(row_int(row, "last_analyzed") == 0);

    bool threw = false;
    try {
        row_int(row, "missing");
    } catch (const db_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        row_int(row, "high_value");
    } catch (const db_error&) {
        threw = true;
    }
    assert(threw);

    precondition_failed error("Staging is not empty", {"run-1", "APP.ORDERS", "BUILT", "cut_over"});
    std::string message = error.what();
    assert(message.find("Staging is not empty") != std::string::npos);
    assert(message.find("run=run-1") != std::string::npos);
    assert(message.find("table=APP.ORDERS") != std::string::npos);
    assert(message.find("step=cut_over") != std::string::npos);
    assert(error.context().phase == "BUILT");

    threw = false;
    try {
        raise_database_error(statement_timeout("slow", "SELECT 1"), {});
    } catch (const step_timeout_error& e) {
        threw = true;
        assert(e.kind() == error_kind::transient_database);
    }
    assert(threw);

    threw = false;
    try {
        raise_database_error(db_error("locked"), {});
    } catch (const step_timeout_error&) {
        assert(false);
    } catch (const transient_database_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Row and error tests passed!" << std::endl;
}

// ============================================================================
// Test: Events
// ============================================================================

void test_events() {
    std::cout << "Testing events..." << std::endl;

    gate_result gate;
    gate.kind = gate_kind::row_reconciliation;
    gate.target = "APP.ORDERS_NEW";
    gate.verdict = gate_verdict::warn;
    gate.detail = "more rows than expected";
    gate.observed = 105;
    gate.reference = 100;

    auto event = make_event({"run-7", "APP.ORDERS", "BUILT", "cut_over"}, "cutover", "preconditions",
                            event_outcome::warned, "one warning");
    event.gates = {gate};

    auto j = nlohmann::json::parse(event.to_json());
    assert(j["runId"] == "run-7");
    assert(j["identity"] == "APP.ORDERS");
    assert(j["component"] == "cutover");
    assert(j["step"] == "preconditions");
    assert(j["phase"] == "BUILT");
    assert(j["outcome"] == "warned");
    assert(j["detail"] == "one warning");
    assert(j["at"].get<int64_t>() > 0);
    assert(j["gates"].size() == 1);
    assert(j["gates"][0]["kind"] == "RowReconciliation");
    assert(j["gates"][0]["verdict"] == "WARN");
    assert(j["gates"][0]["observed"] == 105);
    assert(j["gates"][0]["reference"] == 100);

    // Fan-out to every sink, in subscription order
    event_stream stream;
    std::ostringstream out;
    std::vector<std::string> seen;
    stream.subscribe(json_lines_sink(out));
    stream.subscribe([&seen](const migration_event& e) { seen.push_back(e.step); });
    stream.subscribe(log_event_sink());

    auto previous = get_log_level();
    set_log_level(log_level::off);
    stream.emit(event);
    stream.emit(make_event({}, "exchange", "swap_oldest_slice", event_outcome::succeeded));
    set_log_level(previous);

    assert(seen == (std::vector<std::string>{"preconditions", "swap_oldest_slice"}));

    std::istringstream lines(out.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        auto parsed = nlohmann::json::parse(line);
        assert(parsed.contains("outcome"));
        ++count;
    }
    assert(count == 2);

    std::cout << "  Event tests passed!" << std::endl;
}

// ============================================================================
// Test: SQLite gateway
// ============================================================================

void test_sqlite_gateway() {
    std::cout << "Testing SQLite gateway..." << std::endl;

    sqlite_gateway db(":memory:");
    assert(std::string(db.sql_dialect().name()) == "sqlite");
    db.execute("CREATE TABLE main.t (id INTEGER PRIMARY KEY, label TEXT, weight REAL, raw BLOB)");

    assert(db.execute("INSERT INTO main.t (id, label, weight, raw) VALUES (?1, ?2, ?3, ?4)",
                      {int64_t{1}, std::string("one"), 1.5, std::vector<uint8_t>{1, 2, 3}}) == 1);
    assert(db.execute("INSERT INTO main.t (id, label, weight, raw) VALUES (?1, ?2, ?3, ?4)",
                      {int64_t{2}, nullptr, 2.5, nullptr}) == 1);
    assert(db.execute("UPDATE main.t SET weight = weight * 2") == 2);

    auto rows = db.query("SELECT id, label, weight, raw FROM main.t ORDER BY id");
    assert(rows.size() == 2);
    assert(std::get<int64_t>(rows[0].at("id")) == 1);
    assert(std::get<std::string>(rows[0].at("label")) == "one");
    assert(std::get<double>(rows[0].at("weight")) == 3.0);
    assert(std::get<std::vector<uint8_t>>(rows[0].at("raw")).size() == 3);
    assert(std::holds_alternative<std::nullptr_t>(rows[1].at("label")));

    // Bad SQL reports db_error with the statement
    bool threw = false;
    try {
        db.query("SELECT nope FROM main.t");
    } catch (const db_error& e) {
        threw = true;
        assert(e.sql() == "SELECT nope FROM main.t");
    }
    assert(threw);

    // The transaction guard rolls back unless committed
    {
        transaction tx(db);
        db.execute("DELETE FROM main.t");
        assert(db.is_in_transaction());
    }
    assert(!db.is_in_transaction());
    assert(count_rows(db, "t") == 2);
    {
        transaction tx(db);
        db.execute("DELETE FROM main.t WHERE id = 2");
        tx.commit();
    }
    assert(count_rows(db, "t") == 1);

    // A statement that outlives its timeout is interrupted
    statement endless("WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) "
                      "SELECT COUNT(*) AS n FROM c");
    endless.timeout = std::chrono::milliseconds(50);
    threw = false;
    try {
        db.query(endless);
    } catch (const statement_timeout&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        run_query(db, endless, std::chrono::milliseconds(50), {"", "main.t", "", "count"});
    } catch (const step_timeout_error& e) {
        threw = true;
        assert(e.context().step == "count");
    }
    assert(threw);

    // The connection is still usable afterwards
    assert(count_rows(db, "t") == 1);

    // A read-only connection answers gates but refuses writes
    auto path = (std::filesystem::temp_directory_path() / ("repart_ro_" + uuid_t::generate().to_string() + ".db"))
                    .string();
    {
        sqlite_gateway writer(path);
        create_orders(writer, "orders", 4);
    }
    {
        sqlite_gateway reader(path, sqlite_gateway::open_mode::read_only);
        gate_engine gates(reader);
        assert(gates.run(gate_request::existence({"main", "orders", {}}, true)).passed());
        assert(count_rows(reader, "orders") == 4);
        threw = false;
        try {
            reader.execute("DELETE FROM main.orders");
        } catch (const db_error&) {
            threw = true;
        }
        assert(threw);
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
    assert(std::filesystem::exists(path) == false);

    std::cout << "  SQLite gateway tests passed!" << std::endl;
}

// ============================================================================
// Test: Oracle dialect rendering
// ============================================================================

void test_oracle_dialect() {
    std::cout << "Testing Oracle dialect..." << std::endl;

    oracle_dialect d;
    assert(d.supports_partitioning());
    assert(d.qualify("app", "orders_NEW") == "APP.ORDERS_NEW");

    table_metadata meta;
    meta.columns = {{"id", "NUMBER(19,0)", false}, {"customer_id", "NUMBER(10,0)", false},
                    {"created_at", "DATE", false}, {"note", "VARCHAR2(200)", true}};
    meta.primary_key = {"id"};

    physical_table target{"app", "orders_NEW", {}};
    target.scheme.method = partition_method::interval;
    target.scheme.columns = {"created_at"};
    target.scheme.interval = "NUMTOYMINTERVAL(1, 'MONTH')";
    target.scheme.initial_upper_bound = "DATE '2020-01-01'";
    target.scheme.subpartition_method = partition_method::hash;
    target.scheme.subpartition_columns = {"customer_id"};
    target.scheme.subpartition_count = 8;

    auto create = d.create_table(target, meta, 4).sql;
    assert(create.find("CREATE TABLE APP.ORDERS_NEW (ID NUMBER(19,0) NOT NULL") == 0);
    assert(create.find("NOTE VARCHAR2(200),") != std::string::npos);
    assert(create.find("CONSTRAINT ORDERS_NEW_PK PRIMARY KEY (ID)") != std::string::npos);
    assert(create.find("PARTITION BY RANGE (CREATED_AT) INTERVAL (NUMTOYMINTERVAL(1, 'MONTH')) "
                       "SUBPARTITION BY HASH (CUSTOMER_ID) SUBPARTITIONS 8 "
                       "(PARTITION P_INITIAL VALUES LESS THAN (DATE '2020-01-01'))") != std::string::npos);
    assert(create.find("ENABLE ROW MOVEMENT PARALLEL 4") != std::string::npos);

    physical_table source{"app", "orders", {}};
    auto batch = d.backfill_batch(source, target, meta, {"id"}, 1000, 4).sql;
    assert(batch.find("INSERT /*+ PARALLEL(4) */ INTO APP.ORDERS_NEW") == 0);
    assert(batch.find("WHERE NOT EXISTS (SELECT 1 FROM APP.ORDERS_NEW t WHERE t.ID = s.ID)") != std::string::npos);
    assert(batch.find("ORDER BY s.ID FETCH FIRST 1000 ROWS ONLY") != std::string::npos);
    auto whole = d.backfill_batch(source, target, meta, {}, 0, 1).sql;
    assert(whole.find("FETCH FIRST") == std::string::npos);
    assert(whole.find("PARALLEL") == std::string::npos);

    assert(d.delete_missing_keys(target, source, {"id"}).sql ==
           "DELETE FROM APP.ORDERS_NEW t WHERE NOT EXISTS (SELECT 1 FROM APP.ORDERS r WHERE r.ID = t.ID)");

    // Sessions count whatever schema they are connected as
    auto sessions = d.active_sessions("app", "orders");
    assert(sessions.sql.find("schemaname") == std::string::npos);
    assert(sessions.params.size() == 1);
    assert(std::get<std::string>(sessions.params[0]) == "ORDERS");

    index_def index{"idx_orders_customer", {"customer_id"}, false};
    assert(d.create_index(target, "idx_orders_customer_N", index, true, 4).sql ==
           "CREATE INDEX APP.IDX_ORDERS_CUSTOMER_N ON APP.ORDERS_NEW (CUSTOMER_ID) LOCAL PARALLEL 4");

    assert(d.rename_table(source, "orders_OLD").sql == "ALTER TABLE APP.ORDERS RENAME TO ORDERS_OLD");

    bridge_spec spec{"app", "orders_BRIDGE", "orders", "orders_OLD", {"id", "note"}, {"id"}};
    auto view = d.create_bridge_view(spec).sql;
    assert(view == "CREATE OR REPLACE VIEW APP.ORDERS_BRIDGE AS SELECT ID, NOTE FROM APP.ORDERS "
                   "UNION ALL SELECT ID, NOTE FROM APP.ORDERS_OLD WHERE ID NOT IN (SELECT ID FROM APP.ORDERS)");
    auto router = d.create_write_router(spec);
    assert(router.size() == 1);
    assert(router[0].sql.find("INSTEAD OF INSERT OR UPDATE OR DELETE ON APP.ORDERS_BRIDGE") != std::string::npos);
    assert(router[0].sql.find("accepts INSERT only") != std::string::npos);
    assert(d.write_router_triggers(spec) == (std::vector<std::string>{"ORDERS_BRIDGE_TRG"}));

    assert(d.exchange_partition(source, "p_2024_01", {"app", "orders_stage", {}}).sql ==
           "ALTER TABLE APP.ORDERS EXCHANGE PARTITION P_2024_01 WITH TABLE APP.ORDERS_STAGE "
           "INCLUDING INDEXES WITHOUT VALIDATION");

    // SQLite keeps names as written and refuses partition DDL
    sqlite_dialect lite;
    assert(lite.qualify("main", "orders_NEW") == "main.orders_NEW");
    assert(!lite.partition_slices(source));
    assert(!lite.invalid_objects("main"));

    std::cout << "  Oracle dialect tests passed!" << std::endl;
}

int main() {
    std::cout << "=== RepartCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Core tests
        test_uuid();
        test_partition_scheme();
        test_configuration();
        test_rows_and_errors();
        test_events();

        // Backends
        test_sqlite_gateway();
        test_oracle_dialect();

        // Components
        gate_tests::run_all();
        shadow_tests::run_all();
        cutover_tests::run_all();
        bridge_tests::run_all();
        finalizer_tests::run_all();
        exchange_tests::run_all();

        // Engine
        engine_tests::run_all();

        std::cout << std::endl;
        std::cout << "All tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
