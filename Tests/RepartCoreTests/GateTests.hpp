#pragma once

#include "TestSupport.hpp"
#include "SimulatedOracle.hpp"
#include <sqlite3.h>

namespace gate_tests {

using namespace repart;
using namespace repart_test;

void test_existence() {
    std::cout << "  test_existence..." << std::flush;

    sqlite_gateway db(":memory:");
    create_orders(db, "orders", 3);
    gate_engine gates(db);

    assert(gates.run(gate_request::existence({"main", "orders", {}}, true)).passed());
    assert(gates.run(gate_request::existence({"main", "ORDERS", {}}, true)).passed());
    assert(gates.run(gate_request::existence({"main", "orders", {}}, false)).failed());
    assert(gates.run(gate_request::existence({"main", "orders_NEW", {}}, false)).passed());

    auto missing = gates.run(gate_request::existence({"main", "orders_NEW", {}}, true));
    assert(missing.failed());
    assert(missing.kind == gate_kind::existence);
    assert(missing.target == "main.orders_NEW");
    assert(missing.observed == 0);

    std::cout << " OK" << std::endl;
}

void test_row_reconciliation() {
    std::cout << "  test_row_reconciliation..." << std::flush;

    sqlite_gateway db(":memory:");
    create_orders(db, "orders", 100);
    create_orders(db, "orders_NEW", 100);
    gate_engine gates(db);

    physical_table source{"main", "orders", {}};
    physical_table shadow{"main", "orders_NEW", {}};

    // 100 / 100 against 100 passes, and keeps passing
    auto first = gates.run(gate_request::row_reconciliation(source, shadow, 100));
    auto second = gates.run(gate_request::row_reconciliation(source, shadow, 100));
    assert(first.passed());
    assert(second.verdict == first.verdict);
    assert(first.observed == 100 && first.reference == 100);

    // Five rows arrive in the source after the snapshot
    insert_orders(db, "orders", 101, 5);
    auto more = gates.run(gate_request::row_reconciliation(source, shadow, 100));
    assert(more.verdict == gate_verdict::warn);
    assert(more.detail.find("source=105") != std::string::npos);

    // Deletes also only warn
    db.execute("DELETE FROM main.orders WHERE id > 90");
    auto fewer = gates.run(gate_request::row_reconciliation(source, shadow, 100));
    assert(fewer.verdict == gate_verdict::warn);
    assert(fewer.detail.find("fewer") != std::string::npos);

    // An empty target never passes
    db.execute("DELETE FROM main.orders_NEW");
    assert(gates.run(gate_request::row_reconciliation(source, shadow, 100)).failed());

    // Expecting empty: pass only when both are empty
    assert(gates.run(gate_request::row_reconciliation(shadow, shadow, 0)).passed());
    assert(gates.run(gate_request::row_reconciliation(source, shadow, 0)).failed());

    std::cout << " OK" << std::endl;
}

void test_gate_query_failure_is_transient() {
    std::cout << "  test_gate_query_failure_is_transient..." << std::flush;

    sqlite_gateway db(":memory:");
    create_orders(db, "orders", 3);
    gate_engine gates(db);

    bool threw = false;
    try {
        gates.run(gate_request::row_reconciliation({"main", "orders", {}}, {"main", "nowhere", {}}, 3));
    } catch (const transient_database_error& e) {
        threw = true;
        assert(e.context().step.find("RowReconciliation") != std::string::npos);
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void test_constraint_state() {
    std::cout << "  test_constraint_state..." << std::flush;

    sqlite_gateway db(":memory:");
    db.execute("CREATE TABLE main.customers (id INTEGER PRIMARY KEY, name TEXT)");
    db.execute("CREATE TABLE main.orders (id INTEGER PRIMARY KEY, customer_id INTEGER REFERENCES customers(id))");
    db.execute("CREATE TABLE main.notes (body TEXT)");
    gate_engine gates(db);

    auto enabled = gates.run(gate_request::constraint_state({"main", "orders", {}}));
    assert(enabled.passed());
    assert(enabled.observed == 2);  // PK + one FK

    auto none = gates.run(gate_request::constraint_state({"main", "notes", {}}));
    assert(none.passed());
    assert(none.detail == "no constraints");

    db.execute("PRAGMA foreign_keys = OFF");
    auto disabled = gates.run(gate_request::constraint_state({"main", "orders", {}}));
    assert(disabled.verdict == gate_verdict::warn);
    assert(disabled.detail.find("FK_0") != std::string::npos);

    // The builder re-enables what the gate reported
    configuration config;
    event_stream events;
    shadow_builder builder(db, config, events);
    assert(builder.enable_constraints({"main", "orders", {}}, {}) == 1);
    assert(gates.run(gate_request::constraint_state({"main", "orders", {}})).passed());

    std::cout << " OK" << std::endl;
}

void test_active_writers() {
    std::cout << "  test_active_writers..." << std::flush;

    sqlite_gateway db(":memory:");
    create_orders(db, "orders", 10);
    gate_engine gates(db);

    assert(gates.run(gate_request::active_writers("main", "orders")).passed());

    // A statement stepped but not finished counts as a session on the table
    sqlite3_stmt* reader = nullptr;
    int rc = sqlite3_prepare_v2(db.handle(), "SELECT * FROM orders", -1, &reader, nullptr);
    assert(rc == SQLITE_OK);
    rc = sqlite3_step(reader);
    assert(rc == SQLITE_ROW);

    auto busy = gates.run(gate_request::active_writers("main", "orders"));
    assert(busy.failed());
    assert(busy.observed == 1);

    // Unrelated tables are not affected
    assert(gates.run(gate_request::active_writers("main", "invoices")).passed());

    sqlite3_finalize(reader);
    assert(gates.run(gate_request::active_writers("main", "orders")).passed());

    std::cout << " OK" << std::endl;
}

void test_key_coverage() {
    std::cout << "  test_key_coverage..." << std::flush;

    sqlite_gateway db(":memory:");
    create_orders(db, "orders", 20);
    create_orders(db, "orders_NEW", 20);
    gate_engine gates(db);

    physical_table source{"main", "orders", {}};
    physical_table shadow{"main", "orders_NEW", {}};
    assert(gates.run(gate_request::key_coverage(source, shadow, {"id"})).passed());

    // Rows missing from the target are missing keys
    db.execute("DELETE FROM main.orders_NEW WHERE id <= 3");
    auto missing = gates.run(gate_request::key_coverage(source, shadow, {"id"}));
    assert(missing.failed());
    assert(missing.observed == 3);

    // Rows only the target holds are not; the reverse direction counts them
    db.execute("DELETE FROM main.orders WHERE id <= 3");
    db.execute("DELETE FROM main.orders WHERE id > 15");
    assert(gates.run(gate_request::key_coverage(source, shadow, {"id"})).passed());
    auto extra = gates.run(gate_request::key_coverage(shadow, source, {"id"}));
    assert(extra.failed());
    assert(extra.observed == 5);

    bool threw = false;
    try {
        gates.run(gate_request::key_coverage(source, shadow, {}));
    } catch (const configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void test_run_all_keeps_request_order() {
    std::cout << "  test_run_all_keeps_request_order..." << std::flush;

    sqlite_gateway db(":memory:");
    create_orders(db, "orders", 50);
    create_orders(db, "orders_NEW", 50);
    gate_engine gates(db);

    auto results = gates.run_all({
        gate_request::existence({"main", "orders", {}}, true),
        gate_request::existence({"main", "orders_OLD", {}}, false),
        gate_request::row_reconciliation({"main", "orders", {}}, {"main", "orders_NEW", {}}, 50),
        gate_request::constraint_state({"main", "orders_NEW", {}}),
        gate_request::partition_distribution({"main", "orders", {}}),
    });
    assert(results.size() == 5);
    assert(results[0].kind == gate_kind::existence);
    assert(results[2].kind == gate_kind::row_reconciliation);
    assert(results[4].kind == gate_kind::partition_distribution);
    assert(results[4].detail == "not partitioned");
    assert(none_failed(results));
    assert(summarize(results).find("RowReconciliation(main.orders -> main.orders_NEW)=PASS") != std::string::npos);

    // One broken gate: everything is joined, then the error surfaces
    bool threw = false;
    try {
        gates.run_all({
            gate_request::existence({"main", "orders", {}}, true),
            gate_request::row_reconciliation({"main", "missing", {}}, {"main", "orders", {}}, 1),
        });
    } catch (const transient_database_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void test_oracle_session_and_distribution() {
    std::cout << "  test_oracle_session_and_distribution..." << std::flush;

    simulated_oracle db;
    db.tables["APP.ORDERS"].partitions = {{"P1", "DATE '2024-01-01'", 100},
                                          {"P2", "DATE '2024-02-01'", 200},
                                          {"P3", "DATE '2024-03-01'", 50}};
    gate_engine gates(db);

    auto distribution = gates.run(gate_request::partition_distribution({"app", "orders", {}}));
    assert(distribution.passed());
    assert(distribution.slices.size() == 3);
    assert(distribution.slices[0].name == "P1");
    assert(distribution.slices[0].ordinal_position == 1);
    assert(distribution.observed == 350);
    assert(distribution.detail.find("P1=100 (28.6%)") != std::string::npos);

    assert(gates.run(gate_request::active_writers("app", "orders")).passed());
    db.sessions.push_back({"APP", "insert into app.orders values (:1, :2)"});
    auto busy = gates.run(gate_request::active_writers("app", "orders"));
    assert(busy.failed());
    assert(busy.observed == 1);

    // Application users rarely connect as the table owner; their
    // sessions still hold the table
    db.sessions.push_back({"ORDERS_APP", "UPDATE APP.ORDERS SET amount = :1"});
    db.sessions.push_back({"REPORTING", "select count(*) from orders"});
    db.sessions.push_back({"REPORTING", "select * from invoices"});
    auto others = gates.run(gate_request::active_writers("app", "orders"));
    assert(others.failed());
    assert(others.observed == 3);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing gates..." << std::endl;
    test_existence();
    test_row_reconciliation();
    test_gate_query_failure_is_transient();
    test_constraint_state();
    test_active_writers();
    test_key_coverage();
    test_run_all_keeps_request_order();
    test_oracle_session_and_distribution();
    std::cout << "  Gate tests passed!" << std::endl;
}

} // namespace gate_tests
