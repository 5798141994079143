#pragma once

#include "TestSupport.hpp"
#include "SimulatedOracle.hpp"

namespace finalizer_tests {

using namespace repart;
using namespace repart_test;

namespace {

configuration no_window() {
    configuration config;
    config.validation_window = std::chrono::seconds(0);
    return config;
}

/// A BRIDGED run over the simulated catalog, cut over eight days ago.
migration_run oracle_run(simulated_oracle& db) {
    db.tables["APP.ORDERS"].rows = 10;
    db.tables["APP.ORDERS_OLD"].rows = 10;
    db.views.insert("APP.ORDERS_BRIDGE");
    db.triggers.insert("APP.ORDERS_BRIDGE_TRG");
    db.invalid = {{"V_ORDERS", "VIEW"}, {"PKG_ORDERS", "PACKAGE BODY"}, {"SYN_ORDERS", "SYNONYM"}};
    db.stubborn.insert("SYN_ORDERS");

    migration_run run;
    run.id = uuid_t::generate();
    run.identity = {"APP", "ORDERS"};
    run.source = {"APP", "ORDERS", {}};
    run.shadow = {"APP", "ORDERS_NEW", {}};
    run.retired_name = "ORDERS_OLD";
    run.phase = migration_phase::bridged;
    run.source_metadata.columns = {{"ID", "NUMBER(19,0)", false}, {"CREATED_AT", "DATE", false}};
    run.source_metadata.primary_key = {"ID"};
    run.captured_grants = {{"REPORTER", "SELECT", false}, {"ETL", "INSERT", true}};
    run.reference_row_count = 10;
    run.cut_over_at = std::chrono::system_clock::now() - std::chrono::hours(24 * 8);
    return run;
}

} // namespace

void test_refused_before_bridged() {
    std::cout << "  test_refused_before_bridged..." << std::flush;

    sqlite_gateway db(":memory:");
    create_orders(db, "orders", 10);
    migration_engine engine(db, no_window());
    auto run = engine.start({"main", "orders"}, {});

    bool threw = false;
    try {
        engine.finalize(run, {true});
    } catch (const precondition_failed&) {
        threw = true;
    }
    assert(threw);
    assert(run.phase == migration_phase::built);
    assert(object_exists(db, "orders"));
    assert(object_exists(db, "orders_NEW"));

    std::cout << " OK" << std::endl;
}

void test_refused_without_confirmation_or_window() {
    std::cout << "  test_refused_without_confirmation_or_window..." << std::flush;

    sqlite_gateway db(":memory:");
    create_orders(db, "orders", 10);
    migration_engine engine(db);  // seven day window
    auto run = engine.start({"main", "orders"}, {});
    engine.cut_over(run);

    bool threw = false;
    try {
        engine.finalize(run, {false});
    } catch (const precondition_failed& e) {
        threw = true;
        assert(std::string(e.what()).find("confirmation") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        engine.finalize(run, {true});
    } catch (const precondition_failed& e) {
        threw = true;
        assert(std::string(e.what()).find("Validation window") != std::string::npos);
    }
    assert(threw);
    assert(run.phase == migration_phase::bridged);
    assert(object_exists(db, "orders_OLD"));
    assert(object_exists(db, "orders_BRIDGE", "view"));

    std::cout << " OK" << std::endl;
}

void test_finalize_sqlite() {
    std::cout << "  test_finalize_sqlite..." << std::flush;

    sqlite_gateway db(":memory:");
    create_orders(db, "orders", 30);
    migration_engine engine(db, no_window());
    event_recorder recorder;
    engine.events().subscribe(recorder.sink());

    auto run = engine.start({"main", "orders"}, {});
    engine.cut_over(run);

    // The application deletes a row during the validation window; the
    // retired table still holds it
    db.execute("DELETE FROM main.orders WHERE id = 3");

    auto report = engine.finalize(run, {true});
    assert(run.phase == migration_phase::finalized);
    assert(report.retired_dropped);
    assert(report.recompiled.empty());
    assert(report.still_invalid.empty());
    assert(report.grants_applied.empty());

    assert(!object_exists(db, "orders_OLD"));
    assert(!object_exists(db, "orders_BRIDGE", "view"));
    assert(!object_exists(db, "orders_BRIDGE_ins", "trigger"));
    assert(count_rows(db, "orders") == 29);
    auto deleted = db.query("SELECT COUNT(*) AS n FROM main.orders WHERE id = 3");
    assert(row_int(deleted.front(), "n") == 0);
    assert(recorder.has("finalizer", "finalize", event_outcome::succeeded));

    // Finalized runs cannot be finalized again
    bool threw = false;
    try {
        engine.finalize(run, {true});
    } catch (const precondition_failed&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void test_finalize_oracle() {
    std::cout << "  test_finalize_oracle..." << std::flush;

    simulated_oracle db;
    migration_engine engine(db);
    event_recorder recorder;
    engine.events().subscribe(recorder.sink());
    auto run = oracle_run(db);

    auto report = engine.finalize(run, {true});
    assert(run.phase == migration_phase::finalized);
    assert(report.retired_dropped);
    assert(db.tables.count("APP.ORDERS_OLD") == 0);
    assert(db.views.empty());
    assert(db.triggers.empty());

    // One recompile pass; the synonym stays invalid and is reported
    assert(report.recompiled.size() == 3);
    assert(report.still_invalid.size() == 1);
    assert(report.still_invalid[0].name == "SYN_ORDERS");
    assert(recorder.has("finalizer", "recompile", event_outcome::warned));

    assert(report.grants_applied.size() == 2);
    assert(db.grants.size() == 2);
    assert(db.grants[0] == "GRANT SELECT ON APP.ORDERS TO REPORTER");
    assert(db.grants[1] == "GRANT INSERT ON APP.ORDERS TO ETL WITH GRANT OPTION");

    std::cout << " OK" << std::endl;
}

void test_failed_grant_is_retryable() {
    std::cout << "  test_failed_grant_is_retryable..." << std::flush;

    simulated_oracle db;
    migration_engine engine(db);
    auto run = oracle_run(db);

    db.fail_next("TO ETL");
    bool threw = false;
    try {
        engine.finalize(run, {true});
    } catch (const transient_database_error& e) {
        threw = true;
        assert(std::string(e.what()).find("ETL") != std::string::npos);
    }
    assert(threw);
    assert(run.phase == migration_phase::bridged);
    assert(db.tables.count("APP.ORDERS_OLD") == 0);

    // The retry skips what is already done
    auto report = engine.finalize(run, {true});
    assert(run.phase == migration_phase::finalized);
    assert(!report.retired_dropped);
    assert(report.grants_applied.size() == 2);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing finalizer..." << std::endl;
    test_refused_before_bridged();
    test_refused_without_confirmation_or_window();
    test_finalize_sqlite();
    test_finalize_oracle();
    test_failed_grant_is_retryable();
    std::cout << "  Finalizer tests passed!" << std::endl;
}

} // namespace finalizer_tests
