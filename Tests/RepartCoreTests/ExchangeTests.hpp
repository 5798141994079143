#pragma once

#include "TestSupport.hpp"
#include "SimulatedOracle.hpp"

namespace exchange_tests {

using namespace repart;
using namespace repart_test;

namespace {

archive_cycle orders_cycle() {
    return {{"APP", "ORDERS", {}}, {"APP", "ORDERS_STAGE", {}}, {"APP", "ORDERS_HIST", {}}};
}

void seed(simulated_oracle& db) {
    db.tables["APP.ORDERS"].partitions = {{"P_2024_01", "DATE '2024-02-01'", 100},
                                          {"P_2024_02", "DATE '2024-03-01'", 200},
                                          {"P_2024_03", "DATE '2024-04-01'", 50}};
    db.tables["APP.ORDERS_STAGE"];
    db.tables["APP.ORDERS_HIST"];
}

} // namespace

void test_two_consecutive_swaps() {
    std::cout << "  test_two_consecutive_swaps..." << std::flush;

    simulated_oracle db;
    seed(db);
    migration_engine engine(db);
    event_recorder recorder;
    engine.events().subscribe(recorder.sink());

    auto first = engine.swap_oldest_slice(orders_cycle());
    assert(first.slice.name == "P_2024_01");
    assert(first.slice.upper_bound == "DATE '2024-02-01'");
    assert(first.rows_moved == 100);
    assert(first.history_partition.rfind("P_HIST_", 0) == 0);
    assert(db.at("APP.ORDERS_STAGE").total() == 0);

    auto second = engine.swap_oldest_slice(orders_cycle());
    assert(second.slice.name == "P_2024_02");
    assert(second.rows_moved == 200);
    assert(second.history_partition != first.history_partition);
    assert(db.at("APP.ORDERS_STAGE").total() == 0);

    // Every archived row is in history exactly once
    const auto& history = db.at("APP.ORDERS_HIST");
    assert(history.partitions.size() == 2);
    assert(history.partitions[0].rows == 100);
    assert(history.partitions[0].high_value == "DATE '2024-02-01'");
    assert(history.partitions[1].rows == 200);
    assert(history.total() == 300);

    const auto& active = db.at("APP.ORDERS");
    assert(active.partitions.size() == 1);
    assert(active.partitions[0].name == "P_2024_03");
    assert(active.total() == 50);

    assert(recorder.count("exchange", "swap_oldest_slice", event_outcome::succeeded) == 2);

    std::cout << " OK" << std::endl;
}

void test_history_partition_names_increase() {
    std::cout << "  test_history_partition_names_increase..." << std::flush;

    simulated_oracle db;
    configuration config;
    event_stream events;
    exchange_engine exchange(db, config, events);

    auto at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000000));
    assert(exchange.next_history_partition(at) == "P_HIST_1700000000000");
    assert(exchange.next_history_partition(at) == "P_HIST_1700000000001");
    assert(exchange.next_history_partition(at - std::chrono::seconds(1)) == "P_HIST_1700000000002");

    std::cout << " OK" << std::endl;
}

void test_staging_not_empty() {
    std::cout << "  test_staging_not_empty..." << std::flush;

    simulated_oracle db;
    seed(db);
    db.at("APP.ORDERS_STAGE").rows = 7;
    migration_engine engine(db);

    bool threw = false;
    try {
        engine.swap_oldest_slice(orders_cycle());
    } catch (const precondition_failed& e) {
        threw = true;
        assert(e.gates()[0].failed());
    }
    assert(threw);
    assert(db.executed.empty());
    assert(db.at("APP.ORDERS").partitions.size() == 3);

    std::cout << " OK" << std::endl;
}

void test_first_exchange_fails() {
    std::cout << "  test_first_exchange_fails..." << std::flush;

    simulated_oracle db;
    seed(db);
    migration_engine engine(db);

    db.fail_next("EXCHANGE PARTITION P_2024_01");
    bool threw = false;
    try {
        engine.swap_oldest_slice(orders_cycle());
    } catch (const transient_database_error&) {
        threw = true;
    }
    assert(threw);

    // Nothing moved
    assert(db.at("APP.ORDERS").total() == 350);
    assert(db.at("APP.ORDERS_STAGE").total() == 0);
    assert(db.at("APP.ORDERS_HIST").partitions.empty());

    // A clean retry
    assert(engine.swap_oldest_slice(orders_cycle()).rows_moved == 100);

    std::cout << " OK" << std::endl;
}

void test_later_failure_leaves_staging() {
    std::cout << "  test_later_failure_leaves_staging..." << std::flush;

    simulated_oracle db;
    seed(db);
    migration_engine engine(db);

    db.fail_next("ADD PARTITION");
    bool threw = false;
    try {
        engine.swap_oldest_slice(orders_cycle());
    } catch (const transient_database_error& e) {
        threw = true;
        assert(std::string(e.what()).find("left non-empty") != std::string::npos);
    }
    assert(threw);
    assert(db.at("APP.ORDERS_STAGE").total() == 100);
    assert(db.at("APP.ORDERS_HIST").partitions.empty());

    // The next cycle refuses rather than mixing slices in staging
    threw = false;
    try {
        engine.swap_oldest_slice(orders_cycle());
    } catch (const precondition_failed&) {
        threw = true;
    }
    assert(threw);
    assert(db.at("APP.ORDERS_STAGE").total() == 100);

    std::cout << " OK" << std::endl;
}

void test_drop_failure_keeps_rows_archived() {
    std::cout << "  test_drop_failure_keeps_rows_archived..." << std::flush;

    simulated_oracle db;
    seed(db);
    migration_engine engine(db);

    db.fail_next("DROP PARTITION");
    bool threw = false;
    try {
        engine.swap_oldest_slice(orders_cycle());
    } catch (const transient_database_error& e) {
        threw = true;
        assert(std::string(e.what()).find("empty slice") != std::string::npos);
    }
    assert(threw);
    assert(db.at("APP.ORDERS_STAGE").total() == 0);
    assert(db.at("APP.ORDERS_HIST").total() == 100);
    assert(db.at("APP.ORDERS").partitions.size() == 3);
    assert(db.at("APP.ORDERS").partitions[0].rows == 0);

    std::cout << " OK" << std::endl;
}

void test_invalid_cycles() {
    std::cout << "  test_invalid_cycles..." << std::flush;

    simulated_oracle oracle;
    seed(oracle);
    migration_engine engine(oracle);

    bool threw = false;
    try {
        engine.swap_oldest_slice({{"APP", "ORDERS", {}}, {"APP", "ORDERS", {}}, {"APP", "ORDERS_HIST", {}}});
    } catch (const configuration_error&) {
        threw = true;
    }
    assert(threw);

    // An unpartitioned active table has nothing to swap
    oracle.tables["APP.PLAIN"].rows = 10;
    threw = false;
    try {
        engine.swap_oldest_slice({{"APP", "PLAIN", {}}, {"APP", "ORDERS_STAGE", {}}, {"APP", "ORDERS_HIST", {}}});
    } catch (const precondition_failed&) {
        threw = true;
    }
    assert(threw);

    // SQLite has no partitions at all
    sqlite_gateway db(":memory:");
    migration_engine local(db);
    threw = false;
    try {
        local.swap_oldest_slice({{"main", "a", {}}, {"main", "b", {}}, {"main", "c", {}}});
    } catch (const configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing partition exchange..." << std::endl;
    test_two_consecutive_swaps();
    test_history_partition_names_increase();
    test_staging_not_empty();
    test_first_exchange_fails();
    test_later_failure_leaves_staging();
    test_drop_failure_keeps_rows_archived();
    test_invalid_cycles();
    std::cout << "  Partition exchange tests passed!" << std::endl;
}

} // namespace exchange_tests
