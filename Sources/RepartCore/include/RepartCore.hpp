#pragma once

// RepartCore - online re-partitioning of large tables
//
// Usage:
//   #include <RepartCore.hpp>
//
//   int main() {
//       repart::sqlite_gateway db("app.db");
//       repart::configuration config;
//       config.validation_window = std::chrono::hours(24);
//
//       repart::migration_engine engine(db, config);
//       engine.events().subscribe(repart::log_event_sink());
//
//       auto run = engine.start({"main", "orders"}, {});  // shadow built, BUILT
//       engine.cut_over(run);                              // BRIDGED
//       // ... validation window ...
//       engine.catch_up(run);
//       engine.finalize(run, {true});                      // FINALIZED
//   }

#include "repart/types.hpp"
#include "repart/errors.hpp"
#include "repart/log.hpp"
#include "repart/config.hpp"
#include "repart/gateway.hpp"
#include "repart/dialect.hpp"
#include "repart/db.hpp"
#include "repart/events.hpp"
#include "repart/cancellation.hpp"
#include "repart/run.hpp"
#include "repart/gates.hpp"
#include "repart/discovery.hpp"
#include "repart/shadow.hpp"
#include "repart/bridge.hpp"
#include "repart/cutover.hpp"
#include "repart/finalizer.hpp"
#include "repart/exchange.hpp"
#include "repart/engine.hpp"
