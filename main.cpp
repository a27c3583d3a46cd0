// -----------------------------------------------------------------------------
// autotrade_engine: single executable entry point.
//
// Usage: autotrade_engine [config.json]
//
//   1) Load AppConfig (defaults when no path is given), then apply the
//      MAX_CONSECUTIVE_FAILURES / RISK_PAUSE_MINUTES environment overrides.
//   2) Build the shared collaborators: live clock, in-memory record store,
//      paper order gateway, ZeroMQ order book feed, research provider,
//      strategy registry, metrics, event bus + ZeroMQ broadcaster.
//   3) Build RiskManager and UserEngineManager and wire them together so a
//      risk pause stops the paused user's engines.
//   4) Create one engine pair per configured user and start quoting and/or
//      auto-trading as configured.
//   5) Sleep on the main thread until SIGINT, then shut down in reverse.
//
// Thread layout (per user):
//   quote-engine:<user>   QuoteEngine cycles (100 ms)
//   quote-timers:<user>   quote cancel timers
//   orchestrator:<user>   ExecutionOrchestrator cycles
// Shared:
//   feed thread           ZmqOrderbookFeed recv loop
//   broadcaster thread    ZmqBroadcaster PUB drain
//   main thread           waits for SIGINT
// -----------------------------------------------------------------------------

#include "autotrade/config/app_config.hpp"
#include "autotrade/domain/errors.hpp"
#include "autotrade/engine/user_engine_manager.hpp"
#include "autotrade/eventbus/event_bus.hpp"
#include "autotrade/eventbus/event_bus_sink.hpp"
#include "autotrade/events/event_types.hpp"
#include "autotrade/execution/paper_order_gateway.hpp"
#include "autotrade/gateway/zmq_orderbook_feed.hpp"
#include "autotrade/metrics/trade_metrics.hpp"
#include "autotrade/network/zmq_broadcaster.hpp"
#include "autotrade/research/orderbook_imbalance_research.hpp"
#include "autotrade/risk/risk_manager.hpp"
#include "autotrade/store/in_memory_record_store.hpp"
#include "autotrade/strategy/strategy_registry.hpp"
#include "autotrade/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <set>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag: the only global. Set from the SIGINT handler (a lock-free
// atomic store is async-signal-safe) and polled by main().
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  autotrade::AppConfig config;
  try {
    if (argc > 1) {
      config = autotrade::loadAppConfig(argv[1]);
    }
    autotrade::applyEnvironmentOverrides(config, autotrade::processEnv);
  } catch (const autotrade::ConfigurationError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  }

  if (config.users.empty()) {
    std::cerr << "[main] no users configured; nothing to run.\n";
  }

  // -------------------------------------------------------------------------
  // 2) Shared collaborators.
  // -------------------------------------------------------------------------
  autotrade::LiveTimeProvider clock;
  autotrade::InMemoryRecordStore store;
  autotrade::PaperOrderGateway paper(clock, config.paper_starting_balance);
  autotrade::ZmqOrderbookFeed feed(config.endpoints.market_data);
  autotrade::OrderbookImbalanceResearch research(clock);
  autotrade::StrategyRegistry strategies;
  autotrade::TradeMetrics metrics;

  autotrade::EventBus bus;
  autotrade::EventBusSink bus_sink(bus);
  autotrade::ZmqBroadcaster broadcaster(config.endpoints.events);
  autotrade::FanOutSink broadcast({&bus_sink, &broadcaster});

  autotrade::EventBus admin_bus;
  autotrade::EventBusSink admin_sink(admin_bus);

  bus.subscribe<autotrade::RiskAlertEvent>(
      [](const autotrade::RiskAlertEvent& e) {
        std::cerr << "[RiskAlert] user=" << e.user_id << " symbol=" << e.symbol
                  << " reason=\"" << e.reason << "\"\n";
      });

  admin_bus.subscribe<autotrade::ExecutionEvent>(
      [](const autotrade::ExecutionEvent& e) {
        std::cout << "[Admin] trade user=" << e.user_id
                  << " symbol=" << e.record.symbol
                  << " order=" << e.record.order_id.value_or("-")
                  << " strategy=" << e.record.strategy << "\n";
      });

  // Resting paper quotes fill against the live book.
  std::set<std::string> symbols;
  for (const auto& user : config.users) {
    if (user.quoting) symbols.insert(user.quoting->symbol);
    if (user.auto_trade) symbols.insert(user.auto_trade->symbol);
  }
  for (const auto& symbol : symbols) {
    feed.subscribeOrderbook(symbol,
                            [&paper](const autotrade::domain::Orderbook& book) {
                              paper.onOrderbook(book);
                            });
  }

  // -------------------------------------------------------------------------
  // 3) Risk and engine lifecycle.
  // -------------------------------------------------------------------------
  autotrade::RiskManager risk(store, paper, clock, config.risk);
  autotrade::UserEngineManager engines(risk, store, clock,
                                       config.quote_engine,
                                       config.orchestrator);
  risk.setEngineLifecycle(&engines);

  int exit_code = 0;
  try {
    feed.start();
    broadcaster.start();

    // -----------------------------------------------------------------------
    // 4) Per-user engines.
    // -----------------------------------------------------------------------
    for (const auto& user : config.users) {
      store.putSettings(user.user_id, user.settings);

      autotrade::UserCollaborators c;
      c.market = &feed;
      c.feed = &feed;
      c.orders = &paper;
      c.positions = &paper;
      c.accounts = &paper;
      c.research = &research;
      c.strategies = &strategies;
      c.metrics = &metrics;
      c.broadcast = &broadcast;
      c.admin = &admin_sink;
      engines.createUserEngine(user.user_id, c);

      if (user.quoting) {
        engines.startQuoting(user.user_id, *user.quoting);
      }
      if (user.auto_trade) {
        engines.startAutoTrade(user.user_id, user.auto_trade->symbol,
                               user.auto_trade->interval);
      }
    }

    // -----------------------------------------------------------------------
    // 5) Run until Ctrl-C.
    // -----------------------------------------------------------------------
    std::signal(SIGINT, sigint_handler);
    std::cout << "[main] running " << config.users.size()
              << " user(s). Press Ctrl-C to shut down.\n";

    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    std::cout << "\n[main] SIGINT received. Shutting down...\n";
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    exit_code = 1;
  }

  // -------------------------------------------------------------------------
  // 6) Shutdown: engines first, then the I/O threads they depend on.
  // -------------------------------------------------------------------------
  engines.stopAll();
  risk.setEngineLifecycle(nullptr);
  feed.stop();
  broadcaster.stop();

  for (const auto& user : config.users) {
    const auto counters =
        metrics.snapshot(user.user_id, user.settings.strategy);
    std::cout << "[main] user=" << user.user_id
              << " trades=" << counters.trades_executed
              << " failed=" << counters.failed_orders
              << " avg_latency_ms=" << counters.averageLatencyMs()
              << " balance=" << paper.balance(user.user_id) << "\n";
  }

  return exit_code;
}
