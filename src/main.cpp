#include "stratmon/core/types.hpp"
#include "stratmon/core/config.hpp"
#include "stratmon/core/logger.hpp"
#include "stratmon/engine/monitor_engine.hpp"
#include "stratmon/market/instrument_registry.hpp"
#include "stratmon/market/simulated_session.hpp"
#include "stratmon/network/event_messages.hpp"
#include "stratmon/network/ws_broadcast_server.hpp"
#include "stratmon/sync/strategy_codec.hpp"

#include <boost/asio.hpp>

#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <filesystem>
#include <unistd.h>
#include <fmt/format.h>

namespace net = boost::asio;

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    static const char msg[] = "\nShutdown signal received...\n";
    (void)::write(STDOUT_FILENO, msg, sizeof(msg) - 1);
    g_shutdown.store(true, std::memory_order_release);
}

std::string format_price(std::optional<stratmon::Price> price) {
    return price ? fmt::format("{:.4f}", *price) : std::string("incomplete");
}

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.yaml";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a path argument\n";
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "stratmon - option strategy price monitor\n\n"
                      << "Usage: " << argv[0] << " [options]\n\n"
                      << "Options:\n"
                      << "  -c, --config <path>  Config file (default: config/config.yaml)\n"
                      << "  -h, --help           Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\nUse -h for help\n";
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    stratmon::RuntimeConfig config;
    if (std::filesystem::exists(config_path)) {
        config = stratmon::ConfigLoader::load(config_path);
    } else {
        std::cerr << "Config file not found: " << config_path << " - using defaults" << std::endl;
        config = stratmon::ConfigLoader::get_default();
    }

    for (const auto& file : {config.logging.file, config.logging.alarm_file}) {
        auto log_dir = std::filesystem::path(file).parent_path();
        if (log_dir.empty()) continue;
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            std::cerr << "Failed to create log directory " << log_dir << ": " << ec.message() << std::endl;
            return 1;
        }
    }

    if (!stratmon::Logger::init(config.logging)) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return 1;
    }
    spdlog::info("=== stratmon starting ===");

    if (config.session.mode != "simulation") {
        spdlog::error("Session mode '{}' is not available in this build", config.session.mode);
        stratmon::Logger::shutdown();
        return 1;
    }

    net::io_context io_context;
    auto work_guard = net::make_work_guard(io_context);

    auto registry = std::make_shared<stratmon::market::InstrumentRegistry>(config.instruments);
    auto session = std::make_shared<stratmon::market::SimulatedSession>(io_context, config.session);

    stratmon::engine::MonitorEngine engine(io_context, session, registry,
                                           std::chrono::milliseconds(config.sync_debounce_ms));

    std::shared_ptr<stratmon::network::WsBroadcastServer> ws_server;
    if (config.broadcast_enabled) {
        ws_server = std::make_shared<stratmon::network::WsBroadcastServer>(io_context, config.broadcast_port);
        ws_server->set_greeting_provider([&engine]() {
            std::vector<std::string> frames;
            for (const auto& id : engine.strategy_ids()) {
                frames.push_back(stratmon::network::price_event(id, engine.price(id)));
            }
            return frames;
        });
    }

    engine.set_price_callback([&](const stratmon::StrategyId& id, std::optional<stratmon::Price> price) {
        spdlog::debug("[Price] {} = {}", id, format_price(price));
        if (ws_server) ws_server->broadcast(stratmon::network::price_event(id, price));
    });
    engine.set_reached_callback([&](const stratmon::StrategyId& id, std::optional<stratmon::Price> price) {
        auto snap = engine.snapshot(id);
        stratmon::Logger::alarm("Target reached: {} '{}' at {}",
                                id, snap ? snap->record.name : "", format_price(price));
        if (ws_server) ws_server->broadcast(stratmon::network::alarm_event(stratmon::AlarmEvent::Reached, id, price));
    });
    engine.set_left_callback([&](const stratmon::StrategyId& id, std::optional<stratmon::Price> price) {
        stratmon::Logger::alarm("Target left: {} at {}", id, format_price(price));
        if (ws_server) ws_server->broadcast(stratmon::network::alarm_event(stratmon::AlarmEvent::Left, id, price));
    });
    engine.set_subscription_status_callback([&](const std::string& ticker, bool ok, const std::string& reason) {
        if (ws_server) ws_server->broadcast(stratmon::network::subscription_event(ticker, ok, reason));
    });
    engine.set_session_callback([&](bool connected, const std::string& message) {
        spdlog::info("[Session] {} ({})", connected ? "connected" : "disconnected", message);
        if (ws_server) ws_server->broadcast(stratmon::network::session_event(connected, message));
    });
    engine.set_strategy_changed_callback([](const stratmon::StrategyId& id, const stratmon::StrategyRecord& record) {
        // No sync transport in this build: the payload is logged only
        spdlog::debug("[Sync] {} -> {}", id,
                      stratmon::sync::encode_sync_message({stratmon::sync::SyncType::Updated, record}));
    });

    // Initial book; treated as already known to the sync server
    for (const auto& record : config.strategies) {
        auto id = engine.upsert_strategy(record, stratmon::ChangeOrigin::Remote);
        if (id) {
            spdlog::info("Loaded strategy {} '{}' ({} legs)", *id, record.name, record.legs.size());
        }
    }

    if (ws_server && !ws_server->start()) {
        spdlog::warn("Event broadcast disabled");
        ws_server.reset();
    }

    std::vector<std::thread> io_threads;
    for (int i = 0; i < config.io_threads; ++i) {
        io_threads.emplace_back([&io_context]() {
            io_context.run();
        });
    }
    spdlog::info("Started {} IO threads", config.io_threads);

    if (!engine.start()) {
        spdlog::error("Market-data session failed to start");
        g_shutdown.store(true, std::memory_order_release);
    }

    uint64_t tick = 0;
    while (!g_shutdown.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        ++tick;

        if (tick % 30 == 0) {
            auto stats = engine.stats();
            spdlog::info("Status: strategies={} legs={} tickers={} armed={} | quotes={} stale={} dropped={} | "
                         "reached={} left={}",
                         stats.strategies, stats.legs, stats.multiplexer.tickers, stats.armed,
                         stats.quotes_applied, stats.quotes_stale, stats.multiplexer.quotes_dropped,
                         stats.reached_events, stats.left_events);
        }
    }

    spdlog::info("Shutting down...");

    engine.stop();
    if (ws_server) ws_server->stop();

    work_guard.reset();
    io_context.stop();

    for (auto& t : io_threads) {
        if (t.joinable()) t.join();
    }

    spdlog::info("=== stratmon stopped ===");
    stratmon::Logger::shutdown();

    return 0;
}
