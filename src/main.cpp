/**
 * Main entry point for the pricewatch service
 */

#include <iostream>
#include <chrono>
#include <atomic>
#include <csignal>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <boost/program_options.hpp>

#include "pricewatch/common/config.h"
#include "pricewatch/common/logging.h"
#include "pricewatch/service/market_service.h"

namespace po = boost::program_options;
using namespace pricewatch;

namespace {

// Cleared by SIGINT/SIGTERM
std::atomic<bool> g_keep_running{true};

void onShutdownSignal(int /*signal*/) {
    g_keep_running = false;
}

std::string formatStatus(service::MarketService& market) {
    std::ostringstream status;
    status << "Status: " << market.historySize() << " history points";

    std::vector<data::Quote> history = market.getHistory();
    if (!history.empty()) {
        const data::Quote& latest = history.back();
        status << ", latest " << latest.price << " from " << latest.source << " at " << latest.time_str;
    }

    double now = common::SystemClock().now();
    for (const auto& source : market.goldSources()) {
        if (source.isMutedAt(now)) {
            status << ", " << source.name << " muted";
        }
    }
    status << ", poller cycles " << market.poller().cycleCount()
           << " errors " << market.poller().errorCount();
    return status.str();
}

} // namespace

int main(int argc, char** argv) {
    try {
        po::options_description desc("pricewatch options");
        desc.add_options()
            ("help,h", "show this help and exit")
            ("config", po::value<std::string>()->default_value("config/system.yaml"), "service configuration file")
            ("log-level", po::value<std::string>(), "log level (debug, info, warning, error, critical)")
        ;

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }

        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        common::Config config(vm["config"].as<std::string>());
        if (vm.count("log-level")) {
            config.setLogLevel(vm["log-level"].as<std::string>());
        }

        common::g_logger.configure(config.getLoggingConfig());
        LOG_INFO("Starting pricewatch, configuration " + vm["config"].as<std::string>());

        service::MarketService market_service(config, service::makeDefaultProviders(config));
        market_service.loadState();
        market_service.startBackground();

        LOG_INFO("Service running");

        // Status line once a minute until a shutdown signal arrives
        const auto status_interval = std::chrono::seconds(60);
        auto last_status_time = std::chrono::steady_clock::now();

        while (g_keep_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            auto now = std::chrono::steady_clock::now();
            if (now - last_status_time >= status_interval) {
                LOG_INFO(formatStatus(market_service));
                last_status_time = now;
            }
        }

        LOG_INFO("Shutdown requested");
        market_service.stopBackground();
        market_service.saveState();

        LOG_INFO("pricewatch shutdown complete");
        common::g_logger.flush();
        return 0;
    } catch (const std::exception& e) {
        LOG_CRITICAL(std::string("Fatal error: ") + e.what());
        common::g_logger.flush();
        std::cerr << "pricewatch: " << e.what() << std::endl;
        return 1;
    }
}
