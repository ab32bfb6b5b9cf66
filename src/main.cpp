#include "charge_controller.hpp"
#include "config_loader.hpp"
#include "modbus_transport.hpp"
#include "poll_controller.hpp"
#include "simulated_controller.hpp"
#include "statistics_accumulator.hpp"
#include "value_bus.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

// Exit code telling the supervisor the serial link is down and needs a fresh handle
constexpr int EXIT_LINK_DOWN = 2;

std::atomic<bool> g_running(true);

/**
 * @brief Signal handler for graceful shutdown (e.g., on Ctrl+C).
 * @param signum The signal number received.
 */
void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

int main(int argc, char* argv[]) {
    // --- 1. Load Configuration ---
    std::string config_file = "config/epever_tracer.yaml";
    if (argc > 1) {
        config_file = argv[1];
    }
    std::cout << "Loading profile from: " << config_file << std::endl;

    Config config;
    try {
        config = ConfigLoader::loadConfig(config_file);
    } catch (const std::exception& e) {
        std::cerr << "Error loading profile: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Profile loaded: " << config.blocks.size() << " register blocks, polling every "
              << config.poll.interval_ms << " ms." << std::endl;

    // --- 2. Open the Transport ---
    std::unique_ptr<RegisterTransport> transport;
    SimulatedController* simulator = nullptr;
    if (config.serial.type == TransportType::SIMULATED) {
        auto sim = std::make_unique<SimulatedController>(config.simulation);
        simulator = sim.get();
        transport = std::move(sim);
        std::cout << "Using the simulated charge controller." << std::endl;
    } else {
        auto rtu = std::make_unique<ModbusRtuTransport>(config.serial);
        if (!rtu->open()) {
            std::cerr << "Failed to open the Modbus RTU link on " << config.serial.port << "." << std::endl;
            return EXIT_LINK_DOWN;
        }
        transport = std::move(rtu);
    }

    // --- 3. Set up the Bus, Statistics and Poll Controller ---
    SafeValueBus bus;
    // Polls more than three intervals (at least ten minutes) apart are not contiguous
    std::time_t max_poll_gap = std::max<std::time_t>(600, 3 * config.poll.interval_ms / 1000);
    StatisticsAccumulator accumulator(config.poll.use_utc ? CalendarMode::UTC : CalendarMode::LOCAL, max_poll_gap);
    PollController poller(*transport, config, accumulator, bus);
    poller.announce();

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "\nBridge is running. Press Ctrl+C to exit." << std::endl;

    // --- 4. Poll Loop ---
    PollOutcome last_outcome = PollOutcome::SUCCESS;
    while (g_running) {
        auto start_time = std::chrono::steady_clock::now();

        if (simulator) {
            simulator->tick(std::time(nullptr));
        }

        PollResult result = poller.runCycle();
        if (result.outcome != last_outcome) {
            std::cout << "Poll outcome changed to " << toString(result.outcome);
            for (const auto& name : result.failed_blocks) {
                std::cout << " [" << name << "]";
            }
            std::cout << std::endl;
            last_outcome = result.outcome;
        }

        if (result.escalate) {
            std::cerr << "Too many failed poll cycles, the controller link is down. Exiting." << std::endl;
            return EXIT_LINK_DOWN;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);
        auto sleep_duration = std::chrono::milliseconds(config.poll.interval_ms) - elapsed;
        if (sleep_duration.count() > 0) {
            std::this_thread::sleep_for(sleep_duration);
        }
    }

    std::cout << "\nShutting down. Last published values:" << std::endl;
    bus.dump(std::cout);
    return 0;
}
