#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "config_loader.hpp"
#include "poll_controller.hpp"
#include "simulated_controller.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

namespace {
constexpr std::time_t JAN_31_NOON = 1706702400;

const SimulationParams PARAMS{3000.0, 24.0, 96.0, 27.6, 2.0};

// Profile, controller, bus and accumulator wired the way the bridge wires them
struct Bench {
    Config config;
    SimulatedController controller;
    SafeValueBus bus;
    StatisticsAccumulator accumulator;
    std::vector<std::chrono::milliseconds> delays;
    PollController poller;

    Bench()
        : config(ConfigLoader::loadConfig(std::string(TRACER_PROFILE_DIR) + "/epever_tracer.yaml")),
          controller(PARAMS),
          accumulator(CalendarMode::UTC),
          poller(controller, config, accumulator, bus,
                 [this](std::chrono::milliseconds delay) { delays.push_back(delay); })
    {
    }
};

bool contains(const std::vector<std::string>& names, const std::string& name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}
}  // namespace

TEST_CASE("announce publishes the device identity")
{
    Bench bench;
    bench.poller.announce();

    CHECK(bench.bus.getNumber("/ProductId").value() == doctest::Approx(0xA076));
    CHECK(bench.bus.getNumber("/DeviceInstance").value() == doctest::Approx(290));
    CHECK(std::get<std::string>(bench.bus.getValue("/ProductName").value()) == "Epever Tracer MPPT");
    CHECK(bench.bus.getNumber("/Connected").value() == doctest::Approx(0));
    CHECK(bench.bus.getNumber("/Link/NetworkMode").value() == doctest::Approx(0));
    CHECK(bench.bus.getNumber("/Link/NetworkStatus").value() == doctest::Approx(4));
    CHECK(bench.bus.getNumber("/Settings/BmsPresent").value() == doctest::Approx(0));
}

TEST_CASE("successful cycle decodes and publishes every block")
{
    Bench bench;
    bench.controller.setWord(RegisterClass::INPUT, 0x3104, 4468);
    bench.controller.setWord(RegisterClass::INPUT, 0x3100, 9120);
    bench.controller.setWide(RegisterClass::INPUT, 0x3102, 0x000493E0);
    bench.controller.setWord(RegisterClass::INPUT, 0x3201, 0x0005);
    bench.controller.setWord(RegisterClass::INPUT, 0x3202, 0x0001);

    PollResult result = bench.poller.runCycle(JAN_31_NOON);

    CHECK(result.outcome == PollOutcome::SUCCESS);
    CHECK(result.failed_blocks.empty());
    CHECK_FALSE(result.escalate);
    CHECK(bench.poller.state() == PollState::IDLE);
    CHECK(bench.delays.empty());

    REQUIRE(findValue(result.values, "battery_voltage").has_value());
    CHECK(*findValue(result.values, "battery_voltage") == doctest::Approx(44.68));
    CHECK(bench.bus.getNumber("/Dc/0/Voltage").value() == doctest::Approx(44.68));
    CHECK(bench.bus.getNumber("/Pv/V").value() == doctest::Approx(91.2));
    CHECK(bench.bus.getNumber("/Yield/Power").value() == doctest::Approx(3000.0));

    REQUIRE(result.status.has_value());
    CHECK(result.status->charging.stage == ChargingStage::FLOAT);
    CHECK(bench.bus.getNumber("/State").value() == doctest::Approx(5));
    CHECK(bench.bus.getNumber("/ErrorCode").value() == doctest::Approx(0));
    CHECK(bench.bus.getNumber("/Load/State").value() == doctest::Approx(1));
    CHECK(bench.bus.getNumber("/Connected").value() == doctest::Approx(1));

    CHECK(result.statistics.today.max_pv_voltage == doctest::Approx(91.2));
    CHECK(bench.bus.getNumber("/History/Daily/0/MaxPvVoltage").value() == doctest::Approx(91.2));
    CHECK(bench.bus.getNumber("/History/Daily/0/MaxPower").value() == doctest::Approx(3000.0));
    CHECK(bench.bus.getNumber("/History/Overall/DaysAvailable").value() == doctest::Approx(1));
}

TEST_CASE("boost above the float setpoint is published as absorption")
{
    Bench bench;
    bench.controller.setWord(RegisterClass::INPUT, 0x3104, 2840);
    bench.controller.setWord(RegisterClass::INPUT, 0x3201, 0x0009);

    bench.poller.runCycle(JAN_31_NOON);
    CHECK(bench.bus.getNumber("/State").value() == doctest::Approx(4));

    bench.controller.setWord(RegisterClass::INPUT, 0x3104, 2600);
    bench.poller.runCycle(JAN_31_NOON + 1);
    CHECK(bench.bus.getNumber("/State").value() == doctest::Approx(3));
}

TEST_CASE("energy counters feed the yield paths")
{
    Bench bench;
    bench.controller.setWide(RegisterClass::INPUT, 0x330C, 150);
    bench.controller.setWide(RegisterClass::INPUT, 0x3312, 12345);
    bench.poller.runCycle(JAN_31_NOON);

    bench.controller.setWide(RegisterClass::INPUT, 0x330C, 175);
    bench.controller.setWide(RegisterClass::INPUT, 0x3312, 12370);
    PollResult result = bench.poller.runCycle(JAN_31_NOON + 60);

    CHECK(result.warnings.empty());
    CHECK(bench.bus.getNumber("/History/Daily/0/Yield").value() == doctest::Approx(1.75));
    CHECK(bench.bus.getNumber("/Yield/User").value() == doctest::Approx(123.70));
    CHECK(bench.bus.getNumber("/Yield/System").value() == doctest::Approx(123.70));
}

TEST_CASE("failed block only invalidates its own values")
{
    Bench bench;
    bench.controller.setWord(RegisterClass::INPUT, 0x3104, 4468);
    bench.controller.setFailing(RegisterClass::INPUT, 0x3300, true);

    PollResult result = bench.poller.runCycle(JAN_31_NOON);

    CHECK(result.outcome == PollOutcome::PARTIAL_FAILURE);
    REQUIRE(result.failed_blocks.size() == 1);
    CHECK(result.failed_blocks[0] == "statistics");
    CHECK_FALSE(result.escalate);
    CHECK(bench.poller.consecutiveFailures() == 0);

    CHECK_FALSE(findValue(result.values, "generated_energy_today").has_value());
    CHECK(findValue(result.values, "battery_voltage").has_value());
    CHECK(bench.bus.getNumber("/Dc/0/Voltage").value() == doctest::Approx(44.68));
    CHECK(bench.bus.getNumber("/Connected").value() == doctest::Approx(1));

    // Default profile retries twice with 50 ms then 100 ms
    REQUIRE(bench.delays.size() == 2);
    CHECK(bench.delays[0].count() == 50);
    CHECK(bench.delays[1].count() == 100);
}

TEST_CASE("missing status block publishes no charger state")
{
    Bench bench;
    bench.controller.setWord(RegisterClass::INPUT, 0x3200, 0x0001);
    bench.controller.setWord(RegisterClass::INPUT, 0x3201, 0x0005);
    bench.poller.runCycle(JAN_31_NOON);
    CHECK(bench.bus.getNumber("/State").value() == doctest::Approx(5));
    CHECK(bench.bus.getNumber("/ErrorCode").value() == doctest::Approx(2));

    bench.controller.setFailing(RegisterClass::INPUT, 0x3200, true);
    PollResult result = bench.poller.runCycle(JAN_31_NOON + 1);

    CHECK_FALSE(result.status.has_value());
    CHECK_FALSE(result.charge_state.has_value());
    CHECK(contains(result.failed_blocks, "status"));
    for (const char* path : {"/State", "/ErrorCode", "/Load/State", "/Status/Charging/Stage",
                             "/Status/Battery/VoltageState"}) {
        auto value = bench.bus.getValue(path);
        REQUIRE(value.has_value());
        CHECK(std::holds_alternative<std::monostate>(*value));
    }
}

TEST_CASE("decoded status flags are published")
{
    Bench bench;
    bench.controller.setWord(RegisterClass::INPUT, 0x3200, 0x0011); // Overvolt, over temperature
    bench.controller.setWord(RegisterClass::INPUT, 0x3201, 0x2409); // Boost, D13 and D10 faults

    PollResult result = bench.poller.runCycle(JAN_31_NOON);
    REQUIRE(result.charge_state.has_value());
    CHECK(*result.charge_state == ChargeState::BULK);

    auto text = [&bench](const std::string& path) { return std::get<std::string>(bench.bus.getValue(path).value()); };
    CHECK(text("/Status/Battery/VoltageState") == "Overvolt");
    CHECK(text("/Status/Battery/TemperatureState") == "Over Temperature");
    CHECK(text("/Status/Charging/InputVoltageState") == "Normal");
    CHECK(text("/Status/Charging/Stage") == "Boost");
    CHECK(text("/Status/Charging/Faults") == "Charging MOSFET short, Input over current");
    CHECK(bench.bus.getNumber("/Status/Battery/InternalResistanceAbnormal").value() == doctest::Approx(0));
    CHECK(bench.bus.getNumber("/Status/Battery/RatedVoltageMismatch").value() == doctest::Approx(0));
    CHECK(bench.bus.getNumber("/ErrorCode").value() == doctest::Approx(2));
    CHECK(bench.bus.getNumber("/History/Daily/0/LastError1").value() == doctest::Approx(2));
    CHECK(bench.bus.getNumber("/History/Overall/LastError1").value() == doctest::Approx(2));
}

TEST_CASE("time in float is accumulated from consecutive cycles")
{
    Bench bench;
    bench.controller.setWord(RegisterClass::INPUT, 0x3201, 0x0005);
    bench.poller.runCycle(JAN_31_NOON);
    bench.poller.runCycle(JAN_31_NOON + 60);

    CHECK(bench.bus.getNumber("/History/Daily/0/TimeInFloat").value() == doctest::Approx(60.0 / 3600.0));
    CHECK(bench.bus.getNumber("/History/Daily/0/TimeInBulk").value() == doctest::Approx(0.0));
    CHECK(bench.bus.getNumber("/History/Overall/TimeInFloat").value() == doctest::Approx(60.0 / 3600.0));
}

TEST_CASE("transient failure is absorbed by a retry")
{
    Bench bench;
    bench.controller.failNextReads(1);

    PollResult result = bench.poller.runCycle(JAN_31_NOON);

    CHECK(result.outcome == PollOutcome::SUCCESS);
    REQUIRE(bench.delays.size() == 1);
    CHECK(bench.delays[0].count() == 50);
    CHECK(bench.controller.readCount() == static_cast<int>(bench.config.blocks.size()) + 1);
}

TEST_CASE("backoff doubles up to the configured ceiling")
{
    Bench bench;
    bench.config.poll.max_retries = 5;
    bench.config.poll.initial_backoff_ms = 50;
    bench.config.poll.max_backoff_ms = 120;
    bench.controller.setFailing(RegisterClass::INPUT, 0x3200, true);

    bench.poller.runCycle(JAN_31_NOON);

    REQUIRE(bench.delays.size() == 5);
    CHECK(bench.delays[0].count() == 50);
    CHECK(bench.delays[1].count() == 100);
    CHECK(bench.delays[2].count() == 120);
    CHECK(bench.delays[3].count() == 120);
    CHECK(bench.delays[4].count() == 120);
}

TEST_CASE("repeated total failures escalate")
{
    Bench bench;
    bench.controller.setWord(RegisterClass::INPUT, 0x3104, 4468);
    bench.poller.runCycle(JAN_31_NOON);
    CHECK(bench.bus.getNumber("/Dc/0/Voltage").value() == doctest::Approx(44.68));

    bench.controller.failNextReads(1000000);
    for (int cycle = 1; cycle <= 3; ++cycle) {
        PollResult result = bench.poller.runCycle(JAN_31_NOON + cycle);
        CHECK(result.outcome == PollOutcome::TOTAL_FAILURE);
        CHECK(result.failed_blocks.size() == bench.config.blocks.size());
        CHECK(bench.poller.consecutiveFailures() == cycle);
        CHECK(result.escalate == (cycle == 3));
    }

    // Values are marked as no data instead of keeping stale readings
    auto voltage = bench.bus.getValue("/Dc/0/Voltage");
    REQUIRE(voltage.has_value());
    CHECK(std::holds_alternative<std::monostate>(*voltage));
    CHECK(bench.bus.getNumber("/Connected").value() == doctest::Approx(0));

    // Statistics survive the outage
    CHECK(bench.accumulator.snapshot().today.max_battery_voltage == doctest::Approx(44.68));
}

TEST_CASE("successful cycle clears the failure streak")
{
    Bench bench;
    bench.controller.failNextReads(1000000);
    bench.poller.runCycle(JAN_31_NOON);
    bench.poller.runCycle(JAN_31_NOON + 1);
    CHECK(bench.poller.consecutiveFailures() == 2);

    bench.controller.failNextReads(0);
    PollResult result = bench.poller.runCycle(JAN_31_NOON + 2);
    CHECK(result.outcome == PollOutcome::SUCCESS);
    CHECK(bench.poller.consecutiveFailures() == 0);
    CHECK_FALSE(result.escalate);
}
