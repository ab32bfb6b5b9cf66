#include <cstdlib>
#include <ctime>

#include "simulated_controller.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

namespace {
// UTC timestamps
constexpr std::time_t JUN_20_2200 = 1718920800;
constexpr std::time_t JUN_20_2300 = 1718924400;
constexpr std::time_t JUN_20_2330 = 1718926200;
constexpr std::time_t JUN_21_0010 = 1718928600;
constexpr std::time_t JUN_21_NOON = 1718971200;

const SimulationParams PARAMS{3000.0, 24.0, 96.0, 27.6, 2.0};

void use_utc()
{
    setenv("TZ", "UTC", 1);
    tzset();
}

uint32_t read_wide(SimulatedController& controller, uint16_t address)
{
    auto words = controller.read(RegisterClass::INPUT, address, 2);
    return (static_cast<uint32_t>(words[1]) << 16) | words[0];
}
}  // namespace

TEST_CASE("seeded register file answers the Tracer ranges")
{
    SimulatedController controller(PARAMS);

    auto rated = controller.read(RegisterClass::INPUT, 0x3000, 9);
    CHECK(rated.size() == 9);
    CHECK(rated[4] == 2400);
    CHECK(read_wide(controller, 0x3002) == 300000u);

    auto settings = controller.read(RegisterClass::HOLDING, 0x9000, 15);
    CHECK(settings[8] == 2760);

    CHECK(controller.read(RegisterClass::COIL, 0x0005, 2).size() == 2);
    CHECK(controller.read(RegisterClass::DISCRETE, 0x200C, 1).size() == 1);
    CHECK(controller.readCount() == 5);
}

TEST_CASE("unmapped addresses are rejected like the device does")
{
    SimulatedController controller(PARAMS);
    CHECK_THROWS_AS(controller.read(RegisterClass::INPUT, 0x4000, 1), TransportError);
    CHECK_THROWS_AS(controller.read(RegisterClass::INPUT, 0x3200, 4), TransportError);
    CHECK_THROWS_AS(controller.read(RegisterClass::HOLDING, 0x3100, 1), TransportError);
}

TEST_CASE("wide values store the low word first")
{
    SimulatedController controller(PARAMS);
    controller.setWide(RegisterClass::INPUT, 0x3102, 0x000493E0);

    auto words = controller.read(RegisterClass::INPUT, 0x3102, 2);
    CHECK(words[0] == 0x93E0);
    CHECK(words[1] == 0x0004);
}

TEST_CASE("injected failures")
{
    SimulatedController controller(PARAMS);

    controller.failNextReads(2);
    CHECK_THROWS_AS(controller.read(RegisterClass::INPUT, 0x3100, 1), TransportError);
    CHECK_THROWS_AS(controller.read(RegisterClass::INPUT, 0x3200, 1), TransportError);
    CHECK(controller.read(RegisterClass::INPUT, 0x3100, 1).size() == 1);

    controller.setFailing(RegisterClass::INPUT, 0x3300, true);
    CHECK_THROWS_AS(controller.read(RegisterClass::INPUT, 0x3300, 20), TransportError);
    CHECK(controller.read(RegisterClass::INPUT, 0x3304, 2).size() == 2);
    controller.setFailing(RegisterClass::INPUT, 0x3300, false);
    CHECK(controller.read(RegisterClass::INPUT, 0x3300, 20).size() == 20);
}

TEST_CASE("midday tick charges the battery")
{
    use_utc();
    SimulatedController controller(PARAMS);
    controller.tick(JUN_21_NOON);
    controller.tick(JUN_21_NOON + 60);

    CHECK(read_wide(controller, 0x3102) > 0u);
    CHECK(controller.read(RegisterClass::INPUT, 0x3100, 1)[0] > 0);

    uint16_t charging = controller.read(RegisterClass::INPUT, 0x3201, 1)[0];
    CHECK((charging & 0x0001) != 0);
    CHECK((charging & 0x000C) == 0x0008); // Boost below the float setpoint
    CHECK((charging & 0xC000) == 0);
    CHECK(controller.read(RegisterClass::DISCRETE, 0x200C, 1)[0] == 0);
    CHECK(read_wide(controller, 0x330C) > 0u);
}

TEST_CASE("night ticks report no PV power")
{
    use_utc();
    SimulatedController controller(PARAMS);
    controller.tick(JUN_20_2200);

    CHECK(read_wide(controller, 0x3102) == 0u);
    uint16_t charging = controller.read(RegisterClass::INPUT, 0x3201, 1)[0];
    CHECK((charging & 0xC000) == 0x4000);
    CHECK((charging & 0x000C) == 0);
    CHECK(controller.read(RegisterClass::DISCRETE, 0x200C, 1)[0] == 1);
}

TEST_CASE("daily counters clear at the controller's midnight")
{
    use_utc();
    SimulatedController controller(PARAMS);
    controller.tick(JUN_20_2200);
    controller.tick(JUN_20_2300);
    controller.tick(JUN_20_2330);

    uint32_t today_before = read_wide(controller, 0x3304);
    uint32_t total_before = read_wide(controller, 0x330A);
    CHECK(today_before > 0u);

    controller.tick(JUN_21_0010);
    CHECK(read_wide(controller, 0x3304) < today_before);
    CHECK(read_wide(controller, 0x330A) > total_before);
    CHECK(read_wide(controller, 0x3306) == read_wide(controller, 0x330A)); // Same month
}
