#include <stdexcept>
#include <string>

#include <yaml-cpp/yaml.h>

#include "config_loader.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

namespace {
const std::string PROFILE = std::string(TRACER_PROFILE_DIR) + "/epever_tracer.yaml";

Config parse(const std::string& text)
{
    return ConfigLoader::parseConfig(YAML::Load(text));
}

const RegisterSpec* find_register(const Config& config, const std::string& name)
{
    for (const auto& block : config.blocks) {
        for (const auto& reg : block.registers) {
            if (reg.name == name) return &reg;
        }
    }
    return nullptr;
}

const std::string MINIMAL = R"(
blocks:
  - name: "realtime"
    class: "input"
    start: 0x3100
    count: 6
    registers:
      - { name: "pv_voltage", address: 0x3100, unit: "V", scale: 100, path: "/Pv/V" }
      - { name: "pv_power", address: 0x3102, width: "double", unit: "W", scale: 100 }
)";
}  // namespace

TEST_CASE("shipped Tracer profile loads")
{
    Config config = ConfigLoader::loadConfig(PROFILE);

    CHECK(config.identity.product_id == 0xA076);
    CHECK(config.identity.device_instance == 290);
    CHECK(config.serial.type == TransportType::RTU);
    CHECK(config.serial.baud_rate == 115200);
    CHECK(config.serial.parity == 'N');
    CHECK(config.serial.response_timeout_ms == 200);
    CHECK(config.poll.interval_ms == 1000);
    CHECK(config.poll.max_consecutive_failures == 3);
    CHECK(config.simulation.float_voltage == doctest::Approx(27.6));
    CHECK(config.blocks.size() == 12);

    const RegisterSpec* generated = find_register(config, "generated_energy_today");
    REQUIRE(generated != nullptr);
    CHECK(generated->address == 0x330C);
    CHECK(generated->width == RegisterWidth::DOUBLE);
    CHECK(generated->scale == 100);

    const RegisterSpec* battery = find_register(config, "battery_voltage");
    REQUIRE(battery != nullptr);
    CHECK(battery->address == 0x3104);
    CHECK(battery->path == "/Dc/0/Voltage");

    const RegisterSpec* net_current = find_register(config, "net_battery_current");
    REQUIRE(net_current != nullptr);
    CHECK(net_current->is_signed);

    CHECK(find_register(config, "battery_status") != nullptr);
    CHECK(find_register(config, "charging_status") != nullptr);
    CHECK(find_register(config, "float_voltage") != nullptr);
}

TEST_CASE("missing sections fall back to the driver defaults")
{
    Config config = parse(MINIMAL);

    CHECK(config.serial.port == "/dev/ttyUSB0");
    CHECK(config.serial.slave_id == 1);
    CHECK(config.poll.max_retries == 2);
    CHECK_FALSE(config.poll.use_utc);
    REQUIRE(config.blocks.size() == 1);
    CHECK(config.blocks[0].start == 0x3100);
    CHECK(config.blocks[0].registers[1].width == RegisterWidth::DOUBLE);
    CHECK_FALSE(config.blocks[0].optional);
}

TEST_CASE("decimal and hexadecimal addresses are equivalent")
{
    Config config = parse(R"(
blocks:
  - { name: "status", class: "input", start: 12800, count: 3,
      registers: [ { name: "battery_status", address: 0x3200 } ] }
)");
    CHECK(config.blocks[0].start == 0x3200);
    CHECK(config.blocks[0].registers[0].scale == 1);
}

TEST_CASE("leading zeros are decimal")
{
    Config config = parse(R"(
blocks:
  - { name: "coils", class: "coil", start: 0002, count: 010,
      registers: [ { name: "manual_load_control", address: 0x0002, scale: 0100 } ] }
)");
    CHECK(config.blocks[0].start == 2);
    CHECK(config.blocks[0].count == 10);
    CHECK(config.blocks[0].registers[0].scale == 100);
}

TEST_CASE("negative and oversized numbers are rejected")
{
    CHECK_THROWS_AS(parse(R"(
blocks:
  - { name: "b", class: "input", start: 0x3100, count: 2,
      registers: [ { name: "x", address: 0x3100, scale: -1 } ] }
)"), std::runtime_error);

    // Would wrap to a one-register block if narrowed before checking
    CHECK_THROWS_AS(parse(R"(
blocks:
  - { name: "b", class: "input", start: 0, count: 65537, registers: [] }
)"), std::runtime_error);

    CHECK_THROWS_AS(parse(R"(
blocks:
  - { name: "b", class: "input", start: 0x10000, count: 1, registers: [] }
)"), std::runtime_error);

    CHECK_THROWS_AS(parse(R"(
blocks:
  - { name: "b", class: "input", start: -5, count: 1, registers: [] }
)"), std::runtime_error);

    CHECK_THROWS_AS(parse(R"(
blocks:
  - { name: "b", class: "input", start: 0x3100, count: 1,
      registers: [ { name: "x", address: 0x3100, scale: 99999999999999999999999 } ] }
)"), std::runtime_error);
}

TEST_CASE("inconsistent register maps are rejected")
{
    // Register outside its block
    CHECK_THROWS_AS(parse(R"(
blocks:
  - { name: "b", class: "input", start: 0x3100, count: 2,
      registers: [ { name: "x", address: 0x3102 } ] }
)"), std::runtime_error);

    // Double width register crossing the block end
    CHECK_THROWS_AS(parse(R"(
blocks:
  - { name: "b", class: "input", start: 0x3100, count: 2,
      registers: [ { name: "x", address: 0x3101, width: "double" } ] }
)"), std::runtime_error);

    // Zero scale
    CHECK_THROWS_AS(parse(R"(
blocks:
  - { name: "b", class: "input", start: 0x3100, count: 2,
      registers: [ { name: "x", address: 0x3100, scale: 0 } ] }
)"), std::runtime_error);

    // Double width in a bit block
    CHECK_THROWS_AS(parse(R"(
blocks:
  - { name: "b", class: "coil", start: 0x0005, count: 2,
      registers: [ { name: "x", address: 0x0005, width: "double" } ] }
)"), std::runtime_error);

    // Duplicate names across blocks
    CHECK_THROWS_AS(parse(R"(
blocks:
  - { name: "a", class: "input", start: 0x3100, count: 1, registers: [ { name: "x", address: 0x3100 } ] }
  - { name: "b", class: "input", start: 0x3200, count: 1, registers: [ { name: "x", address: 0x3200 } ] }
)"), std::runtime_error);
}

TEST_CASE("invalid enumerations and parameters are rejected")
{
    CHECK_THROWS_AS(parse(R"(
blocks:
  - { name: "b", class: "analog", start: 0x3100, count: 1, registers: [] }
)"), std::runtime_error);

    CHECK_THROWS_AS(parse("transport: { type: \"tcp\" }\n" + MINIMAL), std::runtime_error);
    CHECK_THROWS_AS(parse("transport: { parity: \"X\" }\n" + MINIMAL), std::runtime_error);
    CHECK_THROWS_AS(parse("poll_parameters: { interval_ms: 0 }\n" + MINIMAL), std::runtime_error);
    CHECK_THROWS_AS(parse("poll_parameters: { initial_backoff_ms: 500, max_backoff_ms: 100 }\n" + MINIMAL),
                    std::runtime_error);
    CHECK_THROWS_AS(parse(R"(
blocks:
  - { name: "b", class: "input", start: 0xZZ, count: 1, registers: [] }
)"), std::runtime_error);
}

TEST_CASE("profile without blocks is rejected")
{
    CHECK_THROWS_AS(parse("poll_parameters: { interval_ms: 500 }\n"), std::runtime_error);
    CHECK_THROWS_AS(ConfigLoader::loadConfig("/nonexistent/profile.yaml"), std::runtime_error);
}
