#include "poll_controller.hpp"
#include "register_codec.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <thread>

namespace {

BusValue toBusValue(const std::optional<double>& value) {
    if (value) return BusValue(*value);
    return BusValue();
}

// Neutral window bounds (+inf/-inf) are not published
BusValue finiteOrEmpty(double value) {
    if (std::isfinite(value)) return BusValue(value);
    return BusValue();
}

std::optional<uint16_t> findWord(const std::vector<DecodedValue>& values, const std::string& name) {
    for (const auto& v : values) {
        if (v.name == name && v.value) return static_cast<uint16_t>(v.raw & 0xFFFF);
    }
    return std::nullopt;
}

} // namespace

std::optional<double> findValue(const std::vector<DecodedValue>& values, const std::string& name) {
    for (const auto& v : values) {
        if (v.name == name) return v.value;
    }
    return std::nullopt;
}

std::string toString(PollOutcome outcome) {
    switch (outcome) {
        case PollOutcome::SUCCESS: return "success";
        case PollOutcome::PARTIAL_FAILURE: return "partial-failure";
        case PollOutcome::TOTAL_FAILURE: return "total-failure";
    }
    return "unknown";
}

PollController::PollController(RegisterTransport& t, const Config& cfg, StatisticsAccumulator& acc, Publisher& pub,
                               Sleeper s)
    : transport(t), config(cfg), accumulator(acc), publisher(pub), sleeper(std::move(s)),
      current_state(PollState::IDLE), consecutive_failures(0) {
    if (!sleeper) {
        sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

PollState PollController::state() const {
    return current_state;
}

int PollController::consecutiveFailures() const {
    return consecutive_failures;
}

void PollController::announce() {
    const DeviceIdentity& id = config.identity;
    publisher.publish("/Mgmt/ProcessName", id.process_name);
    publisher.publish("/Mgmt/ProcessVersion", id.process_version);
    publisher.publish("/Mgmt/Connection", id.connection);
    publisher.publish("/DeviceInstance", static_cast<int64_t>(id.device_instance));
    publisher.publish("/ProductId", static_cast<int64_t>(id.product_id));
    publisher.publish("/ProductName", id.product_name);
    publisher.publish("/FirmwareVersion", id.firmware_version);
    publisher.publish("/Serial", id.serial_number);
    publisher.publish("/CustomName", id.custom_name);
    publisher.publish("/Connected", static_cast<int64_t>(0));
    publisher.publish("/ErrorCode", static_cast<int64_t>(0));

    // Standalone charger without a BMS
    publisher.publish("/Link/NetworkMode", static_cast<int64_t>(0));
    publisher.publish("/Link/NetworkStatus", static_cast<int64_t>(4));
    publisher.publish("/Settings/BmsPresent", static_cast<int64_t>(0));
}

PollResult PollController::runCycle() {
    return runCycle(std::time(nullptr));
}

PollResult PollController::runCycle(std::time_t now) {
    PollResult result{};
    result.timestamp = now;
    result.outcome = PollOutcome::SUCCESS;
    result.escalate = false;

    // 1. Read every block, a failing block does not stop the others
    current_state = PollState::READING;
    std::vector<std::vector<uint16_t>> block_words(config.blocks.size());
    std::vector<bool> block_ok(config.blocks.size(), false);
    size_t succeeded = 0;
    for (size_t i = 0; i < config.blocks.size(); ++i) {
        if (readBlock(config.blocks[i], block_words[i])) {
            block_ok[i] = true;
            ++succeeded;
        } else {
            result.failed_blocks.push_back(config.blocks[i].name);
        }
    }

    // 2. Decode and accumulate
    current_state = PollState::DECODING;
    for (size_t i = 0; i < config.blocks.size(); ++i) {
        decodeBlock(config.blocks[i], block_ok[i] ? &block_words[i] : nullptr, now, result.values);
    }
    result.status = decodeStatus(result.values);
    if (result.status) {
        result.charge_state = toChargeState(result.status->charging,
                                            findValue(result.values, RegisterNames::BATTERY_VOLTAGE),
                                            findValue(result.values, RegisterNames::FLOAT_VOLTAGE));
    }

    if (succeeded > 0) {
        result.warnings = accumulator.observe(now, buildSample(result.values, result.status, result.charge_state));
        for (const auto& warning : result.warnings) {
            std::cerr << "[poll] Data quality warning on " << warning.field << ": " << warning.message << std::endl;
        }
    }
    result.statistics = accumulator.snapshot();

    if (succeeded == 0) {
        result.outcome = PollOutcome::TOTAL_FAILURE;
        ++consecutive_failures;
        std::cerr << "[poll] No register block could be read (" << consecutive_failures
                  << " consecutive failed cycles)" << std::endl;
    } else {
        if (!result.failed_blocks.empty()) {
            result.outcome = PollOutcome::PARTIAL_FAILURE;
        }
        consecutive_failures = 0;
    }
    result.escalate = consecutive_failures >= config.poll.max_consecutive_failures;

    // 3. Publish
    current_state = PollState::PUBLISHING;
    publishValues(result.values);
    publishStatus(result.status, result.charge_state);
    if (succeeded > 0) {
        publishStatistics(result.statistics);
    }
    publisher.publish("/Connected", static_cast<int64_t>(succeeded > 0 ? 1 : 0));

    current_state = PollState::IDLE;
    return result;
}

bool PollController::readBlock(const RegisterBlock& block, std::vector<uint16_t>& words) {
    const int attempts = config.poll.max_retries + 1;
    int delay_ms = config.poll.initial_backoff_ms;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            words = transport.read(block.register_class, block.start, block.count);
            if (words.size() == block.count) {
                return true;
            }
            std::cerr << "[poll] Block '" << block.name << "' returned " << words.size() << " words, expected "
                      << block.count << std::endl;
        } catch (const TransportError& e) {
            std::cerr << "[poll] Read of block '" << block.name << "' failed (attempt " << attempt << "/" << attempts
                      << "): " << e.what() << std::endl;
        }

        if (attempt < attempts) {
            current_state = PollState::BACKOFF;
            sleeper(std::chrono::milliseconds(delay_ms));
            delay_ms = std::min(delay_ms * 2, config.poll.max_backoff_ms);
            current_state = PollState::READING;
        }
    }

    if (block.optional) {
        std::cout << "[poll] Optional block '" << block.name << "' unavailable this cycle" << std::endl;
    }
    words.clear();
    return false;
}

void PollController::decodeBlock(const RegisterBlock& block, const std::vector<uint16_t>* words, std::time_t now,
                                 std::vector<DecodedValue>& values) const {
    for (const auto& spec : block.registers) {
        if (words == nullptr) {
            values.push_back(DecodedValue{spec.name, std::nullopt, 0, spec.unit, spec.path});
            continue;
        }

        size_t offset = spec.address - block.start;
        size_t width = spec.width == RegisterWidth::DOUBLE ? 2 : 1;
        RawSample sample{spec.address, {}, now};
        sample.words.assign(words->begin() + offset, words->begin() + offset + width);
        values.push_back(decodeSample(spec, sample));
    }
}

std::optional<StatusFlags> PollController::decodeStatus(const std::vector<DecodedValue>& values) const {
    auto battery_word = findWord(values, RegisterNames::BATTERY_STATUS);
    auto charging_word = findWord(values, RegisterNames::CHARGING_STATUS);
    if (!battery_word || !charging_word) {
        return std::nullopt;
    }

    StatusFlags flags{decodeBatteryStatus(*battery_word), decodeChargingStatus(*charging_word), std::nullopt};
    if (auto discharging_word = findWord(values, RegisterNames::DISCHARGING_STATUS)) {
        flags.discharging = decodeDischargingStatus(*discharging_word);
    }
    return flags;
}

StatisticsSample PollController::buildSample(const std::vector<DecodedValue>& values,
                                             const std::optional<StatusFlags>& status,
                                             const std::optional<ChargeState>& charge_state) const {
    StatisticsSample sample;
    sample.pv_voltage = findValue(values, RegisterNames::PV_VOLTAGE);
    sample.battery_voltage = findValue(values, RegisterNames::BATTERY_VOLTAGE);
    sample.pv_power = findValue(values, RegisterNames::PV_POWER);
    sample.battery_current = findValue(values, RegisterNames::BATTERY_CURRENT);
    sample.consumed_today = findValue(values, RegisterNames::CONSUMED_TODAY);
    sample.consumed_month = findValue(values, RegisterNames::CONSUMED_MONTH);
    sample.consumed_year = findValue(values, RegisterNames::CONSUMED_YEAR);
    sample.consumed_total = findValue(values, RegisterNames::CONSUMED_TOTAL);
    sample.generated_today = findValue(values, RegisterNames::GENERATED_TODAY);
    sample.generated_month = findValue(values, RegisterNames::GENERATED_MONTH);
    sample.generated_year = findValue(values, RegisterNames::GENERATED_YEAR);
    sample.generated_total = findValue(values, RegisterNames::GENERATED_TOTAL);
    sample.charge_state = charge_state;
    if (status) {
        sample.error_code = toErrorCode(*status);
    }
    return sample;
}

void PollController::publishValues(const std::vector<DecodedValue>& values) {
    for (const auto& v : values) {
        if (!v.path.empty()) {
            publisher.publish(v.path, toBusValue(v.value));
        }
    }
}

void PollController::publishStatus(const std::optional<StatusFlags>& status,
                                   const std::optional<ChargeState>& charge_state) {
    static const char* const STATUS_PATHS[] = {
        "/State",
        "/ErrorCode",
        "/Load/State",
        "/Status/Battery/VoltageState",
        "/Status/Battery/TemperatureState",
        "/Status/Battery/InternalResistanceAbnormal",
        "/Status/Battery/RatedVoltageMismatch",
        "/Status/Charging/InputVoltageState",
        "/Status/Charging/Stage",
        "/Status/Charging/Faults",
    };

    if (!status || !charge_state) {
        for (const char* path : STATUS_PATHS) {
            publisher.publish(path, BusValue());
        }
        return;
    }

    publisher.publish("/State", static_cast<int64_t>(*charge_state));
    publisher.publish("/ErrorCode", static_cast<int64_t>(toErrorCode(*status)));

    if (status->discharging) {
        publisher.publish("/Load/State", static_cast<int64_t>(status->discharging->running ? 1 : 0));
    } else {
        publisher.publish("/Load/State", BusValue());
    }

    const BatteryStatus& battery = status->battery;
    publisher.publish("/Status/Battery/VoltageState", toString(battery.voltage_state));
    publisher.publish("/Status/Battery/TemperatureState", toString(battery.temperature_state));
    publisher.publish("/Status/Battery/InternalResistanceAbnormal",
                      static_cast<int64_t>(battery.internal_resistance_abnormal ? 1 : 0));
    publisher.publish("/Status/Battery/RatedVoltageMismatch",
                      static_cast<int64_t>(battery.rated_voltage_mismatch ? 1 : 0));

    const ChargingStatus& charging = status->charging;
    publisher.publish("/Status/Charging/InputVoltageState", toString(charging.input_voltage_state));
    publisher.publish("/Status/Charging/Stage", toString(charging.stage));
    publisher.publish("/Status/Charging/Faults", formatFaults(charging.faults));
}

void PollController::publishStatistics(const StatisticsState& statistics) {
    publisher.publish("/Yield/User", statistics.lifetime.generated_energy);
    publisher.publish("/Yield/System", statistics.lifetime.generated_energy);

    publishWindow("/History/Daily/0", statistics.today);
    publishWindow("/History/Monthly/0", statistics.month);
    publishWindow("/History/Yearly/0", statistics.year);
    publishWindow("/History/Overall", statistics.lifetime);
    publisher.publish("/History/Overall/DaysAvailable", static_cast<int64_t>(statistics.days_observed));
}

void PollController::publishWindow(const std::string& prefix, const WindowStats& window) {
    publisher.publish(prefix + "/Yield", window.generated_energy);
    publisher.publish(prefix + "/Consumption", window.consumed_energy);
    publisher.publish(prefix + "/MaxPower", finiteOrEmpty(window.max_pv_power));
    publisher.publish(prefix + "/MaxPvVoltage", finiteOrEmpty(window.max_pv_voltage));
    publisher.publish(prefix + "/MinPvVoltage", finiteOrEmpty(window.min_pv_voltage));
    publisher.publish(prefix + "/MaxBatteryVoltage", finiteOrEmpty(window.max_battery_voltage));
    publisher.publish(prefix + "/MinBatteryVoltage", finiteOrEmpty(window.min_battery_voltage));
    publisher.publish(prefix + "/MaxBatteryCurrent", finiteOrEmpty(window.max_battery_current));
    publisher.publish(prefix + "/TimeInBulk", window.time_in_bulk);
    publisher.publish(prefix + "/TimeInAbsorption", window.time_in_absorption);
    publisher.publish(prefix + "/TimeInFloat", window.time_in_float);
    publisher.publish(prefix + "/LastError1", static_cast<int64_t>(window.last_error));
}
