#include "simulated_controller.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace {

uint16_t toWord(double value, uint32_t scale) {
    long scaled = std::lround(value * scale);
    if (scaled < 0) {
        return static_cast<uint16_t>(static_cast<int16_t>(std::max(scaled, -32768L)));
    }
    return static_cast<uint16_t>(std::min(scaled, 65535L));
}

} // namespace

SimulatedController::SimulatedController(const SimulationParams& p)
    : params(p), pending_failures(0), reads(0), last_tick(0), last_day(-1), last_month(-1), last_year(-1),
      battery_voltage(p.battery_nominal_voltage * 1.04), max_pv_voltage_today(0.0), min_pv_voltage_today(0.0),
      max_battery_voltage_today(0.0), min_battery_voltage_today(0.0), generated_today(0.0), generated_month(0.0),
      generated_year(0.0), generated_total(0.0), consumed_today(0.0), consumed_month(0.0), consumed_year(0.0),
      consumed_total(0.0) {
    std::random_device rd;
    rng.seed(rd());
    seedRegisterFile();
}

void SimulatedController::seedRegisterFile() {
    auto zeroFill = [this](RegisterClass cls, uint16_t start, uint16_t count) {
        for (uint16_t i = 0; i < count; ++i) {
            register_file[{cls, static_cast<uint16_t>(start + i)}] = 0;
        }
    };
    zeroFill(RegisterClass::INPUT, 0x3000, 0x20);
    zeroFill(RegisterClass::INPUT, 0x3100, 0x20);
    zeroFill(RegisterClass::INPUT, 0x3200, 0x03);
    zeroFill(RegisterClass::INPUT, 0x3300, 0x20);
    zeroFill(RegisterClass::HOLDING, 0x9000, 0x20);
    zeroFill(RegisterClass::COIL, 0x0000, 0x10);
    zeroFill(RegisterClass::DISCRETE, 0x2000, 0x10);

    // Rated data
    double rated_current = params.rated_pv_power_watts / params.battery_nominal_voltage;
    setWord(RegisterClass::INPUT, 0x3000, toWord(150.0, 100));
    setWord(RegisterClass::INPUT, 0x3001, toWord(rated_current, 100));
    setWide(RegisterClass::INPUT, 0x3002, static_cast<uint32_t>(params.rated_pv_power_watts * 100));
    setWord(RegisterClass::INPUT, 0x3004, toWord(params.battery_nominal_voltage, 100));
    setWord(RegisterClass::INPUT, 0x3005, toWord(rated_current, 100));
    setWide(RegisterClass::INPUT, 0x3006, static_cast<uint32_t>(params.rated_pv_power_watts * 100));
    setWord(RegisterClass::INPUT, 0x3008, 2); // MPPT
    setWord(RegisterClass::INPUT, 0x300E, toWord(20.0, 100));

    // Settings
    setWord(RegisterClass::HOLDING, 0x9000, 1); // Sealed
    setWord(RegisterClass::HOLDING, 0x9001, 200);
    setWord(RegisterClass::HOLDING, 0x9007, toWord(params.float_voltage * 1.043, 100));
    setWord(RegisterClass::HOLDING, 0x9008, toWord(params.float_voltage, 100));

    writeScaled(0x3104, battery_voltage);
    setWord(RegisterClass::INPUT, 0x3110, toWord(25.0, 100));
    setWord(RegisterClass::INPUT, 0x3111, toWord(25.0, 100));
}

std::vector<uint16_t> SimulatedController::read(RegisterClass register_class, uint16_t start, uint16_t count) {
    ++reads;
    if (pending_failures > 0) {
        --pending_failures;
        throw TransportError("simulated response timeout");
    }
    if (failing_ranges.count({register_class, start}) > 0) {
        std::ostringstream reason;
        reason << "simulated device did not answer at 0x" << std::hex << start;
        throw TransportError(reason.str());
    }

    std::vector<uint16_t> words;
    words.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        auto it = register_file.find({register_class, static_cast<uint16_t>(start + i)});
        if (it == register_file.end()) {
            std::ostringstream reason;
            reason << "illegal data address 0x" << std::hex << (start + i);
            throw TransportError(reason.str());
        }
        words.push_back(it->second);
    }
    return words;
}

void SimulatedController::setWord(RegisterClass register_class, uint16_t address, uint16_t value) {
    register_file[{register_class, address}] = value;
}

void SimulatedController::setWide(RegisterClass register_class, uint16_t address, uint32_t value) {
    register_file[{register_class, address}] = value & 0xFFFF;                                   // Low word
    register_file[{register_class, static_cast<uint16_t>(address + 1)}] = (value >> 16) & 0xFFFF; // High word
}

void SimulatedController::setFailing(RegisterClass register_class, uint16_t start, bool failing) {
    if (failing) {
        failing_ranges.insert({register_class, start});
    } else {
        failing_ranges.erase({register_class, start});
    }
}

void SimulatedController::failNextReads(int count) {
    pending_failures = std::max(0, count);
}

int SimulatedController::readCount() const {
    return reads;
}

void SimulatedController::writeScaled(uint16_t address, double value) {
    setWord(RegisterClass::INPUT, address, toWord(value, 100));
}

void SimulatedController::writeScaledWide(uint16_t address, double value) {
    double scaled = std::max(0.0, std::round(value * 100));
    setWide(RegisterClass::INPUT, address, static_cast<uint32_t>(std::min(scaled, 4294967295.0)));
}

double SimulatedController::calculatePowerOutput(const struct tm& local_time) {
    double hour_of_day = local_time.tm_hour + local_time.tm_min / 60.0 + local_time.tm_sec / 3600.0;

    // Seasonal adjustment, peak in summer
    int day_of_year = local_time.tm_yday;
    double seasonal_factor = 0.8 + 0.4 * std::sin(2 * M_PI * (day_of_year - 80) / 365.0);

    // Longer days around the summer solstice
    double sunrise = 6.0 + 2.0 * std::cos(2 * M_PI * day_of_year / 365.0);
    double sunset = 18.0 - 2.0 * std::cos(2 * M_PI * day_of_year / 365.0);
    if (hour_of_day < sunrise || hour_of_day > sunset) {
        return 0.0;
    }

    double day_length = sunset - sunrise;
    double noon = (sunrise + sunset) / 2.0;
    double normalized_time = 2.0 * (hour_of_day - noon) / day_length; // -1 to 1
    double solar_factor = std::exp(-2.0 * normalized_time * normalized_time);

    std::uniform_real_distribution<> variation_dis(0.95, 1.05);
    double power = params.rated_pv_power_watts * solar_factor * seasonal_factor * variation_dis(rng);
    return std::min(power, params.rated_pv_power_watts);
}

void SimulatedController::tick(std::time_t now) {
    struct tm local_time{};
    localtime_r(&now, &local_time);

    double elapsed_seconds = 0.0;
    if (last_tick != 0 && now > last_tick) {
        elapsed_seconds = std::min(std::difftime(now, last_tick), 3600.0);
    }

    // 1. Controller-side counter clearing at its own midnight
    if (last_day != -1 && local_time.tm_mday != last_day) {
        generated_today = 0.0;
        consumed_today = 0.0;
        max_pv_voltage_today = 0.0;
        min_pv_voltage_today = 0.0;
        max_battery_voltage_today = 0.0;
        min_battery_voltage_today = 0.0;
    }
    if (last_month != -1 && local_time.tm_mon != last_month) {
        generated_month = 0.0;
        consumed_month = 0.0;
    }
    if (last_year != -1 && local_time.tm_year != last_year) {
        generated_year = 0.0;
        consumed_year = 0.0;
    }
    last_day = local_time.tm_mday;
    last_month = local_time.tm_mon;
    last_year = local_time.tm_year;
    last_tick = now;

    // 2. PV side
    double pv_power = calculatePowerOutput(local_time);
    double power_ratio = pv_power / params.rated_pv_power_watts;
    double pv_voltage = pv_power > 0 ? battery_voltage * (1.4 + 0.3 * power_ratio) : 0.0;
    double pv_current = pv_voltage > 0 ? pv_power / pv_voltage : 0.0;

    // 3. Battery side
    double charge_power = pv_power * params.efficiency_percent / 100.0;
    double target_voltage = pv_power > 0 ? params.float_voltage + 0.4 * power_ratio
                                         : params.battery_nominal_voltage * 1.04;
    battery_voltage += (target_voltage - battery_voltage) * 0.1;
    double charge_current = charge_power / battery_voltage;
    double load_power = battery_voltage * params.load_current_amps;

    // 4. Energy counters in kWh
    double generated = charge_power * elapsed_seconds / 3.6e6;
    double consumed = load_power * elapsed_seconds / 3.6e6;
    generated_today += generated;
    generated_month += generated;
    generated_year += generated;
    generated_total += generated;
    consumed_today += consumed;
    consumed_month += consumed;
    consumed_year += consumed;
    consumed_total += consumed;

    if (max_pv_voltage_today == 0.0 || pv_voltage > max_pv_voltage_today) max_pv_voltage_today = pv_voltage;
    if (min_pv_voltage_today == 0.0 || pv_voltage < min_pv_voltage_today) min_pv_voltage_today = pv_voltage;
    if (battery_voltage > max_battery_voltage_today) max_battery_voltage_today = battery_voltage;
    if (min_battery_voltage_today == 0.0 || battery_voltage < min_battery_voltage_today) {
        min_battery_voltage_today = battery_voltage;
    }

    // 5. Status words
    uint16_t stage = 0x00;
    if (pv_power > 0) {
        stage = battery_voltage >= params.float_voltage ? 0x01 : 0x02; // Float : Boost
    }
    uint16_t charging_status = static_cast<uint16_t>(0x0001 | (stage << 2));
    if (pv_power <= 0) {
        charging_status |= 0x4000; // No power connected
    }
    setWord(RegisterClass::INPUT, 0x3200, 0x0000);
    setWord(RegisterClass::INPUT, 0x3201, charging_status);
    setWord(RegisterClass::INPUT, 0x3202, params.load_current_amps > 0 ? 0x0001 : 0x0000);

    // 6. Real-time data
    writeScaled(0x3100, pv_voltage);
    writeScaled(0x3101, pv_current);
    writeScaledWide(0x3102, pv_power);
    writeScaled(0x3104, battery_voltage);
    writeScaled(0x3105, charge_current);
    writeScaledWide(0x3106, charge_power);
    writeScaled(0x310C, battery_voltage);
    writeScaled(0x310D, params.load_current_amps);
    writeScaledWide(0x310E, load_power);
    writeScaled(0x3110, 25.0);
    writeScaled(0x3111, 25.0 + 20.0 * power_ratio);

    double soc = (battery_voltage - params.battery_nominal_voltage * 0.95) / (params.battery_nominal_voltage * 0.15);
    setWord(RegisterClass::INPUT, 0x311A, static_cast<uint16_t>(std::clamp(soc, 0.0, 1.0) * 100));
    writeScaled(0x311B, 25.0);

    // 7. Statistics
    writeScaled(0x3300, max_pv_voltage_today);
    writeScaled(0x3301, min_pv_voltage_today);
    writeScaled(0x3302, max_battery_voltage_today);
    writeScaled(0x3303, min_battery_voltage_today);
    writeScaledWide(0x3304, consumed_today);
    writeScaledWide(0x3306, consumed_month);
    writeScaledWide(0x3308, consumed_year);
    writeScaledWide(0x330A, consumed_total);
    writeScaledWide(0x330C, generated_today);
    writeScaledWide(0x330E, generated_month);
    writeScaledWide(0x3310, generated_year);
    writeScaledWide(0x3312, generated_total);

    double net_current = charge_current - params.load_current_amps;
    setWide(RegisterClass::INPUT, 0x331B, static_cast<uint32_t>(static_cast<int32_t>(std::lround(net_current * 100))));
    writeScaled(0x331D, 25.0);
    writeScaled(0x331E, 25.0);

    setWord(RegisterClass::DISCRETE, 0x200C, pv_power > 0 ? 0 : 1); // Night
}
