#include "status_decoder.hpp"
#include <array>
#include <utility>

namespace {

bool isBitSet(uint16_t value, unsigned bit) {
    return ((value >> bit) & 1u) != 0;
}

const std::array<std::pair<unsigned, ChargingFault>, 8> CHARGING_FAULT_BITS = {{
    {13, ChargingFault::CHARGING_MOSFET_SHORT},
    {12, ChargingFault::CHARGING_OR_ANTI_REVERSE_MOSFET_SHORT},
    {11, ChargingFault::ANTI_REVERSE_MOSFET_SHORT},
    {10, ChargingFault::INPUT_OVER_CURRENT},
    {9, ChargingFault::LOAD_OVER_CURRENT},
    {8, ChargingFault::LOAD_SHORT},
    {7, ChargingFault::LOAD_MOSFET_SHORT},
    {4, ChargingFault::PV_INPUT_SHORT},
}};

// Victron error codes
constexpr int ERROR_NONE = 0;
constexpr int ERROR_BATTERY_VOLTAGE_HIGH = 2;
constexpr int ERROR_INPUT_VOLTAGE_HIGH = 33;
constexpr int ERROR_INPUT_CURRENT_HIGH = 34;

} // namespace

BatteryStatus decodeBatteryStatus(uint16_t word) {
    BatteryStatus status{};

    switch (word & 0x0F) {
        case 0x00: status.voltage_state = BatteryVoltageState::NORMAL; break;
        case 0x01: status.voltage_state = BatteryVoltageState::OVERVOLTAGE; break;
        case 0x02: status.voltage_state = BatteryVoltageState::UNDERVOLTAGE; break;
        case 0x03: status.voltage_state = BatteryVoltageState::LOW_VOLTAGE_DISCONNECT; break;
        case 0x04: status.voltage_state = BatteryVoltageState::FAULT; break;
        default:   status.voltage_state = BatteryVoltageState::UNKNOWN; break;
    }

    switch ((word >> 4) & 0x0F) {
        case 0x00: status.temperature_state = BatteryTemperatureState::NORMAL; break;
        case 0x01: status.temperature_state = BatteryTemperatureState::OVER; break;
        case 0x02: status.temperature_state = BatteryTemperatureState::UNDER; break;
        default:   status.temperature_state = BatteryTemperatureState::UNKNOWN; break;
    }

    status.internal_resistance_abnormal = isBitSet(word, 8);
    status.rated_voltage_mismatch = isBitSet(word, 15);
    return status;
}

ChargingStatus decodeChargingStatus(uint16_t word) {
    ChargingStatus status{};

    // Two-bit fields cover every pattern, no unknown variant needed
    status.input_voltage_state = static_cast<InputVoltageState>((word >> 14) & 0x03);
    status.stage = static_cast<ChargingStage>((word >> 2) & 0x03);

    for (const auto& entry : CHARGING_FAULT_BITS) {
        if (isBitSet(word, entry.first)) {
            status.faults.insert(entry.second);
        }
    }

    status.fault = isBitSet(word, 1);
    status.running = isBitSet(word, 0);
    return status;
}

DischargingStatus decodeDischargingStatus(uint16_t word) {
    DischargingStatus status{};
    status.input_voltage_state = static_cast<LoadInputVoltageState>((word >> 14) & 0x03);
    status.output_load = static_cast<OutputLoad>((word >> 12) & 0x03);
    status.short_circuit = isBitSet(word, 11);
    status.fault = isBitSet(word, 1);
    status.running = isBitSet(word, 0);
    return status;
}

ChargeState toChargeState(const ChargingStatus& charging,
                          std::optional<double> battery_voltage,
                          std::optional<double> float_voltage) {
    if (charging.fault) {
        return ChargeState::FAULT;
    }

    switch (charging.stage) {
        case ChargingStage::NONE:
            return ChargeState::OFF;
        case ChargingStage::FLOAT:
            return ChargeState::FLOAT;
        case ChargingStage::BOOST:
            if (battery_voltage && float_voltage && *battery_voltage > *float_voltage) {
                return ChargeState::ABSORPTION;
            }
            return ChargeState::BULK;
        case ChargingStage::EQUALIZATION:
            return ChargeState::STORAGE;
    }
    return ChargeState::OFF;
}

int toErrorCode(const StatusFlags& flags) {
    if (flags.battery.voltage_state == BatteryVoltageState::OVERVOLTAGE) {
        return ERROR_BATTERY_VOLTAGE_HIGH;
    }
    if (flags.charging.input_voltage_state == InputVoltageState::HIGH_VOLTAGE) {
        return ERROR_INPUT_VOLTAGE_HIGH;
    }
    if (flags.charging.faults.count(ChargingFault::INPUT_OVER_CURRENT) > 0) {
        return ERROR_INPUT_CURRENT_HIGH;
    }
    return ERROR_NONE;
}

std::string toString(BatteryVoltageState state) {
    switch (state) {
        case BatteryVoltageState::NORMAL: return "Normal";
        case BatteryVoltageState::OVERVOLTAGE: return "Overvolt";
        case BatteryVoltageState::UNDERVOLTAGE: return "Undervolt";
        case BatteryVoltageState::LOW_VOLTAGE_DISCONNECT: return "Low Volt Disconnect";
        case BatteryVoltageState::FAULT: return "Fault";
        case BatteryVoltageState::UNKNOWN: break;
    }
    return "Unknown";
}

std::string toString(BatteryTemperatureState state) {
    switch (state) {
        case BatteryTemperatureState::NORMAL: return "Normal";
        case BatteryTemperatureState::OVER: return "Over Temperature";
        case BatteryTemperatureState::UNDER: return "Low Temperature";
        case BatteryTemperatureState::UNKNOWN: break;
    }
    return "Unknown";
}

std::string toString(InputVoltageState state) {
    switch (state) {
        case InputVoltageState::NORMAL: return "Normal";
        case InputVoltageState::NO_POWER: return "No Power";
        case InputVoltageState::HIGH_VOLTAGE: return "High Voltage";
        case InputVoltageState::VOLTAGE_ERROR: return "Voltage Error";
    }
    return "Unknown";
}

std::string toString(ChargingStage stage) {
    switch (stage) {
        case ChargingStage::NONE: return "None";
        case ChargingStage::FLOAT: return "Float";
        case ChargingStage::BOOST: return "Boost";
        case ChargingStage::EQUALIZATION: return "Equalization";
    }
    return "Unknown";
}

std::string toString(ChargingFault fault) {
    switch (fault) {
        case ChargingFault::CHARGING_MOSFET_SHORT: return "Charging MOSFET short";
        case ChargingFault::CHARGING_OR_ANTI_REVERSE_MOSFET_SHORT: return "Charging or anti-reverse MOSFET short";
        case ChargingFault::ANTI_REVERSE_MOSFET_SHORT: return "Anti-reverse MOSFET short";
        case ChargingFault::INPUT_OVER_CURRENT: return "Input over current";
        case ChargingFault::LOAD_OVER_CURRENT: return "Load over current";
        case ChargingFault::LOAD_SHORT: return "Load short";
        case ChargingFault::LOAD_MOSFET_SHORT: return "Load MOSFET short";
        case ChargingFault::PV_INPUT_SHORT: return "PV input short";
    }
    return "Unknown";
}

std::string formatFaults(const std::set<ChargingFault>& faults) {
    std::string text;
    for (ChargingFault fault : faults) {
        if (!text.empty()) text += ", ";
        text += toString(fault);
    }
    return text;
}
