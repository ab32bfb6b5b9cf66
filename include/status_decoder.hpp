#ifndef STATUS_DECODER_H
#define STATUS_DECODER_H

#include <cstdint>
#include <optional>
#include <set>
#include <string>

/// @brief Battery status register (0x3200) bits D3-D0.
enum class BatteryVoltageState {
    NORMAL,
    OVERVOLTAGE,
    UNDERVOLTAGE,
    LOW_VOLTAGE_DISCONNECT,
    FAULT,
    UNKNOWN ///< Undocumented combination
};

/// @brief Battery status register (0x3200) bits D7-D4.
enum class BatteryTemperatureState {
    NORMAL,
    OVER,  ///< Higher than the warning settings
    UNDER, ///< Lower than the warning settings
    UNKNOWN
};

/// @brief Charging equipment status (0x3201) bits D15-D14.
enum class InputVoltageState {
    NORMAL,
    NO_POWER,     ///< No power connected
    HIGH_VOLTAGE, ///< Higher voltage input
    VOLTAGE_ERROR
};

/// @brief Charging equipment status (0x3201) bits D3-D2.
enum class ChargingStage {
    NONE,
    FLOAT,
    BOOST,
    EQUALIZATION
};

/// @brief Individual fault bits of the charging equipment status.
enum class ChargingFault {
    CHARGING_MOSFET_SHORT,                 ///< D13
    CHARGING_OR_ANTI_REVERSE_MOSFET_SHORT, ///< D12
    ANTI_REVERSE_MOSFET_SHORT,             ///< D11
    INPUT_OVER_CURRENT,                    ///< D10
    LOAD_OVER_CURRENT,                     ///< D9
    LOAD_SHORT,                            ///< D8
    LOAD_MOSFET_SHORT,                     ///< D7
    PV_INPUT_SHORT                         ///< D4
};

/// @brief Discharging equipment status (0x3202) bits D15-D14.
enum class LoadInputVoltageState {
    NORMAL,
    LOW,
    HIGH,
    NO_ACCESS
};

/// @brief Discharging equipment status (0x3202) bits D13-D12.
enum class OutputLoad {
    LIGHT,
    MODERATE,
    RATED,
    OVERLOAD
};

/// @brief Charger state enumeration of the monitoring bus (/State).
enum class ChargeState {
    OFF = 0,
    FAULT = 2,
    BULK = 3,
    ABSORPTION = 4,
    FLOAT = 5,
    STORAGE = 6
};

struct BatteryStatus {
    BatteryVoltageState voltage_state;
    BatteryTemperatureState temperature_state;
    bool internal_resistance_abnormal;
    bool rated_voltage_mismatch;
};

struct ChargingStatus {
    InputVoltageState input_voltage_state;
    std::set<ChargingFault> faults;
    ChargingStage stage;
    bool running;
    bool fault;
};

struct DischargingStatus {
    LoadInputVoltageState input_voltage_state;
    OutputLoad output_load;
    bool short_circuit;
    bool running;
    bool fault;
};

/**
 * @struct StatusFlags
 * @brief Decoded form of the real-time status registers of one poll.
 */
struct StatusFlags {
    BatteryStatus battery;
    ChargingStatus charging;
    std::optional<DischargingStatus> discharging; ///< Absent on profiles without a load output
};

/**
 * @brief Decodes the battery status word (0x3200).
 *
 * Never fails: undocumented voltage or temperature codes map to UNKNOWN.
 */
BatteryStatus decodeBatteryStatus(uint16_t word);

/**
 * @brief Decodes the charging equipment status word (0x3201).
 */
ChargingStatus decodeChargingStatus(uint16_t word);

/**
 * @brief Decodes the discharging equipment status word (0x3202).
 */
DischargingStatus decodeDischargingStatus(uint16_t word);

/**
 * @brief Maps the charging status to the bus charger state.
 *
 * A boost stage whose battery voltage already exceeds the float setpoint is
 * reported as absorption. The fault bit takes precedence over the stage.
 * @param charging Decoded charging equipment status.
 * @param battery_voltage Battery voltage of the same poll, if read.
 * @param float_voltage Float charging setpoint, if read.
 */
ChargeState toChargeState(const ChargingStatus& charging,
                          std::optional<double> battery_voltage,
                          std::optional<double> float_voltage);

/**
 * @brief Maps the decoded flags to the bus error code (/ErrorCode), 0 when none applies.
 */
int toErrorCode(const StatusFlags& flags);

std::string toString(BatteryVoltageState state);
std::string toString(BatteryTemperatureState state);
std::string toString(InputVoltageState state);
std::string toString(ChargingStage stage);
std::string toString(ChargingFault fault);

/**
 * @brief Joins the fault descriptions with ", ", empty when there is no fault.
 */
std::string formatFaults(const std::set<ChargingFault>& faults);

#endif // STATUS_DECODER_H
