#ifndef CHARGE_CONTROLLER_H
#define CHARGE_CONTROLLER_H

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

/// @brief Modbus object class a register belongs to.
enum class RegisterClass {
    INPUT,    ///< Read only 16-bit register (FC04)
    HOLDING,  ///< Read/write 16-bit register (FC03)
    COIL,     ///< Read/write bit (FC01)
    DISCRETE  ///< Read only bit (FC02)
};

/// @brief Number of 16-bit words a register value spans.
enum class RegisterWidth {
    SINGLE, ///< One word
    DOUBLE  ///< Low word at the address, high word at address + 1
};

/**
 * @struct RegisterSpec
 * @brief Describes how to interpret one value of the controller's register map.
 *
 * Populated from the YAML profile. The scale is an integer divisor applied to
 * the raw integer, so a battery voltage register with scale 100 turns 4468
 * into 44.68 V.
 */
struct RegisterSpec {
    std::string name;
    uint16_t address;
    RegisterWidth width;
    std::string unit;
    uint32_t scale;
    bool is_signed;
    std::string path; // Bus path, empty if the value is not published directly
};

/**
 * @struct RegisterBlock
 * @brief A contiguous address range fetched with a single transport read.
 *
 * Blocks are independent of each other: a failing block only invalidates the
 * registers it contains.
 */
struct RegisterBlock {
    std::string name;
    RegisterClass register_class;
    uint16_t start;
    uint16_t count;
    bool optional;
    std::vector<RegisterSpec> registers;
};

/**
 * @struct RawSample
 * @brief Words acquired for a single register during one poll.
 */
struct RawSample {
    uint16_t address;
    std::vector<uint16_t> words; // One or two words, low word first
    std::time_t acquired_at;
};

/**
 * @struct DecodedValue
 * @brief A register value converted to its physical quantity.
 */
struct DecodedValue {
    std::string name;
    std::optional<double> value; ///< Empty when the owning block could not be read
    uint32_t raw;                ///< Reconstructed bit pattern, valid when value is set
    std::string unit;
    std::string path;
};

/**
 * @struct RegisterNames
 * @brief Logical register names the poll cycle relies on for status decoding
 * and statistics. Profiles for other controller models must use the same names.
 */
struct RegisterNames {
    static constexpr const char* PV_VOLTAGE = "pv_voltage";
    static constexpr const char* PV_POWER = "pv_power";
    static constexpr const char* BATTERY_VOLTAGE = "battery_voltage";
    static constexpr const char* BATTERY_CURRENT = "battery_current";
    static constexpr const char* BATTERY_STATUS = "battery_status";
    static constexpr const char* CHARGING_STATUS = "charging_status";
    static constexpr const char* DISCHARGING_STATUS = "discharging_status";
    static constexpr const char* FLOAT_VOLTAGE = "float_voltage";
    static constexpr const char* CONSUMED_TODAY = "consumed_energy_today";
    static constexpr const char* CONSUMED_MONTH = "consumed_energy_month";
    static constexpr const char* CONSUMED_YEAR = "consumed_energy_year";
    static constexpr const char* CONSUMED_TOTAL = "consumed_energy_total";
    static constexpr const char* GENERATED_TODAY = "generated_energy_today";
    static constexpr const char* GENERATED_MONTH = "generated_energy_month";
    static constexpr const char* GENERATED_YEAR = "generated_energy_year";
    static constexpr const char* GENERATED_TOTAL = "generated_energy_total";
};

/**
 * @struct DeviceIdentity
 * @brief Static identification published once when the bridge starts.
 */
struct DeviceIdentity {
    std::string product_name;
    uint32_t product_id;
    std::string serial_number;
    std::string firmware_version;
    std::string custom_name;
    int device_instance;
    std::string process_name;
    std::string process_version;
    std::string connection;
};

/// @brief Selects the transport implementation the bridge polls through.
enum class TransportType {
    RTU,      ///< libmodbus RTU over a serial port
    SIMULATED ///< In-memory controller model
};

/**
 * @struct SerialParams
 * @brief Serial link settings for the Modbus RTU transport.
 */
struct SerialParams {
    TransportType type;
    std::string port;
    int baud_rate;
    char parity;
    int data_bits;
    int stop_bits;
    int slave_id;
    int response_timeout_ms;
};

/**
 * @struct PollParams
 * @brief Cadence, retry and escalation settings of the poll loop.
 */
struct PollParams {
    int interval_ms;
    int max_retries;
    int initial_backoff_ms;
    int max_backoff_ms;
    int max_consecutive_failures;
    bool use_utc;
};

/**
 * @struct SimulationParams
 * @brief Parameters of the simulated controller used when no device is attached.
 */
struct SimulationParams {
    double rated_pv_power_watts;
    double battery_nominal_voltage;
    double efficiency_percent;
    double float_voltage;
    double load_current_amps;
};

/**
 * @struct Config
 * @brief Top-level structure holding the entire parsed profile.
 */
struct Config {
    DeviceIdentity identity;
    SerialParams serial;
    PollParams poll;
    SimulationParams simulation;
    std::vector<RegisterBlock> blocks;
};

#endif // CHARGE_CONTROLLER_H
