#ifndef POLL_CONTROLLER_H
#define POLL_CONTROLLER_H

#include "charge_controller.hpp"
#include "register_transport.hpp"
#include "statistics_accumulator.hpp"
#include "status_decoder.hpp"
#include "value_bus.hpp"
#include <chrono>
#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/// @brief Phase of the poll cycle the controller is currently in.
enum class PollState {
    IDLE,
    READING,
    BACKOFF,
    DECODING,
    PUBLISHING
};

/// @brief Overall result of one poll cycle.
enum class PollOutcome {
    SUCCESS,
    PARTIAL_FAILURE, ///< Some blocks failed, the rest was decoded and published
    TOTAL_FAILURE    ///< No block could be read
};

/**
 * @struct PollResult
 * @brief Everything one poll cycle produced.
 */
struct PollResult {
    std::time_t timestamp;
    std::vector<DecodedValue> values; ///< One entry per configured register
    std::optional<StatusFlags> status;
    std::optional<ChargeState> charge_state; ///< Set together with status
    StatisticsState statistics;
    PollOutcome outcome;
    std::vector<std::string> failed_blocks;
    std::vector<DataQualityWarning> warnings;
    bool escalate; ///< Link considered down, the supervisor should restart the bridge
};

/**
 * @class PollController
 * @brief Runs poll cycles against the charge controller and publishes the results.
 *
 * Each cycle reads every configured register block through the transport,
 * retrying failed reads with a bounded exponential backoff, decodes the words,
 * feeds the statistics accumulator and publishes values, status and statistics.
 * Blocks are independent, so a block that cannot be read only turns its own
 * values into "no data". Cycles never overlap; the caller drives the cadence.
 */
class PollController {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * @brief Constructor for the PollController.
     * @param transport Link to the controller, exclusively used by this object.
     * @param config Register map and poll parameters.
     * @param accumulator Statistics state, owned by the caller.
     * @param publisher Bus receiving the published paths.
     * @param sleeper Called for backoff delays, defaults to std::this_thread::sleep_for.
     */
    PollController(RegisterTransport& transport, const Config& config, StatisticsAccumulator& accumulator,
                   Publisher& publisher, Sleeper sleeper = Sleeper());

    /**
     * @brief Publishes the static identification paths.
     */
    void announce();

    /**
     * @brief Runs one poll cycle stamped with the current wall clock time.
     */
    PollResult runCycle();

    /**
     * @brief Runs one poll cycle stamped with the given time.
     */
    PollResult runCycle(std::time_t now);

    PollState state() const;
    int consecutiveFailures() const;

private:
    bool readBlock(const RegisterBlock& block, std::vector<uint16_t>& words);
    void decodeBlock(const RegisterBlock& block, const std::vector<uint16_t>* words, std::time_t now,
                     std::vector<DecodedValue>& values) const;
    std::optional<StatusFlags> decodeStatus(const std::vector<DecodedValue>& values) const;
    StatisticsSample buildSample(const std::vector<DecodedValue>& values, const std::optional<StatusFlags>& status,
                                 const std::optional<ChargeState>& charge_state) const;

    void publishValues(const std::vector<DecodedValue>& values);
    void publishStatus(const std::optional<StatusFlags>& status, const std::optional<ChargeState>& charge_state);
    void publishStatistics(const StatisticsState& statistics);
    void publishWindow(const std::string& prefix, const WindowStats& window);

    RegisterTransport& transport;
    const Config& config;
    StatisticsAccumulator& accumulator;
    Publisher& publisher;
    Sleeper sleeper;

    PollState current_state;
    int consecutive_failures;
};

/**
 * @brief Looks up a decoded value by register name.
 * @return The value, std::nullopt if the register is unknown or had no data.
 */
std::optional<double> findValue(const std::vector<DecodedValue>& values, const std::string& name);

std::string toString(PollOutcome outcome);

#endif // POLL_CONTROLLER_H
