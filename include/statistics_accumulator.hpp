#ifndef STATISTICS_ACCUMULATOR_H
#define STATISTICS_ACCUMULATOR_H

#include "status_decoder.hpp"
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

/**
 * @struct WindowStats
 * @brief Running extrema and energy totals of one statistics window.
 *
 * A freshly reset window holds the neutral baseline: minima at +inf,
 * maxima at -inf, zero energy and zero time in every charging stage.
 */
struct WindowStats {
    double min_pv_voltage;
    double max_pv_voltage;
    double min_battery_voltage;
    double max_battery_voltage;
    double max_pv_power;
    double max_battery_current;
    double consumed_energy;  ///< kWh
    double generated_energy; ///< kWh
    double time_in_bulk;       ///< Hours
    double time_in_absorption; ///< Hours
    double time_in_float;      ///< Hours
    int last_error;            ///< Most recent non-zero bus error code, 0 if none

    static WindowStats neutral();
};

/**
 * @struct StatisticsState
 * @brief Snapshot of every window kept by the accumulator.
 */
struct StatisticsState {
    WindowStats today;
    WindowStats month;
    WindowStats year;
    WindowStats lifetime;
    uint32_t days_observed;
};

/**
 * @struct StatisticsSample
 * @brief Values of one poll that feed the accumulator.
 *
 * Fields whose register block could not be read stay empty and are skipped.
 * Energy fields are the controller's own cumulative counters in kWh.
 */
struct StatisticsSample {
    std::optional<double> pv_voltage;
    std::optional<double> battery_voltage;
    std::optional<double> pv_power;
    std::optional<double> battery_current;

    std::optional<double> consumed_today;
    std::optional<double> consumed_month;
    std::optional<double> consumed_year;
    std::optional<double> consumed_total;

    std::optional<double> generated_today;
    std::optional<double> generated_month;
    std::optional<double> generated_year;
    std::optional<double> generated_total;

    std::optional<ChargeState> charge_state; ///< Empty when the status block was not read
    std::optional<int> error_code;
};

/**
 * @struct DataQualityWarning
 * @brief A recovered anomaly in the polled data, reported but never fatal.
 */
struct DataQualityWarning {
    std::string field;
    std::string message;
};

/// @brief Calendar used to place timestamps into day/month/year windows.
enum class CalendarMode {
    LOCAL,
    UTC
};

/**
 * @class StatisticsAccumulator
 * @brief Maintains daily, monthly, yearly and lifetime statistics.
 *
 * Window boundaries are detected by comparing the calendar date of each
 * observed timestamp with the date of the previous one, so a window is reset
 * exactly once no matter how many polls fall inside it. Energy is accumulated
 * from deltas of the controller's cumulative counters. The controller clears
 * those counters at its own midnight, so a reading lower than the previous one
 * is taken as a controller-side reset instead of a negative delta. A counter
 * baseline left over from an earlier window is only used when the polls are
 * contiguous; after a longer gap the controller has already cleared the
 * counter and the new reading is taken as the window's total.
 *
 * Time in each charging stage is credited to the stage seen at the previous
 * poll, for gaps no longer than the contiguity limit.
 */
class StatisticsAccumulator {
public:
    /**
     * @param mode Calendar used for the window boundaries.
     * @param max_poll_gap Longest interval, in seconds, between two polls that
     *        are still considered contiguous.
     */
    explicit StatisticsAccumulator(CalendarMode mode = CalendarMode::LOCAL, std::time_t max_poll_gap = 600);

    /**
     * @brief Folds one poll into the statistics.
     * @param timestamp Acquisition time of the sample.
     * @param sample Values read during the poll.
     * @return Anomalies detected while folding the sample, empty when clean.
     */
    std::vector<DataQualityWarning> observe(std::time_t timestamp, const StatisticsSample& sample);

    const StatisticsState& snapshot() const;

private:
    struct CalendarDate {
        int year;
        int month;
        int day;
    };

    struct CounterReading {
        double value;
        std::time_t taken_at;
    };

    /// Last cumulative readings a window computes its deltas from.
    struct CounterBaseline {
        std::optional<CounterReading> consumed;
        std::optional<CounterReading> generated;
        std::time_t window_opened;
    };

    CalendarDate toDate(std::time_t timestamp) const;
    void resetWindows(const CalendarDate& date, std::time_t timestamp);
    void accumulateEnergy(double& energy, std::optional<CounterReading>& baseline, std::time_t window_opened,
                          const std::optional<double>& reading, std::time_t timestamp,
                          const std::string& field, std::vector<DataQualityWarning>& warnings);
    void accumulateStageTime(std::time_t elapsed);
    void recordError(const std::optional<int>& error_code);
    void updateLifetimeEnergy(double& energy, const std::optional<double>& reading,
                              const std::string& field, std::vector<DataQualityWarning>& warnings);

    CalendarMode calendar_mode;
    std::time_t max_gap;
    StatisticsState state;
    std::optional<std::time_t> last_seen;
    CalendarDate last_date;

    CounterBaseline today_baseline;
    CounterBaseline month_baseline;
    CounterBaseline year_baseline;
    std::optional<ChargeState> last_charge_state;
};

#endif // STATISTICS_ACCUMULATOR_H
