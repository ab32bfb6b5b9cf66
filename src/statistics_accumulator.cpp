#include "statistics_accumulator.hpp"
#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <sstream>

namespace {

void foldMin(double& current, const std::optional<double>& value) {
    if (value) current = std::min(current, *value);
}

void foldMax(double& current, const std::optional<double>& value) {
    if (value) current = std::max(current, *value);
}

void foldExtrema(WindowStats& window, const StatisticsSample& sample) {
    foldMin(window.min_pv_voltage, sample.pv_voltage);
    foldMax(window.max_pv_voltage, sample.pv_voltage);
    foldMin(window.min_battery_voltage, sample.battery_voltage);
    foldMax(window.max_battery_voltage, sample.battery_voltage);
    foldMax(window.max_pv_power, sample.pv_power);
    foldMax(window.max_battery_current, sample.battery_current);
}

} // namespace

WindowStats WindowStats::neutral() {
    const double inf = std::numeric_limits<double>::infinity();
    return WindowStats{inf, -inf, inf, -inf, -inf, -inf, 0.0, 0.0, 0.0, 0.0, 0.0, 0};
}

StatisticsAccumulator::StatisticsAccumulator(CalendarMode mode, std::time_t max_poll_gap)
    : calendar_mode(mode),
      max_gap(max_poll_gap),
      state{WindowStats::neutral(), WindowStats::neutral(), WindowStats::neutral(), WindowStats::neutral(), 0},
      last_date{0, 0, 0},
      today_baseline{std::nullopt, std::nullopt, 0},
      month_baseline{std::nullopt, std::nullopt, 0},
      year_baseline{std::nullopt, std::nullopt, 0} {}

const StatisticsState& StatisticsAccumulator::snapshot() const {
    return state;
}

StatisticsAccumulator::CalendarDate StatisticsAccumulator::toDate(std::time_t timestamp) const {
    struct tm parts{};
    if (calendar_mode == CalendarMode::UTC) {
        gmtime_r(&timestamp, &parts);
    } else {
        localtime_r(&timestamp, &parts);
    }
    return CalendarDate{parts.tm_year + 1900, parts.tm_mon + 1, parts.tm_mday};
}

std::vector<DataQualityWarning> StatisticsAccumulator::observe(std::time_t timestamp, const StatisticsSample& sample) {
    std::vector<DataQualityWarning> warnings;
    std::time_t elapsed = 0;

    // 1. Window boundaries
    if (!last_seen) {
        last_seen = timestamp;
        last_date = toDate(timestamp);
        state.days_observed = 1;
        today_baseline.window_opened = timestamp;
        month_baseline.window_opened = timestamp;
        year_baseline.window_opened = timestamp;
    } else if (timestamp < *last_seen) {
        std::ostringstream msg;
        msg << "timestamp " << timestamp << " is older than the previous observation " << *last_seen
            << ", window boundaries left unchanged";
        warnings.push_back({"timestamp", msg.str()});
    } else {
        elapsed = timestamp - *last_seen;
        CalendarDate date = toDate(timestamp);
        if (date.year != last_date.year || date.month != last_date.month || date.day != last_date.day) {
            resetWindows(date, timestamp);
        }
        last_seen = timestamp;
        last_date = date;
    }

    // 2. Extrema, stage time and errors
    foldExtrema(state.today, sample);
    foldExtrema(state.month, sample);
    foldExtrema(state.year, sample);
    foldExtrema(state.lifetime, sample);

    if (elapsed > 0 && elapsed <= max_gap) {
        accumulateStageTime(elapsed);
    }
    last_charge_state = sample.charge_state;
    recordError(sample.error_code);

    // 3. Energy deltas from the controller's cumulative counters
    accumulateEnergy(state.today.consumed_energy, today_baseline.consumed, today_baseline.window_opened,
                     sample.consumed_today, timestamp, "consumed_energy_today", warnings);
    accumulateEnergy(state.today.generated_energy, today_baseline.generated, today_baseline.window_opened,
                     sample.generated_today, timestamp, "generated_energy_today", warnings);
    accumulateEnergy(state.month.consumed_energy, month_baseline.consumed, month_baseline.window_opened,
                     sample.consumed_month, timestamp, "consumed_energy_month", warnings);
    accumulateEnergy(state.month.generated_energy, month_baseline.generated, month_baseline.window_opened,
                     sample.generated_month, timestamp, "generated_energy_month", warnings);
    accumulateEnergy(state.year.consumed_energy, year_baseline.consumed, year_baseline.window_opened,
                     sample.consumed_year, timestamp, "consumed_energy_year", warnings);
    accumulateEnergy(state.year.generated_energy, year_baseline.generated, year_baseline.window_opened,
                     sample.generated_year, timestamp, "generated_energy_year", warnings);

    updateLifetimeEnergy(state.lifetime.consumed_energy, sample.consumed_total, "consumed_energy_total", warnings);
    updateLifetimeEnergy(state.lifetime.generated_energy, sample.generated_total, "generated_energy_total", warnings);

    return warnings;
}

void StatisticsAccumulator::resetWindows(const CalendarDate& date, std::time_t timestamp) {
    state.today = WindowStats::neutral();
    today_baseline.window_opened = timestamp;
    ++state.days_observed;
    std::cout << "[stats] Daily window reset for " << date.year << "-" << date.month << "-" << date.day << std::endl;

    if (date.year != last_date.year || date.month != last_date.month) {
        state.month = WindowStats::neutral();
        month_baseline.window_opened = timestamp;
        std::cout << "[stats] Monthly window reset" << std::endl;
    }
    if (date.year != last_date.year) {
        state.year = WindowStats::neutral();
        year_baseline.window_opened = timestamp;
        std::cout << "[stats] Yearly window reset" << std::endl;
    }
}

void StatisticsAccumulator::accumulateEnergy(double& energy, std::optional<CounterReading>& baseline,
                                             std::time_t window_opened, const std::optional<double>& reading,
                                             std::time_t timestamp, const std::string& field,
                                             std::vector<DataQualityWarning>& warnings) {
    if (!reading) return;

    bool carried_over = baseline && baseline->taken_at < window_opened;
    if (carried_over && timestamp - baseline->taken_at > max_gap) {
        // The controller cleared the counter during the gap
        baseline.reset();
    }

    if (!baseline) {
        // First reading: the controller's counter already covers this window
        energy = *reading;
    } else if (*reading >= baseline->value) {
        energy += *reading - baseline->value;
    } else {
        // Controller-side reset, the reading is what accrued since then
        energy += *reading;
        if (!carried_over) {
            // Controller and local clock disagree on the boundary
            std::ostringstream msg;
            msg << "counter dropped from " << baseline->value << " to " << *reading
                << " inside the window, treated as a controller reset";
            warnings.push_back({field, msg.str()});
        }
    }
    baseline = CounterReading{*reading, timestamp};
}

void StatisticsAccumulator::accumulateStageTime(std::time_t elapsed) {
    if (!last_charge_state) return;

    double hours = static_cast<double>(elapsed) / 3600.0;
    for (WindowStats* window : {&state.today, &state.month, &state.year, &state.lifetime}) {
        switch (*last_charge_state) {
            case ChargeState::BULK: window->time_in_bulk += hours; break;
            case ChargeState::ABSORPTION: window->time_in_absorption += hours; break;
            case ChargeState::FLOAT: window->time_in_float += hours; break;
            default: break;
        }
    }
}

void StatisticsAccumulator::recordError(const std::optional<int>& error_code) {
    if (!error_code || *error_code == 0) return;

    for (WindowStats* window : {&state.today, &state.month, &state.year, &state.lifetime}) {
        window->last_error = *error_code;
    }
}

void StatisticsAccumulator::updateLifetimeEnergy(double& energy, const std::optional<double>& reading,
                                                 const std::string& field,
                                                 std::vector<DataQualityWarning>& warnings) {
    if (!reading) return;

    if (*reading < energy) {
        std::ostringstream msg;
        msg << "lifetime counter decreased from " << energy << " to " << *reading << ", stale read ignored";
        warnings.push_back({field, msg.str()});
        return;
    }
    energy = *reading;
}
