#ifndef SIMULATED_CONTROLLER_H
#define SIMULATED_CONTROLLER_H

#include "charge_controller.hpp"
#include "register_transport.hpp"
#include <ctime>
#include <map>
#include <random>
#include <set>
#include <utility>

/**
 * @class SimulatedController
 * @brief In-memory model of a Tracer charge controller answering register reads.
 *
 * Holds a word map of the controller's register file and, on tick(), derives
 * PV production from a seasonal diurnal curve, charges a battery model and
 * advances the cumulative energy counters. Like the real device it clears the
 * daily, monthly and yearly counters on its own clock.
 */
class SimulatedController : public RegisterTransport {
public:
    explicit SimulatedController(const SimulationParams& params);

    std::vector<uint16_t> read(RegisterClass register_class, uint16_t start, uint16_t count) override;

    /**
     * @brief Sets a single register word.
     */
    void setWord(RegisterClass register_class, uint16_t address, uint16_t value);

    /**
     * @brief Sets a 32-bit value as a low/high word pair starting at address.
     */
    void setWide(RegisterClass register_class, uint16_t address, uint32_t value);

    /**
     * @brief Makes every read starting at the given address fail.
     */
    void setFailing(RegisterClass register_class, uint16_t start, bool failing);

    /**
     * @brief Makes the next reads fail regardless of their address.
     * @param reads Number of consecutive reads to fail.
     */
    void failNextReads(int reads);

    /**
     * @brief Advances the model to the given wall clock time.
     */
    void tick(std::time_t now);

    int readCount() const;

private:
    using Key = std::pair<RegisterClass, uint16_t>;

    void seedRegisterFile();
    double calculatePowerOutput(const struct tm& local_time);
    void writeScaled(uint16_t address, double value);
    void writeScaledWide(uint16_t address, double value);

    SimulationParams params;
    std::map<Key, uint16_t> register_file;
    std::set<Key> failing_ranges;
    int pending_failures;
    int reads;

    std::time_t last_tick;
    int last_day;
    int last_month;
    int last_year;
    double battery_voltage;
    double max_pv_voltage_today;
    double min_pv_voltage_today;
    double max_battery_voltage_today;
    double min_battery_voltage_today;
    double generated_today;
    double generated_month;
    double generated_year;
    double generated_total;
    double consumed_today;
    double consumed_month;
    double consumed_year;
    double consumed_total;

    std::mt19937 rng;
};

#endif // SIMULATED_CONTROLLER_H
