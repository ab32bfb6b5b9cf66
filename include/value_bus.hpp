#ifndef VALUE_BUS_H
#define VALUE_BUS_H

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

/// @brief A value on the bus. std::monostate means "no data".
using BusValue = std::variant<std::monostate, int64_t, double, std::string>;

/**
 * @class Publisher
 * @brief Capability to expose named values to monitoring consumers.
 *
 * Publishing never fails from the caller's point of view.
 */
class Publisher {
public:
    virtual ~Publisher() = default;

    /**
     * @brief Creates or updates the value at a path.
     * @param path Slash separated path, e.g. "/Dc/0/Voltage".
     * @param value The new value, std::monostate to mark it invalid.
     */
    virtual void publish(const std::string& path, const BusValue& value) = 0;
};

/**
 * @class SafeValueBus
 * @brief Process-wide store of published values with thread-safe access.
 *
 * The poll loop is the only writer; any other thread of the process may read
 * the latest values through getValue() or dump().
 */
class SafeValueBus : public Publisher {
public:
    void publish(const std::string& path, const BusValue& value) override;

    /**
     * @brief Gets the value currently published at a path.
     * @param path The bus path.
     * @return The value if the path was ever published, std::nullopt otherwise.
     */
    std::optional<BusValue> getValue(const std::string& path);

    /**
     * @brief Gets a numeric value, converting integers to double.
     * @return std::nullopt if the path is unknown, holds no data or a string.
     */
    std::optional<double> getNumber(const std::string& path);

    /**
     * @brief Number of publish calls received for a path since startup.
     */
    uint64_t updateCount(const std::string& path);

    std::vector<std::string> paths();

    /**
     * @brief Writes every path and value, one per line, sorted by path.
     */
    void dump(std::ostream& out);

private:
    struct Entry {
        BusValue value;
        uint64_t updates;
    };

    std::mutex bus_mutex;
    std::map<std::string, Entry> entries;
};

/**
 * @brief Formats a bus value for logs, "---" for no data.
 */
std::string formatBusValue(const BusValue& value);

#endif // VALUE_BUS_H
