#include "value_bus.hpp"
#include <sstream>

void SafeValueBus::publish(const std::string& path, const BusValue& value) {
    std::lock_guard<std::mutex> lock(bus_mutex);
    auto it = entries.find(path);
    if (it == entries.end()) {
        entries.emplace(path, Entry{value, 1});
        return;
    }
    it->second.value = value;
    ++it->second.updates;
}

std::optional<BusValue> SafeValueBus::getValue(const std::string& path) {
    std::lock_guard<std::mutex> lock(bus_mutex);
    auto it = entries.find(path);
    if (it != entries.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

std::optional<double> SafeValueBus::getNumber(const std::string& path) {
    auto value = getValue(path);
    if (!value) return std::nullopt;
    if (const auto* d = std::get_if<double>(&*value)) return *d;
    if (const auto* i = std::get_if<int64_t>(&*value)) return static_cast<double>(*i);
    return std::nullopt;
}

uint64_t SafeValueBus::updateCount(const std::string& path) {
    std::lock_guard<std::mutex> lock(bus_mutex);
    auto it = entries.find(path);
    return it != entries.end() ? it->second.updates : 0;
}

std::vector<std::string> SafeValueBus::paths() {
    std::lock_guard<std::mutex> lock(bus_mutex);
    std::vector<std::string> result;
    result.reserve(entries.size());
    for (const auto& pair : entries) {
        result.push_back(pair.first);
    }
    return result;
}

void SafeValueBus::dump(std::ostream& out) {
    std::lock_guard<std::mutex> lock(bus_mutex);
    for (const auto& pair : entries) {
        out << pair.first << " = " << formatBusValue(pair.second.value) << "\n";
    }
    out.flush();
}

std::string formatBusValue(const BusValue& value) {
    std::ostringstream out;
    switch (value.index()) {
        case 0:
            out << "---";
            break;
        case 1:
            out << std::get<int64_t>(value);
            break;
        case 2:
            out << std::get<double>(value);
            break;
        case 3:
            out << std::get<std::string>(value);
            break;
    }
    return out.str();
}
