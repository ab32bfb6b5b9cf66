#include "config_loader.hpp"
#include <yaml-cpp/yaml.h>
#include <cctype>
#include <iostream>
#include <set>
#include <stdexcept>

namespace {

// Helpers to convert strings to enums
RegisterClass to_register_class(const std::string& s) {
    if (s == "input") return RegisterClass::INPUT;
    if (s == "holding") return RegisterClass::HOLDING;
    if (s == "coil") return RegisterClass::COIL;
    if (s == "discrete") return RegisterClass::DISCRETE;
    throw std::runtime_error("Invalid register class: " + s);
}

RegisterWidth to_width(const std::string& s) {
    if (s == "single") return RegisterWidth::SINGLE;
    if (s == "double") return RegisterWidth::DOUBLE;
    throw std::runtime_error("Invalid register width: " + s);
}

TransportType to_transport_type(const std::string& s) {
    if (s == "rtu") return TransportType::RTU;
    if (s == "simulated") return TransportType::SIMULATED;
    throw std::runtime_error("Invalid transport type: " + s);
}

char to_parity(const std::string& s) {
    if (s == "N" || s == "E" || s == "O") return s[0];
    throw std::runtime_error("Invalid parity: " + s);
}

// Accepts decimal or 0x-prefixed hexadecimal, never octal or negative values
unsigned long parse_number(const YAML::Node& node, const std::string& what, unsigned long max_value) {
    const std::string text = node.as<std::string>();
    const bool hex = text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
    const std::string digits = hex ? text.substr(2) : text;

    bool valid = !digits.empty();
    for (char c : digits) {
        if (!(hex ? std::isxdigit(static_cast<unsigned char>(c)) : std::isdigit(static_cast<unsigned char>(c)))) {
            valid = false;
            break;
        }
    }
    if (!valid) {
        throw std::runtime_error("Invalid " + what + ": " + text);
    }

    unsigned long value = 0;
    try {
        value = std::stoul(digits, nullptr, hex ? 16 : 10);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Out of range " + what + ": " + text);
    }
    if (value > max_value) {
        throw std::runtime_error("Out of range " + what + ": " + text);
    }
    return value;
}

uint16_t parse_address(const YAML::Node& node) {
    return static_cast<uint16_t>(parse_number(node, "register address", 0xFFFF));
}

template <typename T>
T value_or(const YAML::Node& node, const char* key, const T& fallback) {
    return node && node[key] ? node[key].as<T>() : fallback;
}

RegisterSpec parse_register(const YAML::Node& node, const RegisterBlock& block) {
    RegisterSpec reg;
    reg.name = node["name"].as<std::string>();
    reg.address = parse_address(node["address"]);
    reg.width = to_width(value_or<std::string>(node, "width", "single"));
    reg.unit = value_or<std::string>(node, "unit", "");
    reg.scale = node["scale"] ? static_cast<uint32_t>(parse_number(node["scale"], "scale", 0xFFFFFFFF)) : 1;
    reg.is_signed = value_or<bool>(node, "signed", false);
    reg.path = value_or<std::string>(node, "path", "");

    if (reg.scale == 0) {
        throw std::runtime_error("Register " + reg.name + " has a zero scale");
    }

    // The register must sit entirely inside its block
    uint32_t words = reg.width == RegisterWidth::DOUBLE ? 2 : 1;
    uint32_t block_end = static_cast<uint32_t>(block.start) + block.count;
    if (reg.address < block.start || reg.address + words > block_end) {
        throw std::runtime_error("Register " + reg.name + " lies outside block " + block.name);
    }
    if (words == 2 && (block.register_class == RegisterClass::COIL || block.register_class == RegisterClass::DISCRETE)) {
        throw std::runtime_error("Register " + reg.name + " cannot be double width in a bit block");
    }
    return reg;
}

} // namespace

Config ConfigLoader::loadConfig(const std::string& filename) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Cannot read profile " + filename + ": " + e.what());
    }
    return parseConfig(root);
}

Config ConfigLoader::parseConfig(const YAML::Node& root) {
    Config config;

    try {
        // Load Device Identity
        const auto& identity_node = root["device_identity"];
        config.identity.product_name = value_or<std::string>(identity_node, "product_name", "Epever Tracer MPPT");
        config.identity.product_id = 0xA076;
        if (identity_node && identity_node["product_id"]) {
            config.identity.product_id =
                static_cast<uint32_t>(parse_number(identity_node["product_id"], "product id", 0xFFFFFFFF));
        }
        config.identity.serial_number = value_or<std::string>(identity_node, "serial_number", "");
        config.identity.firmware_version = value_or<std::string>(identity_node, "firmware_version", "");
        config.identity.custom_name = value_or<std::string>(identity_node, "custom_name", "PV Charger");
        config.identity.device_instance = value_or<int>(identity_node, "device_instance", 290);
        config.identity.process_name = value_or<std::string>(identity_node, "process_name", "tracer-bridge");
        config.identity.process_version = value_or<std::string>(identity_node, "process_version", "0.9");
        config.identity.connection = value_or<std::string>(identity_node, "connection", "USB");

        // Load Transport
        const auto& transport_node = root["transport"];
        config.serial.type = to_transport_type(value_or<std::string>(transport_node, "type", "rtu"));
        config.serial.port = value_or<std::string>(transport_node, "port", "/dev/ttyUSB0");
        config.serial.baud_rate = value_or<int>(transport_node, "baud_rate", 115200);
        config.serial.parity = to_parity(value_or<std::string>(transport_node, "parity", "N"));
        config.serial.data_bits = value_or<int>(transport_node, "data_bits", 8);
        config.serial.stop_bits = value_or<int>(transport_node, "stop_bits", 1);
        config.serial.slave_id = value_or<int>(transport_node, "slave_id", 1);
        config.serial.response_timeout_ms = value_or<int>(transport_node, "response_timeout_ms", 200);

        // Load Poll Parameters
        const auto& poll_node = root["poll_parameters"];
        config.poll.interval_ms = value_or<int>(poll_node, "interval_ms", 1000);
        config.poll.max_retries = value_or<int>(poll_node, "max_retries", 2);
        config.poll.initial_backoff_ms = value_or<int>(poll_node, "initial_backoff_ms", 50);
        config.poll.max_backoff_ms = value_or<int>(poll_node, "max_backoff_ms", 400);
        config.poll.max_consecutive_failures = value_or<int>(poll_node, "max_consecutive_failures", 3);
        config.poll.use_utc = value_or<bool>(poll_node, "use_utc", false);

        if (config.poll.interval_ms <= 0 || config.poll.max_retries < 0 || config.poll.initial_backoff_ms < 0 ||
            config.poll.max_backoff_ms < config.poll.initial_backoff_ms || config.poll.max_consecutive_failures <= 0) {
            throw std::runtime_error("Invalid poll_parameters");
        }

        // Load Simulation Parameters
        const auto& sim_node = root["simulation_parameters"];
        config.simulation.rated_pv_power_watts = value_or<double>(sim_node, "rated_pv_power_watts", 3000.0);
        config.simulation.battery_nominal_voltage = value_or<double>(sim_node, "battery_nominal_voltage", 24.0);
        config.simulation.efficiency_percent = value_or<double>(sim_node, "efficiency_percent", 96.0);
        config.simulation.float_voltage = value_or<double>(sim_node, "float_voltage", 27.6);
        config.simulation.load_current_amps = value_or<double>(sim_node, "load_current_amps", 2.0);

        if (config.simulation.rated_pv_power_watts <= 0 || config.simulation.battery_nominal_voltage <= 0) {
            throw std::runtime_error("Invalid simulation_parameters");
        }

        // Load Register Blocks
        std::set<std::string> names;
        for (const auto& node : root["blocks"]) {
            RegisterBlock block;
            block.name = node["name"].as<std::string>();
            block.register_class = to_register_class(node["class"].as<std::string>());
            block.start = parse_address(node["start"]);
            unsigned long count = parse_number(node["count"], "block count", 0xFFFF);
            block.optional = value_or<bool>(node, "optional", false);

            if (count == 0 || block.start + count > 0x10000) {
                throw std::runtime_error("Block " + block.name + " has an invalid range");
            }
            block.count = static_cast<uint16_t>(count);

            for (const auto& reg_node : node["registers"]) {
                RegisterSpec reg = parse_register(reg_node, block);
                if (!names.insert(reg.name).second) {
                    throw std::runtime_error("Duplicate register name: " + reg.name);
                }
                block.registers.push_back(reg);
            }
            config.blocks.push_back(block);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Malformed profile: ") + e.what());
    }

    if (config.blocks.empty()) {
        throw std::runtime_error("Profile defines no register blocks");
    }
    return config;
}
