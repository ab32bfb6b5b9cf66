#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "charge_controller.hpp"
#include <string>

namespace YAML {
class Node;
}

/**
 * @class ConfigLoader
 * @brief Parses the YAML profile to populate the Config structure.
 *
 * This class uses the yaml-cpp library to read the device identity, the
 * serial link, the poll parameters and the controller's register map from
 * the specified file. The register map lives entirely in the profile so that
 * related controller models only need a different file.
 */
class ConfigLoader {
public:
    /**
     * @brief Loads and parses the YAML profile.
     * @param filename The path to the YAML profile.
     * @return A Config object populated with data from the file.
     * @throw std::runtime_error if the file cannot be opened or parsed, or the
     *        register map is inconsistent.
     */
    static Config loadConfig(const std::string& filename);

    /**
     * @brief Parses a profile that is already in memory.
     * @throw std::runtime_error on the same conditions as loadConfig().
     */
    static Config parseConfig(const YAML::Node& root);
};

#endif // CONFIG_LOADER_H
