/*
 * configor.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Configor

**************************************************/

#ifndef FROSTGUARD_CONFIG_CONFIGOR_HPP
#define FROSTGUARD_CONFIG_CONFIGOR_HPP

#include <concepts>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace frostguard {

namespace fs = std::filesystem;
using json = nlohmann::json;

class ConfigManagerImpl;

/**
 * @brief Concept for values that can be stored in a configuration
 */
template <typename T>
concept ConfigValue = requires(T value, json j) {
    { j = value } -> std::convertible_to<json>;
    { j.get<T>() } -> std::convertible_to<T>;
};

/**
 * @brief JSON configuration store addressed by "/"-separated key paths.
 *
 * A file loaded with loadFromFile() is mounted under its stem, so
 * `config/frostguard.json` is reachable as `frostguard/...`.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager &) = delete;
    ConfigManager &operator=(const ConfigManager &) = delete;

    ConfigManager(ConfigManager &&) noexcept;
    ConfigManager &operator=(ConfigManager &&) noexcept;

    [[nodiscard]] static auto createShared() -> std::shared_ptr<ConfigManager>;
    [[nodiscard]] static auto createUnique() -> std::unique_ptr<ConfigManager>;

    /**
     * @brief Retrieves the value associated with the given key path.
     * @param key_path The path to the configuration value.
     * @return std::optional<json> The optional JSON value if found.
     */
    [[nodiscard]] auto get(std::string_view key_path) const
        -> std::optional<json>;

    /**
     * @brief Retrieves a typed value from the configuration.
     * @return The value, or nullopt if missing or of another type.
     */
    template <ConfigValue T>
    [[nodiscard]] auto get_as(std::string_view key_path) const
        -> std::optional<T> {
        auto value = get(key_path);
        if (!value.has_value()) {
            return std::nullopt;
        }

        try {
            return value->get<T>();
        } catch (const json::exception &e) {
            spdlog::warn("Config value at {} has the wrong type: {}", key_path,
                         e.what());
            return std::nullopt;
        }
    }

    /**
     * @brief Sets the value for the specified key path, creating
     * intermediate objects as needed.
     * @return bool True if the value was successfully set.
     */
    auto set(std::string_view key_path, const json &value) -> bool;

    template <ConfigValue T>
    auto set_value(std::string_view key_path, T &&value) -> bool {
        return set(key_path, json(std::forward<T>(value)));
    }

    auto remove(std::string_view key_path) -> bool;

    [[nodiscard]] auto has(std::string_view key_path) const -> bool;

    /**
     * @brief All leaf key paths in the configuration.
     */
    [[nodiscard]] auto getKeys() const -> std::vector<std::string>;

    /**
     * @brief Loads a JSON file and mounts it under its file stem.
     * @return bool True if the file was successfully loaded.
     */
    auto loadFromFile(const fs::path &path) -> bool;

    /**
     * @brief Loads every `.json` file of a directory.
     */
    auto loadFromDir(const fs::path &dir_path) -> bool;

    /**
     * @brief Writes the subtree named after the file stem to `file_path`.
     */
    [[nodiscard]] auto save(const fs::path &file_path) const -> bool;

    void clear();

    /**
     * @brief Recursively merges `src` into the configuration. Objects are
     * merged key by key; everything else is replaced.
     */
    void merge(const json &src);

private:
    std::unique_ptr<ConfigManagerImpl>
        impl_;  ///< Implementation-specific pointer.
};

}  // namespace frostguard

#endif  // FROSTGUARD_CONFIG_CONFIGOR_HPP
