/*
 * configor.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Configor

**************************************************/

#include "configor.hpp"

#include <fstream>
#include <functional>
#include <mutex>
#include <ranges>
#include <shared_mutex>

namespace frostguard {

namespace {
auto splitPath(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> keys;
    for (auto &&segment : path | std::views::split('/')) {
        std::string key(segment.begin(), segment.end());
        if (!key.empty()) {
            keys.push_back(std::move(key));
        }
    }
    return keys;
}

void mergeInto(const json &src, json &target) {
    for (auto it = src.begin(); it != src.end(); ++it) {
        if (it->is_object() && target.contains(it.key()) &&
            target[it.key()].is_object()) {
            mergeInto(*it, target[it.key()]);
        } else {
            target[it.key()] = *it;
        }
    }
}
}  // namespace

class ConfigManagerImpl {
public:
    mutable std::shared_mutex rwMutex;
    json config = json::object();
};

ConfigManager::ConfigManager() : impl_(std::make_unique<ConfigManagerImpl>()) {
    spdlog::debug("ConfigManager created.");
}

ConfigManager::~ConfigManager() = default;

ConfigManager::ConfigManager(ConfigManager &&other) noexcept = default;

ConfigManager &ConfigManager::operator=(ConfigManager &&other) noexcept =
    default;

auto ConfigManager::createShared() -> std::shared_ptr<ConfigManager> {
    return std::make_shared<ConfigManager>();
}

auto ConfigManager::createUnique() -> std::unique_ptr<ConfigManager> {
    return std::make_unique<ConfigManager>();
}

auto ConfigManager::loadFromFile(const fs::path &path) -> bool {
    try {
        std::ifstream ifs(path);
        if (!ifs || ifs.peek() == std::ifstream::traits_type::eof()) {
            spdlog::error("Failed to open file: {}", path.string());
            return false;
        }
        if (path.extension() != ".json") {
            spdlog::warn("Unsupported file extension: {}",
                         path.extension().string());
            return false;
        }

        json j = json::parse(ifs);
        if (!j.is_object() || j.empty()) {
            spdlog::warn("Config file is empty or not an object: {}",
                         path.string());
            return false;
        }

        std::unique_lock lock(impl_->rwMutex);
        impl_->config[path.stem().string()] = std::move(j);
        spdlog::info("Config loaded from file: {}", path.string());
        return true;
    } catch (const json::exception &e) {
        spdlog::error("Failed to parse file: {}, error message: {}",
                      path.string(), e.what());
    }
    return false;
}

auto ConfigManager::loadFromDir(const fs::path &dir_path) -> bool {
    std::error_code ec;
    if (!fs::is_directory(dir_path, ec)) {
        spdlog::error("Config directory does not exist: {}", dir_path.string());
        return false;
    }

    bool allLoaded = true;
    for (const auto &entry : fs::directory_iterator(dir_path, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            if (!loadFromFile(entry.path())) {
                spdlog::warn("Failed to load config file: {}",
                             entry.path().string());
                allLoaded = false;
            }
        }
    }
    if (ec) {
        spdlog::error("Failed to read config directory {}: {}",
                      dir_path.string(), ec.message());
        return false;
    }
    return allLoaded;
}

auto ConfigManager::save(const fs::path &file_path) const -> bool {
    std::shared_lock lock(impl_->rwMutex);
    std::string filename = file_path.stem().string();
    if (!impl_->config.contains(filename)) {
        spdlog::error("Config for file: {} not found", file_path.string());
        return false;
    }

    std::ofstream ofs(file_path);
    if (!ofs) {
        spdlog::error("Failed to open file: {}", file_path.string());
        return false;
    }
    ofs << impl_->config[filename].dump(4);
    if (!ofs) {
        spdlog::error("Failed to write config file: {}", file_path.string());
        return false;
    }
    spdlog::info("Config saved to file: {}", file_path.string());
    return true;
}

auto ConfigManager::get(std::string_view key_path) const
    -> std::optional<json> {
    std::shared_lock lock(impl_->rwMutex);
    const json *p = &impl_->config;
    for (const auto &key : splitPath(key_path)) {
        if (!p->is_object()) {
            return std::nullopt;
        }
        auto it = p->find(key);
        if (it == p->end()) {
            spdlog::debug("Key not found: {}", key_path);
            return std::nullopt;
        }
        p = &*it;
    }
    return *p;
}

auto ConfigManager::set(std::string_view key_path, const json &value) -> bool {
    auto keys = splitPath(key_path);
    std::unique_lock lock(impl_->rwMutex);
    if (keys.empty()) {
        if (!value.is_object()) {
            spdlog::error("Root config must be an object");
            return false;
        }
        impl_->config = value;
        return true;
    }

    json *p = &impl_->config;
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        json &next = (*p)[keys[i]];
        if (!next.is_object()) {
            next = json::object();
        }
        p = &next;
    }
    (*p)[keys.back()] = value;
    spdlog::debug("Set config {} = {}", key_path, value.dump());
    return true;
}

auto ConfigManager::remove(std::string_view key_path) -> bool {
    auto keys = splitPath(key_path);
    if (keys.empty()) {
        spdlog::warn("Invalid key path for deletion: {}", key_path);
        return false;
    }

    std::unique_lock lock(impl_->rwMutex);
    json *p = &impl_->config;
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        if (!p->is_object() || !p->contains(keys[i])) {
            spdlog::warn("Key not found for deletion: {}", key_path);
            return false;
        }
        p = &(*p)[keys[i]];
    }
    if (!p->is_object() || p->erase(keys.back()) == 0) {
        spdlog::warn("Key not found for deletion: {}", key_path);
        return false;
    }
    spdlog::debug("Deleted key: {}", key_path);
    return true;
}

auto ConfigManager::has(std::string_view key_path) const -> bool {
    return get(key_path).has_value();
}

void ConfigManager::merge(const json &src) {
    if (!src.is_object()) {
        spdlog::warn("Ignoring non-object config merge");
        return;
    }
    std::unique_lock lock(impl_->rwMutex);
    mergeInto(src, impl_->config);
    spdlog::debug("Config merged.");
}

void ConfigManager::clear() {
    std::unique_lock lock(impl_->rwMutex);
    impl_->config = json::object();
    spdlog::debug("Config cleared.");
}

auto ConfigManager::getKeys() const -> std::vector<std::string> {
    std::shared_lock lock(impl_->rwMutex);
    std::vector<std::string> paths;

    std::function<void(const json &, const std::string &)> extractPaths =
        [&](const json &j, const std::string &path) {
            for (const auto &[key, value] : j.items()) {
                std::string currentPath = path.empty() ? key : path + "/" + key;
                if (value.is_object()) {
                    extractPaths(value, currentPath);
                } else {
                    paths.push_back(currentPath);
                }
            }
        };

    extractPaths(impl_->config, "");
    return paths;
}

}  // namespace frostguard
