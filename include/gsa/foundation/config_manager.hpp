#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed, dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "gsa/foundation/agent_result.hpp"

namespace gsa::foundation {

/// YAML configuration store.
///
/// The YAML tree is flattened into a dotted-key map on load
/// (`metadata.base_url`, `watcher.key`, ...), which sidesteps yaml-cpp's
/// reference semantics when nodes are read from several threads.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// Entries are left untouched when the file is unreadable or malformed.
    /// @return Success or ConfigLoadFailed.
    AgentResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    AgentResult<void> loadString(std::string_view yaml);

    /// Typed value by dotted key.
    /// @return The value or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    AgentResult<T> get(std::string_view key) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    [[nodiscard]] std::size_t size() const;

private:
    AgentResult<void> replaceFrom(const std::string& yaml, const std::string& source);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
AgentResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end() || it->second.IsNull()) {
        return AgentResult<T>::err(
            AgentError(ErrorCode::ConfigKeyNotFound,
                       std::string("config key not found: ") + std::string(key)));
    }
    try {
        return AgentResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return AgentResult<T>::err(
            AgentError(ErrorCode::ConfigTypeMismatch,
                       std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace gsa::foundation
