/// @file config_manager.cpp
/// @brief YAML loading and dotted-key flattening for ConfigManager.

#include "gsa/foundation/config_manager.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace gsa::foundation {

namespace {

using Entries = std::unordered_map<std::string, YAML::Node>;

// Scalars, sequences and nulls are leaves; only maps extend the key.
void flattenInto(Entries& out, const std::string& prefix, const YAML::Node& node) {
    if (!node.IsMap()) {
        if (!prefix.empty()) {
            out[prefix] = YAML::Clone(node);
        }
        return;
    }
    for (const auto& child : node) {
        auto name = child.first.as<std::string>();
        flattenInto(out, prefix.empty() ? name : prefix + "." + name, child.second);
    }
}

} // anonymous namespace

AgentResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return AgentResult<void>::err(
            AgentError(ErrorCode::ConfigLoadFailed, "cannot read config file: " + path.string()));
    }
    std::ostringstream text;
    text << in.rdbuf();
    return replaceFrom(text.str(), path.string());
}

AgentResult<void> ConfigManager::loadString(std::string_view yaml) {
    return replaceFrom(std::string(yaml), "<string>");
}

AgentResult<void> ConfigManager::replaceFrom(const std::string& yaml, const std::string& source) {
    Entries parsed;
    try {
        flattenInto(parsed, "", YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        // Existing entries stay in place when the new document is rejected.
        return AgentResult<void>::err(
            AgentError(ErrorCode::ConfigLoadFailed, source + ": " + e.what()));
    }
    std::lock_guard lock(mutex_);
    entries_ = std::move(parsed);
    return AgentResult<void>::ok();
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.find(std::string(key)) != entries_.end();
}

std::size_t ConfigManager::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

} // namespace gsa::foundation
