#include "BridgeConfig.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace dify_bridge {

namespace {

std::string trim(const std::string& text) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(text.begin(), text.end(), not_space);
    auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

std::optional<std::string> BridgeConfig::process_environment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

long BridgeConfig::parse_timeout(const std::string& text) {
    const std::string trimmed = trim(text);
    long value = 0;
    try {
        size_t consumed = 0;
        value = std::stol(trimmed, &consumed);
        if (consumed != trimmed.size()) {
            throw ConfigError("Invalid timeout: " + text);
        }
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid timeout: " + text);
    }
    if (value <= 0) {
        throw ConfigError("Timeout must be positive: " + text);
    }
    return value;
}

BridgeConfig BridgeConfig::from_environment(const EnvLookup& lookup) {
    BridgeConfig config;
    config.remote_url = lookup("DIFY_MCP_URL").value_or("");
    config.token = lookup("DIFY_MCP_TOKEN").value_or("");

    auto timeout = lookup("DIFY_MCP_TIMEOUT");
    if (timeout && !trim(*timeout).empty()) {
        config.timeout_ms = parse_timeout(*timeout);
    }
    return config;
}

void BridgeConfig::validate() const {
    if (remote_url.empty() || token.empty()) {
        throw ConfigError("Missing env. Set DIFY_MCP_URL and DIFY_MCP_TOKEN.");
    }
    if (timeout_ms <= 0) {
        throw ConfigError("Timeout must be positive: " + std::to_string(timeout_ms));
    }
}

std::map<std::string, std::string> parse_env_file(std::istream& in) {
    std::map<std::string, std::string> vars;
    std::string line;

    while (std::getline(in, line)) {
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') {
            continue;
        }
        if (entry.rfind("export ", 0) == 0) {
            entry = trim(entry.substr(7));
        }

        size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(entry.substr(0, eq));
        std::string value = trim(entry.substr(eq + 1));
        if (key.empty()) {
            continue;
        }

        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing comment
            size_t hash = value.find(" #");
            if (hash != std::string::npos) {
                value = trim(value.substr(0, hash));
            }
        }

        vars[key] = value;
    }

    return vars;
}

size_t load_env_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::debug("No env file at {}", path.string());
        return 0;
    }

    size_t applied = 0;
    for (const auto& [key, value] : parse_env_file(file)) {
        if (std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++applied;
        } else {
            spdlog::warn("Failed to set {} from {}", key, path.string());
        }
    }

    spdlog::debug("Loaded {} variables from {}", applied, path.string());
    return applied;
}

} // namespace dify_bridge
