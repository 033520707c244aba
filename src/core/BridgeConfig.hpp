#pragma once

#include <filesystem>
#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace dify_bridge {

/**
 * @brief Raised when the bridge cannot start with the given settings
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Settings consumed by the bridge
 */
struct BridgeConfig {
    static constexpr long kDefaultTimeoutMs = 60000;

    std::string remote_url;
    std::string token;
    long timeout_ms = kDefaultTimeoutMs;

    /**
     * @brief Variable lookup, returns nullopt for unset variables
     */
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Read DIFY_MCP_URL, DIFY_MCP_TOKEN and DIFY_MCP_TIMEOUT
     * @param lookup Variable source (defaults to the process environment)
     * @return Config; not yet validated
     * @throws ConfigError if DIFY_MCP_TIMEOUT is not a number
     */
    static BridgeConfig from_environment(const EnvLookup& lookup = process_environment);

    /**
     * @brief Lookup backed by getenv()
     */
    static std::optional<std::string> process_environment(const std::string& name);

    /**
     * @brief Parse a timeout given in milliseconds
     * @throws ConfigError on non-numeric or non-positive values
     */
    static long parse_timeout(const std::string& text);

    /**
     * @brief Ensure URL and token are set and the timeout is positive
     * @throws ConfigError describing the first problem found
     */
    void validate() const;
};

/**
 * @brief Parse dotenv content (KEY=VALUE lines)
 *
 * Supports "#" comments, an optional "export " prefix and single or double
 * quoted values.
 */
std::map<std::string, std::string> parse_env_file(std::istream& in);

/**
 * @brief Load a dotenv file into the process environment
 *
 * Variables already set in the environment are left untouched.
 *
 * @param path File to read; a missing file is not an error
 * @return Number of variables set
 */
size_t load_env_file(const std::filesystem::path& path);

} // namespace dify_bridge
