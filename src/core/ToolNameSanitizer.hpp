#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace dify_bridge {

using json = nlohmann::ordered_json;

/**
 * @brief Rewrites tool names in remote results to a strict character set
 *
 * Clients reject tool names outside [A-Za-z0-9_-] or longer than 64
 * characters, while remotes happily publish names like "My Tool!!".
 */
class ToolNameSanitizer {
public:
    static constexpr size_t kMaxNameLength = 64;

    /**
     * @brief Sanitize every descriptor in result["tools"]
     *
     * Non-object results, results without a "tools" array and non-object
     * descriptors are returned unchanged. Only "name" is rewritten; other
     * fields and their order are preserved.
     *
     * @param result Result payload (not modified)
     * @return Copy of result with sanitized tool names
     */
    static json sanitize_result(const json& result);

    /**
     * @brief Sanitize a single tool name
     * @param name Raw name (any characters)
     * @param fallback Name used when the sanitized result is empty
     * @return Name matching [A-Za-z0-9_-]{1,64}
     */
    static std::string sanitize_name(const std::string& name, const std::string& fallback);
};

} // namespace dify_bridge
