#include "ToolNameSanitizer.hpp"
#include "NormalizedError.hpp"
#include <algorithm>

namespace dify_bridge {

namespace {

bool is_allowed(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

// Length in UTF-16 code units of the UTF-8 sequence starting with lead byte
// (supplementary-plane characters count twice), plus its byte length.
void utf8_sequence(unsigned char lead, size_t& bytes, size_t& units) {
    if (lead >= 0xF0 && lead < 0xF8) {
        bytes = 4;
        units = 2;
    } else if (lead >= 0xE0 && lead < 0xF0) {
        bytes = 3;
        units = 1;
    } else if (lead >= 0xC0 && lead < 0xE0) {
        bytes = 2;
        units = 1;
    } else {
        bytes = 1;
        units = 1;
    }
}

} // namespace

std::string ToolNameSanitizer::sanitize_name(const std::string& name, const std::string& fallback) {
    std::string cleaned;
    cleaned.reserve(std::min(name.size(), kMaxNameLength));

    size_t i = 0;
    while (i < name.size() && cleaned.size() < kMaxNameLength) {
        auto c = static_cast<unsigned char>(name[i]);
        if (is_allowed(c)) {
            cleaned += static_cast<char>(c);
            ++i;
            continue;
        }

        size_t bytes = 1;
        size_t units = 1;
        utf8_sequence(c, bytes, units);
        for (size_t u = 0; u < units && cleaned.size() < kMaxNameLength; ++u) {
            cleaned += '_';
        }
        i += bytes;
    }

    return cleaned.empty() ? fallback : cleaned;
}

json ToolNameSanitizer::sanitize_result(const json& result) {
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return result;
    }

    json sanitized = result;
    json& tools = sanitized["tools"];

    for (size_t i = 0; i < tools.size(); ++i) {
        json& tool = tools[i];
        if (!tool.is_object()) {
            continue;
        }

        const std::string fallback = "tool_" + std::to_string(i + 1);
        std::string raw_name = fallback;
        if (tool.contains("name") && !tool["name"].is_null()) {
            raw_name = json_to_text(tool["name"]);
        }

        // Assigning to an existing key keeps its position
        tool["name"] = sanitize_name(raw_name, fallback);
    }

    return sanitized;
}

} // namespace dify_bridge
