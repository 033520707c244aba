#include "BodyDecoder.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <functional>
#include <utility>

namespace dify_bridge {

namespace {

constexpr const char* kDataMarker = "data:";

std::string trim(const std::string& text) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(text.begin(), text.end(), not_space);
    auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string normalize_newlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out += text[i];
        }
    }
    return out;
}

// Last "data: {...}" span whose closing brace ends a line or the text.
// The span stops at the first such brace, so nested objects may be cut short.
std::optional<std::string> scan_inline_objects(const std::string& text) {
    std::optional<std::string> last;
    const size_t marker_len = std::char_traits<char>::length(kDataMarker);

    size_t pos = text.find(kDataMarker);
    while (pos != std::string::npos) {
        size_t open = pos + marker_len;
        while (open < text.size() && std::isspace(static_cast<unsigned char>(text[open]))) {
            ++open;
        }
        if (open >= text.size() || text[open] != '{') {
            pos = text.find(kDataMarker, pos + 1);
            continue;
        }

        size_t close = text.find('}', open + 1);
        while (close != std::string::npos && close + 1 < text.size() && text[close + 1] != '\n') {
            close = text.find('}', close + 1);
        }
        if (close == std::string::npos) {
            // No later marker can close either
            break;
        }

        last = text.substr(open, close - open + 1);
        pos = text.find(kDataMarker, close + 1);
    }

    return last;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

bool BodyDecoder::is_event_stream(const std::string& content_type) {
    return to_lower(content_type).find("text/event-stream") != std::string::npos;
}

std::optional<json> BodyDecoder::decode_json(const std::string& body) {
    json value = json::parse(body, nullptr, false);
    if (value.is_discarded()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> BodyDecoder::extract_last_data(const std::string& body) {
    const std::string text = normalize_newlines(body);
    std::optional<std::string> last_data;

    // Events are separated by blank lines; data lines win last-write across all events
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t sep = text.find("\n\n", pos);
        std::string chunk = trim(text.substr(pos, sep == std::string::npos ? std::string::npos : sep - pos));
        if (!chunk.empty()) {
            size_t line_start = 0;
            while (line_start <= chunk.size()) {
                size_t line_end = chunk.find('\n', line_start);
                std::string line = chunk.substr(line_start, line_end == std::string::npos
                                                                ? std::string::npos
                                                                : line_end - line_start);
                if (line.rfind(kDataMarker, 0) == 0) {
                    std::string payload = trim(line.substr(5));
                    if (!payload.empty()) {
                        last_data = payload;
                    }
                }
                if (line_end == std::string::npos) {
                    break;
                }
                line_start = line_end + 1;
            }
        }
        if (sep == std::string::npos) {
            break;
        }
        pos = sep + 2;
    }

    if (!last_data && text.find(kDataMarker) != std::string::npos) {
        last_data = scan_inline_objects(text);
    }

    return last_data;
}

std::optional<json> BodyDecoder::decode_event_stream(const std::string& body) {
    auto data = extract_last_data(body);
    if (!data) {
        return std::nullopt;
    }

    auto value = decode_json(*data);
    if (!value || value->is_null()) {
        return std::nullopt;
    }

    if (value->is_string()) {
        auto inner = decode_json(value->get<std::string>());
        if (inner && !inner->is_null()) {
            return inner;
        }
    }
    return value;
}

DecodeResult BodyDecoder::decode(const std::string& body, const std::string& content_type) {
    using Strategy = std::function<std::optional<json>(const std::string&)>;
    const Strategy json_strategy = &BodyDecoder::decode_json;
    const Strategy stream_strategy = &BodyDecoder::decode_event_stream;

    const bool stream_hint = is_event_stream(content_type);
    const std::array<Strategy, 2> strategies = stream_hint
        ? std::array<Strategy, 2>{stream_strategy, json_strategy}
        : std::array<Strategy, 2>{json_strategy, stream_strategy};

    for (const auto& strategy : strategies) {
        if (auto value = strategy(body)) {
            return DecodeResult(std::in_place_type<json>, std::move(*value));
        }
    }

    return DecodeResult(std::in_place_type<NormalizedError>,
                        make_error(error_code::kParseError,
                                   stream_hint ? "Parse error (no SSE data)" : "Parse error (invalid JSON)",
                                   body));
}

} // namespace dify_bridge
