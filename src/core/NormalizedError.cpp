#include "NormalizedError.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace dify_bridge {

namespace {

bool present(const json& obj, const char* key) {
    return obj.contains(key) && !obj[key].is_null();
}

int coerce_code(const json& value) {
    if (value.is_number_integer()) {
        auto v = value.get<long long>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            return error_code::kRemoteError;
        }
        return static_cast<int>(v);
    }
    if (value.is_number_unsigned()) {
        auto v = value.get<unsigned long long>();
        if (v > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
            return error_code::kRemoteError;
        }
        return static_cast<int>(v);
    }
    if (value.is_number_float()) {
        double v = value.get<double>();
        if (!std::isfinite(v) || v < std::numeric_limits<int>::min() ||
            v > std::numeric_limits<int>::max()) {
            return error_code::kRemoteError;
        }
        return static_cast<int>(std::trunc(v));
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? 1 : 0;
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        try {
            size_t consumed = 0;
            long long v = std::stoll(text, &consumed);
            // Allow trailing whitespace only ("404 " but not "404abc")
            while (consumed < text.size() && std::isspace(static_cast<unsigned char>(text[consumed]))) {
                ++consumed;
            }
            if (consumed == text.size() &&
                v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max()) {
                return static_cast<int>(v);
            }
        } catch (const std::logic_error&) {
            // not numeric
        }
    }
    return error_code::kRemoteError;
}

} // namespace

json NormalizedError::to_json() const {
    json out = {
        {"code", code},
        {"message", message}
    };
    if (has_data) {
        out["data"] = data;
    }
    return out;
}

NormalizedError make_error(int code, const std::string& message, const json& data) {
    NormalizedError err;
    err.code = code;
    err.message = message;
    err.data = data;
    err.has_data = true;
    return err;
}

NormalizedError make_error(int code, const std::string& message) {
    NormalizedError err;
    err.code = code;
    err.message = message;
    return err;
}

std::string json_to_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

NormalizedError normalize_remote_error(const json& err) {
    if (!err.is_object()) {
        return make_error(error_code::kRemoteError, err.is_null() ? "Remote error" : json_to_text(err));
    }

    NormalizedError out;
    if (present(err, "code")) {
        out.code = coerce_code(err["code"]);
    } else if (present(err, "status")) {
        out.code = coerce_code(err["status"]);
    }

    out.message = "Remote error";
    for (const char* key : {"message", "error", "reason"}) {
        if (present(err, key)) {
            out.message = json_to_text(err[key]);
            break;
        }
    }

    if (err.contains("data")) {
        out.data = err["data"];
        out.has_data = true;
    }
    return out;
}

} // namespace dify_bridge
