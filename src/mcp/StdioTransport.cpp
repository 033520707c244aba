#include "StdioTransport.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace dify_bridge {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out,
                               std::shared_ptr<spdlog::logger> logger)
    : in_(in), out_(out), logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null");
    }
    logger_->debug("StdioTransport initialized");
}

std::optional<json> StdioTransport::parse_line(const std::string& line) {
    bool blank = std::all_of(line.begin(), line.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        return std::nullopt;
    }

    json message = json::parse(line, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        return std::nullopt;
    }
    return message;
}

json StdioTransport::read_message() {
    std::string line;

    while (std::getline(in_, line)) {
        if (auto message = parse_line(line)) {
            logger_->debug("Read message: {}", line);
            return *message;
        }
        logger_->debug("Ignoring non-JSON-object input line ({} bytes)", line.size());
    }

    if (in_.eof()) {
        logger_->debug("Reached end of input stream");
    } else {
        logger_->error("Error reading from input stream");
    }
    return json();  // Null on EOF or error
}

void StdioTransport::write_message(const json& message) {
    // Replace invalid UTF-8 rather than throw mid-frame
    std::string serialized = message.dump(-1, ' ', false, json::error_handler_t::replace);
    out_ << serialized << '\n';
    out_.flush();
    logger_->debug("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace dify_bridge
