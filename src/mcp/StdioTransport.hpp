#pragma once

#include "ITransport.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace dify_bridge {

/**
 * @brief Newline-delimited JSON-RPC over standard input/output
 *
 * Reads one JSON object per line; blank lines and lines that do not parse
 * as a JSON object are dropped silently. Each written frame is one line of
 * compact JSON, flushed immediately. Diagnostics go to the logger, never
 * to the output stream.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     * @param logger Diagnostics sink (must not write to out)
     */
    explicit StdioTransport(std::istream& in = std::cin,
                            std::ostream& out = std::cout,
                            std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    json read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

    /**
     * @brief Decode a single input line
     * @return JSON object, or nullopt for blank or invalid lines
     */
    static std::optional<json> parse_line(const std::string& line);

private:
    std::istream& in_;
    std::ostream& out_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace dify_bridge
