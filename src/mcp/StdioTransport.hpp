#pragma once

#include "ITransport.hpp"
#include <iostream>

namespace sf_boost {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads requests line-by-line from stdin and writes each response as a
 * single line to stdout, flushed immediately so the client sees it before
 * the next read.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    std::optional<std::string> read_line() override;
    void write_line(const std::string& line) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace sf_boost
