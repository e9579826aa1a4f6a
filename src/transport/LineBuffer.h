#pragma once
#include <string>
#include <vector>

/**
 * @brief Accumulates raw bytes and hands out complete newline-terminated lines.
 *
 * A trailing '\r' is stripped so CRLF peers work too. Lines longer than
 * maxLineLength are dropped and reported through overflowed().
 */
class LineBuffer {
public:
    explicit LineBuffer(size_t maxLineLength = 16 * 1024 * 1024) : maxLineLength(maxLineLength) {}

    std::vector<std::string> append(const char* data, size_t length);

    // Whatever is left without a terminator, e.g. at EOF.
    std::string takeRemainder();

    size_t overflowed() const { return overflowCount; }
    size_t pending() const { return buffer.size(); }

private:
    std::string buffer;
    size_t maxLineLength;
    size_t overflowCount = 0;
    bool discarding = false;
};
