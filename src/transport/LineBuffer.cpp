#include "transport/LineBuffer.h"

std::vector<std::string> LineBuffer::append(const char* data, size_t length) {
    std::vector<std::string> lines;
    size_t start = 0;
    for (size_t i = 0; i < length; ++i) {
        if (data[i] != '\n') continue;

        if (discarding) {
            discarding = false;
        } else {
            buffer.append(data + start, i - start);
            if (!buffer.empty() && buffer.back() == '\r') buffer.pop_back();
            lines.push_back(std::move(buffer));
        }
        buffer.clear();
        start = i + 1;
    }

    if (start < length && !discarding) {
        buffer.append(data + start, length - start);
        if (buffer.size() > maxLineLength) {
            buffer.clear();
            discarding = true;
            overflowCount++;
        }
    }
    return lines;
}

std::string LineBuffer::takeRemainder() {
    std::string rest = std::move(buffer);
    buffer.clear();
    discarding = false;
    if (!rest.empty() && rest.back() == '\r') rest.pop_back();
    return rest;
}
