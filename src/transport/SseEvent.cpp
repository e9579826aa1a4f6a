#include "transport/SseEvent.h"

std::string SseEvent::format() const {
    std::string out;
    if (!id.empty()) out += "id: " + id + "\n";
    out += "event: " + event + "\n";

    size_t start = 0;
    while (true) {
        size_t nl = data.find('\n', start);
        std::string line = data.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out += "data: " + line + "\n";
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    out += "\n";
    return out;
}

std::vector<SseEvent> SseParser::feed(const char* data, size_t length) {
    std::vector<SseEvent> events;
    buffer.append(data, length);

    size_t start = 0;
    while (true) {
        size_t nl = buffer.find('\n', start);
        if (nl == std::string::npos) break;
        std::string line = buffer.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        processLine(line, events);
        start = nl + 1;
    }
    buffer.erase(0, start);
    return events;
}

void SseParser::processLine(const std::string& line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        if (hasData) out.push_back(current);
        current = SseEvent();
        hasData = false;
        return;
    }
    if (line[0] == ':') return;

    std::string field = line;
    std::string value;
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') value.erase(0, 1);
    }

    if (field == "event") {
        current.event = value;
    } else if (field == "data") {
        if (hasData) current.data += "\n";
        current.data += value;
        hasData = true;
    } else if (field == "id") {
        current.id = value;
    }
}
