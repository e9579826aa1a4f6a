#pragma once
#include <string>
#include <vector>

/**
 * @brief One server-sent event: "event:" name plus "data:" payload.
 */
struct SseEvent {
    std::string event = "message";
    std::string data;
    std::string id;

    // Wire form, terminated by a blank line. Multi-line data becomes several data fields.
    std::string format() const;
};

/**
 * @brief Incremental parser for a text/event-stream body.
 *
 * Feed arbitrary chunks; complete events come back as soon as their
 * terminating blank line has arrived. Comment lines (":...") are skipped.
 */
class SseParser {
public:
    std::vector<SseEvent> feed(const char* data, size_t length);
    std::vector<SseEvent> feed(const std::string& chunk) { return feed(chunk.data(), chunk.size()); }

private:
    void processLine(const std::string& line, std::vector<SseEvent>& out);

    std::string buffer;
    SseEvent current;
    bool hasData = false;
};
