#pragma once
#include <cstddef>
#include <functional>
#include <string>

/**
 * @brief Write policy for one event stream.
 *
 * A tick where the peer is not writable defers the frame and counts as a
 * failed write; maxFailures consecutive failures break the stream. A write
 * the transport rejects breaks it at once, since the HTTP layer ends the
 * response after a rejected chunk. Any successful write resets the count.
 */
class FrameWriter {
public:
    enum class Status {
        Written,
        Deferred,
        Broken
    };

    using WriteFn = std::function<bool(const char* data, size_t length)>;
    using WritableFn = std::function<bool()>;

    explicit FrameWriter(int maxFailures) : maxFailures(maxFailures > 0 ? maxFailures : 1) {}

    // writable may be empty when the transport cannot report it.
    Status write(const std::string& frame, const WriteFn& writeFn, const WritableFn& writable);

    int failures() const { return consecutive; }

private:
    int maxFailures;
    int consecutive = 0;
};
