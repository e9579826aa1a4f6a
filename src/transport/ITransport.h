#pragma once
#include <string>

/**
 * @brief A way for clients to reach the session multiplexer.
 *
 * Both implementations feed decoded envelopes into a session's input
 * channel and write whatever appears on its output channel.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual std::string name() const = 0;

    // Acquires the underlying endpoint. A false return is fatal for the process.
    virtual bool start() = 0;

    // Serves until stop() is called or the endpoint goes away.
    virtual void run() = 0;

    virtual void stop() = 0;
};
