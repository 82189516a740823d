#pragma once

#include <chrono>
#include <functional>
#include <ostream>
#include <string>

namespace dropzone {

/**
 * Text received from a client. Never persisted.
 */
struct Message {
    std::string text;
    std::string sender;
    std::chrono::system_clock::time_point arrivedAt = std::chrono::system_clock::now();
};

/**
 * Hands messages to the operator console.
 *
 * Uses the console lock only, so a slow terminal never holds up
 * storage reservation on other connections.
 */
class MessageRelay {
public:
    using Listener = std::function<void(const Message&)>;

    explicit MessageRelay(std::ostream& out);

    void deliver(const Message& message);

    // Extra observer called after the console write
    void setListener(Listener listener) { listener_ = std::move(listener); }

    static std::string format(const Message& message);

private:
    std::ostream& out_;
    Listener listener_;
};

} // namespace dropzone
