#include "server/MessageRelay.hpp"
#include "core/Log.hpp"

#include <ctime>
#include <sstream>

namespace dropzone {

MessageRelay::MessageRelay(std::ostream& out) : out_(out) {}

std::string MessageRelay::format(const Message& message) {
    std::time_t t = std::chrono::system_clock::to_time_t(message.arrivedAt);
    std::tm tm{};
    localtime_r(&t, &tm);
    char ts[16];
    std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm);

    std::ostringstream ss;
    ss << Log::paint(std::string("[") + ts + "]", LogColor::Dim) << " "
       << Log::paint("MESSAGE", LogColor::Yellow, true);
    if (!message.sender.empty()) {
        ss << " " << Log::paint("from " + Log::sanitize(message.sender), LogColor::Dim);
    }
    ss << "\n";

    // Indent every line of the text under the header
    std::istringstream lines(message.text);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        ss << "  " << Log::sanitize(line) << "\n";
    }
    return ss.str();
}

void MessageRelay::deliver(const Message& message) {
    Log::write(out_, format(message));
    if (listener_) {
        listener_(message);
    }
}

} // namespace dropzone
