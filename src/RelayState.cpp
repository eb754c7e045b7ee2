#include "RelayState.h"
#include <sstream>

const char* toString(SessionStatus status) {
    switch (status) {
        case SessionStatus::IDLE:
            return "idle";
        case SessionStatus::STARTING:
            return "starting";
        case SessionStatus::ACTIVE:
            return "active";
        default:
            return "unknown";
    }
}

template <typename T>
static void writeOptional(std::ostringstream& out, const std::optional<T>& value) {
    if (value) {
        out << *value;
    } else {
        out << "null";
    }
}

std::string TelemetrySnapshot::toJson() const {
    std::ostringstream out;
    out << "{\"battery\": ";
    writeOptional(out, battery);
    out << ", \"speed\": ";
    writeOptional(out, speed);
    out << ", \"time\": ";
    writeOptional(out, flight_time);
    out << ", \"lastUpdate\": ";
    writeOptional(out, last_update_ms);
    out << "}";
    return out.str();
}

int64_t nowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}
