#include "TelemetryClassifier.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace {

struct SpeedUnit {
    const char* suffix;
    double to_cm_per_s;
};

// Longer suffixes first: "cm/s" must win over "m/s"
const SpeedUnit SPEED_UNITS[] = {
    {"cm/s", 1.0},
    {"dm/s", 10.0},
    {"km/h", 100000.0 / 3600.0},
    {"m/s", 100.0},
    {"mph", 44.704}
};

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Whole string is a decimal number ("87", "-3", "100.0")
bool parseNumber(const std::string& text, double& value) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        return false;
    }
    size_t i = (trimmed[0] == '-' || trimmed[0] == '+') ? 1 : 0;
    bool digits = false;
    bool dot = false;
    for (; i < trimmed.size(); i++) {
        char c = trimmed[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits = true;
        } else if (c == '.' && !dot) {
            dot = true;
        } else {
            return false;
        }
    }
    if (!digits) {
        return false;
    }
    value = std::strtod(trimmed.c_str(), nullptr);
    return true;
}

int roundToInt(double value) {
    return static_cast<int>(std::lround(value));
}

}  // namespace

ClassifiedResponse TelemetryClassifier::classify(const std::string& payload,
                                                 const std::string& correlated_command) {
    ClassifiedResponse result;
    result.text = trim(payload);
    std::string lower = toLower(result.text);

    if (lower == "ok") {
        result.kind = ResponseKind::ACK_OK;
        return result;
    }
    if (lower.compare(0, 5, "error") == 0) {
        result.kind = ResponseKind::ACK_ERROR;
        return result;
    }

    double number = 0.0;

    for (const SpeedUnit& unit : SPEED_UNITS) {
        if (endsWith(lower, unit.suffix) &&
            parseNumber(lower.substr(0, lower.size() - std::string(unit.suffix).size()), number)) {
            result.kind = ResponseKind::TELEMETRY;
            result.field = TelemetryField::SPEED;
            result.value = roundToInt(number * unit.to_cm_per_s);
            return result;
        }
    }

    if (endsWith(lower, "s") && parseNumber(lower.substr(0, lower.size() - 1), number)) {
        result.kind = ResponseKind::TELEMETRY;
        result.field = TelemetryField::FLIGHT_TIME;
        result.value = roundToInt(number);
        return result;
    }

    if (parseNumber(lower, number)) {
        result.value = roundToInt(number);
        result.field = fieldForCommand(correlated_command);
        result.kind = result.field == TelemetryField::NONE ? ResponseKind::UNKNOWN : ResponseKind::TELEMETRY;
        return result;
    }

    return result;
}

TelemetryField TelemetryClassifier::fieldForCommand(const std::string& command) {
    std::string lower = toLower(trim(command));
    if (lower == "battery?") {
        return TelemetryField::BATTERY;
    }
    if (lower == "speed?") {
        return TelemetryField::SPEED;
    }
    if (lower == "time?") {
        return TelemetryField::FLIGHT_TIME;
    }
    return TelemetryField::NONE;
}

bool TelemetryClassifier::isReadCommand(const std::string& command) {
    std::string trimmed = trim(command);
    return !trimmed.empty() && trimmed.back() == '?';
}

const char* TelemetryClassifier::fieldName(TelemetryField field) {
    switch (field) {
        case TelemetryField::BATTERY:
            return "battery";
        case TelemetryField::SPEED:
            return "speed";
        case TelemetryField::FLIGHT_TIME:
            return "time";
        default:
            return "none";
    }
}
