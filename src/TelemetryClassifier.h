#pragma once

#include <string>

enum class ResponseKind {
    ACK_OK,        // "ok"
    ACK_ERROR,     // "error ..."
    TELEMETRY,     // Value attributed to a telemetry field
    UNKNOWN
};

enum class TelemetryField {
    NONE,
    BATTERY,
    SPEED,
    FLIGHT_TIME
};

struct ClassifiedResponse {
    ResponseKind kind = ResponseKind::UNKNOWN;
    TelemetryField field = TelemetryField::NONE;
    int value = 0;
    std::string text;     // Trimmed payload
};

/**
 * TelemetryClassifier - Interprets the drone's unlabeled text responses
 *
 * A unit suffix decides the field on its own ("12s" is flight time,
 * "30cm/s" is speed). A bare number belongs to the read-command it answers.
 * Speeds are normalized to cm/s.
 */
class TelemetryClassifier {
public:
    static ClassifiedResponse classify(const std::string& payload, const std::string& correlated_command);

    // "battery?" -> BATTERY, "speed?" -> SPEED, "time?" -> FLIGHT_TIME
    static TelemetryField fieldForCommand(const std::string& command);

    // Any query command (ends with '?')
    static bool isReadCommand(const std::string& command);

    static const char* fieldName(TelemetryField field);
};
