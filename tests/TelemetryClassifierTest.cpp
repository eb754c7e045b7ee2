/**
 * TelemetryClassifier tests
 *
 * Covers acknowledgement detection, unit-suffixed values that classify
 * themselves, bare numbers attributed through the correlated read-command,
 * speed unit normalization and read-command detection.
 */

#include "TelemetryClassifier.h"
#include <gtest/gtest.h>

TEST(TelemetryClassifierTest, OkIsAcknowledgement) {
    auto response = TelemetryClassifier::classify("ok", "command");
    EXPECT_EQ(response.kind, ResponseKind::ACK_OK);

    response = TelemetryClassifier::classify("  OK\r\n", "");
    EXPECT_EQ(response.kind, ResponseKind::ACK_OK);
    EXPECT_EQ(response.text, "OK");
}

TEST(TelemetryClassifierTest, ErrorIsNegativeAcknowledgement) {
    auto response = TelemetryClassifier::classify("error Not joystick", "takeoff");
    EXPECT_EQ(response.kind, ResponseKind::ACK_ERROR);
    EXPECT_EQ(response.text, "error Not joystick");
}

TEST(TelemetryClassifierTest, BareNumberFollowsBatteryQuery) {
    auto response = TelemetryClassifier::classify("87", "battery?");
    EXPECT_EQ(response.kind, ResponseKind::TELEMETRY);
    EXPECT_EQ(response.field, TelemetryField::BATTERY);
    EXPECT_EQ(response.value, 87);
}

TEST(TelemetryClassifierTest, BareNumberFollowsSpeedQuery) {
    auto response = TelemetryClassifier::classify("100.0", "speed?");
    EXPECT_EQ(response.kind, ResponseKind::TELEMETRY);
    EXPECT_EQ(response.field, TelemetryField::SPEED);
    EXPECT_EQ(response.value, 100);
}

TEST(TelemetryClassifierTest, BareNumberWithoutQueryIsUnknown) {
    auto response = TelemetryClassifier::classify("42", "");
    EXPECT_EQ(response.kind, ResponseKind::UNKNOWN);

    response = TelemetryClassifier::classify("42", "takeoff");
    EXPECT_EQ(response.kind, ResponseKind::UNKNOWN);
}

TEST(TelemetryClassifierTest, SecondsSuffixIsFlightTimeRegardlessOfQuery) {
    auto response = TelemetryClassifier::classify("15s", "battery?");
    EXPECT_EQ(response.kind, ResponseKind::TELEMETRY);
    EXPECT_EQ(response.field, TelemetryField::FLIGHT_TIME);
    EXPECT_EQ(response.value, 15);
}

TEST(TelemetryClassifierTest, SpeedUnitsAreNormalizedToCentimetresPerSecond) {
    auto cm = TelemetryClassifier::classify("30cm/s", "battery?");
    EXPECT_EQ(cm.field, TelemetryField::SPEED);
    EXPECT_EQ(cm.value, 30);

    auto m = TelemetryClassifier::classify("1.5m/s", "");
    EXPECT_EQ(m.field, TelemetryField::SPEED);
    EXPECT_EQ(m.value, 150);

    auto dm = TelemetryClassifier::classify("4dm/s", "");
    EXPECT_EQ(dm.value, 40);

    auto kmh = TelemetryClassifier::classify("36km/h", "");
    EXPECT_EQ(kmh.value, 1000);

    auto mph = TelemetryClassifier::classify("10mph", "");
    EXPECT_EQ(mph.value, 447);
}

TEST(TelemetryClassifierTest, TextThatIsNotANumberIsUnknown) {
    auto response = TelemetryClassifier::classify("unknown command: flip", "battery?");
    EXPECT_EQ(response.kind, ResponseKind::UNKNOWN);

    response = TelemetryClassifier::classify("", "battery?");
    EXPECT_EQ(response.kind, ResponseKind::UNKNOWN);

    response = TelemetryClassifier::classify("s", "");
    EXPECT_EQ(response.kind, ResponseKind::UNKNOWN);
}

TEST(TelemetryClassifierTest, FieldForCommand) {
    EXPECT_EQ(TelemetryClassifier::fieldForCommand("battery?"), TelemetryField::BATTERY);
    EXPECT_EQ(TelemetryClassifier::fieldForCommand("speed?"), TelemetryField::SPEED);
    EXPECT_EQ(TelemetryClassifier::fieldForCommand("time?"), TelemetryField::FLIGHT_TIME);
    EXPECT_EQ(TelemetryClassifier::fieldForCommand("wifi?"), TelemetryField::NONE);
    EXPECT_EQ(TelemetryClassifier::fieldForCommand("battery"), TelemetryField::NONE);
}

TEST(TelemetryClassifierTest, ReadCommands) {
    EXPECT_TRUE(TelemetryClassifier::isReadCommand("battery?"));
    EXPECT_TRUE(TelemetryClassifier::isReadCommand("wifi?"));
    EXPECT_FALSE(TelemetryClassifier::isReadCommand("takeoff"));
    EXPECT_FALSE(TelemetryClassifier::isReadCommand(""));
}

TEST(TelemetryClassifierTest, FieldNames) {
    EXPECT_STREQ(TelemetryClassifier::fieldName(TelemetryField::BATTERY), "battery");
    EXPECT_STREQ(TelemetryClassifier::fieldName(TelemetryField::SPEED), "speed");
    EXPECT_STREQ(TelemetryClassifier::fieldName(TelemetryField::FLIGHT_TIME), "time");
}
