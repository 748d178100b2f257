#include "../test_runner.h"
#include "core/logger.h"
#include "utils/time_utils.h"
#include <stdexcept>

int main() {
  TestRunner runner;

  runner.runTest("Canonical formatting is fixed width", [&]() {
    Timestamp ts = TimeUtils::makeTimestamp(2024, 3, 5, 7, 8, 9, 42);
    runner.assertEquals(std::string("2024-03-05 07:08:09.000042"),
                        TimeUtils::formatTimestamp(ts), "canonical text");
    runner.assertEquals(std::string("2024-03-05"), TimeUtils::formatDate(ts),
                        "date part");
    runner.assertEquals(std::string("07:08:09"),
                        TimeUtils::formatTimeOfDay(ts), "time part");
  });

  runner.runTest("Sentinels", [&]() {
    runner.assertEquals(std::string("1970-01-01 00:00:00.000000"),
                        TimeUtils::formatTimestamp(TimeUtils::minTimestamp()),
                        "min sentinel is the epoch");
    runner.assertEquals(std::string("9999-12-31 23:59:59.000000"),
                        TimeUtils::formatTimestamp(TimeUtils::maxTimestamp()),
                        "max sentinel");
    runner.assertTrue(TimeUtils::minTimestamp() < TimeUtils::maxTimestamp(),
                      "sentinels are ordered");
  });

  runner.runTest("Lenient parsing accepts the common forms", [&]() {
    Timestamp expected = TimeUtils::makeTimestamp(2024, 1, 15, 10, 30, 0);
    runner.assertTrue(TimeUtils::parseTimestamp("2024-01-15 10:30:00") ==
                          expected,
                      "space separator");
    runner.assertTrue(TimeUtils::parseTimestamp("2024-01-15T10:30:00Z") ==
                          expected,
                      "ISO form with Z");
    runner.assertTrue(TimeUtils::parseTimestamp("2024-01-15") ==
                          TimeUtils::makeTimestamp(2024, 1, 15),
                      "date only");
    runner.assertEquals(
        std::string("2024-01-15 10:30:00.120000"),
        TimeUtils::formatTimestamp(
            TimeUtils::parseTimestamp("2024-01-15 10:30:00.12")),
        "short fraction is scaled");
  });

  runner.runTest("Invalid timestamps are rejected", [&]() {
    runner.assertThrows<std::invalid_argument>(
        []() { TimeUtils::parseTimestamp("2024-02-30"); }, "Feb 30");
    runner.assertThrows<std::invalid_argument>(
        []() { TimeUtils::parseTimestamp("2024-01-15 25:00:00"); },
        "hour 25");
    runner.assertThrows<std::invalid_argument>(
        []() { TimeUtils::parseTimestamp("yesterday"); }, "free text");
    runner.assertFalse(
        TimeUtils::tryParseTimestamp("2024-01-15 10:30:00.1234567")
            .has_value(),
        "seven fraction digits");
    runner.assertTrue(TimeUtils::tryParseTimestamp("2024-02-29").has_value(),
                      "leap day");
  });

  runner.runTest("Canonical parsing is strict", [&]() {
    runner.assertThrows<std::invalid_argument>(
        []() { TimeUtils::parseCanonicalTimestamp("2024-01-15 10:30:00"); },
        "missing fraction");
    runner.assertThrows<std::invalid_argument>(
        []() {
          TimeUtils::parseCanonicalTimestamp("2024-01-15T10:30:00.000000");
        },
        "T separator");
    std::string text = "2023-12-31 23:59:59.999999";
    runner.assertEquals(
        text,
        TimeUtils::formatTimestamp(TimeUtils::parseCanonicalTimestamp(text)),
        "canonical text survives parse and format");
  });

  runner.runTest("Epoch conversions", [&]() {
    Timestamp ts = TimeUtils::fromEpochSeconds(1700000000.5);
    runner.assertEquals(std::string("2023-11-14 22:13:20.500000"),
                        TimeUtils::formatTimestamp(ts), "fractional seconds");
    runner.assertEquals(static_cast<int64_t>(1700000000500000),
                        TimeUtils::toEpochMicros(ts), "micros since epoch");
    runner.assertTrue(TimeUtils::fromEpochMicros(1700000000500000) == ts,
                      "micros round back");
  });

  return runner.printSummary();
}
