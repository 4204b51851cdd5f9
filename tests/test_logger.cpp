/**
 * @file test_logger.cpp
 * @brief Unit tests for the Logger facade.
 */

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>
#include "../libpdfshrink/include/logger.hpp"

namespace {

struct Entry {
    LogLevel level;
    std::string message;
    std::string tag;
};

class RecordingSink final : public ILogSink {
public:
    explicit RecordingSink(std::vector<Entry>& entries) : entries_(entries) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        entries_.push_back({level, std::string(message), std::string(tag)});
    }

private:
    std::vector<Entry>& entries_;
};

} // namespace

TEST_CASE("Level names", "[logger]") {
    REQUIRE(Logger::string_to_level("DEBUG") == LogLevel::Debug);
    REQUIRE(Logger::string_to_level("info") == LogLevel::Info);
    REQUIRE(Logger::string_to_level("Warning") == LogLevel::Warning);
    REQUIRE(Logger::string_to_level("WARN") == LogLevel::Warning);
    REQUIRE(Logger::string_to_level("error") == LogLevel::Error);
    REQUIRE_FALSE(Logger::string_to_level("NONE").has_value());
    REQUIRE_FALSE(Logger::string_to_level("verbose").has_value());

    REQUIRE(std::string(Logger::level_to_string(LogLevel::Warning)) == "WARN");
}

TEST_CASE("Messages fan out to every sink", "[logger]") {
    std::vector<Entry> first;
    std::vector<Entry> second;
    Logger::clear_sinks();
    Logger::add_sink(std::make_unique<RecordingSink>(first));
    Logger::add_sink(std::make_unique<RecordingSink>(second));
    Logger::add_sink(nullptr);

    Logger::log(LogLevel::Info, "hello", "resolver");
    Logger::log(LogLevel::Error, "bye");

    Logger::clear_sinks();
    Logger::log(LogLevel::Error, "dropped");

    REQUIRE(first.size() == 2);
    REQUIRE(second.size() == 2);
    REQUIRE(first[0].message == "hello");
    REQUIRE(first[0].tag == "resolver");
    REQUIRE(first[1].level == LogLevel::Error);
    REQUIRE(first[1].tag == "pdfshrink");
}
