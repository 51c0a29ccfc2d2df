#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include "../src/Log.hpp"
#include "../src/ReplicaConfig.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static bool parseFails(const std::string& text) {
    try {
        ReplicaConfig::parse(text);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

int main() {
    try {
        ReplicaConfig defaults;
        ASSERT_TRUE(defaults.duplicatePolicy == DuplicatePolicy::Allow);
        ASSERT_TRUE(defaults.logLevel == LogLevel::Info);

        auto empty = ReplicaConfig::parse("{}");
        ASSERT_TRUE(empty.duplicatePolicy == DuplicatePolicy::Allow);
        ASSERT_TRUE(empty.logLevel == LogLevel::Info);

        auto strict = ReplicaConfig::parse(R"({"duplicate_policy": "reject", "log_level": "debug"})");
        ASSERT_TRUE(strict.duplicatePolicy == DuplicatePolicy::Reject);
        ASSERT_TRUE(strict.logLevel == LogLevel::Debug);
        ASSERT_TRUE(strict.toJson()["duplicate_policy"].asString() == "reject");
        ASSERT_TRUE(strict.toJson()["log_level"].asString() == "debug");

        ASSERT_TRUE(parseFails(R"({"duplicate_policy": "sometimes"})"));
        ASSERT_TRUE(parseFails(R"({"log_level": "loud"})"));
        ASSERT_TRUE(parseFails("[1, 2]"));
        ASSERT_TRUE(parseFails("{not json"));
        ASSERT_TRUE(parseFails(R"({"duplicate_policy": {"mode": "reject"}})"));
        ASSERT_TRUE(parseFails(R"({"log_level": ["info"]})"));

        LogLevel level = LogLevel::Info;
        ASSERT_TRUE(parseLogLevel("warning", level));
        ASSERT_TRUE(level == LogLevel::Warn);
        ASSERT_TRUE(parseLogLevel("off", level));
        ASSERT_TRUE(level == LogLevel::Off);
        ASSERT_TRUE(!parseLogLevel("verbose", level));

        auto tmpFile = std::filesystem::temp_directory_path() / "datanode_replica_config_test.json";
        {
            std::ofstream ofs(tmpFile);
            ofs << R"({"log_level": "error"})";
        }
        auto fromFile = ReplicaConfig::loadFile(tmpFile.string());
        ASSERT_TRUE(fromFile.logLevel == LogLevel::Error);
        ASSERT_TRUE(fromFile.duplicatePolicy == DuplicatePolicy::Allow);
        std::filesystem::remove(tmpFile);

        bool threw = false;
        try {
            ReplicaConfig::loadFile(tmpFile.string());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All replica config tests passed" << std::endl;
    return 0;
}
