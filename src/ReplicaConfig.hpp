#pragma once
#include <string>
#include <json/json.h>
#include "Log.hpp"

enum class DuplicatePolicy { Allow, Reject };

struct ReplicaConfig {
    // Allow keeps first-match lookups over duplicate IDs.
    DuplicatePolicy duplicatePolicy = DuplicatePolicy::Allow;
    LogLevel logLevel = LogLevel::Info;

    // Missing keys keep their defaults; unknown values throw std::runtime_error.
    static ReplicaConfig fromJson(const Json::Value& value);
    static ReplicaConfig parse(const std::string& text);
    static ReplicaConfig loadFile(const std::string& path);

    Json::Value toJson() const;
};
