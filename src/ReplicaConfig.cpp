#include "ReplicaConfig.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {
ReplicaConfig parseStream(std::istream& in, const std::string& origin) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        throw std::runtime_error("Invalid replica config " + origin + ": " + errs);
    }
    return ReplicaConfig::fromJson(root);
}
}

ReplicaConfig ReplicaConfig::fromJson(const Json::Value& value) {
    ReplicaConfig config;
    if (value.isNull()) {
        return config;
    }
    if (!value.isObject()) {
        throw std::runtime_error("Replica config must be a JSON object");
    }
    if (value.isMember("duplicate_policy")) {
        if (!value["duplicate_policy"].isString()) {
            throw std::runtime_error("duplicate_policy must be a string");
        }
        std::string policy = value["duplicate_policy"].asString();
        if (policy == "allow") {
            config.duplicatePolicy = DuplicatePolicy::Allow;
        } else if (policy == "reject") {
            config.duplicatePolicy = DuplicatePolicy::Reject;
        } else {
            throw std::runtime_error("Unknown duplicate_policy: " + policy);
        }
    }
    if (value.isMember("log_level")) {
        if (!value["log_level"].isString()) {
            throw std::runtime_error("log_level must be a string");
        }
        std::string level = value["log_level"].asString();
        if (!parseLogLevel(level, config.logLevel)) {
            throw std::runtime_error("Unknown log_level: " + level);
        }
    }
    return config;
}

ReplicaConfig ReplicaConfig::parse(const std::string& text) {
    std::istringstream iss(text);
    return parseStream(iss, "text");
}

ReplicaConfig ReplicaConfig::loadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("Cannot open replica config: " + path);
    }
    return parseStream(ifs, path);
}

Json::Value ReplicaConfig::toJson() const {
    Json::Value value(Json::objectValue);
    value["duplicate_policy"] = duplicatePolicy == DuplicatePolicy::Reject ? "reject" : "allow";
    std::string level = logLevelName(logLevel);
    for (auto& ch : level) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    value["log_level"] = level;
    return value;
}
