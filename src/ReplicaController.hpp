#pragma once
#include <string>
#include <json/json.h>
#include "CollectionReplica.hpp"

// JSON front for a CollectionReplica. Each request is
// {"id": ..., "method": <replica operation>, "params": {...}} and each reply is
// a JSON-RPC 2.0 style object carrying either "result" or "error".
class ReplicaController {
public:
    static constexpr int kParseError = -32700;
    static constexpr int kMethodNotFound = -32601;
    static constexpr int kInvalidParams = -32602;
    static constexpr int kInternalError = -32000;
    static constexpr int kNotFound = -32004;
    static constexpr int kDuplicateId = -32009;

    ReplicaController() = default;
    explicit ReplicaController(const ReplicaConfig& config);

    Json::Value createResponse(const Json::Value& id, const Json::Value& result) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message) const;

    // Never throws; failures come back as error replies.
    Json::Value handleRequest(const Json::Value& request);
    Json::Value handleLine(const std::string& line);

    Json::Value listMethods() const;

    CollectionReplica& replica();

private:
    Json::Value dispatch(const std::string& method, const Json::Value& params);

    CollectionReplica replica_;
};
