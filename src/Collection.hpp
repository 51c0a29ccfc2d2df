#pragma once
#include <string>
#include <json/json.h>
#include "ReplicaTypes.hpp"

// Immutable once constructed. The schema is opaque; only its "name" is read.
class Collection {
public:
    Collection(UniqueID id, Json::Value schema);

    UniqueID id() const;
    const std::string& name() const;
    const Json::Value& schema() const;

private:
    UniqueID collectionID;
    std::string collectionName;
    Json::Value collectionSchema;
};
