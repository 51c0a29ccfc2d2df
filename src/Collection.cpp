#include "Collection.hpp"
#include <utility>

Collection::Collection(UniqueID id, Json::Value schema)
    : collectionID(id),
      collectionName(schema.isObject() ? schema.get("name", "").asString() : std::string()),
      collectionSchema(std::move(schema)) {}

UniqueID Collection::id() const {
    return collectionID;
}

const std::string& Collection::name() const {
    return collectionName;
}

const Json::Value& Collection::schema() const {
    return collectionSchema;
}
