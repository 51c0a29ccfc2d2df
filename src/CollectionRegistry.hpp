#pragma once
#include <memory>
#include <string>
#include <vector>
#include <json/json.h>
#include "Collection.hpp"

// Live collection set. Not synchronized; CollectionReplica holds the lock.
// Duplicate IDs and names are tolerated: lookups return the first match.
class CollectionRegistry {
public:
    int count() const;
    std::shared_ptr<const Collection> add(UniqueID id, const Json::Value& schema);
    // Drops every collection with this ID. Missing IDs are a no-op.
    void remove(UniqueID id);

    std::shared_ptr<const Collection> getByID(UniqueID id) const;
    std::shared_ptr<const Collection> getByName(const std::string& name) const;
    // Throws NotFoundError.
    UniqueID getIDByName(const std::string& name) const;
    bool hasCollection(UniqueID id) const;

private:
    std::vector<std::shared_ptr<const Collection>> collections;
};
