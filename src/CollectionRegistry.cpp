#include "CollectionRegistry.hpp"
#include "Log.hpp"
#include "ReplicaErrors.hpp"

int CollectionRegistry::count() const {
    return static_cast<int>(collections.size());
}

std::shared_ptr<const Collection> CollectionRegistry::add(UniqueID id, const Json::Value& schema) {
    auto collection = std::make_shared<const Collection>(id, schema);
    collections.push_back(collection);
    logInfo("Create collection: " + collection->name() + " (id " + std::to_string(id) + ")");
    return collection;
}

void CollectionRegistry::remove(UniqueID id) {
    std::vector<std::shared_ptr<const Collection>> kept;
    kept.reserve(collections.size());
    for (const auto& collection : collections) {
        if (collection->id() != id) {
            kept.push_back(collection);
        } else {
            logInfo("Drop collection: " + collection->name() + " (id " + std::to_string(id) + ")");
        }
    }
    collections.swap(kept);
}

std::shared_ptr<const Collection> CollectionRegistry::getByID(UniqueID id) const {
    for (const auto& collection : collections) {
        if (collection->id() == id) {
            return collection;
        }
    }
    return nullptr;
}

std::shared_ptr<const Collection> CollectionRegistry::getByName(const std::string& name) const {
    for (const auto& collection : collections) {
        if (collection->name() == name) {
            return collection;
        }
    }
    return nullptr;
}

UniqueID CollectionRegistry::getIDByName(const std::string& name) const {
    auto collection = getByName(name);
    if (!collection) {
        throw NotFoundError("There is no collection name=" + name);
    }
    return collection->id();
}

bool CollectionRegistry::hasCollection(UniqueID id) const {
    return getByID(id) != nullptr;
}
