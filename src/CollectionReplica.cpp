#include "CollectionReplica.hpp"
#include <mutex>
#include <string>
#include <utility>
#include "ReplicaErrors.hpp"

CollectionReplica::CollectionReplica(const ReplicaConfig& config) : replicaConfig(config) {}

const ReplicaConfig& CollectionReplica::config() const {
    return replicaConfig;
}

int CollectionReplica::getCollectionNum() const {
    std::shared_lock lock(mutex);
    return collections.count();
}

void CollectionReplica::addCollection(UniqueID collectionID, const Json::Value& schema) {
    std::unique_lock lock(mutex);
    if (replicaConfig.duplicatePolicy == DuplicatePolicy::Reject &&
        collections.hasCollection(collectionID)) {
        throw DuplicateIdError("collection " + std::to_string(collectionID) + " already exists");
    }
    collections.add(collectionID, schema);
}

void CollectionReplica::removeCollection(UniqueID collectionID) {
    std::unique_lock lock(mutex);
    collections.remove(collectionID);
}

std::shared_ptr<const Collection> CollectionReplica::getCollectionByID(UniqueID collectionID) const {
    std::shared_lock lock(mutex);
    return collections.getByID(collectionID);
}

std::shared_ptr<const Collection> CollectionReplica::getCollectionByName(const std::string& collectionName) const {
    std::shared_lock lock(mutex);
    return collections.getByName(collectionName);
}

UniqueID CollectionReplica::getCollectionIDByName(const std::string& collectionName) const {
    std::shared_lock lock(mutex);
    return collections.getIDByName(collectionName);
}

bool CollectionReplica::hasCollection(UniqueID collectionID) const {
    std::shared_lock lock(mutex);
    return collections.hasCollection(collectionID);
}

void CollectionReplica::addSegment(UniqueID segmentID, UniqueID collectionID, UniqueID partitionID,
                                   Timestamp createTime, MsgPositions startPositions) {
    std::unique_lock lock(mutex);
    if (replicaConfig.duplicatePolicy == DuplicatePolicy::Reject && segments.hasSegment(segmentID)) {
        throw DuplicateIdError("segment " + std::to_string(segmentID) + " already exists");
    }
    segments.add(segmentID, collectionID, partitionID, createTime, std::move(startPositions));
}

void CollectionReplica::removeSegment(UniqueID segmentID) {
    std::unique_lock lock(mutex);
    segments.remove(segmentID);
}

bool CollectionReplica::hasSegment(UniqueID segmentID) const {
    std::shared_lock lock(mutex);
    return segments.hasSegment(segmentID);
}

void CollectionReplica::updateStatistics(UniqueID segmentID, int64_t numRows, Timestamp endTime,
                                         MsgPositions endPositions) {
    std::unique_lock lock(mutex);
    segments.updateStatistics(segmentID, numRows, endTime, std::move(endPositions));
}

SegmentStatisticsUpdates CollectionReplica::getSegmentStatisticsUpdates(UniqueID segmentID) {
    std::unique_lock lock(mutex);
    return segments.getStatisticsSnapshot(segmentID);
}

std::vector<SegmentStatisticsUpdates> CollectionReplica::getAllSegmentStatisticsUpdates() {
    std::unique_lock lock(mutex);
    return segments.getAllStatisticsSnapshots();
}

std::shared_ptr<const Segment> CollectionReplica::getSegmentByID(UniqueID segmentID) const {
    std::shared_lock lock(mutex);
    return segments.getByID(segmentID);
}

int CollectionReplica::getSegmentNum() const {
    std::shared_lock lock(mutex);
    return segments.count();
}

std::vector<UniqueID> CollectionReplica::listSegmentIDs() const {
    std::shared_lock lock(mutex);
    return segments.listIDs();
}
