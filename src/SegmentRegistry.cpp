#include "SegmentRegistry.hpp"
#include <string>
#include <utility>
#include "Log.hpp"
#include "ReplicaErrors.hpp"

namespace {
NotFoundError missingSegment(UniqueID segmentID) {
    return NotFoundError("there's no segment " + std::to_string(segmentID));
}
}

std::shared_ptr<Segment> SegmentRegistry::find(UniqueID segmentID) const {
    for (const auto& segment : segments) {
        if (segment->segmentID() == segmentID) {
            return segment;
        }
    }
    return nullptr;
}

void SegmentRegistry::add(UniqueID segmentID, UniqueID collectionID, UniqueID partitionID,
                          Timestamp createTime, MsgPositions startPositions) {
    logInfo("Add segment " + std::to_string(segmentID) + " (collection " +
            std::to_string(collectionID) + ", partition " + std::to_string(partitionID) + ")");
    segments.push_back(std::make_shared<Segment>(segmentID, collectionID, partitionID,
                                                 createTime, std::move(startPositions)));
}

void SegmentRegistry::remove(UniqueID segmentID) {
    for (size_t index = 0; index < segments.size(); ++index) {
        if (segments[index]->segmentID() == segmentID) {
            logInfo("Removing segment " + std::to_string(segmentID));
            segments[index] = std::move(segments.back());
            segments.pop_back();
            return;
        }
    }
    throw missingSegment(segmentID);
}

bool SegmentRegistry::hasSegment(UniqueID segmentID) const {
    return find(segmentID) != nullptr;
}

std::shared_ptr<const Segment> SegmentRegistry::getByID(UniqueID segmentID) const {
    auto segment = find(segmentID);
    if (!segment) {
        return nullptr;
    }
    return std::make_shared<const Segment>(*segment);
}

void SegmentRegistry::updateStatistics(UniqueID segmentID, int64_t deltaRows, Timestamp endTime,
                                       MsgPositions endPositions) {
    auto segment = find(segmentID);
    if (!segment) {
        throw missingSegment(segmentID);
    }
    segment->applyStatistics(deltaRows, endTime, std::move(endPositions));
    logDebug("Updating segment " + std::to_string(segmentID) + " row nums: +" +
             std::to_string(deltaRows) + " -> " + std::to_string(segment->numRows()));
}

SegmentStatisticsUpdates SegmentRegistry::getStatisticsSnapshot(UniqueID segmentID) {
    auto segment = find(segmentID);
    if (!segment) {
        throw missingSegment(segmentID);
    }
    return segment->takeStatistics();
}

std::vector<SegmentStatisticsUpdates> SegmentRegistry::getAllStatisticsSnapshots() {
    std::vector<SegmentStatisticsUpdates> snapshots;
    snapshots.reserve(segments.size());
    for (const auto& segment : segments) {
        snapshots.push_back(segment->takeStatistics());
    }
    return snapshots;
}

int SegmentRegistry::count() const {
    return static_cast<int>(segments.size());
}

std::vector<UniqueID> SegmentRegistry::listIDs() const {
    std::vector<UniqueID> ids;
    ids.reserve(segments.size());
    for (const auto& segment : segments) {
        ids.push_back(segment->segmentID());
    }
    return ids;
}
