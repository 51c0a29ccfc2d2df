#pragma once
#include <memory>
#include <vector>
#include "Segment.hpp"

// Live segment set. Not synchronized; CollectionReplica holds the lock.
// Removal swaps the victim with the last element, so order is not stable.
class SegmentRegistry {
public:
    void add(UniqueID segmentID, UniqueID collectionID, UniqueID partitionID,
             Timestamp createTime, MsgPositions startPositions);
    // Throws NotFoundError.
    void remove(UniqueID segmentID);
    bool hasSegment(UniqueID segmentID) const;
    // Returns a detached copy, or nullptr.
    std::shared_ptr<const Segment> getByID(UniqueID segmentID) const;

    // Throws NotFoundError; std::invalid_argument on a negative delta.
    void updateStatistics(UniqueID segmentID, int64_t deltaRows, Timestamp endTime,
                          MsgPositions endPositions);
    // Clears the segment's new flag. Throws NotFoundError.
    SegmentStatisticsUpdates getStatisticsSnapshot(UniqueID segmentID);
    std::vector<SegmentStatisticsUpdates> getAllStatisticsSnapshots();

    int count() const;
    std::vector<UniqueID> listIDs() const;

private:
    std::shared_ptr<Segment> find(UniqueID segmentID) const;

    std::vector<std::shared_ptr<Segment>> segments;
};
