#pragma once
#include <stdexcept>
#include <string>

// Lookup or mutation targeted a segment ID, collection ID or collection name
// that is not in the live set.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& message) : std::runtime_error(message) {}
};

// Raised only when the replica is configured to reject duplicate identifiers.
class DuplicateIdError : public std::runtime_error {
public:
    explicit DuplicateIdError(const std::string& message) : std::runtime_error(message) {}
};
