#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace loc_core {

enum class Status : std::uint8_t {
    Ok = 0,
    ExtractionFailed,
    InsufficientFeatures,
    InsufficientMatches,
    InsufficientCorrespondences,
    NoConsensus,
    InsufficientInliers
};

const char* toString(Status s);

// Coordinate and descriptor arrays are not index-aligned.
class MapIntegrityError : public std::runtime_error {
public:
    explicit MapIntegrityError(const std::string& what) : std::runtime_error(what) {}
};

// Query image could not be read or decoded into features.
class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace loc_core
