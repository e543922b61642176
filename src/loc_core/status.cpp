#include "loc_core/status.hpp"

namespace loc_core {

const char* toString(Status s) {
    switch (s) {
        case Status::Ok:                          return "ok";
        case Status::ExtractionFailed:            return "feature extraction failed";
        case Status::InsufficientFeatures:        return "not enough features detected in query image";
        case Status::InsufficientMatches:         return "not enough feature matches found";
        case Status::InsufficientCorrespondences: return "not enough 2D-3D correspondences for PnP";
        case Status::NoConsensus:                 return "pose estimation failed (RANSAC)";
        case Status::InsufficientInliers:         return "pose rejected: too few inliers";
    }
    return "unknown";
}

} // namespace loc_core
