#pragma once

#include <string>
#include <vector>

#include "map/map.hpp"
#include "map/reconstruction.hpp"

namespace loc_core {

struct BuildStats {
    int points_loaded{0};
    int images_loaded{0};      // images with a descriptor table
    int registry_size{0};
    int dropped_empty_track{0};
    int dropped_unknown_image{0};
    int dropped_missing_descriptors{0};
    int dropped_bad_keypoint{0};
    int map_size{0};
};

struct BuildOutput {
    MapStore store;
    BuildStats stats;
};

// Turns a structure-from-motion reconstruction into a MapStore. Each point is
// represented by the descriptor of the first entry of its track only.
class MapBuilder {
public:
    BuildOutput build(const std::vector<ReconstructedPoint>& points,
                      const ImageRegistry& registry,
                      const DescriptorTables& tables) const;

    // Reads <reconstructionDir>/points3D.txt and images.txt plus the
    // descriptor sidecars, then builds. A missing points file is fatal.
    BuildOutput buildFromFiles(const std::string& reconstructionDir,
                               const std::string& imageDir,
                               const std::string& descriptorDir) const;
};

} // namespace loc_core
