#pragma once
#include <string>
#include "map/map.hpp"

namespace loc_core {

// Node names inside the persisted artifact.
constexpr const char* kXyzNode = "xyz_world";
constexpr const char* kDescriptorNode = "descriptors";

// Writes both arrays through cv::FileStorage. A ".gz" suffix (e.g. map.yml.gz)
// produces a compressed archive.
void saveMap(const std::string& path, const MapStore& store);

// Throws std::runtime_error if the file or a node is missing and
// MapIntegrityError if the arrays are not index-aligned.
MapStore loadMap(const std::string& path);

} // namespace loc_core
