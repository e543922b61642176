#pragma once
#include <opencv2/core.hpp>
#include <string>

#include "loc_core/localizer.hpp"

namespace loc_core {

// Reads fx, fy, cx, cy from a JSON or YAML file, either under a
// "camera_intrinsics" node or at the root. Returns a 3x3 CV_64F matrix.
// Throws std::runtime_error if the file or any field is missing.
cv::Mat loadIntrinsics(const std::string& path);

void saveIntrinsics(const std::string& path, const cv::Mat& K);

// Optional keys: ratio_threshold, reprojection_error, confidence,
// ransac_iterations, min_inliers, refine. Missing keys keep their defaults.
LocalizerConfig loadLocalizerConfig(const std::string& path);

} // namespace loc_core
