#pragma once

#include <opencv2/core.hpp>
#include <opencv2/core/quaternion.hpp>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "geometry/geometry.hpp"

namespace loc_core {

struct TrackEntry {
    int image_id{-1};
    int point2d_idx{-1};
};

// One record of points3D.txt: ID X Y Z R G B ERROR (IMAGE_ID POINT2D_IDX)*
struct ReconstructedPoint {
    long long id{-1};
    cv::Point3d xyz;
    double error{0.0};               // reprojection error, not used downstream
    std::vector<TrackEntry> track;
};

// One image line of images.txt: IMAGE_ID QW QX QY QZ TX TY TZ CAMERA_ID NAME
struct ImageRecord {
    int id{-1};
    std::string name;
    Pose T_c_w;                      // world-to-camera
    int camera_id{-1};
};

using ImageRegistry = std::unordered_map<int, ImageRecord>;

// Descriptor table per image name; rows are index-aligned with keypoints.
using DescriptorTables = std::map<std::string, cv::Mat>;

// Throws std::runtime_error if the file cannot be opened.
std::vector<ReconstructedPoint> readPoints3D(const std::string& path);

// Only 10-field lines are image records; the per-image keypoint line is skipped.
ImageRegistry readImageRegistry(const std::string& path);

// One descriptor per non-blank line, integer components; returns N x D CV_32F.
cv::Mat readDescriptorTable(const std::string& path);

// Sidecar naming: <descriptorDir>/<imageName>_desc.txt
std::string descriptorSidecarPath(const std::string& descriptorDir, const std::string& imageName);

// Loads the sidecar of every .jpg in imageDir (sorted). Images without a
// sidecar are reported on std::cerr and left out.
DescriptorTables loadDescriptorTables(const std::string& imageDir, const std::string& descriptorDir);

// Camera centre of every registered image, keyed by image name.
std::map<std::string, cv::Vec3d> readGroundTruthCenters(const std::string& imagesTxt);

} // namespace loc_core
