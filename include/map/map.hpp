#pragma once

#include <opencv2/core.hpp>
#include <vector>
#include <memory>
#include <string>

#include "geometry/geometry.hpp"

namespace loc_core {

// Index-aligned 3D coordinates and descriptors: row i of xyz belongs to row i
// of descriptors. Nothing maps a row back to the reconstruction point id.
class MapStore {
public:
    MapStore() = default;

    // Throws MapIntegrityError if the row counts differ or xyz is not N x 3.
    MapStore(const cv::Mat& xyz, const cv::Mat& descriptors);

    int size() const noexcept { return xyz_.rows; }
    int descriptorDim() const noexcept { return descriptors_.cols; }
    bool empty() const noexcept { return xyz_.empty(); }

    const cv::Mat& xyz() const noexcept { return xyz_; }                 // N x 3, CV_32F
    const cv::Mat& descriptors() const noexcept { return descriptors_; } // N x D, CV_32F

    cv::Point3f point(int i) const;
    std::vector<cv::Point3f> gather(const std::vector<int>& indices) const;

    const Bounds& bounds() const noexcept { return bounds_; }

private:
    cv::Mat xyz_;
    cv::Mat descriptors_;
    Bounds bounds_;
};

using MapStorePtr = std::shared_ptr<const MapStore>;

} // namespace loc_core
