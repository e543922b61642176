#pragma once
#include <opencv2/core.hpp>
#include <vector>

#include "loc_core/status.hpp"

namespace loc_core {

struct PnpParams {
    double reprojection_error = 8.0;   // RANSAC inlier threshold, pixels
    double confidence = 0.99;
    int    iterations = 100;           // hard cap on RANSAC iterations
    bool   refine = true;              // LM refinement over the inlier set
};

struct PoseResult {
    bool success = false;
    Status status = Status::InsufficientCorrespondences;
    cv::Mat rvec;                      // 3x1, CV_64F
    cv::Matx33d R;                     // world-to-camera rotation
    cv::Vec3d t;                       // world-to-camera translation
    cv::Vec3d position;                // camera centre in world frame, -R^T * t
    std::vector<int> inliers;
    int inlier_count = 0;
    int total_count = 0;
};

class PoseEstimator {
public:
    // K must be 3x3; distortion is fixed to five zero coefficients.
    explicit PoseEstimator(const cv::Mat& K, const PnpParams& prm = PnpParams());

    PoseResult estimate(const std::vector<cv::Point3f>& pts3d,
                        const std::vector<cv::Point2f>& pts2d) const;

    // Pixel distance between each observation and the projection of its 3D point.
    std::vector<double> reprojectionErrors(const PoseResult& pose,
                                           const std::vector<cv::Point3f>& pts3d,
                                           const std::vector<cv::Point2f>& pts2d) const;

    const cv::Mat& K() const { return K_; }
    const cv::Mat& dist() const { return dist_; }
    const PnpParams& params() const { return prm_; }

private:
    cv::Mat K_;
    cv::Mat dist_;
    PnpParams prm_;
};

}
