#pragma once
#include <opencv2/core.hpp>
#include <opencv2/core/quaternion.hpp>

namespace loc_core {

// World-to-camera transform as stored by the reconstruction (x_c = R*x_w + t).
struct Pose {
    cv::Quatd Q;
    cv::Vec3d T;

    Pose() : Q(1,0,0,0), T(0,0,0) {}
    cv::Vec3d center() const;
};

struct Bounds {
    cv::Vec3f min{0.f, 0.f, 0.f};
    cv::Vec3f max{0.f, 0.f, 0.f};
};

// C = -R^T * t
cv::Vec3d cameraCenter(const cv::Matx33d& Rcw, const cv::Vec3d& tcw);

cv::Mat intrinsicsMatrix(double fx, double fy, double cx, double cy);

Bounds computeBounds(const cv::Mat& xyzN3);

} // namespace loc_core
