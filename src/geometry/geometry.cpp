#include "geometry/geometry.hpp"
#include <algorithm>

namespace loc_core {

cv::Vec3d Pose::center() const {
    return cameraCenter(Q.toRotMat3x3(cv::QUAT_ASSUME_UNIT), T);
}

cv::Vec3d cameraCenter(const cv::Matx33d& Rcw, const cv::Vec3d& tcw) {
    return -(Rcw.t() * tcw);
}

cv::Mat intrinsicsMatrix(double fx, double fy, double cx, double cy) {
    cv::Mat K = (cv::Mat_<double>(3,3) <<
                 fx,  0.0, cx,
                 0.0, fy,  cy,
                 0.0, 0.0, 1.0);
    return K;
}

Bounds computeBounds(const cv::Mat& xyzN3) {
    Bounds b;
    if (xyzN3.empty()) return b;
    CV_Assert(xyzN3.cols == 3 && xyzN3.type() == CV_32F);

    b.min = b.max = xyzN3.at<cv::Vec3f>(0, 0);
    for (int i = 1; i < xyzN3.rows; ++i) {
        const cv::Vec3f p = xyzN3.at<cv::Vec3f>(i, 0);
        for (int k = 0; k < 3; ++k) {
            b.min[k] = std::min(b.min[k], p[k]);
            b.max[k] = std::max(b.max[k], p[k]);
        }
    }
    return b;
}

} // namespace loc_core
