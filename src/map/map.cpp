#include "map/map.hpp"
#include "loc_core/status.hpp"

#include <sstream>

namespace loc_core {

namespace {

cv::Mat toFloat32(const cv::Mat& m) {
    if (m.empty() || m.type() == CV_32F) return m.clone();
    cv::Mat out;
    m.reshape(1).convertTo(out, CV_32F);
    return out;
}

} // namespace

MapStore::MapStore(const cv::Mat& xyz, const cv::Mat& descriptors)
{
    xyz_ = toFloat32(xyz);
    descriptors_ = toFloat32(descriptors);

    if (xyz_.rows != descriptors_.rows) {
        std::ostringstream ss;
        ss << "Mismatch between number of 3D points (" << xyz_.rows
           << ") and descriptors (" << descriptors_.rows << ")";
        throw MapIntegrityError(ss.str());
    }
    if (!xyz_.empty() && xyz_.cols != 3) {
        std::ostringstream ss;
        ss << "3D point array must be N x 3, got N x " << xyz_.cols;
        throw MapIntegrityError(ss.str());
    }

    bounds_ = computeBounds(xyz_);
}

cv::Point3f MapStore::point(int i) const {
    CV_Assert(i >= 0 && i < xyz_.rows);
    const float* p = xyz_.ptr<float>(i);
    return cv::Point3f(p[0], p[1], p[2]);
}

std::vector<cv::Point3f> MapStore::gather(const std::vector<int>& indices) const {
    std::vector<cv::Point3f> out;
    out.reserve(indices.size());
    for (int idx : indices) out.push_back(point(idx));
    return out;
}

} // namespace loc_core
