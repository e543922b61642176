#include "loc_core/config_io.hpp"
#include "geometry/geometry.hpp"

#include <stdexcept>

namespace loc_core {

namespace {

double requireReal(const cv::FileNode& node, const char* key, const std::string& path) {
    const cv::FileNode n = node[key];
    if (n.empty() || !(n.isReal() || n.isInt())) {
        throw std::runtime_error(path + ": missing numeric field '" + key + "'");
    }
    return static_cast<double>(n);
}

template <typename T>
void readOptional(const cv::FileNode& root, const char* key, T& value) {
    const cv::FileNode n = root[key];
    if (!n.empty()) n >> value;
}

} // namespace

cv::Mat loadIntrinsics(const std::string& path)
{
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) throw std::runtime_error("Failed to open intrinsics file: " + path);

    cv::FileNode node = fs["camera_intrinsics"];
    if (node.empty()) node = fs.root();

    const double fx = requireReal(node, "fx", path);
    const double fy = requireReal(node, "fy", path);
    const double cx = requireReal(node, "cx", path);
    const double cy = requireReal(node, "cy", path);
    if (fx <= 0.0 || fy <= 0.0) throw std::runtime_error(path + ": focal lengths must be positive");

    return intrinsicsMatrix(fx, fy, cx, cy);
}

void saveIntrinsics(const std::string& path, const cv::Mat& K)
{
    CV_Assert(K.rows == 3 && K.cols == 3);
    cv::Mat Kd;
    K.convertTo(Kd, CV_64F);

    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if (!fs.isOpened()) throw std::runtime_error("Failed to open intrinsics file for writing: " + path);
    fs << "camera_intrinsics" << "{";
    fs << "fx" << Kd.at<double>(0,0);
    fs << "fy" << Kd.at<double>(1,1);
    fs << "cx" << Kd.at<double>(0,2);
    fs << "cy" << Kd.at<double>(1,2);
    fs << "}";
}

LocalizerConfig loadLocalizerConfig(const std::string& path)
{
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) throw std::runtime_error("Failed to open config file: " + path);

    const cv::FileNode root = fs.root();
    LocalizerConfig cfg;
    readOptional(root, "ratio_threshold", cfg.ratio_threshold);
    readOptional(root, "reprojection_error", cfg.reprojection_error);
    readOptional(root, "confidence", cfg.confidence);
    readOptional(root, "ransac_iterations", cfg.ransac_iterations);
    readOptional(root, "min_inliers", cfg.min_inliers);

    int refine = cfg.refine ? 1 : 0;
    readOptional(root, "refine", refine);
    cfg.refine = refine != 0;
    return cfg;
}

} // namespace loc_core
