#pragma once
#include <opencv2/core.hpp>
#include <opencv2/features2d.hpp>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "geometry/geometry.hpp"

namespace loc_test {

inline cv::Matx33d generateRotation(double x, double y, double z)
{
    const cv::Matx33d R1(1, 0, 0,
                         0, std::cos(x), -std::sin(x),
                         0, std::sin(x),  std::cos(x));
    const cv::Matx33d R2( std::cos(y), 0, std::sin(y),
                          0, 1, 0,
                         -std::sin(y), 0, std::cos(y));
    const cv::Matx33d R3(std::cos(z), -std::sin(z), 0,
                         std::sin(z),  std::cos(z), 0,
                         0, 0, 1);
    return R3 * R2 * R1;
}

struct Scene {
    cv::Mat K;
    cv::Matx33d R;                    // world-to-camera
    cv::Vec3d t;
    cv::Vec3d center;                 // ground-truth camera centre
    std::vector<cv::Point3f> pts3d;   // world frame
    std::vector<cv::Point2f> pts2d;   // noiseless projections
};

// Points spread over a 640x480 view at depths [4, 8], expressed in world
// coordinates of a camera with a known pose.
inline Scene makeScene(int numPts, std::uint64_t seed = 42)
{
    Scene s;
    s.K = loc_core::intrinsicsMatrix(800.0, 800.0, 320.0, 240.0);
    s.R = generateRotation(0.1, -0.2, 0.05);
    s.t = cv::Vec3d(0.3, -0.5, 2.0);
    s.center = loc_core::cameraCenter(s.R, s.t);

    cv::RNG rng(seed);
    for (int i = 0; i < numPts; ++i) {
        const double u = rng.uniform(20.0, 620.0);
        const double v = rng.uniform(20.0, 460.0);
        const double z = rng.uniform(4.0, 8.0);
        const cv::Vec3d Xc((u - 320.0) / 800.0 * z, (v - 240.0) / 800.0 * z, z);
        const cv::Vec3d Xw = s.R.t() * (Xc - s.t);
        s.pts3d.emplace_back(static_cast<float>(Xw[0]), static_cast<float>(Xw[1]), static_cast<float>(Xw[2]));

        // project the float-rounded point so the observation is exact
        const cv::Vec3d Xr = s.R * cv::Vec3d(s.pts3d.back().x, s.pts3d.back().y, s.pts3d.back().z) + s.t;
        s.pts2d.emplace_back(static_cast<float>(800.0 * Xr[0] / Xr[2] + 320.0),
                             static_cast<float>(800.0 * Xr[1] / Xr[2] + 240.0));
    }
    return s;
}

// Well separated random descriptors, one row per point.
inline cv::Mat randomDescriptors(int rows, int dim = 128, std::uint64_t seed = 7)
{
    cv::Mat d(rows, dim, CV_32F);
    cv::RNG rng(seed);
    rng.fill(d, cv::RNG::UNIFORM, 0.0, 255.0);
    return d;
}

inline std::vector<cv::KeyPoint> toKeypoints(const std::vector<cv::Point2f>& pts)
{
    std::vector<cv::KeyPoint> kps;
    kps.reserve(pts.size());
    for (const auto& p : pts) kps.emplace_back(p, 1.f);
    return kps;
}

// Fresh empty directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        cv::RNG rng(cv::getTickCount());
        path_ = std::filesystem::temp_directory_path() /
                ("loc_core_" + tag + "_" + std::to_string(rng.next()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

    void write(const std::string& name, const std::string& contents) const {
        std::ofstream f(path_ / name);
        f << contents;
    }

private:
    std::filesystem::path path_;
};

} // namespace loc_test
