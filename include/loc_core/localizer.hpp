#pragma once
#include <opencv2/core.hpp>
#include <memory>
#include <string>
#include <vector>

#include "geometry/geometry.hpp"
#include "map/map.hpp"
#include "loc_core/status.hpp"
#include "loc_core/feature_extractor.hpp"
#include "loc_core/feature_matcher.hpp"
#include "loc_core/pose_estimator.hpp"

namespace loc_core {

struct LocalizerConfig {
    float  ratio_threshold{0.75f};
    double reprojection_error{8.0};
    double confidence{0.99};
    int    ransac_iterations{100};
    int    min_inliers{4};
    bool   refine{true};
};

struct MapInfo {
    int num_points{0};
    int descriptor_dim{0};
    Bounds bounds;
};

struct LocalizationResult {
    Status status{Status::ExtractionFailed};
    std::string detail;
    PoseResult pose;

    bool ok() const { return status == Status::Ok; }
    std::string message() const;
};

// Relocalizes single images against an immutable map. All methods are const
// and keep no per-call state, so one instance can serve several threads.
class Localizer {
public:
    Localizer(MapStorePtr map, const cv::Mat& K, const LocalizerConfig& cfg = LocalizerConfig());
    Localizer(const Localizer&) = delete;
    Localizer& operator=(const Localizer&) = delete;
    ~Localizer();

    LocalizationResult localize(const std::string& image_path) const;
    LocalizationResult localize(const cv::Mat& image_bgr) const;

    // Matching and pose recovery on already extracted features.
    LocalizationResult localizeFeatures(const FeatureResult& features) const;

    std::vector<LocalizationResult> localizeBatch(const std::vector<std::string>& image_paths) const;

    MapInfo mapInfo() const;
    const LocalizerConfig& config() const noexcept { return cfg_; }
    const cv::Mat& intrinsics() const noexcept { return K_; }
    const MapStore& map() const noexcept { return *map_; }

private:
    MapStorePtr map_;
    cv::Mat K_;
    LocalizerConfig cfg_;

    FeatureExtractor extractor_;
    FeatureMatcher matcher_;
    PoseEstimator estimator_;

    template <typename Source>
    LocalizationResult extractAndLocalize(const Source& src) const;
};

} // namespace loc_core
