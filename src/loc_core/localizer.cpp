#include "loc_core/localizer.hpp"

#include <sstream>
#include <stdexcept>

namespace loc_core {

namespace {

MatchParams toMatchParams(const LocalizerConfig& cfg) {
    MatchParams prm;
    prm.ratio = cfg.ratio_threshold;
    return prm;
}

PnpParams toPnpParams(const LocalizerConfig& cfg) {
    PnpParams prm;
    prm.reprojection_error = cfg.reprojection_error;
    prm.confidence = cfg.confidence;
    prm.iterations = cfg.ransac_iterations;
    prm.refine = cfg.refine;
    return prm;
}

LocalizationResult failure(Status s, std::string detail = std::string()) {
    LocalizationResult r;
    r.status = s;
    r.detail = std::move(detail);
    r.pose.status = s;
    return r;
}

} // namespace

std::string LocalizationResult::message() const {
    if (detail.empty()) return toString(status);
    return std::string(toString(status)) + ": " + detail;
}

Localizer::Localizer(MapStorePtr map, const cv::Mat& K, const LocalizerConfig& cfg)
    : map_(std::move(map)),
      cfg_(cfg),
      matcher_(toMatchParams(cfg)),
      estimator_(K, toPnpParams(cfg))
{
    if (!map_) throw std::invalid_argument("Localizer requires a map.");
    if (cfg_.min_inliers < 0) throw std::invalid_argument("min_inliers must be non-negative.");
    K_ = estimator_.K();
}

Localizer::~Localizer() = default;

template <typename Source>
LocalizationResult Localizer::extractAndLocalize(const Source& src) const
{
    FeatureResult features;
    try {
        features = extractor_.extract(src);
    } catch (const ExtractionError& e) {
        return failure(Status::ExtractionFailed, e.what());
    }
    return localizeFeatures(features);
}

LocalizationResult Localizer::localize(const std::string& image_path) const {
    return extractAndLocalize(image_path);
}

LocalizationResult Localizer::localize(const cv::Mat& image_bgr) const {
    return extractAndLocalize(image_bgr);
}

LocalizationResult Localizer::localizeFeatures(const FeatureResult& features) const
{
    if (static_cast<int>(features.keypoints.size()) != features.descriptors.rows) {
        std::ostringstream ss;
        ss << features.keypoints.size() << " keypoints and " << features.descriptors.rows
           << " descriptors are not index-aligned";
        return failure(Status::ExtractionFailed, ss.str());
    }
    if (features.descriptors.rows < 4) return failure(Status::InsufficientFeatures);
    if (map_->empty()) return failure(Status::InsufficientMatches, "map is empty");

    if (features.descriptors.cols != map_->descriptorDim()) {
        std::ostringstream ss;
        ss << "query descriptors have dimension " << features.descriptors.cols
           << ", map has " << map_->descriptorDim();
        return failure(Status::ExtractionFailed, ss.str());
    }

    cv::Mat queryDesc = features.descriptors;
    if (queryDesc.type() != CV_32F) features.descriptors.convertTo(queryDesc, CV_32F);

    const MatchResult matches = matcher_.match(map_->descriptors(), queryDesc, features.keypoints);
    if (!matches.ok()) return failure(matches.status);

    const std::vector<cv::Point3f> pts3d = map_->gather(matches.mapIndices());
    const std::vector<cv::Point2f> pts2d = matches.points2d();

    PoseResult pose = estimator_.estimate(pts3d, pts2d);
    if (!pose.success) return failure(pose.status);

    if (pose.inlier_count < cfg_.min_inliers) {
        std::ostringstream ss;
        ss << pose.inlier_count << " inliers, need " << cfg_.min_inliers;
        return failure(Status::InsufficientInliers, ss.str());
    }

    LocalizationResult r;
    r.status = Status::Ok;
    r.pose = std::move(pose);
    return r;
}

std::vector<LocalizationResult> Localizer::localizeBatch(const std::vector<std::string>& image_paths) const
{
    std::vector<LocalizationResult> out;
    out.reserve(image_paths.size());
    for (const auto& path : image_paths) out.push_back(localize(path));
    return out;
}

MapInfo Localizer::mapInfo() const {
    MapInfo info;
    info.num_points = map_->size();
    info.descriptor_dim = map_->descriptorDim();
    info.bounds = map_->bounds();
    return info;
}

} // namespace loc_core
