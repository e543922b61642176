#include "loc_core/feature_matcher.hpp"

#include <stdexcept>
#include <unordered_map>

namespace loc_core {

std::vector<int> MatchResult::mapIndices() const {
    std::vector<int> out; out.reserve(correspondences.size());
    for (const auto& c : correspondences) out.push_back(c.map_index);
    return out;
}

std::vector<cv::Point2f> MatchResult::points2d() const {
    std::vector<cv::Point2f> out; out.reserve(correspondences.size());
    for (const auto& c : correspondences) out.push_back(c.point2d);
    return out;
}

FeatureMatcher::FeatureMatcher(const MatchParams& prm) : prm_(prm) {
    if (!(prm_.ratio > 0.f && prm_.ratio <= 1.f)) throw std::invalid_argument("ratio must be in (0, 1]");
}

const MatchParams& FeatureMatcher::params() const { return prm_; }

std::vector<cv::DMatch> FeatureMatcher::ratioCandidates(const cv::Mat& mapDesc, const cv::Mat& queryDesc) const
{
    std::vector<cv::DMatch> out;
    if (mapDesc.empty() || queryDesc.rows < 2) return out;
    if (mapDesc.cols != queryDesc.cols) {
        throw std::invalid_argument("descriptor dimensionality mismatch: map " + std::to_string(mapDesc.cols) +
                                    " vs query " + std::to_string(queryDesc.cols));
    }
    CV_Assert(mapDesc.type() == CV_32F && queryDesc.type() == CV_32F);

    // map rows are the matcher's queries: queryIdx = map index, trainIdx = query keypoint
    std::vector<std::vector<cv::DMatch>> knn;
    cv::BFMatcher(cv::NORM_L2).knnMatch(mapDesc, queryDesc, knn, 2);

    out.reserve(knn.size());
    for (const auto& nn : knn) {
        if (nn.size() < 2) continue;
        // strict: a tie with ratio * second is rejected
        if (nn[0].distance < prm_.ratio * nn[1].distance) out.push_back(nn[0]);
    }
    return out;
}

std::vector<cv::DMatch> FeatureMatcher::dedupByQuery(const std::vector<cv::DMatch>& candidates)
{
    // slot per query index, in order of first appearance
    std::unordered_map<int, size_t> slot;
    std::vector<cv::DMatch> kept;
    for (const auto& m : candidates) {
        auto it = slot.find(m.trainIdx);
        if (it == slot.end()) {
            slot.emplace(m.trainIdx, kept.size());
            kept.push_back(m);
        } else if (m.distance < kept[it->second].distance) {
            kept[it->second] = m;
        }
    }
    return kept;
}

MatchResult FeatureMatcher::match(const cv::Mat& mapDesc,
                                  const cv::Mat& queryDesc,
                                  const std::vector<cv::KeyPoint>& queryKps) const
{
    if (static_cast<int>(queryKps.size()) != queryDesc.rows) {
        throw std::invalid_argument("query keypoints and descriptors are not index-aligned");
    }

    MatchResult res;
    const std::vector<cv::DMatch> kept = dedupByQuery(ratioCandidates(mapDesc, queryDesc));
    if (static_cast<int>(kept.size()) < prm_.minMatches) return res;

    res.correspondences.reserve(kept.size());
    for (const auto& m : kept) {
        res.correspondences.push_back({m.queryIdx, m.trainIdx, queryKps[m.trainIdx].pt, m.distance});
    }
    res.status = Status::Ok;
    return res;
}

}
