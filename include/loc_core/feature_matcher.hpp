#pragma once
#include <opencv2/core.hpp>
#include <opencv2/features2d.hpp>
#include <vector>

#include "loc_core/status.hpp"

namespace loc_core {

struct MatchParams {
    float ratio = 0.75f;        // Lowe ratio: accept iff d1 < ratio * d2
    int   minMatches = 4;
};

struct Correspondence {
    int map_index{-1};
    int query_index{-1};
    cv::Point2f point2d;
    float distance{0.f};
};

struct MatchResult {
    Status status{Status::InsufficientMatches};
    std::vector<Correspondence> correspondences;

    bool ok() const { return status == Status::Ok; }
    std::vector<int> mapIndices() const;
    std::vector<cv::Point2f> points2d() const;
};

// Map-to-query matching. Every map descriptor proposes its nearest query
// descriptor; a query keypoint keeps only its closest proposal. The same map
// point may therefore end up matched to several query keypoints.
class FeatureMatcher {
public:
    explicit FeatureMatcher(const MatchParams& prm = MatchParams());
    const MatchParams& params() const;

    MatchResult match(const cv::Mat& mapDesc,
                      const cv::Mat& queryDesc,
                      const std::vector<cv::KeyPoint>& queryKps) const;

    // Ratio-test survivors before per-keypoint deduplication, in map order.
    std::vector<cv::DMatch> ratioCandidates(const cv::Mat& mapDesc, const cv::Mat& queryDesc) const;

    static std::vector<cv::DMatch> dedupByQuery(const std::vector<cv::DMatch>& candidates);

private:
    MatchParams prm_;
};

}
