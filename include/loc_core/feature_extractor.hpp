#pragma once
#include <opencv2/core.hpp>
#include <opencv2/features2d.hpp>
#include <string>
#include <vector>

namespace loc_core {

struct FeatureResult {

    // Keypoints in image pixel coordinates, index-aligned with descriptors
    std::vector<cv::KeyPoint> keypoints;

    // SIFT descriptors (Nx128) (float32)
    cv::Mat descriptors;

    int size() const { return static_cast<int>(keypoints.size()); }
};

// SIFT keypoints and descriptors for query images. Any read or decode failure
// is raised as ExtractionError.
class FeatureExtractor {
public:
    explicit FeatureExtractor(int n_features = 0, int n_octave_layers = 3,
                              double contrast_threshold = 0.04, double edge_threshold = 10.0,
                              double sigma = 1.6);

    FeatureResult extract(const cv::Mat& img_bgr, const cv::Mat& mask = cv::Mat()) const;
    FeatureResult extract(const std::string& image_path) const;

    // Resizes to target before extraction; keypoints are in resized pixels.
    FeatureResult resizeAndExtract(const std::string& image_path, cv::Size target = cv::Size(640, 480)) const;

    int nFeatures() const { return n_features_; }

private:
    int n_features_;
    cv::Ptr<cv::SIFT> sift_;

    static cv::Mat readImage_(const std::string& image_path);
};

}
