#include "loc_core/feature_extractor.hpp"
#include "loc_core/status.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace loc_core {

FeatureExtractor::FeatureExtractor(int n_features, int n_octave_layers,
                                   double contrast_threshold, double edge_threshold, double sigma)
{
    n_features_ = n_features;

    sift_ = cv::SIFT::create(
        n_features_,          // nfeatures (0 = keep all)
        n_octave_layers,      // nOctaveLayers
        contrast_threshold,   // contrastThreshold
        edge_threshold,       // edgeThreshold
        sigma                 // sigma
    );
}

cv::Mat FeatureExtractor::readImage_(const std::string& image_path)
{
    cv::Mat img = cv::imread(image_path, cv::IMREAD_COLOR);
    if (img.empty()) throw ExtractionError("Could not load image: " + image_path);
    return img;
}

FeatureResult FeatureExtractor::extract(const cv::Mat& img_bgr, const cv::Mat& mask) const
{
    if (img_bgr.empty()) throw ExtractionError("Empty image");

    FeatureResult res;
    try {
        // convert to gray
        cv::Mat gray;
        if (img_bgr.channels() == 1) gray = img_bgr;
        else cv::cvtColor(img_bgr, gray, cv::COLOR_BGR2GRAY);

        sift_->detectAndCompute(gray, mask, res.keypoints, res.descriptors);
    } catch (const cv::Exception& e) {
        throw ExtractionError(e.what());
    }

    if (res.keypoints.empty()) {
        res.descriptors.create(0, sift_->descriptorSize(), CV_32F);
    } else if (res.descriptors.type() != CV_32F) {
        res.descriptors.convertTo(res.descriptors, CV_32F);
    }
    return res;
}

FeatureResult FeatureExtractor::extract(const std::string& image_path) const
{
    return extract(readImage_(image_path));
}

FeatureResult FeatureExtractor::resizeAndExtract(const std::string& image_path, cv::Size target) const
{
    cv::Mat img = readImage_(image_path);
    cv::Mat resized;
    try {
        cv::resize(img, resized, target);
    } catch (const cv::Exception& e) {
        throw ExtractionError(e.what());
    }
    return extract(resized);
}

}
