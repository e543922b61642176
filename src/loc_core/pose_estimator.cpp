#include "loc_core/pose_estimator.hpp"

#include <opencv2/calib3d.hpp>
#include <cmath>
#include <stdexcept>

namespace loc_core {

PoseEstimator::PoseEstimator(const cv::Mat& K, const PnpParams& prm) : prm_(prm) {
    if (K.empty() || K.rows != 3 || K.cols != 3) throw std::invalid_argument("K must be 3x3.");
    if (K.type() == CV_64F) K_ = K.clone(); else K.convertTo(K_, CV_64F);
    dist_ = cv::Mat::zeros(5, 1, CV_64F);

    if (prm_.reprojection_error <= 0.0) throw std::invalid_argument("reprojection_error must be positive.");
    if (prm_.confidence <= 0.0 || prm_.confidence >= 1.0) throw std::invalid_argument("confidence must be in (0, 1).");
    if (prm_.iterations <= 0) throw std::invalid_argument("iterations must be positive.");
}

PoseResult PoseEstimator::estimate(const std::vector<cv::Point3f>& pts3d,
                                   const std::vector<cv::Point2f>& pts2d) const {
    PoseResult res;
    res.total_count = static_cast<int>(pts3d.size());
    if (pts3d.size() < 4 || pts2d.size() < 4 || pts3d.size() != pts2d.size()) return res;

    cv::Mat rvec, tvec;
    std::vector<int> inliers;

    bool ok = false;
    try {
        ok = cv::solvePnPRansac(
            pts3d, pts2d, K_, dist_, rvec, tvec,
            false, prm_.iterations, static_cast<float>(prm_.reprojection_error), prm_.confidence, inliers,
            cv::SOLVEPNP_ITERATIVE
        );
    } catch (const cv::Exception&) {
        // degenerate configurations make the minimal solvers throw
        ok = false;
    }

    if (!ok || inliers.empty()) {
        res.status = Status::NoConsensus;
        return res;
    }

    if (prm_.refine && inliers.size() >= 4) {
        std::vector<cv::Point3f> P; P.reserve(inliers.size());
        std::vector<cv::Point2f> p; p.reserve(inliers.size());
        for (int idx : inliers) { P.push_back(pts3d[idx]); p.push_back(pts2d[idx]); }
        cv::solvePnPRefineLM(P, p, K_, dist_, rvec, tvec);
    }

    cv::Mat R;
    cv::Rodrigues(rvec, R);

    res.success = true;
    res.status = Status::Ok;
    res.rvec = rvec;
    res.R = cv::Matx33d(R);
    res.t = cv::Vec3d(tvec.at<double>(0), tvec.at<double>(1), tvec.at<double>(2));
    res.position = -(res.R.t() * res.t);
    res.inliers = std::move(inliers);
    res.inlier_count = static_cast<int>(res.inliers.size());
    return res;
}

std::vector<double> PoseEstimator::reprojectionErrors(const PoseResult& pose,
                                                      const std::vector<cv::Point3f>& pts3d,
                                                      const std::vector<cv::Point2f>& pts2d) const {
    CV_Assert(pose.success && pts3d.size() == pts2d.size());
    std::vector<double> errs;
    if (pts3d.empty()) return errs;

    std::vector<cv::Point2f> proj;
    cv::projectPoints(pts3d, pose.rvec, cv::Mat(pose.t), K_, dist_, proj);
    errs.reserve(proj.size());
    for (size_t i = 0; i < proj.size(); ++i) {
        const cv::Point2f d = proj[i] - pts2d[i];
        errs.push_back(std::sqrt(static_cast<double>(d.x) * d.x + static_cast<double>(d.y) * d.y));
    }
    return errs;
}

}
