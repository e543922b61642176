#include "loc_core/feature_matcher.hpp"
#include "synthetic_scene.hpp"

#define BOOST_TEST_MODULE featureMatcher

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <limits>

using namespace loc_core;

namespace {

cv::Mat rows1d(const std::vector<float>& values) {
    cv::Mat m(static_cast<int>(values.size()), 1, CV_32F);
    for (size_t i = 0; i < values.size(); ++i) m.at<float>(static_cast<int>(i), 0) = values[i];
    return m;
}

std::vector<cv::KeyPoint> gridKeypoints(int n) {
    std::vector<cv::KeyPoint> kps;
    for (int i = 0; i < n; ++i) kps.emplace_back(cv::Point2f(10.f * i, 5.f * i), 1.f);
    return kps;
}

} // namespace

BOOST_AUTO_TEST_CASE(featureMatcher_ratioBoundaryIsStrict)
{
    const FeatureMatcher matcher;   // ratio 0.75
    // map descriptor 0 sees query neighbours at distances 3 and 4: 3 == 0.75 * 4
    const cv::Mat mapDesc = rows1d({0.f});
    const cv::Mat queryDesc = rows1d({3.f, -4.f});
    BOOST_CHECK(matcher.ratioCandidates(mapDesc, queryDesc).empty());

    // 2.9 < 3 is accepted
    const std::vector<cv::DMatch> c = matcher.ratioCandidates(mapDesc, rows1d({2.9f, -4.f}));
    BOOST_REQUIRE_EQUAL(c.size(), 1u);
    BOOST_CHECK_EQUAL(c[0].queryIdx, 0);
    BOOST_CHECK_EQUAL(c[0].trainIdx, 0);
    BOOST_CHECK_CLOSE(c[0].distance, 2.9f, 1e-4);
}

BOOST_AUTO_TEST_CASE(featureMatcher_singleQueryDescriptorNeverPasses)
{
    const FeatureMatcher matcher;
    BOOST_CHECK(matcher.ratioCandidates(rows1d({0.f, 1.f}), rows1d({0.f})).empty());
}

BOOST_AUTO_TEST_CASE(featureMatcher_dedupKeepsSmallestDistancePerQuery)
{
    const std::vector<cv::DMatch> candidates = {
        cv::DMatch(0, 5, 3.f),
        cv::DMatch(1, 2, 1.f),
        cv::DMatch(2, 5, 1.5f),
        cv::DMatch(3, 5, 2.f),
        cv::DMatch(4, 2, 1.f),   // tie: the earlier one stays
    };
    const std::vector<cv::DMatch> kept = FeatureMatcher::dedupByQuery(candidates);

    BOOST_REQUIRE_EQUAL(kept.size(), 2u);
    // ordered by first appearance of the query index
    BOOST_CHECK_EQUAL(kept[0].trainIdx, 5);
    BOOST_CHECK_EQUAL(kept[0].queryIdx, 2);
    BOOST_CHECK_EQUAL(kept[1].trainIdx, 2);
    BOOST_CHECK_EQUAL(kept[1].queryIdx, 1);
}

BOOST_AUTO_TEST_CASE(featureMatcher_identicalDescriptorsMatchOneToOne)
{
    const int n = 30;
    const cv::Mat mapDesc = loc_test::randomDescriptors(n);

    // query holds the same descriptors in reverse order
    cv::Mat queryDesc;
    cv::flip(mapDesc, queryDesc, 0);
    const std::vector<cv::KeyPoint> kps = gridKeypoints(n);

    const MatchResult res = FeatureMatcher().match(mapDesc, queryDesc, kps);
    BOOST_REQUIRE(res.ok());
    BOOST_REQUIRE_EQUAL(res.correspondences.size(), static_cast<size_t>(n));
    for (const auto& c : res.correspondences) {
        BOOST_CHECK_EQUAL(c.query_index, n - 1 - c.map_index);
        BOOST_CHECK(c.point2d == kps[c.query_index].pt);
        BOOST_CHECK_SMALL(c.distance, 1e-6f);
    }
}

BOOST_AUTO_TEST_CASE(featureMatcher_duplicateMapPointsCollapseOnQueryKeypoint)
{
    const cv::Mat base = loc_test::randomDescriptors(6);
    // map rows 6 and 7 repeat rows 0 and 1
    cv::Mat mapDesc = base.clone();
    mapDesc.push_back(base.row(0));
    mapDesc.push_back(base.row(1));

    const MatchResult res = FeatureMatcher().match(mapDesc, base, gridKeypoints(6));
    BOOST_REQUIRE(res.ok());
    BOOST_CHECK_EQUAL(res.correspondences.size(), 6u);

    std::vector<int> seen(6, 0);
    for (const auto& c : res.correspondences) {
        ++seen[c.query_index];
        BOOST_CHECK(c.map_index < 6);   // first proposal wins the tie
    }
    for (int s : seen) BOOST_CHECK_EQUAL(s, 1);
}

BOOST_AUTO_TEST_CASE(featureMatcher_fewerThanFourIsAllOrNothing)
{
    const cv::Mat desc = loc_test::randomDescriptors(3);
    const MatchResult res = FeatureMatcher().match(desc, desc, gridKeypoints(3));
    BOOST_CHECK(!res.ok());
    BOOST_CHECK(res.status == Status::InsufficientMatches);
    BOOST_CHECK(res.correspondences.empty());
}

BOOST_AUTO_TEST_CASE(featureMatcher_dimensionMismatchThrows)
{
    const cv::Mat mapDesc = loc_test::randomDescriptors(5, 128);
    const cv::Mat queryDesc = loc_test::randomDescriptors(5, 64);
    BOOST_CHECK_THROW(FeatureMatcher().match(mapDesc, queryDesc, gridKeypoints(5)), std::invalid_argument);
    BOOST_CHECK_THROW(FeatureMatcher().match(mapDesc, mapDesc, gridKeypoints(4)), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(featureMatcher_candidatesAreNearestQueryDescriptors)
{
    const cv::Mat mapDesc = loc_test::randomDescriptors(200, 128, 3);

    // query rows are perturbed copies of every fourth map row
    cv::Mat queryDesc;
    cv::RNG rng(11);
    for (int i = 0; i < 200; i += 4) {
        cv::Mat noise(1, 128, CV_32F);
        rng.fill(noise, cv::RNG::UNIFORM, -2.0, 2.0);
        queryDesc.push_back(cv::Mat(mapDesc.row(i) + noise));
    }

    const std::vector<cv::DMatch> c = FeatureMatcher().ratioCandidates(mapDesc, queryDesc);
    BOOST_REQUIRE_GE(c.size(), 50u);
    for (size_t k = 1; k < c.size(); ++k) BOOST_CHECK_LT(c[k - 1].queryIdx, c[k].queryIdx);

    int exact = 0;
    for (const auto& m : c) {
        double best = std::numeric_limits<double>::max();
        for (int j = 0; j < queryDesc.rows; ++j) {
            best = std::min(best, cv::norm(mapDesc.row(m.queryIdx), queryDesc.row(j), cv::NORM_L2));
        }
        BOOST_CHECK_CLOSE(static_cast<double>(m.distance), best, 1e-3);
        if (m.queryIdx % 4 == 0 && m.trainIdx == m.queryIdx / 4) ++exact;
    }
    BOOST_CHECK_EQUAL(exact, 50);
}
