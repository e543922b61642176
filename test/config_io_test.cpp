#include "loc_core/config_io.hpp"
#include "synthetic_scene.hpp"

#define BOOST_TEST_MODULE config_io

#include <boost/test/unit_test.hpp>

using namespace loc_core;

BOOST_AUTO_TEST_CASE(intrinsics_nestedJson)
{
    const loc_test::TempDir dir("cfg");
    dir.write("intr.json",
              "{\n"
              "  \"camera_intrinsics\": { \"fx\": 500.5, \"fy\": 501, \"cx\": 320, \"cy\": 240.25 }\n"
              "}\n");

    const cv::Mat K = loadIntrinsics(dir.file("intr.json"));
    BOOST_REQUIRE_EQUAL(K.type(), CV_64F);
    BOOST_CHECK_CLOSE(K.at<double>(0,0), 500.5, 1e-9);
    BOOST_CHECK_CLOSE(K.at<double>(1,1), 501.0, 1e-9);
    BOOST_CHECK_CLOSE(K.at<double>(0,2), 320.0, 1e-9);
    BOOST_CHECK_CLOSE(K.at<double>(1,2), 240.25, 1e-9);
    BOOST_CHECK_EQUAL(K.at<double>(2,2), 1.0);
    BOOST_CHECK_EQUAL(K.at<double>(0,1), 0.0);
}

BOOST_AUTO_TEST_CASE(intrinsics_rootLevelYaml)
{
    const loc_test::TempDir dir("cfg");
    dir.write("intr.yml", "%YAML:1.0\n---\nfx: 700.\nfy: 710.\ncx: 300.\ncy: 200.\n");

    const cv::Mat K = loadIntrinsics(dir.file("intr.yml"));
    BOOST_CHECK_CLOSE(K.at<double>(0,0), 700.0, 1e-9);
    BOOST_CHECK_CLOSE(K.at<double>(1,2), 200.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(intrinsics_saveLoad)
{
    const loc_test::TempDir dir("cfg");
    const cv::Mat K = intrinsicsMatrix(612.0, 615.0, 319.5, 239.5);
    saveIntrinsics(dir.file("saved.json"), K);

    const cv::Mat back = loadIntrinsics(dir.file("saved.json"));
    BOOST_CHECK_SMALL(cv::norm(back, K, cv::NORM_INF), 1e-9);
}

BOOST_AUTO_TEST_CASE(intrinsics_failures)
{
    const loc_test::TempDir dir("cfg");
    dir.write("partial.json", "{ \"camera_intrinsics\": { \"fx\": 500, \"fy\": 500, \"cx\": 320 } }\n");
    dir.write("negative.json", "{ \"fx\": -1, \"fy\": 500, \"cx\": 320, \"cy\": 240 }\n");

    BOOST_CHECK_THROW(loadIntrinsics(dir.file("partial.json")), std::runtime_error);
    BOOST_CHECK_THROW(loadIntrinsics(dir.file("negative.json")), std::runtime_error);
    BOOST_CHECK_THROW(loadIntrinsics(dir.file("absent.json")), std::exception);
}

BOOST_AUTO_TEST_CASE(localizerConfig_partialOverrides)
{
    const loc_test::TempDir dir("cfg");
    dir.write("loc.json", "{ \"ratio_threshold\": 0.8, \"min_inliers\": 12, \"refine\": 0 }\n");

    const LocalizerConfig cfg = loadLocalizerConfig(dir.file("loc.json"));
    const LocalizerConfig defaults;
    BOOST_CHECK_CLOSE(cfg.ratio_threshold, 0.8f, 1e-4);
    BOOST_CHECK_EQUAL(cfg.min_inliers, 12);
    BOOST_CHECK(!cfg.refine);
    BOOST_CHECK_EQUAL(cfg.reprojection_error, defaults.reprojection_error);
    BOOST_CHECK_EQUAL(cfg.confidence, defaults.confidence);
    BOOST_CHECK_EQUAL(cfg.ransac_iterations, defaults.ransac_iterations);
}
