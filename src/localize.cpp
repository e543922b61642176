#include <loc_core/localizer.hpp>
#include <loc_core/config_io.hpp>
#include <map/map_io.hpp>
#include <iostream>
#include <iomanip>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <map.yml.gz> <intrinsics.json> <image>... [--config params.yml]\n";
        return 1;
    }

    std::string configPath;
    std::vector<std::string> images;
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) { configPath = argv[++i]; continue; }
        images.push_back(arg);
    }
    if (images.empty()) { std::cerr << "No query images given.\n"; return 1; }

    std::unique_ptr<loc_core::Localizer> localizer;
    try {
        auto map = std::make_shared<const loc_core::MapStore>(loc_core::loadMap(argv[1]));
        const cv::Mat K = loc_core::loadIntrinsics(argv[2]);
        loc_core::LocalizerConfig cfg;
        if (!configPath.empty()) cfg = loc_core::loadLocalizerConfig(configPath);
        localizer = std::make_unique<loc_core::Localizer>(map, K, cfg);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialise localizer: " << e.what() << "\n";
        return 1;
    }

    const loc_core::MapInfo info = localizer->mapInfo();
    std::cout << "Map: " << info.num_points << " points, descriptor dim " << info.descriptor_dim << "\n";
    std::cout << "Bounds: min " << info.bounds.min << " max " << info.bounds.max << "\n\n";

    const std::vector<loc_core::LocalizationResult> results = localizer->localizeBatch(images);
    int failed = 0;
    for (size_t i = 0; i < images.size(); ++i) {
        const auto& r = results[i];
        if (!r.ok()) {
            std::cout << images[i] << ": FAILED - " << r.message() << "\n";
            ++failed;
            continue;
        }
        const cv::Vec3d& C = r.pose.position;
        std::cout << images[i] << ": position "
                  << std::fixed << std::setprecision(4)
                  << C[0] << " " << C[1] << " " << C[2]
                  << " | Inliers " << r.pose.inlier_count << "/" << r.pose.total_count << "\n";
    }
    return failed == 0 ? 0 : 2;
}
