#include <map/map_builder.hpp>
#include <map/map_io.hpp>
#include <loc_core/status.hpp>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 5) {
        std::cerr << "Usage: " << argv[0]
                  << " <reconstruction_dir> <train_image_dir> <descriptor_dir> <out_map.yml.gz>\n"
                  << "\n  reconstruction_dir must contain points3D.txt and images.txt\n";
        return 1;
    }
    const std::string reconDir = argv[1];
    const std::string imageDir = argv[2];
    const std::string descDir  = argv[3];
    const std::string outPath  = argv[4];

    loc_core::BuildOutput built;
    try {
        loc_core::MapBuilder builder;
        built = builder.buildFromFiles(reconDir, imageDir, descDir);
    } catch (const std::exception& e) {
        std::cerr << "Map construction failed: " << e.what() << "\n";
        return 1;
    }

    const loc_core::BuildStats& st = built.stats;
    std::cout << "Loaded " << st.points_loaded << " 3D points\n";
    std::cout << "Loaded " << st.images_loaded << " images\n";
    std::cout << "Loaded " << st.registry_size << " image mappings\n";
    std::cout << "Dropped: " << st.dropped_empty_track << " empty track, "
              << st.dropped_unknown_image << " unknown image, "
              << st.dropped_missing_descriptors << " missing descriptors, "
              << st.dropped_bad_keypoint << " keypoint out of range\n";
    std::cout << "\nBuilt map with " << st.map_size << " points\n";
    std::cout << "3D points shape: (" << built.store.size() << ", 3)\n";
    std::cout << "Descriptors shape: (" << built.store.size() << ", " << built.store.descriptorDim() << ")\n";

    try {
        loc_core::saveMap(outPath, built.store);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "Saved map to " << outPath << "\n";
    return 0;
}
