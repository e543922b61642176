#include "map/map_builder.hpp"
#include "loc_core/status.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>

namespace loc_core {

BuildOutput MapBuilder::build(const std::vector<ReconstructedPoint>& points,
                              const ImageRegistry& registry,
                              const DescriptorTables& tables) const
{
    BuildOutput out;
    BuildStats& st = out.stats;
    st.points_loaded = static_cast<int>(points.size());
    st.images_loaded = static_cast<int>(tables.size());
    st.registry_size = static_cast<int>(registry.size());

    int dim = -1;
    for (const auto& kv : tables) {
        if (kv.second.empty()) continue;
        if (dim < 0) dim = kv.second.cols;
        else if (kv.second.cols != dim) {
            std::ostringstream ss;
            ss << "Descriptor table of " << kv.first << " has dimension " << kv.second.cols
               << ", expected " << dim;
            throw MapIntegrityError(ss.str());
        }
    }

    cv::Mat xyz(0, 3, CV_32F);
    cv::Mat desc(0, std::max(dim, 0), CV_32F);
    xyz.reserve(points.size());
    desc.reserve(points.size());

    for (const auto& pt : points) {
        if (pt.track.empty()) { ++st.dropped_empty_track; continue; }

        const TrackEntry& first = pt.track.front();
        const auto img = registry.find(first.image_id);
        if (img == registry.end()) { ++st.dropped_unknown_image; continue; }

        const auto table = tables.find(img->second.name);
        if (table == tables.end()) { ++st.dropped_missing_descriptors; continue; }

        const cv::Mat& d = table->second;
        if (first.point2d_idx < 0 || first.point2d_idx >= d.rows) { ++st.dropped_bad_keypoint; continue; }

        float p[3] = {static_cast<float>(pt.xyz.x),
                      static_cast<float>(pt.xyz.y),
                      static_cast<float>(pt.xyz.z)};
        xyz.push_back(cv::Mat(1, 3, CV_32F, p));

        cv::Mat row = d.row(first.point2d_idx);
        if (row.type() != CV_32F) row.convertTo(row, CV_32F);
        desc.push_back(row);
    }

    out.store = MapStore(xyz, desc);
    st.map_size = out.store.size();
    return out;
}

BuildOutput MapBuilder::buildFromFiles(const std::string& reconstructionDir,
                                       const std::string& imageDir,
                                       const std::string& descriptorDir) const
{
    namespace fs = std::filesystem;
    const fs::path root(reconstructionDir);

    const auto points = readPoints3D((root / "points3D.txt").string());
    const DescriptorTables tables = loadDescriptorTables(imageDir, descriptorDir);
    const ImageRegistry registry = readImageRegistry((root / "images.txt").string());
    return build(points, registry, tables);
}

} // namespace loc_core
