#include "map/map_io.hpp"
#include "loc_core/status.hpp"

#include <stdexcept>

namespace loc_core {

void saveMap(const std::string& path, const MapStore& store)
{
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if (!fs.isOpened()) throw std::runtime_error("Failed to open map for writing: " + path);

    fs << kXyzNode << store.xyz();
    fs << kDescriptorNode << store.descriptors();
    fs.release();
}

MapStore loadMap(const std::string& path)
{
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) throw std::runtime_error("Failed to open map: " + path);

    const cv::FileNode xyzNode = fs[kXyzNode];
    const cv::FileNode descNode = fs[kDescriptorNode];
    if (xyzNode.empty() || descNode.empty()) {
        throw std::runtime_error("Map " + path + " must contain '" + kXyzNode +
                                 "' and '" + kDescriptorNode + "'");
    }

    cv::Mat xyz, desc;
    xyzNode >> xyz;
    descNode >> desc;
    return MapStore(xyz, desc);
}

} // namespace loc_core
