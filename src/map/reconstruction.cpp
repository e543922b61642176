#include "map/reconstruction.hpp"
#include "loc_core/dataset_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace loc_core {

namespace {

bool isCommentOrBlank(const std::string& line) {
    const auto first = line.find_first_not_of(" \t\r");
    return first == std::string::npos || line[first] == '#';
}

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string tok;
    while (ss >> tok) fields.push_back(tok);
    return fields;
}

std::ifstream openOrThrow(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw std::runtime_error(path + " not found");
    return f;
}

} // namespace

std::vector<ReconstructedPoint> readPoints3D(const std::string& path)
{
    std::ifstream f = openOrThrow(path);

    std::vector<ReconstructedPoint> points;
    std::string line;
    while (std::getline(f, line)) {
        if (isCommentOrBlank(line)) continue;
        const std::vector<std::string> parts = splitFields(line);
        if (parts.size() < 8) continue;

        ReconstructedPoint pt;
        pt.id = std::stoll(parts[0]);
        pt.xyz = cv::Point3d(std::stod(parts[1]), std::stod(parts[2]), std::stod(parts[3]));
        pt.error = std::stod(parts[7]);

        // a trailing unpaired field is ignored
        for (size_t i = 8; i + 1 < parts.size(); i += 2) {
            pt.track.push_back({std::stoi(parts[i]), std::stoi(parts[i + 1])});
        }
        points.push_back(std::move(pt));
    }
    return points;
}

ImageRegistry readImageRegistry(const std::string& path)
{
    std::ifstream f = openOrThrow(path);

    ImageRegistry registry;
    std::string line;
    while (std::getline(f, line)) {
        if (isCommentOrBlank(line)) continue;
        const std::vector<std::string> parts = splitFields(line);
        if (parts.size() != 10) continue;

        ImageRecord rec;
        rec.id = std::stoi(parts[0]);
        rec.T_c_w.Q = cv::Quatd(std::stod(parts[1]), std::stod(parts[2]),
                                std::stod(parts[3]), std::stod(parts[4])).normalize();
        rec.T_c_w.T = cv::Vec3d(std::stod(parts[5]), std::stod(parts[6]), std::stod(parts[7]));
        rec.camera_id = std::stoi(parts[8]);
        rec.name = parts[9];
        registry[rec.id] = std::move(rec);
    }
    return registry;
}

cv::Mat readDescriptorTable(const std::string& path)
{
    std::ifstream f = openOrThrow(path);

    cv::Mat table;
    std::string line;
    int lineNo = 0;
    std::vector<float> row;
    while (std::getline(f, line)) {
        ++lineNo;
        row.clear();
        std::istringstream ss(line);
        long v;
        while (ss >> v) row.push_back(static_cast<float>(v));
        if (!ss.eof()) {
            throw std::runtime_error(path + ":" + std::to_string(lineNo) + ": non-integer descriptor component");
        }
        if (row.empty()) continue;

        if (!table.empty() && static_cast<int>(row.size()) != table.cols) {
            std::ostringstream msg;
            msg << path << ":" << lineNo << ": descriptor has " << row.size()
                << " components, expected " << table.cols;
            throw std::runtime_error(msg.str());
        }
        table.push_back(cv::Mat(1, static_cast<int>(row.size()), CV_32F, row.data()));
    }
    return table;
}

std::string descriptorSidecarPath(const std::string& descriptorDir, const std::string& imageName)
{
    return (fs::path(descriptorDir) / (imageName + "_desc.txt")).string();
}

DescriptorTables loadDescriptorTables(const std::string& imageDir, const std::string& descriptorDir)
{
    DescriptorTables tables;
    for (const std::string& name : listFiles(imageDir, {".jpg"})) {
        const std::string descPath = descriptorSidecarPath(descriptorDir, name);
        if (!fs::exists(descPath)) {
            std::cerr << "Warning: Missing descriptor for " << name << "\n";
            continue;
        }
        tables[name] = readDescriptorTable(descPath);
    }
    return tables;
}

std::map<std::string, cv::Vec3d> readGroundTruthCenters(const std::string& imagesTxt)
{
    std::map<std::string, cv::Vec3d> centers;
    for (const auto& kv : readImageRegistry(imagesTxt)) {
        centers[kv.second.name] = kv.second.T_c_w.center();
    }
    return centers;
}

} // namespace loc_core
