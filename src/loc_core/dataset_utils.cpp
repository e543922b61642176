#include "loc_core/dataset_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <numeric>
#include <random>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace fs = std::filesystem;

namespace loc_core {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

int numDigits(size_t n) {
    int d = 1;
    while (n >= 10) { n /= 10; ++d; }
    return d;
}

} // namespace

const std::vector<std::string>& imageExtensions() {
    static const std::vector<std::string> exts = {
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".webp"
    };
    return exts;
}

std::vector<std::string> listFiles(const std::string& dir, const std::vector<std::string>& extensions)
{
    if (!fs::is_directory(dir)) throw std::runtime_error("'" + dir + "' is not a directory");

    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        const std::string ext = toLower(entry.path().extension().string());
        if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) continue;
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> listImages(const std::string& dir) {
    return listFiles(dir, imageExtensions());
}

RenamePlan planSequentialRename(std::vector<std::string> names)
{
    std::sort(names.begin(), names.end());
    const int width = std::max(4, numDigits(names.size()));

    RenamePlan plan;
    plan.moves.reserve(names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        std::ostringstream ss;
        ss << "frame_" << std::setw(width) << std::setfill('0') << (i + 1)
           << fs::path(names[i]).extension().string();
        plan.moves.emplace_back(names[i], ss.str());
    }
    return plan;
}

void markRenameConflicts(const std::string& dir, RenamePlan& plan)
{
    plan.conflicts.clear();
    for (const auto& mv : plan.moves) {
        if (mv.first != mv.second && fs::exists(fs::path(dir) / mv.second)) {
            plan.conflicts.push_back(mv.second);
        }
    }
}

void applyRename(const std::string& dir, const RenamePlan& plan)
{
    const fs::path root(dir);
    for (const auto& mv : plan.moves) {
        fs::rename(root / mv.first, root / ("_temp_" + mv.first));
    }
    for (const auto& mv : plan.moves) {
        fs::rename(root / ("_temp_" + mv.first), root / mv.second);
    }
}

SplitPlan planTrainTestSplit(std::vector<std::string> names, size_t numTest,
                             SplitMode mode, std::uint32_t seed)
{
    const size_t total = names.size();
    if (numTest == 0 || numTest >= total) {
        std::ostringstream ss;
        ss << "Number of test images (" << numTest << ") must be in (0, " << total << ")";
        throw std::invalid_argument(ss.str());
    }
    std::sort(names.begin(), names.end());

    SplitPlan plan;
    if (mode == SplitMode::EvenlySpaced) {
        for (size_t i = 0; i < numTest; ++i) plan.test_positions.push_back(i * total / numTest);
    } else {
        std::vector<size_t> order(total);
        std::iota(order.begin(), order.end(), 0);
        std::mt19937 rng(seed);
        std::shuffle(order.begin(), order.end(), rng);
        plan.test_positions.assign(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(numTest));
        std::sort(plan.test_positions.begin(), plan.test_positions.end());
    }

    std::vector<char> isTest(total, 0);
    for (size_t p : plan.test_positions) isTest[p] = 1;
    for (size_t i = 0; i < total; ++i) {
        (isTest[i] ? plan.test : plan.train).push_back(names[i]);
    }
    return plan;
}

void applySplit(const std::string& dir, const SplitPlan& plan)
{
    const fs::path root(dir);
    const fs::path trainDir = root / kTrainFolder;
    const fs::path testDir  = root / kTestFolder;
    fs::create_directories(trainDir);
    fs::create_directories(testDir);

    for (const auto& n : plan.train) fs::rename(root / n, trainDir / n);
    for (const auto& n : plan.test)  fs::rename(root / n, testDir / n);
}

} // namespace loc_core
