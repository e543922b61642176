#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace loc_core {

// Extensions recognised as images by the dataset tools.
const std::vector<std::string>& imageExtensions();

// Names (not paths) of regular files in dir whose extension, compared
// case-insensitively, is in extensions. Sorted ascending.
std::vector<std::string> listFiles(const std::string& dir, const std::vector<std::string>& extensions);

std::vector<std::string> listImages(const std::string& dir);

struct RenamePlan {
    std::vector<std::pair<std::string, std::string>> moves;  // old -> new
    std::vector<std::string> conflicts;                      // targets that already exist
};

// frame_<idx><ext>, idx from 1 in ascending name order, zero-padded to
// max(4, digits(N)).
RenamePlan planSequentialRename(std::vector<std::string> names);

void markRenameConflicts(const std::string& dir, RenamePlan& plan);

// Renames through temporary names so that overlapping old/new sets are safe.
void applyRename(const std::string& dir, const RenamePlan& plan);

enum class SplitMode : std::uint8_t { EvenlySpaced = 0, Random = 1 };

struct SplitPlan {
    std::vector<std::string> train;
    std::vector<std::string> test;
    std::vector<size_t> test_positions;   // ascending indices into the sorted list
};

// Requires 0 < numTest < names.size(); throws std::invalid_argument otherwise.
SplitPlan planTrainTestSplit(std::vector<std::string> names, size_t numTest,
                             SplitMode mode, std::uint32_t seed = 42);

constexpr const char* kTrainFolder = "large_set_train";
constexpr const char* kTestFolder  = "large_set_test";

void applySplit(const std::string& dir, const SplitPlan& plan);

} // namespace loc_core
