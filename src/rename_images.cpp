#include <loc_core/dataset_utils.hpp>
#include <iostream>
#include <iomanip>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <folder_path> [--execute]\n"
                  << "\nOptions:\n"
                  << "  --execute    Actually perform the renaming (default is dry-run)\n";
        return 1;
    }
    const std::string folder = argv[1];
    bool execute = false;
    for (int i = 2; i < argc; ++i) if (std::string(argv[i]) == "--execute") execute = true;

    std::vector<std::string> images;
    try {
        images = loc_core::listImages(folder);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    if (images.empty()) { std::cout << "No image files found in '" << folder << "'\n"; return 0; }
    std::cout << "Found " << images.size() << " image files\n\n";

    loc_core::RenamePlan plan = loc_core::planSequentialRename(images);
    loc_core::markRenameConflicts(folder, plan);
    if (!plan.conflicts.empty()) {
        std::cout << "WARNING: The following target filenames already exist:\n";
        for (const auto& n : plan.conflicts) std::cout << "  - " << n << "\n";
        std::cout << "\n";
    }

    if (!execute) {
        std::cout << "DRY RUN - No files will be renamed. Preview of changes:\n";
        std::cout << std::string(80, '-') << "\n";
        for (const auto& mv : plan.moves)
            std::cout << std::left << std::setw(50) << mv.first << " -> " << mv.second << "\n";
        std::cout << std::string(80, '-') << "\n";
        std::cout << "\nTotal files to rename: " << plan.moves.size() << "\n";
        std::cout << "\nTo actually rename the files, run with --execute flag\n";
        return 0;
    }

    std::cout << "This will rename all images in the folder. Are you sure? (yes/no): ";
    std::string answer; std::cin >> answer;
    if (answer != "yes") { std::cout << "Aborted.\n"; return 0; }

    try {
        loc_core::applyRename(folder, plan);
    } catch (const std::exception& e) {
        std::cerr << "Rename failed: " << e.what() << "\n";
        return 1;
    }
    std::cout << "Successfully renamed " << plan.moves.size() << " files!\n";
    return 0;
}
