#include "assets.h"
#include "errors.h"

namespace storyforge {

std::vector<std::filesystem::path> asset_candidates(const std::filesystem::path& root,
                                                    const std::string& asset_id) {
    static const char* const subdirs[] = {"sfx", "music", "ambience"};

    std::vector<std::filesystem::path> paths;
    paths.push_back(root / asset_id);
    for (const char* sub : subdirs) {
        paths.push_back(root / sub / asset_id);
    }
    return paths;
}

FilesystemAssetResolver::FilesystemAssetResolver(std::filesystem::path root)
    : root_(std::move(root)) {}

std::filesystem::path FilesystemAssetResolver::resolve(const std::string& asset_id) {
    std::vector<std::string> tried;
    for (const auto& candidate : asset_candidates(root_, asset_id)) {
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
        tried.push_back(candidate.string());
    }
    throw AssetResolutionError(asset_id, tried);
}

} // namespace storyforge
