#pragma once

#include "tools.h"

#include <filesystem>
#include <string>
#include <vector>

namespace storyforge {

// Search order for an asset id: the bare id under the root, then
// sfx/, music/ and ambience/ below it.
std::vector<std::filesystem::path> asset_candidates(const std::filesystem::path& root,
                                                    const std::string& asset_id);

class FilesystemAssetResolver : public AssetResolver {
public:
    explicit FilesystemAssetResolver(std::filesystem::path root);
    std::filesystem::path resolve(const std::string& asset_id) override;

private:
    std::filesystem::path root_;
};

} // namespace storyforge
