#pragma once

#include <filesystem>
#include <string>

namespace storyforge {

// Per-render scratch directory, removed when the object goes out of
// scope on every exit path.
class ScopedWorkdir {
public:
    // Creates a fresh "storyforge-XXXXXX" directory under root (or the
    // system temp directory when root is empty). path() is always
    // absolute. Throws RenderError when the directory cannot be made.
    explicit ScopedWorkdir(const std::filesystem::path& root = {});
    ~ScopedWorkdir();

    ScopedWorkdir(const ScopedWorkdir&) = delete;
    ScopedWorkdir& operator=(const ScopedWorkdir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Replaces every character that is not alphanumeric, '-' or '_' with '_'.
std::string sanitize_name(const std::string& name);

// Moves a finished file into place, copying when a rename across
// filesystems is not possible. Overwrites an existing target. A failed
// copy leaves nothing at the target path.
void move_file(const std::filesystem::path& from, const std::filesystem::path& to);

} // namespace storyforge
