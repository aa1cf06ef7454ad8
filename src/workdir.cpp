#include "workdir.h"
#include "errors.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

namespace storyforge {

ScopedWorkdir::ScopedWorkdir(const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::path base = root.empty() ? std::filesystem::temp_directory_path(ec) : root;
    if (!ec) {
        std::filesystem::create_directories(base, ec);
    }
    if (!ec) {
        base = std::filesystem::absolute(base, ec);
    }
    if (ec) {
        throw RenderError("cannot prepare working directory root " + base.string() + ": " + ec.message());
    }

    std::string pattern = (base / "storyforge-XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        throw RenderError("cannot create working directory under " + base.string() + ": " +
                          std::strerror(errno));
    }
    path_ = buf.data();
}

ScopedWorkdir::~ScopedWorkdir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        std::cerr << "Warning: could not remove " << path_ << ": " << ec.message() << "\n";
    }
}

std::string sanitize_name(const std::string& name) {
    std::string out = name;
    for (auto& c : out) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            c = '_';
        }
    }
    return out;
}

void move_file(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec) return;

    // EXDEV and friends: copy beside the target, then rename into place
    auto part = to;
    part += ".part";
    try {
        std::filesystem::copy_file(from, part, std::filesystem::copy_options::overwrite_existing);
        std::filesystem::rename(part, to);
    } catch (const std::filesystem::filesystem_error&) {
        std::filesystem::remove(part, ec);
        throw;
    }
    std::filesystem::remove(from, ec);
}

} // namespace storyforge
