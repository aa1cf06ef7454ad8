#pragma once

#include "renderer.h"
#include "storyforge.pb.h"

#include <cstdint>
#include <filesystem>

namespace storyforge {

RenderManifest make_manifest(const RenderResult& result, std::int64_t rendered_at);

// <output stem>.manifest.pb beside the artifact
std::filesystem::path manifest_path(const std::filesystem::path& output);

// Throws RenderError on I/O or parse failure
void write_manifest(const RenderManifest& manifest, const std::filesystem::path& path);
RenderManifest read_manifest(const std::filesystem::path& path);

} // namespace storyforge
