#pragma once

#include "config.h"
#include "script.h"
#include "timeline.h"

#include <filesystem>
#include <string>
#include <vector>

namespace storyforge {

// Looped background track (music or ambience) trimmed to the narration.
struct BedTrack {
    std::string           role;       // "music" or "ambience"; also the graph label
    std::string           asset_id;
    std::filesystem::path path;
    double                gain_db = 0.0;
};

struct MixInput {
    std::vector<std::string> options;   // demuxer options placed before -i
    std::filesystem::path    path;
};

// Everything the mixing engine needs for the single mixing call.
struct MixPlan {
    std::vector<MixInput>              inputs;          // input 0 is the narration manifest
    std::vector<std::string>           filters;
    std::string                        output_label = "mix";
    std::filesystem::path              concat_manifest;
    std::vector<std::filesystem::path> concat_entries;  // narration segments in order
    std::string                        codec;
    std::string                        bitrate;
    std::filesystem::path              output;
    double                             duration = 0.0;

    // Filters joined into one -filter_complex argument
    std::string filter_graph() const;
};

// Shortest decimal form, e.g. 2.5, -18, 0.125
std::string format_number(double v);

// Seconds to an integer millisecond delay (truncating)
long long delay_ms(double seconds);

// Contents of an ffmpeg concat-demuxer list for the given files
std::string concat_manifest_text(const std::vector<std::filesystem::path>& files);

// Sanitized @title (fallback "story") plus the configured extension
// @title, or "story" when the directive is absent or empty.
std::string story_title(const Document& doc);

std::string output_filename(const Document& doc, const ProducerConfig& cfg);

// Compiles the finished timeline into one mixing invocation. The
// concat manifest lives in workdir; the artifact goes to output.
MixPlan compile_mix(const Timeline& tl, const std::vector<BedTrack>& beds, const ProducerConfig& cfg,
                    const std::filesystem::path& workdir, const std::filesystem::path& output);

} // namespace storyforge
