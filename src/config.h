#pragma once

#include "generator.h"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace storyforge {

// Per-track gains in dB. The final sum is not normalized, so these
// alone decide the balance.
struct MixLevels {
    double narration_db = 0.0;
    double music_db     = -18.0;
    double ambience_db  = -22.0;
};

struct ProducerConfig {
    // paths
    std::filesystem::path assets_dir = "assets";
    std::filesystem::path out_dir    = "out";
    std::filesystem::path work_root;             // empty = system temp directory

    // speaker -> reference voice sample
    std::map<std::string, std::filesystem::path> speaker_refs;

    // mix
    MixLevels   levels;
    std::string codec     = "libmp3lame";
    std::string bitrate   = "160k";
    std::string extension = "mp3";

    // tools
    std::string ffmpeg          = "ffmpeg";
    std::string voicegen        = "tools/voicegen_xtts.sh";
    std::string voicegen_device = "cuda";

    // silence segments
    int         silence_sample_rate = 48000;
    std::string silence_layout      = "mono";

    // duration probe
    int probe_sample_rate = 44100;

    std::string language       = "en"; // used when the script has no @lang
    bool        write_manifest = false;
};

enum class Command {
    RENDER,
    GENERATE,
};

struct Config {
    Command        command = Command::RENDER;
    std::string    story_file;            // render input
    std::string    output_file;           // generate output, empty = stdout
    ProducerConfig producer;
    StoryGenConfig story;
};

// Parses SPEAKER=PATH items. Throws ConfigurationError on a missing '='.
std::map<std::string, std::filesystem::path> parse_speaker_refs(const std::vector<std::string>& items);

// Applies YAML text on top of cfg. Throws ConfigurationError on bad YAML.
void load_yaml_text(ProducerConfig& cfg, const std::string& text);

// Applies a YAML file on top of cfg. Returns false if it cannot be opened.
bool load_yaml_file(ProducerConfig& cfg, const std::string& path);

// Load config: YAML file first, then CLI args override.
// Returns true on success, false on error (e.g. --help requested).
bool load_config(Config& cfg, int argc, char* argv[]);

} // namespace storyforge
