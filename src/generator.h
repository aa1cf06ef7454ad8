#pragma once

#include <cstdint>
#include <string>

namespace storyforge {

struct StoryGenConfig {
    std::string   title    = "Bedtime Story";
    std::uint32_t seed     = 0;
    std::string   narrator = "Ruby";
    std::string   music_asset;      // empty = no @music line
    std::string   ambience_asset;   // empty = no @ambience line
};

// Deterministic bedtime-story script: intro, three beats with SFX cues,
// gentle outro. Same config and seed always yield the same text.
std::string generate_script(const StoryGenConfig& cfg);

} // namespace storyforge
