#pragma once

#include <filesystem>
#include <string>

namespace storyforge {

struct MixPlan;

// Narrow seams around every external collaborator of a render. The
// production adapters shell out or call into essentia; tests plug in
// deterministic fakes.

struct SpeechRequest {
    std::filesystem::path voice_reference;
    std::string           text;
    std::string           language;
    std::filesystem::path output;    // audio file to create
};

class VoiceSynthesizer {
public:
    virtual ~VoiceSynthesizer() = default;
    virtual void synthesize(const SpeechRequest& request) = 0;
};

class AudioProbe {
public:
    virtual ~AudioProbe() = default;
    // Duration in seconds. Throws ExternalToolFailure, never returns 0 as a fallback.
    virtual double duration(const std::filesystem::path& audio) = 0;
};

class SilenceGenerator {
public:
    virtual ~SilenceGenerator() = default;
    virtual void generate(double seconds, int sample_rate, const std::string& channel_layout,
                          const std::filesystem::path& output) = 0;
};

class AssetResolver {
public:
    virtual ~AssetResolver() = default;
    // Throws AssetResolutionError naming every path tried.
    virtual std::filesystem::path resolve(const std::string& asset_id) = 0;
};

class MixingEngine {
public:
    virtual ~MixingEngine() = default;
    // One invocation per render; writes plan.output.
    virtual void mix(const MixPlan& plan) = 0;
};

// Everything a render talks to. Not owned.
struct Toolchain {
    VoiceSynthesizer& voice;
    AudioProbe&       probe;
    SilenceGenerator& silence;
    AssetResolver&    assets;
    MixingEngine&     mixer;
};

} // namespace storyforge
