#pragma once

#include "config.h"
#include "script.h"
#include "tools.h"

#include <filesystem>
#include <string>
#include <vector>

namespace storyforge {

// --- Timeline ---

enum class SegmentKind {
    NARRATION,
    SILENCE,
};

// One piece of the narration bed. Segments are contiguous: each starts
// where the previous one ended.
struct Segment {
    SegmentKind           kind  = SegmentKind::NARRATION;
    std::filesystem::path audio;
    double                start = 0.0;   // seconds from start of bed
    double                end   = 0.0;
    std::string           speaker;       // empty for silence
};

struct EffectPlacement {
    std::string           asset_id;
    std::filesystem::path path;
    double                start = 0.0;   // absolute seconds, never negative
};

// Running clock threaded through the walk.
struct Clock {
    double current_time = 0.0;
    double last_start   = 0.0;   // start of the most recent narration line
    double last_end     = 0.0;   // end of the most recent narration or silence
};

struct Timeline {
    std::vector<Segment>         segments;
    std::vector<EffectPlacement> effects;
    Clock                        clock;

    double duration() const { return clock.current_time; }
};

// --- Clock arithmetic ---

// Narration line of the given duration starts at current_time.
void advance_narration(Clock& clock, double duration);

// Silence moves the clock and last_end but leaves last_start alone.
void advance_silence(Clock& clock, double seconds);

// Time of the anchor. Throws AnchorError for a value outside the enum.
double anchor_time(const Clock& clock, Anchor anchor);

// Anchor time plus offset, clamped to zero.
double place_effect(const Clock& clock, const SoundEffect& sfx);

// --- Builder ---

// Walks the document in order, synthesizing each narration line and
// each pause into segment_dir and scheduling SFX against the clock.
// Any failure propagates immediately; nothing is retried.
class TimelineBuilder {
public:
    TimelineBuilder(const ProducerConfig& cfg, VoiceSynthesizer& voice, AudioProbe& probe,
                    SilenceGenerator& silence, AssetResolver& assets);

    Timeline build(const Document& doc, const std::filesystem::path& segment_dir);

private:
    const ProducerConfig& cfg_;
    VoiceSynthesizer&     voice_;
    AudioProbe&           probe_;
    SilenceGenerator&     silence_;
    AssetResolver&        assets_;
};

} // namespace storyforge
