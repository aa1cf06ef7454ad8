#include "timeline.h"
#include "errors.h"
#include "workdir.h"

#include <algorithm>
#include <cstdio>
#include <iostream>

namespace storyforge {

// --- Clock arithmetic ---

void advance_narration(Clock& clock, double duration) {
    clock.last_start = clock.current_time;
    clock.current_time += duration;
    clock.last_end = clock.current_time;
}

void advance_silence(Clock& clock, double seconds) {
    clock.current_time += seconds;
    clock.last_end = clock.current_time;
}

double anchor_time(const Clock& clock, Anchor anchor) {
    switch (anchor) {
        case Anchor::NOW:        return clock.current_time;
        case Anchor::LAST_START: return clock.last_start;
        case Anchor::LAST_END:   return clock.last_end;
    }
    throw AnchorError(0, std::to_string(static_cast<int>(anchor)));
}

double place_effect(const Clock& clock, const SoundEffect& sfx) {
    return std::max(0.0, anchor_time(clock, sfx.anchor) + sfx.offset_seconds);
}

// --- Helpers ---

static std::string segment_name(const char* prefix, int index, const std::string& suffix) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s_%04d", prefix, index);
    std::string name = buf;
    if (!suffix.empty()) name += "_" + sanitize_name(suffix);
    return name + ".wav";
}

static std::string script_language(const Document& doc, const ProducerConfig& cfg) {
    if (auto lang = get_directive(doc, "lang")) return *lang;
    if (auto lang = get_directive(doc, "language")) return *lang;
    return cfg.language;
}

// --- Builder ---

TimelineBuilder::TimelineBuilder(const ProducerConfig& cfg, VoiceSynthesizer& voice, AudioProbe& probe,
                                 SilenceGenerator& silence, AssetResolver& assets)
    : cfg_(cfg)
    , voice_(voice)
    , probe_(probe)
    , silence_(silence)
    , assets_(assets) {}

Timeline TimelineBuilder::build(const Document& doc, const std::filesystem::path& segment_dir) {
    const size_t total_lines = count_utterances(doc);
    if (total_lines == 0) {
        throw EmptyDocumentError();
    }

    const std::string language = script_language(doc, cfg_);

    Timeline tl;
    Clock& clock = tl.clock;
    int seg_idx = 0;
    size_t line_idx = 0;

    for (const auto& event : doc) {
        if (const auto* u = std::get_if<Utterance>(&event)) {
            auto ref = cfg_.speaker_refs.find(u->speaker);
            if (ref == cfg_.speaker_refs.end()) {
                throw ConfigurationError("no reference configured for speaker '" + u->speaker +
                                         "'; provide --ref " + u->speaker + "=/path/to/ref.wav");
            }

            ++seg_idx;
            ++line_idx;
            Segment seg;
            seg.kind    = SegmentKind::NARRATION;
            seg.speaker = u->speaker;
            seg.audio   = segment_dir / segment_name("seg", seg_idx, u->speaker);

            std::cout << "  Synthesizing line " << line_idx << "/" << total_lines
                      << " (" << u->speaker << ")..." << std::endl;
            voice_.synthesize(SpeechRequest{ref->second, u->text, language, seg.audio});
            double duration = probe_.duration(seg.audio);

            seg.start = clock.current_time;
            advance_narration(clock, duration);
            seg.end = clock.current_time;
            tl.segments.push_back(seg);
        } else if (const auto* p = std::get_if<Pause>(&event)) {
            ++seg_idx;
            Segment seg;
            seg.kind  = SegmentKind::SILENCE;
            seg.audio = segment_dir / segment_name("sil", seg_idx, "");

            silence_.generate(p->seconds, cfg_.silence_sample_rate, cfg_.silence_layout, seg.audio);

            seg.start = clock.current_time;
            advance_silence(clock, p->seconds);
            seg.end = clock.current_time;
            tl.segments.push_back(seg);
        } else if (const auto* sfx = std::get_if<SoundEffect>(&event)) {
            // Overlay only: the clock is read, never moved.
            EffectPlacement placement;
            placement.asset_id = sfx->asset_id;
            placement.start    = place_effect(clock, *sfx);
            placement.path     = assets_.resolve(sfx->asset_id);
            tl.effects.push_back(placement);
        }
        // Directives are document-level and read before the walk.
    }

    std::cout << "  Timeline: " << tl.segments.size() << " segments, "
              << tl.effects.size() << " effects over " << tl.duration() << "s" << std::endl;
    return tl;
}

} // namespace storyforge
