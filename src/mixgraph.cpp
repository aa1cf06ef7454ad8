#include "mixgraph.h"
#include "workdir.h"

#include <cstdio>
#include <sstream>

namespace storyforge {

// aloop needs a finite buffer size; this is ffmpeg's documented maximum.
static const char* const kLoopSize = "2e+09";

std::string MixPlan::filter_graph() const {
    std::string graph;
    for (const auto& f : filters) {
        if (!graph.empty()) graph += ';';
        graph += f;
    }
    return graph;
}

std::string format_number(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f", v);
    std::string s = buf;
    s.erase(s.find_last_not_of('0') + 1);
    if (s.back() == '.') s.pop_back();
    if (s == "-0") s = "0";
    return s;
}

long long delay_ms(double seconds) {
    return static_cast<long long>(seconds * 1000.0);
}

std::string concat_manifest_text(const std::vector<std::filesystem::path>& files) {
    std::string out;
    for (const auto& file : files) {
        out += "file '";
        for (char c : file.string()) {
            if (c == '\'') {
                out += "'\\''";
            } else {
                out += c;
            }
        }
        out += "'\n";
    }
    return out;
}

std::string story_title(const Document& doc) {
    auto title = get_directive(doc, "title");
    if (!title || title->empty()) return "story";
    return *title;
}

std::string output_filename(const Document& doc, const ProducerConfig& cfg) {
    return sanitize_name(story_title(doc)) + "." + cfg.extension;
}

MixPlan compile_mix(const Timeline& tl, const std::vector<BedTrack>& beds, const ProducerConfig& cfg,
                    const std::filesystem::path& workdir, const std::filesystem::path& output) {
    MixPlan plan;
    plan.codec    = cfg.codec;
    plan.bitrate  = cfg.bitrate;
    plan.output   = output;
    plan.duration = tl.duration();

    // Input 0: the narration bed, concatenated by the demuxer in order
    plan.concat_manifest = workdir / "concat.txt";
    for (const auto& seg : tl.segments) {
        // The concat demuxer resolves relative entries against the manifest's directory
        plan.concat_entries.push_back(std::filesystem::absolute(seg.audio));
    }
    plan.inputs.push_back(MixInput{{"-f", "concat", "-safe", "0"}, plan.concat_manifest});

    std::vector<std::string> mix_labels;

    plan.filters.push_back("[0:a]volume=" + format_number(cfg.levels.narration_db) + "dB[narr]");
    mix_labels.push_back("[narr]");

    const std::string total = format_number(tl.duration());
    for (const auto& bed : beds) {
        size_t idx = plan.inputs.size();
        plan.inputs.push_back(MixInput{{}, bed.path});
        plan.filters.push_back("[" + std::to_string(idx) + ":a]aloop=loop=-1:size=" + kLoopSize +
                               ",volume=" + format_number(bed.gain_db) + "dB" +
                               ",atrim=0:" + total + "[" + bed.role + "]");
        mix_labels.push_back("[" + bed.role + "]");
    }

    // SFX play at source level; the delay applies to every channel
    int sfx_n = 0;
    for (const auto& fx : tl.effects) {
        size_t idx = plan.inputs.size();
        plan.inputs.push_back(MixInput{{}, fx.path});
        std::string label = "sfx" + std::to_string(++sfx_n);
        plan.filters.push_back("[" + std::to_string(idx) + ":a]adelay=delays=" +
                               std::to_string(delay_ms(fx.start)) + ":all=1[" + label + "]");
        mix_labels.push_back("[" + label + "]");
    }

    std::string sum;
    for (const auto& label : mix_labels) sum += label;
    sum += "amix=inputs=" + std::to_string(mix_labels.size()) + ":normalize=0[" + plan.output_label + "]";
    plan.filters.push_back(sum);

    return plan;
}

} // namespace storyforge
