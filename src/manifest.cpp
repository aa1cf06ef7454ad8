#include "manifest.h"
#include "errors.h"

#include <fstream>

namespace storyforge {

RenderManifest make_manifest(const RenderResult& result, std::int64_t rendered_at) {
    RenderManifest m;
    m.set_title(result.title);
    m.set_output(result.output.string());
    m.set_duration(result.timeline.duration());
    m.set_utterances(static_cast<std::uint32_t>(result.utterances));
    m.set_rendered_at(rendered_at);

    for (const auto& seg : result.timeline.segments) {
        auto* s = m.add_segments();
        s->set_kind(seg.kind == SegmentKind::NARRATION ? ManifestSegment::NARRATION
                                                       : ManifestSegment::SILENCE);
        s->set_speaker(seg.speaker);
        s->set_start(seg.start);
        s->set_end(seg.end);
    }
    for (const auto& fx : result.timeline.effects) {
        auto* e = m.add_effects();
        e->set_asset_id(fx.asset_id);
        e->set_path(fx.path.string());
        e->set_start(fx.start);
        e->set_delay_ms(delay_ms(fx.start));
    }
    for (const auto& bed : result.beds) {
        auto* b = m.add_beds();
        b->set_role(bed.role);
        b->set_asset_id(bed.asset_id);
        b->set_path(bed.path.string());
        b->set_gain_db(bed.gain_db);
    }
    m.set_filter_graph(result.filter_graph);
    return m;
}

std::filesystem::path manifest_path(const std::filesystem::path& output) {
    auto path = output;
    path.replace_extension(".manifest.pb");
    return path;
}

void write_manifest(const RenderManifest& manifest, const std::filesystem::path& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open() || !manifest.SerializeToOstream(&out)) {
        throw RenderError("cannot write manifest " + path.string());
    }
}

RenderManifest read_manifest(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw RenderError("cannot open manifest " + path.string());
    }
    RenderManifest m;
    if (!m.ParseFromIstream(&in)) {
        throw RenderError("failed to parse manifest " + path.string());
    }
    return m;
}

} // namespace storyforge
