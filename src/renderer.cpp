#include "renderer.h"
#include "errors.h"
#include "workdir.h"

#include <iostream>

namespace storyforge {

Renderer::Renderer(const ProducerConfig& cfg, Toolchain tools)
    : cfg_(cfg)
    , tools_(tools) {}

RenderResult Renderer::render(const std::string& script_text) {
    return render(parse_script(script_text));
}

std::vector<BedTrack> Renderer::resolve_beds(const Document& doc) {
    struct BedSpec {
        const char* role;
        double      gain_db;
    };
    const BedSpec specs[] = {
        {"music",    cfg_.levels.music_db},
        {"ambience", cfg_.levels.ambience_db},
    };

    std::vector<BedTrack> beds;
    for (const auto& spec : specs) {
        auto id = get_directive(doc, spec.role);
        if (!id || id->empty()) continue;

        BedTrack bed;
        bed.role     = spec.role;
        bed.asset_id = *id;
        bed.path     = tools_.assets.resolve(*id);
        bed.gain_db  = spec.gain_db;
        std::cout << "  " << bed.role << ": " << bed.path.string() << " (" << bed.gain_db << " dB)" << std::endl;
        beds.push_back(bed);
    }
    return beds;
}

RenderResult Renderer::render(const Document& doc) {
    RenderResult result;
    result.utterances = count_utterances(doc);
    if (result.utterances == 0) {
        throw EmptyDocumentError();
    }

    result.title = story_title(doc);
    std::cout << "Rendering '" << result.title << "': " << result.utterances << " narration lines" << std::endl;

    // Document-level directives first, so a missing bed fails before synthesis
    result.beds = resolve_beds(doc);

    ScopedWorkdir work(cfg_.work_root);
    const auto segment_dir = work.path() / "narr";
    std::error_code ec;
    std::filesystem::create_directories(segment_dir, ec);
    if (ec) {
        throw RenderError("cannot create " + segment_dir.string() + ": " + ec.message());
    }

    TimelineBuilder builder(cfg_, tools_.voice, tools_.probe, tools_.silence, tools_.assets);
    result.timeline = builder.build(doc, segment_dir);

    // Mix inside the scratch directory and move the artifact out only on success
    const std::string filename = output_filename(doc, cfg_);
    const auto staged = work.path() / filename;
    MixPlan plan = compile_mix(result.timeline, result.beds, cfg_, work.path(), staged);
    result.filter_graph = plan.filter_graph();

    tools_.mixer.mix(plan);

    if (!std::filesystem::exists(staged, ec)) {
        throw ExternalToolFailure("mixer", 0, "no output written to " + staged.string());
    }

    try {
        std::filesystem::create_directories(cfg_.out_dir);
        result.output = cfg_.out_dir / filename;
        move_file(staged, result.output);
    } catch (const std::filesystem::filesystem_error& e) {
        throw RenderError(std::string("cannot publish output: ") + e.what());
    }

    std::cout << "Done: " << result.output.string() << " (" << result.timeline.duration() << "s)" << std::endl;
    return result;
}

} // namespace storyforge
