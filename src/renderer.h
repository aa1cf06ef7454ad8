#pragma once

#include "config.h"
#include "mixgraph.h"
#include "script.h"
#include "timeline.h"
#include "tools.h"

#include <filesystem>
#include <string>
#include <vector>

namespace storyforge {

struct RenderResult {
    std::string           title;
    std::filesystem::path output;
    Timeline              timeline;
    std::vector<BedTrack> beds;
    std::string           filter_graph;
    size_t                utterances = 0;
};

// Script text in, one mixed audio file out. Each call owns its own
// scratch directory and timeline, so separate Renderer objects may run
// concurrently. A failure at any step aborts the render and leaves no
// file in the output directory.
class Renderer {
public:
    Renderer(const ProducerConfig& cfg, Toolchain tools);

    RenderResult render(const std::string& script_text);
    RenderResult render(const Document& doc);

private:
    std::vector<BedTrack> resolve_beds(const Document& doc);

    const ProducerConfig& cfg_;
    Toolchain             tools_;
};

} // namespace storyforge
