#include "manifest.h"
#include "errors.h"

#include <boost/program_options.hpp>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <string>

namespace po = boost::program_options;

static std::string format_time(std::int64_t unix_seconds) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%SZ", &tm);
    return buf;
}

static std::string format_segment(const storyforge::ManifestSegment& s) {
    char buf[256];
    if (s.kind() == storyforge::ManifestSegment::SILENCE) {
        snprintf(buf, sizeof(buf), "[%8.3f - %8.3f] pause             %.3fs",
                 s.start(), s.end(), s.end() - s.start());
    } else {
        snprintf(buf, sizeof(buf), "[%8.3f - %8.3f] line              speaker=%s",
                 s.start(), s.end(), s.speaker().c_str());
    }
    return buf;
}

static std::string format_effect(const storyforge::ManifestEffect& e) {
    char buf[512];
    snprintf(buf, sizeof(buf), "[%8.3f]            sfx               %s delay=%lldms path=%s",
             e.start(), e.asset_id().c_str(), static_cast<long long>(e.delay_ms()), e.path().c_str());
    return buf;
}

static std::string format_bed(const storyforge::ManifestBed& b) {
    char buf[512];
    snprintf(buf, sizeof(buf), "%-9s %s gain=%.1fdB path=%s",
             b.role().c_str(), b.asset_id().c_str(), b.gain_db(), b.path().c_str());
    return buf;
}

int main(int argc, char* argv[]) {
    std::string manifest_file;
    bool show_graph = false;

    po::options_description desc("storyforge-inspect - print a render manifest");
    desc.add_options()
        ("help,h",  "Show help")
        ("manifest,m", po::value<std::string>(&manifest_file), "Manifest file (.manifest.pb)")
        ("graph,g", po::bool_switch(&show_graph), "Also print the mix filter graph")
    ;

    po::positional_options_description pos;
    pos.add("manifest", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n" << desc << "\n";
        return 1;
    }
    if (vm.count("help") || manifest_file.empty()) {
        std::cout << desc << "\n";
        return vm.count("help") ? 0 : 1;
    }

    storyforge::RenderManifest m;
    try {
        m = storyforge::read_manifest(manifest_file);
    } catch (const storyforge::RenderError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Title:      " << m.title() << "\n"
              << "Output:     " << m.output() << "\n"
              << "Rendered:   " << format_time(m.rendered_at()) << "\n"
              << "Duration:   " << m.duration() << "s\n"
              << "Utterances: " << m.utterances() << "\n";

    if (m.beds_size() > 0) {
        std::cout << "\nBeds:\n";
        for (const auto& b : m.beds()) std::cout << "  " << format_bed(b) << "\n";
    }

    std::cout << "\nNarration:\n";
    for (const auto& s : m.segments()) std::cout << "  " << format_segment(s) << "\n";

    if (m.effects_size() > 0) {
        std::cout << "\nEffects:\n";
        for (const auto& e : m.effects()) std::cout << "  " << format_effect(e) << "\n";
    }

    if (show_graph) {
        std::cout << "\nFilter graph:\n  " << m.filter_graph() << "\n";
    }
    return 0;
}
