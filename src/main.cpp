#include "assets.h"
#include "config.h"
#include "errors.h"
#include "ffmpeg.h"
#include "generator.h"
#include "manifest.h"
#include "probe.h"
#include "renderer.h"
#include "voicegen.h"

#include <essentia/algorithmfactory.h>
#include <google/protobuf/stubs/common.h>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

static int run_generate(const storyforge::Config& cfg) {
    std::string script = storyforge::generate_script(cfg.story);
    if (cfg.output_file.empty()) {
        std::cout << script;
        return 0;
    }
    std::ofstream out(cfg.output_file);
    if (!out.is_open()) {
        std::cerr << "Error: cannot write " << cfg.output_file << "\n";
        return 1;
    }
    out << script;
    std::cerr << "Wrote " << cfg.output_file << std::endl;
    return 0;
}

static int run_render(const storyforge::Config& cfg) {
    const auto& p = cfg.producer;

    std::ifstream fin(cfg.story_file);
    if (!fin.is_open()) {
        std::cerr << "Error: cannot open story " << cfg.story_file << "\n";
        return 1;
    }
    std::stringstream text;
    text << fin.rdbuf();

    std::cout << "STORYFORGE - narration renderer" << std::endl;
    std::cout << "Story:  " << cfg.story_file << std::endl;
    std::cout << "Assets: " << p.assets_dir.string() << std::endl;
    std::cout << "Voices: " << p.speaker_refs.size() << " speakers configured" << std::endl;

    storyforge::CommandVoiceSynthesizer voice(p.voicegen, p.voicegen_device);
    storyforge::EssentiaAudioProbe      probe(p.probe_sample_rate);
    storyforge::FfmpegSilenceGenerator  silence(p.ffmpeg);
    storyforge::FilesystemAssetResolver assets(p.assets_dir);
    storyforge::FfmpegMixingEngine      mixer(p.ffmpeg);

    storyforge::Renderer renderer(p, storyforge::Toolchain{voice, probe, silence, assets, mixer});

    essentia::init();
    int rc = 0;
    try {
        auto result = renderer.render(text.str());

        if (p.write_manifest) {
            auto now = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            auto path = storyforge::manifest_path(result.output);
            storyforge::write_manifest(storyforge::make_manifest(result, now), path);
            std::cout << "Manifest: " << path.string() << std::endl;
        }

        // Last line of stdout is the artifact path
        std::cout << result.output.string() << std::endl;
    } catch (const storyforge::RenderError& e) {
        std::cerr << "Error (" << storyforge::error_category(e) << "): " << e.what() << std::endl;
        rc = 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        rc = 2;
    }
    essentia::shutdown();
    return rc;
}

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    storyforge::Config cfg;
    if (!storyforge::load_config(cfg, argc, argv)) {
        return 1;
    }

    int rc = cfg.command == storyforge::Command::GENERATE ? run_generate(cfg) : run_render(cfg);

    google::protobuf::ShutdownProtobufLibrary();
    return rc;
}
