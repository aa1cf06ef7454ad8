#include "ffmpeg.h"
#include "errors.h"
#include "process.h"

#include <fstream>
#include <iostream>

namespace storyforge {

static std::vector<std::string> base_args(const std::string& ffmpeg) {
    return {ffmpeg, "-hide_banner", "-loglevel", "error", "-y"};
}

std::vector<std::string> silence_command(const std::string& ffmpeg, double seconds, int sample_rate,
                                         const std::string& channel_layout,
                                         const std::filesystem::path& output) {
    auto args = base_args(ffmpeg);
    args.insert(args.end(), {
        "-f", "lavfi",
        "-i", "anullsrc=r=" + std::to_string(sample_rate) + ":cl=" + channel_layout,
        "-t", format_number(seconds),
        output.string(),
    });
    return args;
}

std::vector<std::string> mix_command(const std::string& ffmpeg, const MixPlan& plan) {
    auto args = base_args(ffmpeg);
    for (const auto& input : plan.inputs) {
        args.insert(args.end(), input.options.begin(), input.options.end());
        args.push_back("-i");
        args.push_back(input.path.string());
    }
    args.insert(args.end(), {
        "-filter_complex", plan.filter_graph(),
        "-map", "[" + plan.output_label + "]",
        "-c:a", plan.codec,
        "-b:a", plan.bitrate,
        plan.output.string(),
    });
    return args;
}

// --- Silence ---

FfmpegSilenceGenerator::FfmpegSilenceGenerator(std::string ffmpeg)
    : ffmpeg_(std::move(ffmpeg)) {}

void FfmpegSilenceGenerator::generate(double seconds, int sample_rate, const std::string& channel_layout,
                                      const std::filesystem::path& output) {
    run_command(silence_command(ffmpeg_, seconds, sample_rate, channel_layout, output));
}

// --- Mix ---

FfmpegMixingEngine::FfmpegMixingEngine(std::string ffmpeg)
    : ffmpeg_(std::move(ffmpeg)) {}

void FfmpegMixingEngine::mix(const MixPlan& plan) {
    {
        std::ofstream out(plan.concat_manifest);
        if (!out.is_open()) {
            throw ExternalToolFailure(ffmpeg_, -1, "cannot write " + plan.concat_manifest.string());
        }
        out << concat_manifest_text(plan.concat_entries);
    }

    std::cout << "  Mixing " << plan.inputs.size() << " inputs ("
              << plan.duration << "s)..." << std::endl;
    run_command(mix_command(ffmpeg_, plan));
}

} // namespace storyforge
