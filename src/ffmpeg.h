#pragma once

#include "mixgraph.h"
#include "tools.h"

#include <string>
#include <vector>

namespace storyforge {

// Command lines, exposed so they can be checked without running ffmpeg
std::vector<std::string> silence_command(const std::string& ffmpeg, double seconds, int sample_rate,
                                         const std::string& channel_layout,
                                         const std::filesystem::path& output);
std::vector<std::string> mix_command(const std::string& ffmpeg, const MixPlan& plan);

class FfmpegSilenceGenerator : public SilenceGenerator {
public:
    explicit FfmpegSilenceGenerator(std::string ffmpeg);
    void generate(double seconds, int sample_rate, const std::string& channel_layout,
                  const std::filesystem::path& output) override;

private:
    std::string ffmpeg_;
};

// Writes the concat manifest, then runs the whole graph in one ffmpeg call.
class FfmpegMixingEngine : public MixingEngine {
public:
    explicit FfmpegMixingEngine(std::string ffmpeg);
    void mix(const MixPlan& plan) override;

private:
    std::string ffmpeg_;
};

} // namespace storyforge
