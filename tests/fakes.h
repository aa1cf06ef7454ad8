#pragma once

#include "errors.h"
#include "mixgraph.h"
#include "tools.h"

#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace storyforge::testing {

// Shared call log so tests can check ordering across collaborators.
using CallLog = std::vector<std::string>;

class FakeVoice : public VoiceSynthesizer {
public:
    explicit FakeVoice(CallLog& log) : log_(log) {}

    void synthesize(const SpeechRequest& request) override {
        log_.push_back("voice:" + request.text);
        requests.push_back(request);
        if (request.text == fail_on) {
            throw ExternalToolFailure("voicegen", 1, "synthesis failed");
        }
        if (touch_files) {
            std::ofstream(request.output) << "wav";
        }
    }

    std::vector<SpeechRequest> requests;
    std::string fail_on;
    bool touch_files = false;

private:
    CallLog& log_;
};

// Duration keyed by the text that produced the file.
class FakeProbe : public AudioProbe {
public:
    FakeProbe(CallLog& log, const FakeVoice& voice) : log_(log), voice_(voice) {}

    double duration(const std::filesystem::path& audio) override {
        log_.push_back("probe:" + audio.filename().string());
        for (const auto& req : voice_.requests) {
            if (req.output == audio) {
                auto it = durations.find(req.text);
                return it != durations.end() ? it->second : default_duration;
            }
        }
        throw ExternalToolFailure("probe", -1, "unknown file " + audio.string());
    }

    std::map<std::string, double> durations;
    double default_duration = 1.0;

private:
    CallLog&         log_;
    const FakeVoice& voice_;
};

class FakeSilence : public SilenceGenerator {
public:
    explicit FakeSilence(CallLog& log) : log_(log) {}

    void generate(double seconds, int sample_rate, const std::string& channel_layout,
                  const std::filesystem::path& output) override {
        log_.push_back("silence:" + format_number(seconds));
        calls.push_back({seconds, sample_rate, channel_layout, output});
    }

    struct Call {
        double                seconds;
        int                   sample_rate;
        std::string           layout;
        std::filesystem::path output;
    };
    std::vector<Call> calls;

private:
    CallLog& log_;
};

class FakeAssets : public AssetResolver {
public:
    explicit FakeAssets(CallLog& log) : log_(log) {}

    std::filesystem::path resolve(const std::string& asset_id) override {
        log_.push_back("asset:" + asset_id);
        auto it = known.find(asset_id);
        if (it == known.end()) {
            throw AssetResolutionError(asset_id, {"/assets/" + asset_id});
        }
        return it->second;
    }

    std::map<std::string, std::filesystem::path> known;

private:
    CallLog& log_;
};

class FakeMixer : public MixingEngine {
public:
    explicit FakeMixer(CallLog& log) : log_(log) {}

    void mix(const MixPlan& plan) override {
        log_.push_back("mix");
        plans.push_back(plan);
        workdir_seen = plan.output.parent_path();
        if (fail) {
            std::ofstream(plan.output) << "partial";
            throw ExternalToolFailure("ffmpeg", 1, "mix failed");
        }
        std::ofstream(plan.output) << "mp3";
    }

    std::vector<MixPlan>  plans;
    std::filesystem::path workdir_seen;
    bool                  fail = false;

private:
    CallLog& log_;
};

// All fakes wired together
struct FakeTools {
    CallLog     log;
    FakeVoice   voice{log};
    FakeProbe   probe{log, voice};
    FakeSilence silence{log};
    FakeAssets  assets{log};
    FakeMixer   mixer{log};

    Toolchain toolchain() { return Toolchain{voice, probe, silence, assets, mixer}; }
};

} // namespace storyforge::testing
