#include "voicegen.h"
#include "errors.h"
#include "process.h"

namespace storyforge {

std::vector<std::string> voicegen_command(const std::string& voicegen, const std::string& device,
                                          const SpeechRequest& request) {
    return {
        voicegen,
        "--text",   request.text,
        "--ref",    request.voice_reference.string(),
        "--out",    request.output.string(),
        "--lang",   request.language,
        "--device", device,
    };
}

CommandVoiceSynthesizer::CommandVoiceSynthesizer(std::string voicegen, std::string device)
    : voicegen_(std::move(voicegen))
    , device_(std::move(device)) {}

void CommandVoiceSynthesizer::synthesize(const SpeechRequest& request) {
    run_command(voicegen_command(voicegen_, device_, request));

    // Some wrappers exit 0 without producing audio
    std::error_code ec;
    if (!std::filesystem::exists(request.output, ec)) {
        throw ExternalToolFailure(voicegen_, 0, "no audio written to " + request.output.string());
    }
}

} // namespace storyforge
