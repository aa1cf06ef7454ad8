#pragma once

#include "tools.h"

#include <string>
#include <vector>

namespace storyforge {

std::vector<std::string> voicegen_command(const std::string& voicegen, const std::string& device,
                                          const SpeechRequest& request);

// Runs an external voice-cloning wrapper script:
//   CMD --text T --ref REF --out OUT --lang L --device DEV
class CommandVoiceSynthesizer : public VoiceSynthesizer {
public:
    CommandVoiceSynthesizer(std::string voicegen, std::string device);
    void synthesize(const SpeechRequest& request) override;

private:
    std::string voicegen_;
    std::string device_;
};

} // namespace storyforge
