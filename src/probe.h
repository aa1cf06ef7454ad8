#pragma once

#include "tools.h"

namespace storyforge {

// Measures duration by decoding the file through essentia's MonoLoader.
// essentia::init() must have been called.
class EssentiaAudioProbe : public AudioProbe {
public:
    explicit EssentiaAudioProbe(int sample_rate);
    double duration(const std::filesystem::path& audio) override;

private:
    int sample_rate_;
};

} // namespace storyforge
