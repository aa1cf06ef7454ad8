#include "probe.h"
#include "errors.h"

#include <essentia/algorithmfactory.h>
#include <essentia/scheduler/network.h>
#include <essentia/streaming/algorithms/poolstorage.h>

using namespace essentia;
using namespace essentia::streaming;
using namespace essentia::scheduler;

namespace storyforge {

EssentiaAudioProbe::EssentiaAudioProbe(int sample_rate)
    : sample_rate_(sample_rate) {}

double EssentiaAudioProbe::duration(const std::filesystem::path& audio) {
    long total_samples = 0;
    try {
        auto& factory = streaming::AlgorithmFactory::instance();

        Algorithm* loader = factory.create("MonoLoader",
            "filename", audio.string(),
            "sampleRate", Real(sample_rate_));

        loader->output("audio") >> NOWHERE;

        // The network owns and deletes the loader
        Network network(loader);
        network.run();
        total_samples = loader->output("audio").totalProduced();
    } catch (const EssentiaException& e) {
        throw ExternalToolFailure("essentia MonoLoader", -1, audio.string() + ": " + e.what());
    }

    if (total_samples <= 0) {
        throw ExternalToolFailure("essentia MonoLoader", -1, audio.string() + ": no audio decoded");
    }
    return static_cast<double>(total_samples) / sample_rate_;
}

} // namespace storyforge
