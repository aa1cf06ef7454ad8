#include "generator.h"

#include <random>
#include <sstream>
#include <vector>

namespace storyforge {

template <typename T>
static const T& pick(std::mt19937& rng, const std::vector<T>& items) {
    std::uniform_int_distribution<size_t> dist(0, items.size() - 1);
    return items[dist(rng)];
}

std::string generate_script(const StoryGenConfig& cfg) {
    std::mt19937 rng(cfg.seed);

    static const std::vector<std::string> places = {
        "a quiet lantern shop",
        "a sleepy library",
        "a warm kitchen at night",
        "a moonlit garden",
        "a tiny train station",
    };
    static const std::vector<std::string> objects = {
        "a pocket watch",
        "a paper umbrella",
        "a small music box",
        "a wind-up bird",
        "a map drawn in silver ink",
    };
    static const std::vector<std::string> first_names = {"Pearl", "Violet", "Opal", "Iris", "Jade", "Amber"};
    static const std::vector<std::string> second_names = {"Onyx", "Slate", "Moss", "Copper", "Ember"};

    const std::string& place = pick(rng, places);
    const std::string& obj   = pick(rng, objects);
    const std::string& a     = pick(rng, first_names);
    const std::string& b     = pick(rng, second_names);
    const std::string& n     = cfg.narrator;

    std::ostringstream os;
    os << "@title: " << cfg.title << "\n";
    os << "@lang: en\n";
    if (!cfg.music_asset.empty())    os << "@music: " << cfg.music_asset << "\n";
    if (!cfg.ambience_asset.empty()) os << "@ambience: " << cfg.ambience_asset << "\n";
    os << "\n";

    // Intro
    os << n << ": Tonight we visit " << place << ", where everything moves slowly and softly.\n";
    os << "PAUSE: 0.35\n";
    os << n << ": On a shelf sits " << obj << ". It looks ordinary, until it makes the smallest, kindest sound.\n";
    os << "SFX: sfx_soft_chime at=last_end offset=0.0\n";
    os << "PAUSE: 0.35\n";
    os << a << ": Hello? I think something just said hello back.\n";
    os << "PAUSE: 0.25\n";
    os << b << ": I heard it too. It sounded very polite.\n";
    os << "PAUSE: 0.35\n";

    // Beat 1
    os << "# beat 1\n";
    os << n << ": They lean closer, and " << obj << " clicks once, as if asking permission.\n";
    os << "SFX: sfx_soft_click at=last_end offset=0.0\n";
    os << "PAUSE: 0.30\n";
    os << a << ": Will you help us get sleepy?\n";
    os << "PAUSE: 0.25\n";

    // Beat 2
    os << "# beat 2\n";
    os << n << ": A gentle breeze drifts through the room, though every window is closed.\n";
    os << "SFX: sfx_gentle_wind at=last_end offset=0.0\n";
    os << "PAUSE: 0.35\n";
    os << b << ": If you tell us a story, we promise to listen quietly.\n";
    os << "PAUSE: 0.25\n";

    // Beat 3
    os << "# beat 3\n";
    os << n << ": It answers with a tiny tune. Three notes, a rest, and three notes again.\n";
    os << "SFX: sfx_musicbox_three_notes at=last_end offset=0.0\n";
    os << "PAUSE: 0.45\n";

    // Outro
    os << n << ": As the last note fades, all of " << place << " feels lighter. Breathing is easy. Eyes grow heavy.\n";
    os << "PAUSE: 0.45\n";
    os << n << ": Goodnight. Sleep deeply, and let the quiet keep watch.\n";

    return os.str();
}

} // namespace storyforge
