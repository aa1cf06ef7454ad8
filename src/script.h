#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace storyforge {

// Timeline reference points an SFX cue can be placed against
enum class Anchor {
    NOW,
    LAST_START,
    LAST_END,
};

// --- Script events ---

struct Directive {
    std::string key;
    std::string value;
};

struct Utterance {
    std::string speaker;
    std::string text;
};

struct Pause {
    double seconds = 0.0;
};

struct SoundEffect {
    std::string asset_id;
    Anchor      anchor         = Anchor::LAST_END;
    double      offset_seconds = 0.0;
};

using Event    = std::variant<Directive, Utterance, Pause, SoundEffect>;
using Document = std::vector<Event>;

// Name-to-enum mapping ("now", "last_start", "last_end")
const std::unordered_map<std::string, Anchor>& anchor_name_map();

// Enum-to-name mapping
const std::string& anchor_name(Anchor anchor);

// Parses a script. Throws ParseError (or AnchorError for a bad at= value)
// on the first malformed line; nothing is returned in that case.
Document parse_script(const std::string& text);

// First directive whose key matches case-insensitively, in document order.
std::optional<std::string> get_directive(const Document& doc, const std::string& key);

size_t count_utterances(const Document& doc);

} // namespace storyforge
