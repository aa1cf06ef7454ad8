#include "script.h"
#include "errors.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace storyforge {

struct AnchorNameEntry {
    Anchor      anchor;
    std::string name;
};

static const std::vector<AnchorNameEntry>& all_entries() {
    static const std::vector<AnchorNameEntry> entries = {
        {Anchor::NOW,        "now"},
        {Anchor::LAST_START, "last_start"},
        {Anchor::LAST_END,   "last_end"},
    };
    return entries;
}

const std::unordered_map<std::string, Anchor>& anchor_name_map() {
    static const std::unordered_map<std::string, Anchor> map = [] {
        std::unordered_map<std::string, Anchor> m;
        for (const auto& e : all_entries()) {
            m[e.name] = e.anchor;
        }
        return m;
    }();
    return map;
}

const std::string& anchor_name(Anchor anchor) {
    static const std::string unknown = "unknown";
    for (const auto& e : all_entries()) {
        if (e.anchor == anchor) return e.name;
    }
    return unknown;
}

// --- Helpers ---

static std::string trim(const std::string& s) {
    static const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string to_lower(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

static bool starts_with_nocase(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    return to_lower(s.substr(0, prefix.size())) == to_lower(prefix);
}

// Whole-string float parse; rejects trailing garbage, NaN and infinities.
static bool parse_seconds(const std::string& text, double& out) {
    std::string s = trim(text);
    if (s.empty()) return false;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) return false;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

// --- Line parsers ---

static Directive parse_directive(const std::string& line, const std::string& raw, int lineno) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
        throw ParseError(lineno, raw, "directive missing ':'");
    }
    Directive d;
    d.key   = trim(line.substr(1, colon - 1));
    d.value = trim(line.substr(colon + 1));
    return d;
}

static Pause parse_pause(const std::string& line, const std::string& raw, int lineno) {
    Pause p;
    if (!parse_seconds(line.substr(line.find(':') + 1), p.seconds)) {
        throw ParseError(lineno, raw, "bad pause duration");
    }
    if (p.seconds < 0.0) {
        throw ParseError(lineno, raw, "negative pause duration");
    }
    return p;
}

static SoundEffect parse_sfx(const std::string& line, const std::string& raw, int lineno) {
    std::istringstream tokens(line.substr(line.find(':') + 1));
    SoundEffect sfx;
    if (!(tokens >> sfx.asset_id)) {
        throw ParseError(lineno, raw, "SFX missing asset id");
    }

    std::string token;
    while (tokens >> token) {
        if (token.rfind("at=", 0) == 0) {
            std::string name = token.substr(3);
            const auto& names = anchor_name_map();
            auto it = names.find(name);
            if (it == names.end()) {
                throw AnchorError(lineno, name);
            }
            sfx.anchor = it->second;
        } else if (token.rfind("offset=", 0) == 0) {
            if (!parse_seconds(token.substr(7), sfx.offset_seconds)) {
                throw ParseError(lineno, raw, "bad SFX offset");
            }
        }
        // Unrecognized tokens are ignored.
    }
    return sfx;
}

static Utterance parse_utterance(const std::string& line, const std::string& raw, int lineno) {
    auto colon = line.find(':');
    Utterance u;
    u.speaker = trim(line.substr(0, colon));
    u.text    = trim(line.substr(colon + 1));
    if (u.speaker.empty() || u.text.empty()) {
        throw ParseError(lineno, raw, "bad utterance");
    }
    return u;
}

Document parse_script(const std::string& text) {
    Document doc;
    std::istringstream stream(text);
    std::string raw;
    int lineno = 0;

    while (std::getline(stream, raw)) {
        ++lineno;
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();

        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '@') {
            doc.emplace_back(parse_directive(line, raw, lineno));
        } else if (starts_with_nocase(line, "PAUSE:")) {
            doc.emplace_back(parse_pause(line, raw, lineno));
        } else if (starts_with_nocase(line, "SFX:")) {
            doc.emplace_back(parse_sfx(line, raw, lineno));
        } else if (line.find(':') != std::string::npos) {
            doc.emplace_back(parse_utterance(line, raw, lineno));
        } else {
            throw ParseError(lineno, raw, "unrecognized line");
        }
    }
    return doc;
}

std::optional<std::string> get_directive(const Document& doc, const std::string& key) {
    const std::string wanted = to_lower(key);
    for (const auto& event : doc) {
        if (const auto* d = std::get_if<Directive>(&event)) {
            if (to_lower(d->key) == wanted) return d->value;
        }
    }
    return std::nullopt;
}

size_t count_utterances(const Document& doc) {
    size_t n = 0;
    for (const auto& event : doc) {
        if (std::holds_alternative<Utterance>(event)) ++n;
    }
    return n;
}

} // namespace storyforge
