#include "config.h"
#include "errors.h"

#include <iostream>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace storyforge {

static void apply_yaml(ProducerConfig& cfg, const YAML::Node& root) {
    if (auto paths = root["paths"]) {
        if (paths["assets"]) cfg.assets_dir = paths["assets"].as<std::string>();
        if (paths["output"]) cfg.out_dir    = paths["output"].as<std::string>();
        if (paths["work"])   cfg.work_root  = paths["work"].as<std::string>();
    }
    if (auto voices = root["voices"]) {
        for (const auto& kv : voices) {
            cfg.speaker_refs[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    if (auto mix = root["mix"]) {
        if (mix["narration_gain_db"]) cfg.levels.narration_db = mix["narration_gain_db"].as<double>();
        if (mix["music_gain_db"])     cfg.levels.music_db     = mix["music_gain_db"].as<double>();
        if (mix["ambience_gain_db"])  cfg.levels.ambience_db  = mix["ambience_gain_db"].as<double>();
        if (mix["codec"])             cfg.codec     = mix["codec"].as<std::string>();
        if (mix["bitrate"])           cfg.bitrate   = mix["bitrate"].as<std::string>();
        if (mix["extension"])         cfg.extension = mix["extension"].as<std::string>();
    }
    if (auto tools = root["tools"]) {
        if (tools["ffmpeg"])   cfg.ffmpeg          = tools["ffmpeg"].as<std::string>();
        if (tools["voicegen"]) cfg.voicegen        = tools["voicegen"].as<std::string>();
        if (tools["device"])   cfg.voicegen_device = tools["device"].as<std::string>();
    }
    if (auto sil = root["silence"]) {
        if (sil["sample_rate"])    cfg.silence_sample_rate = sil["sample_rate"].as<int>();
        if (sil["channel_layout"]) cfg.silence_layout      = sil["channel_layout"].as<std::string>();
    }
    if (auto probe = root["probe"]) {
        if (probe["sample_rate"]) cfg.probe_sample_rate = probe["sample_rate"].as<int>();
    }
    if (root["language"]) cfg.language       = root["language"].as<std::string>();
    if (root["manifest"]) cfg.write_manifest = root["manifest"].as<bool>();
}

void load_yaml_text(ProducerConfig& cfg, const std::string& text) {
    try {
        YAML::Node root = YAML::Load(text);
        if (root.IsMap()) apply_yaml(cfg, root);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("bad config: ") + e.what());
    }
}

bool load_yaml_file(ProducerConfig& cfg, const std::string& path) {
    std::ifstream fin(path);
    if (!fin.is_open()) return false;

    std::stringstream buf;
    buf << fin.rdbuf();
    try {
        load_yaml_text(cfg, buf.str());
    } catch (const ConfigurationError& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
    return true;
}

std::map<std::string, std::filesystem::path> parse_speaker_refs(const std::vector<std::string>& items) {
    std::map<std::string, std::filesystem::path> refs;
    for (const auto& item : items) {
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            throw ConfigurationError("--ref expects SPEAKER=/path/to/ref.wav, got: " + item);
        }
        if (eq == 0 || eq + 1 == item.size()) {
            throw ConfigurationError("--ref needs both a speaker and a path, got: " + item);
        }
        refs[item.substr(0, eq)] = item.substr(eq + 1);
    }
    return refs;
}

// --- Sub-commands ---

static bool parse_render(Config& cfg, const std::vector<std::string>& args) {
    po::options_description desc("storyforge render - mix a narration script into one audio file");
    desc.add_options()
        ("help,h",       "Show help")
        ("story,s",      po::value<std::string>(), "Script file to render (required)")
        ("config,c",     po::value<std::string>(), "Config YAML file")
        ("assets-dir",   po::value<std::string>(), "Asset search root")
        ("out-dir,o",    po::value<std::string>(), "Output directory")
        ("work-dir",     po::value<std::string>(), "Root for the per-render scratch directory")
        ("voicegen",     po::value<std::string>(), "Voice generator command")
        ("device",       po::value<std::string>(), "Voice generator device (cpu, cuda, auto)")
        ("ffmpeg",       po::value<std::string>(), "ffmpeg binary")
        ("ref,r",        po::value<std::vector<std::string>>()->composing(),
                         "Speaker reference, SPEAKER=/path/to/ref.wav (repeatable)")
        ("narration-gain", po::value<double>(), "Narration gain in dB")
        ("music-gain",     po::value<double>(), "Music bed gain in dB")
        ("ambience-gain",  po::value<double>(), "Ambience bed gain in dB")
        ("bitrate",      po::value<std::string>(), "Output bitrate (e.g. 160k)")
        ("language",     po::value<std::string>(), "Language when the script has no @lang")
        ("manifest",     "Write <title>.manifest.pb next to the output")
    ;

    po::positional_options_description pos;
    pos.add("story", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(args)
            .options(desc).positional(pos).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n" << desc << "\n";
        return false;
    }

    if (vm.count("help")) {
        std::cout << desc << "\n";
        return false;
    }

    auto& p = cfg.producer;

    // Load YAML config (default or specified)
    try {
        if (vm.count("config")) {
            const auto path = vm["config"].as<std::string>();
            if (!load_yaml_file(p, path)) {
                std::cerr << "Error: cannot open config " << path << "\n";
                return false;
            }
        } else {
            // Try default locations
            load_yaml_file(p, "config/storyforge-default.yaml");
            load_yaml_file(p, "storyforge-default.yaml");
        }
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return false;
    }

    // CLI overrides
    if (vm.count("story"))          cfg.story_file      = vm["story"].as<std::string>();
    if (vm.count("assets-dir"))     p.assets_dir        = vm["assets-dir"].as<std::string>();
    if (vm.count("out-dir"))        p.out_dir           = vm["out-dir"].as<std::string>();
    if (vm.count("work-dir"))       p.work_root         = vm["work-dir"].as<std::string>();
    if (vm.count("voicegen"))       p.voicegen          = vm["voicegen"].as<std::string>();
    if (vm.count("device"))         p.voicegen_device   = vm["device"].as<std::string>();
    if (vm.count("ffmpeg"))         p.ffmpeg            = vm["ffmpeg"].as<std::string>();
    if (vm.count("narration-gain")) p.levels.narration_db = vm["narration-gain"].as<double>();
    if (vm.count("music-gain"))     p.levels.music_db     = vm["music-gain"].as<double>();
    if (vm.count("ambience-gain"))  p.levels.ambience_db  = vm["ambience-gain"].as<double>();
    if (vm.count("bitrate"))        p.bitrate           = vm["bitrate"].as<std::string>();
    if (vm.count("language"))       p.language          = vm["language"].as<std::string>();
    if (vm.count("manifest"))       p.write_manifest    = true;

    if (vm.count("ref")) {
        try {
            for (const auto& [speaker, ref] : parse_speaker_refs(vm["ref"].as<std::vector<std::string>>())) {
                p.speaker_refs[speaker] = ref;
            }
        } catch (const ConfigurationError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return false;
        }
    }

    if (cfg.story_file.empty()) {
        std::cerr << "Error: no story file specified\n" << desc << "\n";
        return false;
    }

    // ffmpeg resolves concat entries relative to the manifest, so keep
    // every path the mixer sees absolute.
    p.assets_dir = std::filesystem::absolute(p.assets_dir);
    p.out_dir    = std::filesystem::absolute(p.out_dir);
    if (!p.work_root.empty()) p.work_root = std::filesystem::absolute(p.work_root);

    cfg.command = Command::RENDER;
    return true;
}

static bool parse_generate(Config& cfg, const std::vector<std::string>& args) {
    po::options_description desc("storyforge generate - write a bedtime-story script");
    desc.add_options()
        ("help,h",     "Show help")
        ("title,t",    po::value<std::string>(),   "Story title (required)")
        ("seed",       po::value<std::uint32_t>(), "Random seed")
        ("narrator",   po::value<std::string>(),   "Narrator speaker name")
        ("music",      po::value<std::string>(),   "Music bed asset id")
        ("ambience",   po::value<std::string>(),   "Ambience bed asset id")
        ("out,o",      po::value<std::string>(),   "Output script file (default: stdout)")
    ;

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(args).options(desc).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n" << desc << "\n";
        return false;
    }

    if (vm.count("help")) {
        std::cout << desc << "\n";
        return false;
    }

    if (!vm.count("title")) {
        std::cerr << "Error: no title specified\n" << desc << "\n";
        return false;
    }

    auto& s = cfg.story;
    s.title = vm["title"].as<std::string>();
    if (vm.count("seed"))     s.seed           = vm["seed"].as<std::uint32_t>();
    if (vm.count("narrator")) s.narrator       = vm["narrator"].as<std::string>();
    if (vm.count("music"))    s.music_asset    = vm["music"].as<std::string>();
    if (vm.count("ambience")) s.ambience_asset = vm["ambience"].as<std::string>();
    if (vm.count("out"))      cfg.output_file  = vm["out"].as<std::string>();

    cfg.command = Command::GENERATE;
    return true;
}

bool load_config(Config& cfg, int argc, char* argv[]) {
    po::options_description global("storyforge - narration script renderer");
    global.add_options()
        ("command",  po::value<std::string>(), "render | generate")
        ("args",     po::value<std::vector<std::string>>(), "Command arguments")
    ;

    po::positional_options_description pos;
    pos.add("command", 1).add("args", -1);

    po::variables_map vm;
    std::vector<std::string> rest;
    try {
        po::parsed_options parsed = po::command_line_parser(argc, argv)
            .options(global).positional(pos).allow_unregistered().run();
        po::store(parsed, vm);
        po::notify(vm);

        // Everything after the command name goes to the sub-command parser
        rest = po::collect_unrecognized(parsed.options, po::include_positional);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return false;
    }

    if (!vm.count("command")) {
        std::cout << "Usage: storyforge <render|generate> [options]\n"
                  << "       storyforge <command> --help\n";
        return false;
    }
    if (!rest.empty()) rest.erase(rest.begin());

    const auto command = vm["command"].as<std::string>();
    if (command == "render")   return parse_render(cfg, rest);
    if (command == "generate") return parse_generate(cfg, rest);

    std::cerr << "Error: unknown command '" << command << "'\n";
    return false;
}

} // namespace storyforge
