#include "config.h"
#include "errors.h"
#include "workdir.h"

#include <fstream>
#include <gtest/gtest.h>
#include <iterator>

using namespace storyforge;

TEST(ProducerConfigDefaults, GainsAndFormats) {
    ProducerConfig cfg;
    EXPECT_DOUBLE_EQ(cfg.levels.narration_db, 0.0);
    EXPECT_DOUBLE_EQ(cfg.levels.music_db, -18.0);
    EXPECT_DOUBLE_EQ(cfg.levels.ambience_db, -22.0);
    EXPECT_EQ(cfg.silence_sample_rate, 48000);
    EXPECT_EQ(cfg.silence_layout, "mono");
    EXPECT_EQ(cfg.codec, "libmp3lame");
    EXPECT_EQ(cfg.bitrate, "160k");
}

TEST(YamlConfig, OverridesOnlyWhatIsPresent) {
    ProducerConfig cfg;
    load_yaml_text(cfg,
        "paths:\n"
        "  assets: /srv/assets\n"
        "voices:\n"
        "  Ruby: /voices/ruby.wav\n"
        "  Onyx: /voices/onyx.wav\n"
        "mix:\n"
        "  music_gain_db: -12.5\n"
        "tools:\n"
        "  device: cpu\n"
        "silence:\n"
        "  sample_rate: 24000\n"
        "manifest: true\n");

    EXPECT_EQ(cfg.assets_dir, "/srv/assets");
    EXPECT_EQ(cfg.out_dir, "out");
    ASSERT_EQ(cfg.speaker_refs.size(), 2u);
    EXPECT_EQ(cfg.speaker_refs.at("Onyx"), "/voices/onyx.wav");
    EXPECT_DOUBLE_EQ(cfg.levels.music_db, -12.5);
    EXPECT_DOUBLE_EQ(cfg.levels.ambience_db, -22.0);
    EXPECT_EQ(cfg.voicegen_device, "cpu");
    EXPECT_EQ(cfg.silence_sample_rate, 24000);
    EXPECT_TRUE(cfg.write_manifest);
}

TEST(YamlConfig, BadYamlIsConfigurationError) {
    ProducerConfig cfg;
    EXPECT_THROW(load_yaml_text(cfg, "mix: [unclosed\n"), ConfigurationError);
    EXPECT_THROW(load_yaml_text(cfg, "mix:\n  music_gain_db: loud\n"), ConfigurationError);
}

TEST(YamlConfig, MissingFileIsSkipped) {
    ProducerConfig cfg;
    EXPECT_FALSE(load_yaml_file(cfg, "/nonexistent/storyforge.yaml"));
    EXPECT_EQ(cfg.assets_dir, "assets");
}

TEST(YamlConfig, LoadsFromFile) {
    ScopedWorkdir dir;
    auto path = dir.path() / "cfg.yaml";
    std::ofstream(path) << "language: de\nprobe:\n  sample_rate: 22050\n";

    ProducerConfig cfg;
    EXPECT_TRUE(load_yaml_file(cfg, path.string()));
    EXPECT_EQ(cfg.language, "de");
    EXPECT_EQ(cfg.probe_sample_rate, 22050);
}

TEST(SpeakerRefs, ParsesPairs) {
    auto refs = parse_speaker_refs({"Ruby=/v/ruby.wav", "Onyx=rel/onyx=1.wav"});
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(refs.at("Ruby"), "/v/ruby.wav");
    EXPECT_EQ(refs.at("Onyx"), "rel/onyx=1.wav");
}

TEST(SpeakerRefs, MissingEqualsIsConfigurationError) {
    EXPECT_THROW(parse_speaker_refs({"Ruby:/v/ruby.wav"}), ConfigurationError);
}

TEST(SpeakerRefs, EmptySideIsConfigurationError) {
    EXPECT_THROW(parse_speaker_refs({"Ruby="}), ConfigurationError);
    EXPECT_THROW(parse_speaker_refs({"=/v/ruby.wav"}), ConfigurationError);
}

TEST(CommandLine, RenderWithRefsAndGains) {
    const char* argv[] = {
        "storyforge", "render", "--story", "night.sfml",
        "--ref", "Ruby=/v/ruby.wav", "--ref", "Onyx=/v/onyx.wav",
        "--music-gain=-10", "--device", "cpu", "--manifest",
    };
    Config cfg;
    ASSERT_TRUE(load_config(cfg, static_cast<int>(std::size(argv)), const_cast<char**>(argv)));
    EXPECT_EQ(cfg.command, Command::RENDER);
    EXPECT_EQ(cfg.story_file, "night.sfml");
    EXPECT_EQ(cfg.producer.speaker_refs.at("Ruby"), "/v/ruby.wav");
    EXPECT_EQ(cfg.producer.speaker_refs.at("Onyx"), "/v/onyx.wav");
    EXPECT_DOUBLE_EQ(cfg.producer.levels.music_db, -10.0);
    EXPECT_EQ(cfg.producer.voicegen_device, "cpu");
    EXPECT_TRUE(cfg.producer.write_manifest);
    EXPECT_TRUE(cfg.producer.assets_dir.is_absolute());
    EXPECT_TRUE(cfg.producer.out_dir.is_absolute());
}

TEST(CommandLine, RenderRequiresStory) {
    const char* argv[] = {"storyforge", "render", "--device", "cpu"};
    Config cfg;
    EXPECT_FALSE(load_config(cfg, static_cast<int>(std::size(argv)), const_cast<char**>(argv)));
}

TEST(CommandLine, Generate) {
    const char* argv[] = {
        "storyforge", "generate", "--title", "Moon Shop", "--seed", "7", "--music", "lullaby",
    };
    Config cfg;
    ASSERT_TRUE(load_config(cfg, static_cast<int>(std::size(argv)), const_cast<char**>(argv)));
    EXPECT_EQ(cfg.command, Command::GENERATE);
    EXPECT_EQ(cfg.story.title, "Moon Shop");
    EXPECT_EQ(cfg.story.seed, 7u);
    EXPECT_EQ(cfg.story.music_asset, "lullaby");
    EXPECT_TRUE(cfg.output_file.empty());
}

TEST(CommandLine, UnknownCommandFails) {
    const char* argv[] = {"storyforge", "publish"};
    Config cfg;
    EXPECT_FALSE(load_config(cfg, static_cast<int>(std::size(argv)), const_cast<char**>(argv)));
}
