#include "renderer.h"
#include "errors.h"
#include "fakes.h"
#include "workdir.h"

#include <algorithm>
#include <gtest/gtest.h>

using namespace storyforge;
using storyforge::testing::FakeTools;

namespace {

class RendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.work_root = sandbox.path() / "work";
        cfg.out_dir   = sandbox.path() / "out";
        std::filesystem::create_directories(cfg.work_root);
        cfg.speaker_refs["A"] = "/voices/a.wav";
        cfg.speaker_refs["B"] = "/voices/b.wav";
        tools.assets.known["chime"]   = "/assets/sfx/chime.wav";
        tools.assets.known["lullaby"] = "/assets/music/lullaby.mp3";
        tools.assets.known["rain"]    = "/assets/ambience/rain.wav";
        tools.voice.touch_files = true;
    }

    RenderResult render(const std::string& script) {
        Renderer renderer(cfg, tools.toolchain());
        return renderer.render(script);
    }

    bool work_root_empty() const {
        return std::filesystem::is_empty(cfg.work_root);
    }

    bool out_dir_empty() const {
        return !std::filesystem::exists(cfg.out_dir) || std::filesystem::is_empty(cfg.out_dir);
    }

    ScopedWorkdir  sandbox;
    ProducerConfig cfg;
    FakeTools      tools;
};

const char* kTwoSpeakersWithChime =
    "@title: T\n"
    "@music: lullaby\n"
    "A: Hello\n"
    "PAUSE: 0.5\n"
    "SFX: chime at=last_end offset=0.0\n"
    "B: Bye\n";

} // namespace

TEST_F(RendererTest, TwoSpeakersWithChimeAndMusicBed) {
    auto result = render(kTwoSpeakersWithChime);

    EXPECT_EQ(result.title, "T");
    EXPECT_EQ(result.utterances, 2u);
    EXPECT_DOUBLE_EQ(result.timeline.duration(), 2.5);
    ASSERT_EQ(result.timeline.effects.size(), 1u);
    EXPECT_DOUBLE_EQ(result.timeline.effects[0].start, 1.5);

    ASSERT_EQ(tools.mixer.plans.size(), 1u);
    const auto& plan = tools.mixer.plans[0];
    EXPECT_NE(plan.filter_graph().find("atrim=0:2.5[music]"), std::string::npos);
    EXPECT_NE(plan.filter_graph().find("adelay=delays=1500:all=1"), std::string::npos);
    EXPECT_EQ(result.filter_graph, plan.filter_graph());

    ASSERT_EQ(result.beds.size(), 1u);
    EXPECT_EQ(result.beds[0].role, "music");
    EXPECT_DOUBLE_EQ(result.beds[0].gain_db, -18.0);

    EXPECT_EQ(result.output, cfg.out_dir / "T.mp3");
    EXPECT_TRUE(std::filesystem::exists(result.output));
}

TEST_F(RendererTest, ExactlyOneMixCallAfterAllSegments) {
    render(kTwoSpeakersWithChime);
    ASSERT_FALSE(tools.log.empty());
    EXPECT_EQ(tools.log.back(), "mix");
    EXPECT_EQ(std::count(tools.log.begin(), tools.log.end(), "mix"), 1);
}

TEST_F(RendererTest, BedsResolvedBeforeSynthesis) {
    render("@ambience: rain\n@music: lullaby\nA: Hello\n");
    ASSERT_GE(tools.log.size(), 3u);
    EXPECT_EQ(tools.log[0], "asset:lullaby");
    EXPECT_EQ(tools.log[1], "asset:rain");
    EXPECT_EQ(tools.log[2], "voice:Hello");
}

TEST_F(RendererTest, WorkdirRemovedAfterSuccess) {
    render(kTwoSpeakersWithChime);
    EXPECT_FALSE(std::filesystem::exists(tools.mixer.workdir_seen));
    EXPECT_TRUE(work_root_empty());
}

TEST_F(RendererTest, TitleFallsBackToStory) {
    auto result = render("A: Hello\n");
    EXPECT_EQ(result.title, "story");
    EXPECT_EQ(result.output.filename(), "story.mp3");
}

TEST_F(RendererTest, EmptyTitleFallsBackToStory) {
    auto result = render("@title:\nA: Hello\n");
    EXPECT_EQ(result.title, "story");
    EXPECT_EQ(result.output, cfg.out_dir / "story.mp3");
    EXPECT_TRUE(std::filesystem::exists(result.output));
}

TEST_F(RendererTest, RelativeWorkRootStillYieldsAbsoluteSegments) {
    cfg.work_root = std::filesystem::relative(cfg.work_root);
    render(kTwoSpeakersWithChime);
    ASSERT_EQ(tools.mixer.plans.size(), 1u);
    for (const auto& entry : tools.mixer.plans[0].concat_entries) {
        EXPECT_TRUE(entry.is_absolute()) << entry;
    }
    EXPECT_TRUE(tools.mixer.plans[0].concat_manifest.is_absolute());
}

TEST_F(RendererTest, EmptyDocumentTriggersNoExternalCalls) {
    EXPECT_THROW(render("@title: Quiet\n@music: lullaby\nPAUSE: 1\nSFX: chime\n"), EmptyDocumentError);
    EXPECT_TRUE(tools.log.empty());
    EXPECT_TRUE(work_root_empty());
}

TEST_F(RendererTest, BadAnchorFailsBeforeAnyLookup) {
    EXPECT_THROW(render("A: Hello\nSFX: x at=bogus\n"), AnchorError);
    EXPECT_TRUE(tools.log.empty());
}

TEST_F(RendererTest, ParseErrorTriggersNoExternalCalls) {
    EXPECT_THROW(render("A: Hello\nnonsense\n"), ParseError);
    EXPECT_TRUE(tools.log.empty());
}

TEST_F(RendererTest, MissingBedFailsBeforeSynthesis) {
    EXPECT_THROW(render("@music: missing\nA: Hello\n"), AssetResolutionError);
    EXPECT_TRUE(tools.voice.requests.empty());
}

TEST_F(RendererTest, SynthesisFailureCleansUp) {
    tools.voice.fail_on = "Bye";
    EXPECT_THROW(render(kTwoSpeakersWithChime), ExternalToolFailure);
    EXPECT_TRUE(tools.mixer.plans.empty());
    EXPECT_TRUE(work_root_empty());
    EXPECT_TRUE(out_dir_empty());
}

TEST_F(RendererTest, MixFailureLeavesNoArtifact) {
    tools.mixer.fail = true;
    EXPECT_THROW(render(kTwoSpeakersWithChime), ExternalToolFailure);
    EXPECT_TRUE(work_root_empty());
    EXPECT_TRUE(out_dir_empty());
}

TEST_F(RendererTest, SeparateRenderersUseDisjointWorkdirs) {
    FakeTools other;
    other.assets.known = tools.assets.known;
    other.voice.touch_files = true;

    Renderer first(cfg, tools.toolchain());
    Renderer second(cfg, other.toolchain());
    first.render("@title: One\nA: Hello\n");
    second.render("@title: Two\nB: Hello\n");

    EXPECT_NE(tools.mixer.workdir_seen, other.mixer.workdir_seen);
    EXPECT_TRUE(std::filesystem::exists(cfg.out_dir / "One.mp3"));
    EXPECT_TRUE(std::filesystem::exists(cfg.out_dir / "Two.mp3"));
}
