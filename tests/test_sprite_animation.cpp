#include <gtest/gtest.h>
#include "gameplay/SpriteAnimation.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace overworld;

namespace {

// Power-of-two durations keep frame arithmetic exact
constexpr float kFrame = 0.125f;

AnimationManifest mayManifest() {
    AnimationManifest manifest;
    manifest.category = "npcs";
    manifest.name = "may";

    AnimationClip walk = AnimationClip::fromGrid("walk_south", 0, 0, 16, 16, 4, kFrame, true);
    walk.eventFrames = (uint64_t{1} << 0) | (uint64_t{1} << 2);
    manifest.addClip(walk);

    manifest.addClip(AnimationClip::fromGrid("faint", 0, 16, 16, 16, 3, kFrame, false));
    manifest.addClip(AnimationClip::fromGrid("idle_south", 0, 32, 16, 16, 1, kFrame, true));
    return manifest;
}

} // namespace

// =============================================================================
// Clips and manifests
// =============================================================================

TEST(AnimationClipTest, FromGridBuildsStrip) {
    AnimationClip clip = AnimationClip::fromGrid("walk", 16, 32, 16, 24, 3, 0.2f, false);
    ASSERT_EQ(clip.frameCount(), 3u);
    EXPECT_FLOAT_EQ(clip.frames[2].sourceRect.x, 48.0f);
    EXPECT_FLOAT_EQ(clip.frames[2].sourceRect.y, 32.0f);
    EXPECT_FLOAT_EQ(clip.frames[2].sourceRect.height, 24.0f);
    EXPECT_FLOAT_EQ(clip.totalDuration(), 0.6f);
    EXPECT_FALSE(clip.loop);
}

TEST(AnimationManifestTest, RejectsInvalidClips) {
    AnimationManifest manifest;
    EXPECT_FALSE(manifest.addClip(AnimationClip::fromGrid("empty", 0, 0, 16, 16, 0)));
    EXPECT_FALSE(manifest.addClip(AnimationClip::fromGrid("frozen", 0, 0, 16, 16, 2, 0.0f)));
    EXPECT_FALSE(manifest.addClip(AnimationClip::fromGrid("long", 0, 0, 16, 16, 65)));
    EXPECT_TRUE(manifest.addClip(AnimationClip::fromGrid("max", 0, 0, 16, 16, 64)));
    EXPECT_EQ(manifest.clips.size(), 1u);
    EXPECT_NE(manifest.findClip("max"), nullptr);
    EXPECT_EQ(manifest.findClip("long"), nullptr);
}

TEST(AnimationManifestTest, FromJson) {
    auto json = nlohmann::json::parse(R"({"clips": [
        {"name": "walk_north", "frame_duration": 0.25, "events": [1, 70],
         "frames": [{"x": 0, "y": 48, "w": 16, "h": 16},
                    {"x": 16, "y": 48, "w": 16, "h": 16, "duration": 0.5}]},
        {"name": "spin", "loop": false, "frames": [{"x": 0, "y": 0, "w": 16, "h": 16}]},
        {"frames": [{"x": 0, "y": 0, "w": 16, "h": 16}]},
        {"name": "broken", "frames": [{"x": 0, "y": 0, "w": 16, "h": 16, "duration": -1}]}
    ]})");

    auto manifest = AnimationManifest::fromJson(json, "npcs", "may");
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->clips.size(), 2u);

    const AnimationClip* walk = manifest->findClip("walk_north");
    ASSERT_NE(walk, nullptr);
    EXPECT_TRUE(walk->loop);
    EXPECT_FLOAT_EQ(walk->frames[0].duration, 0.25f);
    EXPECT_FLOAT_EQ(walk->frames[1].duration, 0.5f);
    EXPECT_FLOAT_EQ(walk->frames[1].sourceRect.x, 16.0f);
    // Out-of-range event index ignored
    EXPECT_EQ(walk->eventFrames, uint64_t{1} << 1);

    ASSERT_NE(manifest->findClip("spin"), nullptr);
    EXPECT_FALSE(manifest->findClip("spin")->loop);
    EXPECT_EQ(manifest->findClip("broken"), nullptr);

    EXPECT_FALSE(AnimationManifest::fromJson(nlohmann::json::array(), "npcs", "may").has_value());
}

// =============================================================================
// Sprite / Animation components
// =============================================================================

TEST(SpriteTest, ManifestKeyComputedOnConstruction) {
    Sprite may("npcs", "may");
    EXPECT_EQ(may.manifestKey, makeManifestKey("npcs", "may"));
    EXPECT_NE(may.manifestKey, makeManifestKey("npcs", "brendan"));
    EXPECT_NE(may.manifestKey, makeManifestKey("players", "may"));

    Sprite copy = may;
    EXPECT_EQ(copy.manifestKey, may.manifestKey);
}

TEST(AnimationComponentTest, TriggeredBitsCoverSixtyFourFrames) {
    Animation anim("walk_south");
    anim.markTriggered(0);
    anim.markTriggered(63);
    anim.markTriggered(64);

    EXPECT_TRUE(anim.hasTriggered(0));
    EXPECT_TRUE(anim.hasTriggered(63));
    EXPECT_FALSE(anim.hasTriggered(1));
    EXPECT_FALSE(anim.hasTriggered(64));
    EXPECT_EQ(anim.triggeredFrames, (uint64_t{1} << 63) | 1u);
}

TEST(AnimationComponentTest, PlaySameClipKeepsState) {
    Animation anim("walk_south");
    anim.currentFrame = 2;
    anim.stop();

    anim.play("walk_south");
    EXPECT_TRUE(anim.isPlaying);
    EXPECT_EQ(anim.currentFrame, 2u);

    anim.play("walk_south", true);
    EXPECT_EQ(anim.currentFrame, 0u);

    anim.markTriggered(1);
    anim.play("idle_south");
    EXPECT_EQ(anim.currentAnimation, "idle_south");
    EXPECT_EQ(anim.triggeredFrames, 0u);
}

// =============================================================================
// Manifest cache
// =============================================================================

TEST(AnimationManifestCacheTest, ProviderCalledOncePerKey) {
    size_t calls = 0;
    AnimationManifestCache cache([&calls](const std::string& category, const std::string& name)
            -> std::optional<AnimationManifest> {
        ++calls;
        AnimationManifest manifest;
        manifest.category = category;
        manifest.name = name;
        return manifest;
    });

    Sprite may("npcs", "may");
    const AnimationManifest* first = cache.get(may);
    const AnimationManifest* second = cache.get(may);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(calls, 1u);
    EXPECT_EQ(cache.providerCalls(), 1u);
}

TEST(AnimationManifestCacheTest, MissesAreRemembered) {
    AnimationManifestCache cache([](const std::string&, const std::string&)
            -> std::optional<AnimationManifest> {
        return std::nullopt;
    });

    Sprite ghost("npcs", "ghost");
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(cache.get(ghost), nullptr);
    }
    EXPECT_EQ(cache.providerCalls(), 1u);

    cache.invalidate(ghost.manifestKey);
    cache.get(ghost);
    EXPECT_EQ(cache.providerCalls(), 2u);
}

TEST(AnimationManifestCacheTest, RegisteredManifestNeedsNoProvider) {
    AnimationManifestCache cache;
    cache.registerManifest(mayManifest());

    const AnimationManifest* manifest = cache.get(Sprite("npcs", "may"));
    ASSERT_NE(manifest, nullptr);
    EXPECT_NE(manifest->findClip("faint"), nullptr);
    EXPECT_EQ(cache.providerCalls(), 0u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.get(Sprite("npcs", "may")), nullptr);
}

TEST(AnimationManifestCacheTest, JsonFileProvider) {
    auto root = std::filesystem::temp_directory_path() / "overworld_sprites_test";
    std::filesystem::create_directories(root / "npcs");
    {
        std::ofstream out(root / "npcs" / "may.json");
        out << R"({"clips": [{"name": "idle_south", "frames": [{"x": 0, "y": 0, "w": 16, "h": 16}]}]})";
    }

    AnimationManifestCache cache(AnimationManifestCache::jsonFileProvider(root.string()));
    const AnimationManifest* may = cache.get(Sprite("npcs", "may"));
    ASSERT_NE(may, nullptr);
    EXPECT_EQ(may->category, "npcs");
    EXPECT_NE(may->findClip("idle_south"), nullptr);
    EXPECT_EQ(cache.get(Sprite("npcs", "nobody")), nullptr);

    std::filesystem::remove_all(root);
}

// =============================================================================
// AnimationSystem
// =============================================================================

class AnimationSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        manifests.registerManifest(mayManifest());
        system.init(registry);
        system.setFrameEventCallback([this](Entity, const std::string& clip, size_t frame) {
            events.emplace_back(clip, frame);
        });
    }

    Registry registry;
    AnimationManifestCache manifests;
    AnimationSystem system{manifests};
    std::vector<std::pair<std::string, size_t>> events;
    Sprite sprite{"npcs", "may"};
};

TEST_F(AnimationSystemTest, FramesAdvanceAndSourceRectFollows) {
    Animation anim("walk_south");
    system.advance(NullEntity, sprite, anim, kFrame);
    EXPECT_EQ(anim.currentFrame, 1u);
    EXPECT_FLOAT_EQ(anim.frameTimer, 0.0f);
    EXPECT_FLOAT_EQ(sprite.sourceRect.x, 16.0f);

    system.advance(NullEntity, sprite, anim, kFrame / 2);
    EXPECT_EQ(anim.currentFrame, 1u);
    EXPECT_FLOAT_EQ(anim.frameTimer, kFrame / 2);
}

TEST_F(AnimationSystemTest, LoopingWrapsAndFiresEventsOncePerLoop) {
    Animation anim("walk_south");
    for (int i = 0; i < 6; ++i) {
        system.advance(NullEntity, sprite, anim, kFrame);
    }

    EXPECT_EQ(anim.currentFrame, 2u);
    EXPECT_FALSE(anim.isComplete);
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].second, 0u);
    EXPECT_EQ(events[1].second, 2u);
    EXPECT_EQ(events[2].second, 0u);
    EXPECT_EQ(events[3].second, 2u);
    EXPECT_EQ(events[0].first, "walk_south");
}

TEST_F(AnimationSystemTest, WrapClearsTriggeredBits) {
    Animation anim("walk_south");
    for (int i = 0; i < 3; ++i) {
        system.advance(NullEntity, sprite, anim, kFrame);
    }
    EXPECT_TRUE(anim.hasTriggered(0));
    EXPECT_TRUE(anim.hasTriggered(2));

    system.advance(NullEntity, sprite, anim, kFrame);
    EXPECT_EQ(anim.currentFrame, 0u);
    // Only frame 0 has fired in the new loop
    EXPECT_EQ(anim.triggeredFrames, uint64_t{1});
}

TEST_F(AnimationSystemTest, LargeStepCrossesSeveralFrames) {
    Animation anim("walk_south");
    system.advance(NullEntity, sprite, anim, kFrame * 3);
    EXPECT_EQ(anim.currentFrame, 3u);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].second, 2u);
}

TEST_F(AnimationSystemTest, NonLoopingClampsAndCompletes) {
    Animation anim("faint");
    system.advance(NullEntity, sprite, anim, 1.0f);

    EXPECT_EQ(anim.currentFrame, 2u);
    EXPECT_TRUE(anim.isComplete);
    EXPECT_FLOAT_EQ(anim.frameTimer, 0.0f);
    EXPECT_FLOAT_EQ(sprite.sourceRect.x, 32.0f);

    system.advance(NullEntity, sprite, anim, 1.0f);
    EXPECT_EQ(anim.currentFrame, 2u);
    EXPECT_TRUE(anim.isComplete);

    // Playing the finished clip again starts it over
    anim.play("faint");
    EXPECT_FALSE(anim.isComplete);
    EXPECT_TRUE(anim.isPlaying);
    EXPECT_EQ(anim.currentFrame, 0u);
    EXPECT_FLOAT_EQ(anim.frameTimer, 0.0f);

    system.advance(NullEntity, sprite, anim, kFrame);
    EXPECT_EQ(anim.currentFrame, 1u);
    EXPECT_FALSE(anim.isComplete);
}

TEST_F(AnimationSystemTest, StoppedAnimationDoesNoWork) {
    size_t calls = 0;
    AnimationManifestCache counting([&calls](const std::string&, const std::string&)
            -> std::optional<AnimationManifest> {
        ++calls;
        return mayManifest();
    });
    AnimationSystem lazy(counting);

    Animation anim("walk_south");
    anim.stop();
    Rect before = sprite.sourceRect;
    lazy.advance(NullEntity, sprite, anim, 1.0f);

    EXPECT_EQ(calls, 0u);
    EXPECT_EQ(anim.currentFrame, 0u);
    EXPECT_FLOAT_EQ(anim.frameTimer, 0.0f);
    EXPECT_FLOAT_EQ(sprite.sourceRect.x, before.x);
}

TEST_F(AnimationSystemTest, MissingManifestKeepsState) {
    Sprite stranger("npcs", "stranger");
    Animation anim("walk_south");
    anim.currentFrame = 1;
    anim.frameTimer = 0.05f;

    system.advance(NullEntity, stranger, anim, 1.0f);
    EXPECT_EQ(anim.currentFrame, 1u);
    EXPECT_FLOAT_EQ(anim.frameTimer, 0.05f);
    EXPECT_TRUE(anim.isPlaying);
}

TEST_F(AnimationSystemTest, MissingClipKeepsState) {
    Animation anim("dance");
    system.advance(NullEntity, sprite, anim, 1.0f);
    EXPECT_EQ(anim.currentFrame, 0u);
    EXPECT_FLOAT_EQ(anim.frameTimer, 0.0f);
}

TEST_F(AnimationSystemTest, MissingAssetsReportedOnceAcrossFrames) {
    int providerCalls = 0;
    manifests.setProvider([&providerCalls](const std::string&, const std::string&) {
        ++providerCalls;
        return std::optional<AnimationManifest>{};
    });

    Sprite stranger("npcs", "stranger");
    Animation lost("walk_south");
    Animation dance("dance");
    for (int frame = 0; frame < 120; ++frame) {
        system.advance(NullEntity, stranger, lost, kFrame);
        system.advance(NullEntity, sprite, dance, kFrame);
    }

    EXPECT_EQ(providerCalls, 1);
    EXPECT_EQ(manifests.providerCalls(), 1u);
    // One warning for the manifest, one for the clip
    EXPECT_EQ(system.warningsLogged(), 2u);

    // A different missing clip on the same sprite is its own problem
    Animation spin("spin");
    system.advance(NullEntity, sprite, spin, kFrame);
    system.advance(NullEntity, sprite, spin, kFrame);
    EXPECT_EQ(system.warningsLogged(), 3u);
}

TEST_F(AnimationSystemTest, OutOfRangeFrameRestarts) {
    Animation anim("faint");
    anim.currentFrame = 10;
    system.advance(NullEntity, sprite, anim, kFrame / 2);
    EXPECT_EQ(anim.currentFrame, 0u);
    EXPECT_FLOAT_EQ(anim.frameTimer, kFrame / 2);
}

TEST_F(AnimationSystemTest, UpdateWritesBackToRegistry) {
    Entity may = registry.create(sprite, Animation("walk_south"));
    system.update(kFrame * 2);

    Animation anim = registry.get<Animation>(may);
    EXPECT_EQ(anim.currentFrame, 2u);
    EXPECT_FLOAT_EQ(registry.get<Sprite>(may).sourceRect.x, 32.0f);
}
