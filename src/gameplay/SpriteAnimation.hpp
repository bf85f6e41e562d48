#pragma once

#include "ecs/Systems.hpp"
#include "engine/Geometry.hpp"

#include <entt/entt.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace overworld {

/// Stable identifier of an animation manifest (hashed "category/name")
using ManifestKey = entt::id_type;

ManifestKey makeManifestKey(const std::string& category, const std::string& name);

/// A single frame: source rect in the sprite sheet and how long it shows
struct AnimationFrame {
    Rect sourceRect;
    float duration = 0.15f;     // Seconds
};

/// A named sequence of frames
struct AnimationClip {
    /// Frame events are tracked in a 64-bit field, one bit per frame
    static constexpr size_t MaxFrames = 64;

    std::string name;
    std::vector<AnimationFrame> frames;
    bool loop = true;
    uint64_t eventFrames = 0;   // Bit i set: entering frame i fires an event

    size_t frameCount() const { return frames.size(); }

    float totalDuration() const {
        float total = 0.0f;
        for (const auto& frame : frames) total += frame.duration;
        return total;
    }

    /// Build a horizontal strip of equally sized frames
    static AnimationClip fromGrid(const std::string& name, int startX, int startY,
                                  int frameWidth, int frameHeight, int frameCount,
                                  float frameDuration = 0.15f, bool loop = true);
};

/// Every clip of one sprite sheet
struct AnimationManifest {
    std::string category;
    std::string name;
    std::unordered_map<std::string, AnimationClip> clips;

    /// Add a clip. Rejects clips with no frames, more than MaxFrames frames,
    /// or a non-positive frame duration.
    bool addClip(AnimationClip clip);

    const AnimationClip* findClip(const std::string& clipName) const {
        auto it = clips.find(clipName);
        return it != clips.end() ? &it->second : nullptr;
    }

    /// Parse {"clips": [{"name", "loop", "frames": [{x, y, w, h, duration}], "events": [i...]}]}.
    /// Invalid clips are skipped and logged; returns nullopt if the JSON is not an object.
    static std::optional<AnimationManifest> fromJson(const nlohmann::json& json,
                                                     const std::string& category,
                                                     const std::string& name);
};

/// Visual identity of an animated entity. The manifest key is computed once
/// here and never rebuilt per frame.
struct Sprite {
    std::string category;       // e.g. "npcs", "players"
    std::string name;           // e.g. "may"
    ManifestKey manifestKey = 0;
    Rect sourceRect;
    bool flipHorizontal = false;

    Sprite() = default;
    Sprite(std::string spriteCategory, std::string spriteName)
        : category(std::move(spriteCategory))
        , name(std::move(spriteName))
        , manifestKey(makeManifestKey(category, name)) {}
};

/// Playback state of the entity's current clip
struct Animation {
    std::string currentAnimation;
    size_t currentFrame = 0;
    float frameTimer = 0.0f;
    bool isPlaying = true;
    bool isComplete = false;
    uint64_t triggeredFrames = 0;   // Frame events already fired this loop

    Animation() = default;
    explicit Animation(std::string clip) : currentAnimation(std::move(clip)) {}

    /// Switch clips. Playing the current clip again is a no-op unless
    /// forceRestart is set.
    /// Switch clips, or resume the current one. A finished clip always
    /// restarts, since there is nothing left to resume.
    void play(const std::string& clip, bool forceRestart = false) {
        if (clip == currentAnimation && !forceRestart && !isComplete) {
            isPlaying = true;
            return;
        }
        currentAnimation = clip;
        currentFrame = 0;
        frameTimer = 0.0f;
        isPlaying = true;
        isComplete = false;
        triggeredFrames = 0;
    }

    void stop() { isPlaying = false; }

    bool hasTriggered(size_t frame) const {
        return frame < AnimationClip::MaxFrames && (triggeredFrames & (uint64_t{1} << frame)) != 0;
    }

    void markTriggered(size_t frame) {
        if (frame < AnimationClip::MaxFrames) {
            triggeredFrames |= uint64_t{1} << frame;
        }
    }
};

/// Manifests keyed by ManifestKey, filled on first use through a provider.
/// A provider miss is remembered, so a missing manifest costs one lookup
/// per frame, not one provider call. Invalidate on asset reload only.
class AnimationManifestCache {
public:
    using Provider = std::function<std::optional<AnimationManifest>(const std::string& category,
                                                                    const std::string& name)>;

    AnimationManifestCache() = default;
    explicit AnimationManifestCache(Provider provider) : m_provider(std::move(provider)) {}

    void setProvider(Provider provider) { m_provider = std::move(provider); }

    /// Manifest for a sprite, loading it on first use. nullptr if unavailable.
    const AnimationManifest* get(const Sprite& sprite);

    /// Insert or replace a manifest directly
    void registerManifest(AnimationManifest manifest);

    /// Forget one manifest (asset reload)
    void invalidate(ManifestKey key);

    /// Forget everything
    void clear();

    size_t size() const { return m_entries.size(); }
    size_t providerCalls() const { return m_providerCalls; }

    /// Provider reading "<root>/<category>/<name>.json"
    static Provider jsonFileProvider(const std::string& root);

private:
    std::unordered_map<ManifestKey, std::optional<AnimationManifest>> m_entries;
    Provider m_provider;
    size_t m_providerCalls = 0;
};

/// Advances Animation frame state for entities with Sprite + Animation and
/// writes the current frame's source rect into the Sprite.
class AnimationSystem : public System {
public:
    using FrameEventCallback = std::function<void(Entity, const std::string& clip, size_t frame)>;

    explicit AnimationSystem(AnimationManifestCache& manifests)
        : System("AnimationSystem", SystemPriority::Animation), m_manifests(manifests) {}

    void update(float dt) override;

    void setFrameEventCallback(FrameEventCallback callback) { m_onFrameEvent = std::move(callback); }

    /// Advance one entity. Exposed for tools and tests.
    void advance(Entity entity, Sprite& sprite, Animation& anim, float dt);

    /// Warnings logged for missing manifests, missing clips and bad frames
    size_t warningsLogged() const { return m_warningsLogged; }

private:
    void fireIfNeeded(Entity entity, const AnimationClip& clip, Animation& anim);

    /// True the first time a problem key is seen. Keys are built from
    /// hashes only, so the degraded per-frame path allocates nothing.
    bool firstReport(std::unordered_set<uint64_t>& seen, ManifestKey manifest, entt::id_type clip = 0);

    AnimationManifestCache& m_manifests;
    FrameEventCallback m_onFrameEvent;
    std::unordered_set<uint64_t> m_missingManifests;
    std::unordered_set<uint64_t> m_missingClips;
    std::unordered_set<uint64_t> m_badFrames;
    size_t m_warningsLogged = 0;
};

} // namespace overworld
