#include "gameplay/SpriteAnimation.hpp"
#include "engine/Log.hpp"

#include <fstream>

namespace overworld {

ManifestKey makeManifestKey(const std::string& category, const std::string& name) {
    std::string composite = category + "/" + name;
    return entt::hashed_string::value(composite.c_str(), composite.size());
}

AnimationClip AnimationClip::fromGrid(const std::string& name, int startX, int startY,
                                      int frameWidth, int frameHeight, int frameCount,
                                      float frameDuration, bool loop) {
    AnimationClip clip;
    clip.name = name;
    clip.loop = loop;
    clip.frames.reserve(frameCount > 0 ? static_cast<size_t>(frameCount) : 0);
    for (int i = 0; i < frameCount; ++i) {
        clip.frames.push_back({
            Rect(static_cast<float>(startX + i * frameWidth), static_cast<float>(startY),
                 static_cast<float>(frameWidth), static_cast<float>(frameHeight)),
            frameDuration
        });
    }
    return clip;
}

// ---------------------------------------------------------------------------
// AnimationManifest
// ---------------------------------------------------------------------------

bool AnimationManifest::addClip(AnimationClip clip) {
    if (clip.frames.empty()) {
        LOG_WARN("AnimationManifest '{}/{}': clip '{}' has no frames", category, name, clip.name);
        return false;
    }
    if (clip.frames.size() > AnimationClip::MaxFrames) {
        LOG_ERROR("AnimationManifest '{}/{}': clip '{}' has {} frames, limit is {}",
                  category, name, clip.name, clip.frames.size(), AnimationClip::MaxFrames);
        return false;
    }
    for (const auto& frame : clip.frames) {
        if (frame.duration <= 0.0f) {
            LOG_WARN("AnimationManifest '{}/{}': clip '{}' has a non-positive frame duration",
                     category, name, clip.name);
            return false;
        }
    }
    std::string key = clip.name;
    clips[key] = std::move(clip);
    return true;
}

std::optional<AnimationManifest> AnimationManifest::fromJson(const nlohmann::json& json,
                                                             const std::string& category,
                                                             const std::string& name) {
    if (!json.is_object()) {
        return std::nullopt;
    }

    AnimationManifest manifest;
    manifest.category = category;
    manifest.name = name;

    if (!json.contains("clips") || !json["clips"].is_array()) {
        LOG_WARN("AnimationManifest '{}/{}': no 'clips' array", category, name);
        return manifest;
    }

    for (const auto& clipJson : json["clips"]) {
        AnimationClip clip;
        clip.name = clipJson.value("name", "");
        if (clip.name.empty()) {
            LOG_WARN("AnimationManifest '{}/{}': clip missing 'name'", category, name);
            continue;
        }
        clip.loop = clipJson.value("loop", true);
        float defaultDuration = clipJson.value("frame_duration", 0.15f);

        if (clipJson.contains("frames") && clipJson["frames"].is_array()) {
            for (const auto& frameJson : clipJson["frames"]) {
                AnimationFrame frame;
                frame.sourceRect = Rect(
                    frameJson.value("x", 0.0f),
                    frameJson.value("y", 0.0f),
                    frameJson.value("w", 0.0f),
                    frameJson.value("h", 0.0f)
                );
                frame.duration = frameJson.value("duration", defaultDuration);
                clip.frames.push_back(frame);
            }
        }

        if (clipJson.contains("events") && clipJson["events"].is_array()) {
            for (const auto& ev : clipJson["events"]) {
                int index = ev.get<int>();
                if (index >= 0 && static_cast<size_t>(index) < AnimationClip::MaxFrames) {
                    clip.eventFrames |= uint64_t{1} << index;
                }
            }
        }

        manifest.addClip(std::move(clip));
    }
    return manifest;
}

// ---------------------------------------------------------------------------
// AnimationManifestCache
// ---------------------------------------------------------------------------

const AnimationManifest* AnimationManifestCache::get(const Sprite& sprite) {
    auto it = m_entries.find(sprite.manifestKey);
    if (it != m_entries.end()) {
        return it->second ? &*it->second : nullptr;
    }

    std::optional<AnimationManifest> loaded;
    if (m_provider) {
        ++m_providerCalls;
        loaded = m_provider(sprite.category, sprite.name);
    }
    auto inserted = m_entries.emplace(sprite.manifestKey, std::move(loaded)).first;
    return inserted->second ? &*inserted->second : nullptr;
}

void AnimationManifestCache::registerManifest(AnimationManifest manifest) {
    ManifestKey key = makeManifestKey(manifest.category, manifest.name);
    m_entries[key] = std::move(manifest);
}

void AnimationManifestCache::invalidate(ManifestKey key) {
    m_entries.erase(key);
}

void AnimationManifestCache::clear() {
    m_entries.clear();
}

AnimationManifestCache::Provider AnimationManifestCache::jsonFileProvider(const std::string& root) {
    return [root](const std::string& category, const std::string& name)
            -> std::optional<AnimationManifest> {
        std::string path = root + "/" + category + "/" + name + ".json";
        std::ifstream file(path);
        if (!file.is_open()) {
            LOG_WARN("AnimationManifestCache: no manifest at '{}'", path);
            return std::nullopt;
        }
        try {
            return AnimationManifest::fromJson(nlohmann::json::parse(file), category, name);
        } catch (const nlohmann::json::exception& e) {
            LOG_ERROR("AnimationManifestCache: failed to parse '{}': {}", path, e.what());
            return std::nullopt;
        }
    };
}

// ---------------------------------------------------------------------------
// AnimationSystem
// ---------------------------------------------------------------------------

void AnimationSystem::update(float dt) {
    getRegistry().query<Sprite, Animation>(
        [this, dt](Entity entity, Sprite& sprite, Animation& anim) {
            advance(entity, sprite, anim, dt);
        }
    );
}

void AnimationSystem::fireIfNeeded(Entity entity, const AnimationClip& clip, Animation& anim) {
    size_t frame = anim.currentFrame;
    if (frame >= AnimationClip::MaxFrames) return;
    if ((clip.eventFrames & (uint64_t{1} << frame)) == 0) return;
    if (anim.hasTriggered(frame)) return;

    anim.markTriggered(frame);
    if (m_onFrameEvent) {
        m_onFrameEvent(entity, clip.name, frame);
    }
}

bool AnimationSystem::firstReport(std::unordered_set<uint64_t>& seen, ManifestKey manifest,
                                  entt::id_type clip) {
    const uint64_t key = (static_cast<uint64_t>(clip) << 32) | manifest;
    if (!seen.insert(key).second) {
        return false;
    }
    ++m_warningsLogged;
    return true;
}

void AnimationSystem::advance(Entity entity, Sprite& sprite, Animation& anim, float dt) {
    if (!anim.isPlaying || anim.isComplete) {
        return;
    }

    const AnimationManifest* manifest = m_manifests.get(sprite);
    if (!manifest) {
        if (firstReport(m_missingManifests, sprite.manifestKey)) {
            LOG_WARN("AnimationSystem: no manifest for sprite '{}/{}'", sprite.category, sprite.name);
        }
        return;
    }

    const AnimationClip* clip = manifest->findClip(anim.currentAnimation);
    if (!clip) {
        const auto clipKey = entt::hashed_string::value(anim.currentAnimation.c_str(),
                                                         anim.currentAnimation.size());
        if (firstReport(m_missingClips, sprite.manifestKey, clipKey)) {
            LOG_WARN("AnimationSystem: sprite '{}/{}' has no clip '{}'",
                     sprite.category, sprite.name, anim.currentAnimation);
        }
        return;
    }

    const size_t frameCount = clip->frames.size();
    if (anim.currentFrame >= frameCount) {
        const auto clipKey = entt::hashed_string::value(clip->name.c_str(), clip->name.size());
        if (firstReport(m_badFrames, sprite.manifestKey, clipKey)) {
            LOG_WARN("AnimationSystem: frame {} out of range for clip '{}', restarting",
                     anim.currentFrame, anim.currentAnimation);
        }
        anim.currentFrame = 0;
        anim.frameTimer = 0.0f;
    }

    // Entering the first frame counts as reaching it
    fireIfNeeded(entity, *clip, anim);

    anim.frameTimer += dt;
    while (anim.frameTimer >= clip->frames[anim.currentFrame].duration) {
        anim.frameTimer -= clip->frames[anim.currentFrame].duration;

        if (anim.currentFrame + 1 < frameCount) {
            ++anim.currentFrame;
        } else if (clip->loop) {
            anim.currentFrame = 0;
            anim.triggeredFrames = 0;
        } else {
            anim.currentFrame = frameCount - 1;
            anim.frameTimer = 0.0f;
            anim.isComplete = true;
            break;
        }
        fireIfNeeded(entity, *clip, anim);
    }

    sprite.sourceRect = clip->frames[anim.currentFrame].sourceRect;
}

} // namespace overworld
