/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IASSET_PROVIDER_HPP
#define IASSET_PROVIDER_HPP

#include <memory>
#include <string>

namespace HordeEngine {

/**
 * @brief Opaque handle to a loaded skinned model
 *
 * Loading and skeleton cloning belong to the host; the simulation only
 * needs to know the model exists.
 */
struct ModelAsset {
    std::string kind;
    float unitScale{1.0f};
};

struct AnimationClip {
    std::string name;
    float duration{1.0f}; // Seconds at 1x playback
};

/**
 * @brief Host asset cache
 *
 * Both getters return nullptr when the asset is unknown and may throw
 * AssetLoadError when it exists but cannot be read.
 */
class IAssetProvider {
public:
    virtual ~IAssetProvider() = default;

    virtual std::shared_ptr<const ModelAsset> getModel(const std::string& kind) const = 0;
    virtual std::shared_ptr<const AnimationClip> getAnimation(const std::string& id) const = 0;
};

} // namespace HordeEngine

#endif // IASSET_PROVIDER_HPP
