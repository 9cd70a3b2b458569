#include "building/BuilderConfig.hpp"
#include "config/Config.hpp"

#include <vector>

namespace Lodestone {
namespace Building {

BuilderConfig BuilderConfig::FromConfig(const Config& config) {
    BuilderConfig result;

    result.maxBuildRange = config.Get<float>("builder.max_build_range", result.maxBuildRange);
    result.pointerRayRadius = config.Get<float>("builder.pointer_ray_radius", result.pointerRayRadius);
    result.overlapRadius = config.Get<float>("builder.overlap_radius", result.overlapRadius);

    result.rotateSpeed = config.Get<float>("builder.rotate_speed", result.rotateSpeed);
    result.angleIncrement = config.Get<float>("builder.angle_increment", result.angleIncrement);

    result.staySnappedWhenBlocked = config.Get<bool>("builder.stay_snapped_when_blocked",
                                                     result.staySnappedWhenBlocked);
    result.flipFaceAlignment = config.Get<bool>("builder.flip_face_alignment", result.flipFaceAlignment);
    result.snapBias = glm::clamp(config.Get<float>("builder.snap_bias", result.snapBias), -1.0f, 1.0f);

    result.useWorldGrid = config.Get<bool>("builder.use_world_grid", result.useWorldGrid);
    result.worldGridDivisions = config.Get<glm::vec3>("builder.world_grid_divisions",
                                                      result.worldGridDivisions);

    result.onPlacedDelay = config.Get<float>("builder.on_placed_delay", result.onPlacedDelay);
    result.lockCameraInMenu = config.Get<bool>("builder.lock_camera_in_menu", result.lockCameraInMenu);
    result.lockPlacementInMenu = config.Get<bool>("builder.lock_placement_in_menu",
                                                  result.lockPlacementInMenu);

    if (config.Has("builder.surface_layers")) {
        result.surfaceMask = MaskFromLayers(config.Get<std::vector<int>>("builder.surface_layers"));
    }
    if (config.Has("builder.magnet_layers")) {
        result.magnetMask = MaskFromLayers(config.Get<std::vector<int>>("builder.magnet_layers"));
    }
    result.focusLayer = config.Get<int>("builder.focus_layer", result.focusLayer);

    return result;
}

} // namespace Building
} // namespace Lodestone
