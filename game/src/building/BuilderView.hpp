#pragma once

/**
 * @file BuilderView.hpp
 * @brief Camera services the Builder uses when available
 */

#include <glm/glm.hpp>

namespace Lodestone {
namespace Building {

class IBuilderView {
public:
    virtual ~IBuilderView() = default;

    [[nodiscard]] virtual glm::vec3 GetCameraPosition() const = 0;

    /**
     * @brief Project a world point; x and y span [0, 1] across the viewport
     */
    [[nodiscard]] virtual glm::vec3 WorldToViewport(const glm::vec3& worldPoint) const = 0;

    /**
     * @brief Suspend camera movement, e.g. while the tool menu is open
     */
    virtual void SetMovementLocked(bool locked) = 0;
};

} // namespace Building
} // namespace Lodestone
