/**
 * @file shape_gizmo.cpp
 * @brief DrawShapeGizmos 实现
 */

#include <sensa_debug/shape_gizmo.hpp>
#include <sensa_debug/grid_overlay.hpp>

#include <sensa_shape/detectable_shape.hpp>
#include <sensa_shape/world_projection.hpp>

namespace sensa::debug {

ShapeGizmoStats DrawShapeGizmos(const sensa::shape::DetectableShape& shape,
                                const glm::mat4& localToWorld,
                                IDebugDraw& draw) {
    ShapeGizmoStats stats;
    if (!shape.HasPoints()) return stats;

    const auto& levels = shape.GetLevels();
    const int selectedLOD = shape.GetSelectedLOD();
    for (size_t i = 0; i < levels.size(); ++i) {
        const bool isSelected = static_cast<int>(i) == selectedLOD;
        const glm::vec3 size(isSelected ? kSelectedPointSize : kOtherPointSize);
        draw.SetColor(isSelected ? colors::kRed : colors::kGrey);
        for (const auto& p : levels[i]) {
            draw.DrawCube(sensa::shape::TransformPoint(localToWorld, p), size);
            ++stats.pointMarkers;
        }
    }

    const float cellSize = shape.GetDrawGrid();
    if (IsGridEnabled(cellSize)) {
        sensa::shape::WorldProjection projection;
        const auto& worldPoints = projection.Project(shape.GetLocalPoints(), localToWorld);
        stats.gridCells = DrawGridOverlay(draw, worldPoints, cellSize);
    }
    return stats;
}

}  // namespace sensa::debug
