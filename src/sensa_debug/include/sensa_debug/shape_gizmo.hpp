/**
 * @file shape_gizmo.hpp
 * @brief 形状 Gizmo：绘制全部 LOD 点并高亮选中档，可选网格去重覆盖层
 *
 * 只读使用 DetectableShape：投影写入本模块自己的缓冲，不改变形状的选择状态与世界缓冲。
 */

#pragma once

#include <cstddef>

#include <sensa_debug/debug_draw.hpp>

#include <glm/glm.hpp>

namespace sensa::shape {
class DetectableShape;
}

namespace sensa::debug {

/** 选中档点标记边长 */
constexpr float kSelectedPointSize = 0.05f;
/** 其他档点标记边长 */
constexpr float kOtherPointSize = 0.025f;

/** 单次 Gizmo 绘制统计 */
struct ShapeGizmoStats {
    size_t pointMarkers = 0;  ///< 点标记数（全部档）
    size_t gridCells = 0;     ///< 网格覆盖层单元数
};

/**
 * 绘制形状调试覆盖层。无点数据时不绘制。
 * 选中档为红色 kSelectedPointSize，其余档为灰色 kOtherPointSize；
 * 随后按 shape.GetDrawGrid() 对选中档绘制网格覆盖层。
 * @param localToWorld 所属实体的局部到世界矩阵
 */
ShapeGizmoStats DrawShapeGizmos(const sensa::shape::DetectableShape& shape,
                                const glm::mat4& localToWorld,
                                IDebugDraw& draw);

}  // namespace sensa::debug
