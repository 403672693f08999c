/**
 * @file grid_overlay.hpp
 * @brief 网格去重覆盖层：世界点吸附到网格单元中心并去重，每个单元绘制一次
 *
 * 吸附：各轴独立 round(p / g) * g（四舍六入五成双）。
 * 去重按吸附后坐标的浮点精确相等判断；仅因舍入噪声不同的坐标视为不同单元，不做容差比较。
 * g < kMinGridCellSize（含 g <= 0、NaN）时覆盖层关闭。
 */

#pragma once

#include <cstddef>
#include <vector>

#include <sensa_debug/debug_draw.hpp>
#include <sensa_shape/shape_types.hpp>

#include <glm/glm.hpp>

namespace sensa::debug {

/** 网格单元最小尺寸，小于此值视为关闭 */
constexpr float kMinGridCellSize = 1e-3f;

/** 网格尺寸是否启用覆盖层 */
bool IsGridEnabled(float cellSize);

/** 将点吸附到最近的网格单元中心 */
glm::vec3 SnapToGrid(const glm::vec3& p, float cellSize);

/**
 * 按出现顺序返回去重后的吸附坐标。
 * 网格关闭时返回空。
 */
std::vector<glm::vec3> CollectGridCells(const sensa::shape::PointSequence& worldPoints, float cellSize);

/**
 * 为每个唯一单元绘制线框立方体（蓝 × 0.75）与实心立方体（蓝 × 0.4），边长为 cellSize。
 * @return 绘制的单元数
 */
size_t DrawGridOverlay(IDebugDraw& draw, const sensa::shape::PointSequence& worldPoints, float cellSize);

}  // namespace sensa::debug
