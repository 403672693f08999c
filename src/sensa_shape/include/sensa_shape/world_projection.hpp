/**
 * @file world_projection.hpp
 * @brief 世界空间投影：将局部点经 localToWorld 矩阵变换到可复用缓冲
 */

#pragma once

#include <sensa_shape/shape_types.hpp>

#include <glm/glm.hpp>

namespace sensa::shape {

/**
 * 持有可复用输出缓冲。每次 Project 先清空再填充，不累积旧数据。
 * 返回的引用仅在下一次 Project/Clear 之前有效，非线程安全。
 */
class WorldProjection {
public:
    WorldProjection() = default;

    /**
     * 将 localPoints 经仿射变换（平移、旋转、缩放）变换到世界空间。
     * 等价于取 localToWorld * vec4(p, 1) 的 xyz，忽略投影行。
     */
    const PointSequence& Project(const PointSequence& localPoints, const glm::mat4& localToWorld);

    const PointSequence& GetPoints() const { return points_; }

    void Clear() { points_.clear(); }

private:
    PointSequence points_;
};

/** 单点变换，供不需要缓冲的调用方（如 Gizmo 绘制） */
inline Point3 TransformPoint(const glm::mat4& localToWorld, const Point3& p) {
    return Point3(localToWorld * glm::vec4(p, 1.f));
}

}  // namespace sensa::shape
