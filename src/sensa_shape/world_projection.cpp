/**
 * @file world_projection.cpp
 * @brief WorldProjection 实现
 */

#include <sensa_shape/world_projection.hpp>

namespace sensa::shape {

const PointSequence& WorldProjection::Project(const PointSequence& localPoints,
                                              const glm::mat4& localToWorld) {
    points_.clear();
    points_.reserve(localPoints.size());
    for (const Point3& p : localPoints)
        points_.push_back(TransformPoint(localToWorld, p));
    return points_;
}

}  // namespace sensa::shape
