/**
 * @file lod_selector.cpp
 * @brief LODSelector 实现：距离反向映射、clamp 与 flatten 覆盖
 */

#include <sensa_shape/lod_selector.hpp>
#include <sensa_shape/shape_types.hpp>

#include <algorithm>
#include <cmath>

namespace sensa::shape {

int LODSelector::DistanceToLOD(float normalizedDistance, int maxLOD) {
    // NaN 按最远处理；先 clamp 距离，避免超大值转 int 溢出
    const float d = std::isnan(normalizedDistance) ? 1.f : std::clamp(normalizedDistance, 0.f, 1.f);
    // 距离 0 为最近 -> 最高档
    const float raw = (1.f - d) * static_cast<float>(maxLOD);
    return static_cast<int>(std::nearbyint(raw));
}

int LODSelector::ClampLOD(int lod, int maxLOD) {
    return std::clamp(lod, 0, std::max(maxLOD, 0));
}

int LODSelector::SelectByDistance(float normalizedDistance) {
    return ApplySelection(DistanceToLOD(normalizedDistance, maxLOD_));
}

int LODSelector::SelectByLOD(int requested) {
    // Gizmo LOD 不能高于扫描 LOD，更细的数据不存在
    gizmoLOD_ = std::clamp(requested, 0, scanLOD_);
    return ApplySelection(gizmoLOD_);
}

int LODSelector::SetMaxLOD(int maxLOD) {
    maxLOD_ = std::max(maxLOD, 0);
    scanLOD_ = ClampLOD(scanLOD_, maxLOD_);
    gizmoLOD_ = ClampLOD(gizmoLOD_, maxLOD_);
    return ApplySelection(selectedLOD_);
}

void LODSelector::SetScanLOD(int scanLOD) {
    scanLOD_ = std::clamp(scanLOD, 0, kMaxScanLOD);
    gizmoLOD_ = scanLOD_;
}

void LODSelector::SetGizmoLOD(int gizmoLOD) {
    gizmoLOD_ = std::clamp(gizmoLOD, 0, scanLOD_);
}

void LODSelector::Reset() {
    maxLOD_ = 0;
    scanLOD_ = 0;
    gizmoLOD_ = 0;
    selectedLOD_ = 0;
}

int LODSelector::ApplySelection(int lod) {
    selectedLOD_ = flatten_ ? 0 : ClampLOD(lod, maxLOD_);
    return selectedLOD_;
}

}  // namespace sensa::shape
