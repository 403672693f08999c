/**
 * @file detectable_shape.cpp
 * @brief DetectableShape 实现：扫描结果替换、选档绑定、配置修改与重扫描通知
 */

#include <sensa_shape/detectable_shape.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace sensa::shape {

namespace {

float SanitizeProjection(float projection) {
    if (std::isnan(projection)) return 0.f;
    return std::clamp(projection, 0.f, 1.f);
}

float SanitizeGridSize(float cellSize) {
    if (std::isnan(cellSize) || cellSize < 0.f) return 0.f;
    return cellSize;
}

}  // namespace

bool DetectableShape::OnScanResult(int maxLOD, std::vector<PointSequence> levels) {
    const size_t levelCount = levels.size();
    if (!store_.SetScanResult(maxLOD, std::move(levels))) {
        lastError_ = store_.GetLastError();
        return false;
    }
    lastError_.clear();

    // 世界缓冲随旧点集一起失效
    projection_.Clear();

    selector_.SetMaxLOD(maxLOD);
    BindSelectedLevel();

    spdlog::debug("DetectableShape: scan result maxLOD={} levels={} selectedLOD={} points={}",
                  maxLOD, levelCount, selector_.GetSelectedLOD(), pointCount_);
    return true;
}

bool DetectableShape::OnScanResult(ScanResult result) {
    return OnScanResult(result.maxLOD, std::move(result.levelsByLOD));
}

void DetectableShape::Reset() {
    store_.Clear();
    projection_.Clear();
    selector_.Reset();
    pointCount_ = 0;
    projectionAmount_ = 0.f;
    drawGrid_ = 0.f;
    lastError_.clear();
}

int DetectableShape::SelectByDistance(float normalizedDistance) {
    selector_.SelectByDistance(normalizedDistance);
    BindSelectedLevel();
    return selector_.GetSelectedLOD();
}

int DetectableShape::SelectByLOD(int requested) {
    selector_.SelectByLOD(requested);
    BindSelectedLevel();
    return selector_.GetSelectedLOD();
}

const PointSequence& DetectableShape::ProjectToWorld(const glm::mat4& localToWorld) {
    return projection_.Project(GetLocalPoints(), localToWorld);
}

const PointSequence& DetectableShape::GetWorldPointsAtDistance(const glm::mat4& localToWorld,
                                                               float normalizedDistance) {
    SelectByDistance(normalizedDistance);
    return ProjectToWorld(localToWorld);
}

const PointSequence& DetectableShape::GetLocalPoints() const {
    // 不缓存指向 store_ 的指针，按选中档即时取视图
    return store_.GetLevel(selector_.GetSelectedLOD());
}

RescanRequired DetectableShape::SetMerge(bool merge) {
    if (!CanEdit("merge") || merge == merge_) return RescanRequired::No;
    merge_ = merge;
    return RequestRescan();
}

RescanRequired DetectableShape::SetFlatten(bool flatten) {
    if (!CanEdit("flatten") || flatten == selector_.IsFlatten()) return RescanRequired::No;
    selector_.SetFlatten(flatten);
    projectionAmount_ = 0.f;
    // Gizmo 与选择回到 scanLOD；flatten 时 ApplySelection 强制为 0
    selector_.SelectByLOD(selector_.GetScanLOD());
    BindSelectedLevel();
    return RequestRescan();
}

RescanRequired DetectableShape::SetProjection(float projection) {
    if (!CanEdit("projection")) return RescanRequired::No;
    if (selector_.IsFlatten()) return RescanRequired::No;
    const float value = SanitizeProjection(projection);
    if (value == projectionAmount_) return RescanRequired::No;
    projectionAmount_ = value;
    // TODO: 仅修改 projection 时可在本地重新投射，无需完整重扫描
    return RequestRescan();
}

RescanRequired DetectableShape::SetScanLOD(int scanLOD) {
    if (!CanEdit("scanLOD")) return RescanRequired::No;
    const int value = std::clamp(scanLOD, 0, kMaxScanLOD);
    if (value == selector_.GetScanLOD()) return RescanRequired::No;
    selector_.SetScanLOD(value);
    RequestRescan();
    // 回调可能已同步送回新扫描结果，按当前 gizmoLOD 重新选择
    selector_.SelectByLOD(selector_.GetGizmoLOD());
    BindSelectedLevel();
    return RescanRequired::Yes;
}

void DetectableShape::SetDrawGrid(float cellSize) {
    drawGrid_ = SanitizeGridSize(cellSize);
}

void DetectableShape::RestoreConfig(const ShapeConfig& config) {
    merge_ = config.merge;
    selector_.SetFlatten(config.flatten);
    projectionAmount_ = config.flatten ? 0.f : SanitizeProjection(config.projection);
    selector_.SetScanLOD(config.scanLOD);
    selector_.SetGizmoLOD(config.gizmoLOD);
    drawGrid_ = SanitizeGridSize(config.drawGrid);
    selector_.SelectByLOD(selector_.GetGizmoLOD());
    BindSelectedLevel();
}

ShapeConfig DetectableShape::GetConfig() const {
    ShapeConfig config;
    config.merge = merge_;
    config.flatten = selector_.IsFlatten();
    config.projection = projectionAmount_;
    config.scanLOD = selector_.GetScanLOD();
    config.gizmoLOD = selector_.GetGizmoLOD();
    config.drawGrid = drawGrid_;
    return config;
}

void DetectableShape::BindSelectedLevel() {
    if (!store_.HasPoints()) {
        pointCount_ = 0;
        return;
    }
    pointCount_ = static_cast<int>(GetLocalPoints().size());

    // Live 模式下 Gizmo LOD 与检测器当前请求的 LOD 保持一致
    if (mode_ == ShapeMode::Live)
        selector_.SetGizmoLOD(selector_.GetSelectedLOD());
}

bool DetectableShape::CanEdit(const char* what) const {
    if (mode_ == ShapeMode::Edit) return true;
    spdlog::debug("DetectableShape: {} change ignored in live mode", what);
    return false;
}

RescanRequired DetectableShape::RequestRescan() {
    if (rescanCallback_)
        rescanCallback_();
    return RescanRequired::Yes;
}

}  // namespace sensa::shape
