/**
 * @file detectable_shape.hpp
 * @brief 可检测对象形状：多 LOD 采样点、按距离选档、世界空间投影、配置与重扫描通知
 *
 * 状态机 {Empty, Populated}：OnScanResult 进入 Populated；Reset 回到 Empty。
 * Empty 时查询为定义良好的空操作：选择返回 0，投影返回空序列。
 * 配置修改通过显式 Set* 接口完成，返回 RescanRequired 并同步触发重扫描回调。
 */

#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <sensa_shape/lod_point_store.hpp>
#include <sensa_shape/lod_selector.hpp>
#include <sensa_shape/shape_types.hpp>
#include <sensa_shape/world_projection.hpp>

#include <glm/glm.hpp>

namespace sensa::shape {

/**
 * 为可检测对象保存形状点并管理 LOD。
 * 单线程同步使用；GetWorldPointsAtDistance / ProjectToWorld 返回内部缓冲引用，
 * 仅在下一次修改调用前有效。
 */
class DetectableShape {
public:
    /** 配置变化要求外部扫描器重新扫描时调用；无负载 */
    using RescanCallback = std::function<void()>;

    DetectableShape() = default;

    // -------------------------------------------------------------------------
    // 扫描结果与生命周期
    // -------------------------------------------------------------------------

    /**
     * 处理扫描器结果：校验后整体替换点数据，并将 scan/gizmo/selected LOD 重新 clamp 到 [0, maxLOD]。
     * @return 结构合法返回 true；不合法时返回 false，原状态保留，GetLastError() 返回原因
     */
    bool OnScanResult(int maxLOD, std::vector<PointSequence> levels);
    bool OnScanResult(ScanResult result);

    /** 清空点数据与 LOD 计数器，projection/drawGrid/点数归零；merge、flatten 保留 */
    void Reset();

    bool HasPoints() const { return store_.HasPoints(); }

    // -------------------------------------------------------------------------
    // 选择与投影
    // -------------------------------------------------------------------------

    /** 按归一化距离（0 近、1 远）选档，局部点视图随之切换 */
    int SelectByDistance(float normalizedDistance);

    /** 按请求 LOD 选档（Gizmo 控件），结果不超过 scanLOD */
    int SelectByLOD(int requested);

    /** 将当前选中档的局部点变换到世界空间 */
    const PointSequence& ProjectToWorld(const glm::mat4& localToWorld);

    /**
     * 检测逻辑每次查询的主入口：先 SelectByDistance，再 ProjectToWorld。
     * @param localToWorld 所属实体的局部到世界矩阵
     * @param normalizedDistance 传感器与对象的归一化距离
     */
    const PointSequence& GetWorldPointsAtDistance(const glm::mat4& localToWorld,
                                                  float normalizedDistance);

    /** 当前选中档的局部点（Empty 时为空序列） */
    const PointSequence& GetLocalPoints() const;

    /** 最近一次投影结果 */
    const PointSequence& GetWorldPoints() const { return projection_.GetPoints(); }

    /** 全部档点数据，供调试绘制与序列化 */
    const std::vector<PointSequence>& GetLevels() const { return store_.GetLevels(); }

    int GetMaxLOD() const { return selector_.GetMaxLOD(); }
    int GetScanLOD() const { return selector_.GetScanLOD(); }
    int GetGizmoLOD() const { return selector_.GetGizmoLOD(); }
    int GetSelectedLOD() const { return selector_.GetSelectedLOD(); }

    /** 当前选中档点数（诊断读数） */
    int GetPointCount() const { return pointCount_; }

    // -------------------------------------------------------------------------
    // 配置
    // -------------------------------------------------------------------------

    RescanRequired SetMerge(bool merge);

    /** 切换 flatten：projection 归零，gizmo 与选择回到 scanLOD（flatten 时为 0） */
    RescanRequired SetFlatten(bool flatten);

    /** [0,1]；flatten 时忽略 */
    RescanRequired SetProjection(float projection);

    /** [0, kMaxScanLOD]；gizmoLOD 跟随，并按新 gizmoLOD 重新选择 */
    RescanRequired SetScanLOD(int scanLOD);

    /** 调试网格单元尺寸，负值视为 0；不触发重扫描 */
    void SetDrawGrid(float cellSize);

    /** 恢复持久化配置：clamp 后直接写入，不触发重扫描回调 */
    void RestoreConfig(const ShapeConfig& config);

    /** 当前配置快照（scanLOD/gizmoLOD 取自选择器） */
    ShapeConfig GetConfig() const;

    bool IsMerge() const { return merge_; }
    bool IsFlatten() const { return selector_.IsFlatten(); }
    float GetProjection() const { return projectionAmount_; }
    float GetDrawGrid() const { return drawGrid_; }

    /** 运行模式由调用方设置：Live 时配置锁定，Gizmo LOD 跟随选择 */
    void SetMode(ShapeMode mode) { mode_ = mode; }
    ShapeMode GetMode() const { return mode_; }

    /** 设置重扫描回调（单一订阅者）；传空函数即取消订阅 */
    void SetRescanCallback(RescanCallback cb) { rescanCallback_ = std::move(cb); }

    const std::string& GetLastError() const { return lastError_; }

private:
    /** 选择后更新点数，Live 模式下同步 Gizmo LOD */
    void BindSelectedLevel();
    /** Edit 模式返回 true；Live 模式记录日志并返回 false */
    bool CanEdit(const char* what) const;
    RescanRequired RequestRescan();

    LODPointStore store_;
    LODSelector selector_;
    WorldProjection projection_;

    int pointCount_ = 0;

    bool merge_ = false;
    float projectionAmount_ = 0.f;
    float drawGrid_ = 0.f;

    ShapeMode mode_ = ShapeMode::Edit;
    RescanCallback rescanCallback_;
    std::string lastError_;
};

}  // namespace sensa::shape
