/**
 * @file lod_selector.hpp
 * @brief LOD 选择器：按归一化距离或请求 LOD 选出合法索引
 *
 * 距离 0（最近）映射到 maxLOD（最细），距离 1（最远）映射到 0（最粗）：
 *   raw = round((1 - d) * maxLOD)，再 clamp 到 [0, maxLOD]。
 * flatten 时一律选 0（硬覆盖，而非 clamp）。
 * SelectByLOD 额外保证 gizmoLOD <= scanLOD。
 */

#pragma once

namespace sensa::shape {

/**
 * LOD 计数器与选择规则。仅保存索引，不持有点数据；
 * 选择后由 DetectableShape 重新绑定局部点视图。
 */
class LODSelector {
public:
    LODSelector() = default;

    /**
     * 将归一化距离映射为原始 LOD（未考虑 flatten）。
     * 距离先 clamp 到 [0,1]（NaN 视为 1），舍入为四舍六入五成双。
     */
    static int DistanceToLOD(float normalizedDistance, int maxLOD);

    /** 将 lod clamp 到 [0, maxLOD]；maxLOD < 0 视为 0 */
    static int ClampLOD(int lod, int maxLOD);

    /**
     * 按距离选择 LOD 并写入 selectedLOD。
     * @param normalizedDistance 0 最近，1 最远；略超出 [0,1] 时结果仍被 clamp
     * @return 选中的 LOD，位于 [0, maxLOD]
     */
    int SelectByDistance(float normalizedDistance);

    /**
     * 按请求 LOD 选择（Gizmo/调试控件使用）。
     * gizmoLOD = clamp(requested, 0, scanLOD)，selectedLOD = clamp(gizmoLOD, 0, maxLOD)。
     * @return 选中的 LOD，不超过 scanLOD
     */
    int SelectByLOD(int requested);

    /**
     * 新扫描结果到达：设置 maxLOD，并将 scanLOD、gizmoLOD 与 selectedLOD 重新 clamp 到 [0, maxLOD]。
     * @return 重新应用后的 selectedLOD
     */
    int SetMaxLOD(int maxLOD);

    /** 用户修改扫描 LOD，clamp 到 [0, kMaxScanLOD]；gizmoLOD 跟随 */
    void SetScanLOD(int scanLOD);

    /** 设置 Gizmo LOD，clamp 到 [0, scanLOD]；不改变 selectedLOD */
    void SetGizmoLOD(int gizmoLOD);

    void SetFlatten(bool flatten) { flatten_ = flatten; }
    bool IsFlatten() const { return flatten_; }

    int GetMaxLOD() const { return maxLOD_; }
    int GetScanLOD() const { return scanLOD_; }
    int GetGizmoLOD() const { return gizmoLOD_; }
    int GetSelectedLOD() const { return selectedLOD_; }

    /** 所有计数器归零；flatten 属于配置，不受影响 */
    void Reset();

private:
    /** 应用 clamp 与 flatten 规则后写入 selectedLOD_ */
    int ApplySelection(int lod);

    int maxLOD_ = 0;
    int scanLOD_ = 0;
    int gizmoLOD_ = 0;
    int selectedLOD_ = 0;
    bool flatten_ = false;
};

}  // namespace sensa::shape
