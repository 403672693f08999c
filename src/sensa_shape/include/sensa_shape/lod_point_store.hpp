/**
 * @file lod_point_store.hpp
 * @brief LOD 点集存储：按 LOD 索引保存局部空间点序列
 *
 * SetScanResult 整体替换（先校验、再清空、再赋值）；结构不合法时不修改状态并返回 false。
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <sensa_shape/shape_types.hpp>

namespace sensa::shape {

/**
 * 每个 LOD 一条有序点序列，索引 [0, maxLOD] 连续。
 * 存储本身不做选择，GetLevel 对越界索引做 clamp。
 */
class LODPointStore {
public:
    LODPointStore() = default;

    /**
     * 替换全部点数据。
     * @param maxLOD 最高可访问档，须 >= 0
     * @param levels 每档点序列，须至少 maxLOD + 1 条
     * @return 结构合法返回 true；否则 false，原数据保留，GetLastError() 返回原因
     */
    bool SetScanResult(int maxLOD, std::vector<PointSequence> levels);

    /** 清空所有档 */
    void Clear();

    /** 是否存有任意档点数据 */
    bool HasPoints() const { return !levels_.empty(); }

    int GetMaxLOD() const { return maxLOD_; }

    /** 已存储档数（可能大于 maxLOD + 1） */
    size_t GetLevelCount() const { return levels_.size(); }

    /**
     * 返回 lod 档点序列，lod clamp 到 [0, maxLOD]。
     * 无数据时返回空序列。
     */
    const PointSequence& GetLevel(int lod) const;

    /** 全部档（含 maxLOD 之后的档），供调试绘制与序列化 */
    const std::vector<PointSequence>& GetLevels() const { return levels_; }

    const std::string& GetLastError() const { return lastError_; }

private:
    std::vector<PointSequence> levels_;
    int maxLOD_ = 0;
    std::string lastError_;
};

}  // namespace sensa::shape
