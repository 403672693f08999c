/**
 * @file shape_types.hpp
 * @brief 形状采样点层：点类型、扫描结果、配置与模式定义
 *
 * 点序列为局部空间 glm::vec3；LOD 0 为最粗，索引越大细节越高。
 * ScanResult 由外部扫描器（ShapeScanUtil）产生，经 DetectableShape::OnScanResult 写入。
 */

#pragma once

#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

namespace sensa::shape {

/** 单个采样点（局部或世界空间） */
using Point3 = glm::vec3;

/** 有序点序列，一个 LOD 档对应一条 */
using PointSequence = std::vector<Point3>;

/** 用户可设置的扫描 LOD 上限（扫描器支持 0..7） */
constexpr int kMaxScanLOD = 7;

/** 单档扫描结果 */
struct ScanResultLOD {
    PointSequence localPoints;
};

/**
 * 外部扫描器输出：maxLOD 为最高可用档，levelsByLOD[i] 为第 i 档点序列。
 * 要求 levelsByLOD.size() >= maxLOD + 1；多余档可存在但不可访问。
 */
struct ScanResult {
    int maxLOD = 0;
    std::vector<PointSequence> levelsByLOD;
};

/** 运行模式：Edit 允许修改配置；Live 时配置锁定，Gizmo LOD 跟随检测选择 */
enum class ShapeMode : std::uint8_t {
    Edit,
    Live,
};

/** 配置修改是否要求外部扫描器重新扫描 */
enum class RescanRequired : std::uint8_t {
    No,
    Yes,
};

/**
 * 形状配置，随实体一起持久化。
 * merge / projection 仅供外部扫描器使用；flatten 强制选择 LOD 0。
 */
struct ShapeConfig {
    bool merge = false;        ///< 扫描前合并不相连的碰撞体
    bool flatten = false;      ///< 压平为 2D 检测，固定使用 LOD 0
    float projection = 0.f;    ///< 点向碰撞体表面投射的比例 [0,1]
    int scanLOD = 0;           ///< 扫描 LOD [0, kMaxScanLOD]
    int gizmoLOD = 0;          ///< Gizmo 高亮 LOD，<= scanLOD
    float drawGrid = 0.f;      ///< 调试网格单元尺寸，0 关闭
};

}  // namespace sensa::shape
