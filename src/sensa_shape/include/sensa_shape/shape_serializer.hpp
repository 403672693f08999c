/**
 * @file shape_serializer.hpp
 * @brief 形状持久化：配置、scanLOD 与全部 LOD 点数据 <-> JSON
 *
 * 格式：
 * {
 *   "merge": false, "flatten": false, "projection": 0.0,
 *   "scanLOD": 2, "gizmoLOD": 2, "drawGrid": 0.0,
 *   "maxLOD": 2,
 *   "levels": [ [[x, y, z], ...], ... ]
 * }
 * worldPoints、selectedLOD 与点数为派生状态，不持久化。
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace sensa::shape {

class DetectableShape;

/** 序列化形状为 JSON 对象 */
nlohmann::json ShapeToJson(const DetectableShape& shape);

/**
 * 从 JSON 恢复形状：恢复配置（不触发重扫描回调），有 "levels" 时作为扫描结果写入。
 * 缺少 "levels" 时形状为 Empty。
 * @param error 失败时写入原因
 * @return 失败时形状保持不变
 */
bool ShapeFromJson(const nlohmann::json& j, DetectableShape& shape, std::string& error);

/** 写入 JSON 文件（缩进 2） */
bool SaveShapeFile(const std::string& path, const DetectableShape& shape, std::string& error);

/** 读取 JSON 文件并恢复形状 */
bool LoadShapeFile(const std::string& path, DetectableShape& shape, std::string& error);

}  // namespace sensa::shape
