/**
 * @file shape_serializer.cpp
 * @brief 形状 JSON 读写：先完整解析校验，再一次性写入 DetectableShape
 */

#include <sensa_shape/shape_serializer.hpp>
#include <sensa_shape/detectable_shape.hpp>
#include <sensa_shape/shape_types.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

namespace sensa::shape {

namespace {

std::string ReadFileToString(const std::string& path, bool& ok) {
    std::ifstream f(path);
    ok = static_cast<bool>(f);
    if (!ok) return {};
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

/** 读取可选字段；存在但类型不符时返回 false */
template <typename T, typename Pred>
bool ReadOptional(const nlohmann::json& j, const char* key, Pred isType, T& out,
                  std::string& error) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!isType(*it)) {
        error = std::string("ShapeSerializer: field '") + key + "' has wrong type or is out of range";
        return false;
    }
    out = it->template get<T>();
    return true;
}

/** 整数字段须落在 int 范围内，get<int> 不做越界检查 */
bool IsIntValue(const nlohmann::json& v) {
    if (v.is_number_unsigned())
        return v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    if (v.is_number_integer()) {
        const std::int64_t value = v.get<std::int64_t>();
        return value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max();
    }
    return false;
}

bool ParsePoint(const nlohmann::json& jp, Point3& out) {
    if (!jp.is_array() || jp.size() != 3u) return false;
    for (const auto& c : jp)
        if (!c.is_number()) return false;
    out = Point3(jp[0].get<float>(), jp[1].get<float>(), jp[2].get<float>());
    return true;
}

bool ParseLevels(const nlohmann::json& jl, std::vector<PointSequence>& levels, std::string& error) {
    if (!jl.is_array()) {
        error = "ShapeSerializer: 'levels' must be an array";
        return false;
    }
    levels.reserve(jl.size());
    for (size_t lod = 0; lod < jl.size(); ++lod) {
        const nlohmann::json& jpoints = jl[lod];
        if (!jpoints.is_array()) {
            error = "ShapeSerializer: level " + std::to_string(lod) + " must be an array";
            return false;
        }
        PointSequence points;
        points.reserve(jpoints.size());
        for (size_t i = 0; i < jpoints.size(); ++i) {
            Point3 p;
            if (!ParsePoint(jpoints[i], p)) {
                error = "ShapeSerializer: level " + std::to_string(lod) + " point " +
                        std::to_string(i) + " is not [x, y, z]";
                return false;
            }
            points.push_back(p);
        }
        levels.push_back(std::move(points));
    }
    return true;
}

}  // namespace

nlohmann::json ShapeToJson(const DetectableShape& shape) {
    const ShapeConfig config = shape.GetConfig();
    nlohmann::json j;
    j["merge"] = config.merge;
    j["flatten"] = config.flatten;
    j["projection"] = config.projection;
    j["scanLOD"] = config.scanLOD;
    j["gizmoLOD"] = config.gizmoLOD;
    j["drawGrid"] = config.drawGrid;

    if (shape.HasPoints()) {
        j["maxLOD"] = shape.GetMaxLOD();
        nlohmann::json levels = nlohmann::json::array();
        for (const PointSequence& level : shape.GetLevels()) {
            nlohmann::json points = nlohmann::json::array();
            for (const Point3& p : level)
                points.push_back(nlohmann::json::array({p.x, p.y, p.z}));
            levels.push_back(std::move(points));
        }
        j["levels"] = std::move(levels);
    }
    return j;
}

bool ShapeFromJson(const nlohmann::json& j, DetectableShape& shape, std::string& error) {
    if (!j.is_object()) {
        error = "ShapeSerializer: root must be a JSON object";
        return false;
    }

    auto isBool = [](const nlohmann::json& v) { return v.is_boolean(); };
    auto isNumber = [](const nlohmann::json& v) { return v.is_number(); };

    ShapeConfig config;
    if (!ReadOptional(j, "merge", isBool, config.merge, error) ||
        !ReadOptional(j, "flatten", isBool, config.flatten, error) ||
        !ReadOptional(j, "projection", isNumber, config.projection, error) ||
        !ReadOptional(j, "scanLOD", IsIntValue, config.scanLOD, error) ||
        !ReadOptional(j, "gizmoLOD", IsIntValue, config.gizmoLOD, error) ||
        !ReadOptional(j, "drawGrid", isNumber, config.drawGrid, error))
        return false;

    std::vector<PointSequence> levels;
    int maxLOD = 0;
    const bool hasLevels = j.contains("levels");
    if (hasLevels) {
        if (!ParseLevels(j.at("levels"), levels, error)) return false;
        // 缺少 maxLOD 时取最后一档
        maxLOD = static_cast<int>(levels.size()) - 1;
        if (!ReadOptional(j, "maxLOD", IsIntValue, maxLOD, error)) return false;
        if (maxLOD < 0 || levels.size() < static_cast<size_t>(maxLOD) + 1u) {
            error = "ShapeSerializer: maxLOD " + std::to_string(maxLOD) + " does not match " +
                    std::to_string(levels.size()) + " levels";
            return false;
        }
    }

    shape.Reset();
    shape.RestoreConfig(config);
    if (hasLevels) {
        if (!shape.OnScanResult(maxLOD, std::move(levels))) {
            error = shape.GetLastError();
            return false;
        }
        // RestoreConfig 时尚无点数据，选择被 clamp 到 0；按恢复的 gizmoLOD 重新选择
        shape.SelectByLOD(shape.GetGizmoLOD());
    }
    return true;
}

bool SaveShapeFile(const std::string& path, const DetectableShape& shape, std::string& error) {
    std::ofstream f(path);
    if (!f) {
        error = "ShapeSerializer: cannot open for writing: " + path;
        spdlog::warn("{}", error);
        return false;
    }
    f << ShapeToJson(shape).dump(2) << '\n';
    if (!f) {
        error = "ShapeSerializer: write failed: " + path;
        spdlog::warn("{}", error);
        return false;
    }
    return true;
}

bool LoadShapeFile(const std::string& path, DetectableShape& shape, std::string& error) {
    bool opened = false;
    const std::string content = ReadFileToString(path, opened);
    if (!opened) {
        error = "ShapeSerializer: failed to read file: " + path;
        spdlog::warn("{}", error);
        return false;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        error = std::string("ShapeSerializer: JSON parse error: ") + e.what();
        spdlog::warn("{}", error);
        return false;
    }

    if (!ShapeFromJson(j, shape, error)) {
        spdlog::warn("{} ({})", error, path);
        return false;
    }
    spdlog::debug("ShapeSerializer: loaded {} (maxLOD={}, scanLOD={})", path, shape.GetMaxLOD(),
                  shape.GetScanLOD());
    return true;
}

}  // namespace sensa::shape
