// Shape Probe - 命令行示例
// 加载持久化形状 JSON，按若干归一化距离查询世界空间点，并以记录式后端运行 Gizmo 覆盖层。
// 用法：shape_probe <shape.json> [--grid <cellSize>] [--save <out.json>] [distance ...]
// 日志级别通过环境变量 SPDLOG_LEVEL 设置（如 SPDLOG_LEVEL=debug）。

#include <sensa_debug/debug_draw.hpp>
#include <sensa_debug/shape_gizmo.hpp>
#include <sensa_shape/detectable_shape.hpp>
#include <sensa_shape/shape_serializer.hpp>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <glm/glm.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct ProbeOptions {
    std::string shapePath;
    std::string savePath;
    float gridSize = -1.f;  ///< < 0 时使用形状中保存的 drawGrid
    std::vector<float> distances;
};

void PrintUsage() {
    std::cerr << "Usage: shape_probe <shape.json> [--grid <cellSize>] [--save <out.json>] [distance ...]\n";
}

bool ParseFloat(const std::string& text, float& out) {
    char* end = nullptr;
    out = std::strtof(text.c_str(), &end);
    return end && *end == '\0' && end != text.c_str();
}

bool ParseArgs(int argc, char** argv, ProbeOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--grid" || arg == "--save") {
            if (i + 1 >= argc) return false;
            const std::string value = argv[++i];
            if (arg == "--save") {
                opts.savePath = value;
            } else if (!ParseFloat(value, opts.gridSize)) {
                return false;
            }
        } else if (opts.shapePath.empty()) {
            opts.shapePath = arg;
        } else {
            float d = 0.f;
            if (!ParseFloat(arg, d)) return false;
            opts.distances.push_back(d);
        }
    }
    if (opts.distances.empty())
        opts.distances = {0.f, 0.25f, 0.5f, 0.75f, 1.f};
    return !opts.shapePath.empty();
}

}  // namespace

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    ProbeOptions opts;
    if (!ParseArgs(argc, argv, opts)) {
        PrintUsage();
        return 1;
    }

    sensa::shape::DetectableShape shape;
    std::string error;
    if (!sensa::shape::LoadShapeFile(opts.shapePath, shape, error)) {
        std::cerr << "LoadShapeFile failed: " << error << "\n";
        return 1;
    }
    if (!shape.HasPoints()) {
        std::cerr << "Shape has no scan result: " << opts.shapePath << "\n";
        return 1;
    }
    if (opts.gridSize >= 0.f)
        shape.SetDrawGrid(opts.gridSize);

    std::cout << "Loaded " << opts.shapePath << ": maxLOD=" << shape.GetMaxLOD()
              << " scanLOD=" << shape.GetScanLOD()
              << " flatten=" << (shape.IsFlatten() ? "true" : "false") << "\n";

    // 检测查询阶段：配置锁定，Gizmo LOD 跟随选择
    shape.SetMode(sensa::shape::ShapeMode::Live);
    const glm::mat4 localToWorld(1.f);  // 以对象局部空间输出
    for (float d : opts.distances) {
        const auto& points = shape.GetWorldPointsAtDistance(localToWorld, d);
        std::cout << "distance " << d << " -> LOD " << shape.GetSelectedLOD()
                  << " (" << points.size() << " points)";
        if (!points.empty()) {
            const glm::vec3& p = points.front();
            std::cout << " first=(" << p.x << ", " << p.y << ", " << p.z << ")";
        }
        std::cout << "\n";
    }

    sensa::debug::RecordingDebugDraw draw;
    const sensa::debug::ShapeGizmoStats stats = sensa::debug::DrawShapeGizmos(shape, localToWorld, draw);
    std::cout << "gizmo: " << stats.pointMarkers << " point markers, " << stats.gridCells
              << " grid cells (cellSize=" << shape.GetDrawGrid() << ")\n";

    if (!opts.savePath.empty()) {
        if (!sensa::shape::SaveShapeFile(opts.savePath, shape, error)) {
            std::cerr << "SaveShapeFile failed: " << error << "\n";
            return 1;
        }
        spdlog::info("Saved shape to {}", opts.savePath);
    }
    return 0;
}
