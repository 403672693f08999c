/**
 * @file grid_overlay.cpp
 * @brief 网格吸附、精确坐标去重与单元绘制
 */

#include <sensa_debug/grid_overlay.hpp>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <unordered_set>

namespace sensa::debug {

namespace {

struct SnappedPointHash {
    size_t operator()(const glm::vec3& p) const noexcept {
        size_t h = 1469598103934665603ull;
        auto mix = [&](float v) {
            // +0 与 -0 相等，需同一哈希
            std::uint32_t bits = 0;
            if (v != 0.f) std::memcpy(&bits, &v, sizeof(bits));
            h ^= static_cast<size_t>(bits) + 0x9e3779b9 + (h << 6) + (h >> 2);
        };
        mix(p.x);
        mix(p.y);
        mix(p.z);
        return h;
    }
};

}  // namespace

bool IsGridEnabled(float cellSize) {
    return cellSize >= kMinGridCellSize;
}

glm::vec3 SnapToGrid(const glm::vec3& p, float cellSize) {
    return glm::vec3(std::nearbyint(p.x / cellSize),
                     std::nearbyint(p.y / cellSize),
                     std::nearbyint(p.z / cellSize)) * cellSize;
}

std::vector<glm::vec3> CollectGridCells(const sensa::shape::PointSequence& worldPoints, float cellSize) {
    std::vector<glm::vec3> cells;
    if (!IsGridEnabled(cellSize)) return cells;

    std::unordered_set<glm::vec3, SnappedPointHash> seen;
    seen.reserve(worldPoints.size());
    for (const glm::vec3& p : worldPoints) {
        const glm::vec3 snapped = SnapToGrid(p, cellSize);
        if (seen.insert(snapped).second)
            cells.push_back(snapped);
    }
    return cells;
}

size_t DrawGridOverlay(IDebugDraw& draw, const sensa::shape::PointSequence& worldPoints, float cellSize) {
    const std::vector<glm::vec3> cells = CollectGridCells(worldPoints, cellSize);
    if (cells.empty()) return 0;

    const glm::vec3 size(cellSize);
    const glm::vec4 wireColor = colors::kBlue * 0.75f;
    const glm::vec4 fillColor = colors::kBlue * 0.4f;
    for (const glm::vec3& c : cells) {
        draw.SetColor(wireColor);
        draw.DrawWireCube(c, size);
        draw.SetColor(fillColor);
        draw.DrawCube(c, size);
    }
    return cells.size();
}

}  // namespace sensa::debug
