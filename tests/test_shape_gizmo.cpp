/**
 * @file test_shape_gizmo.cpp
 * @brief DrawShapeGizmos 单元测试
 *
 * 覆盖：无点数据不绘制、全部档点标记的颜色与尺寸、世界变换、网格覆盖层单元数、
 * 绘制不改变形状的选择状态与世界缓冲。
 */

#include <sensa_debug/debug_draw.hpp>
#include <sensa_debug/shape_gizmo.hpp>
#include <sensa_shape/detectable_shape.hpp>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <cstdlib>
#include <iostream>
#include <vector>

#define TEST_CHECK(cond)                                               \
    do {                                                               \
        if (!(cond)) {                                                 \
            std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__        \
                      << " " << #cond << std::endl;                    \
            std::exit(1);                                              \
        }                                                              \
    } while (0)

int main() {
    using namespace sensa::debug;
    using namespace sensa::shape;

    // 1. 无点数据：不绘制
    DetectableShape shape;
    RecordingDebugDraw draw;
    ShapeGizmoStats stats = DrawShapeGizmos(shape, glm::mat4(1.f), draw);
    TEST_CHECK(stats.pointMarkers == 0u);
    TEST_CHECK(stats.gridCells == 0u);
    TEST_CHECK(draw.GetCommands().empty());

    // 2. 两档：LOD 0 一个点，LOD 1 三个点（其中两个落在同一 0.1 网格单元）
    std::vector<PointSequence> levels = {
        {glm::vec3(0.f, 0.f, 0.f)},
        {glm::vec3(0.02f, 0.f, 0.f), glm::vec3(0.03f, 0.f, 0.f), glm::vec3(0.12f, 0.f, 0.f)},
    };
    shape.SetScanLOD(1);
    TEST_CHECK(shape.OnScanResult(1, levels));
    TEST_CHECK(shape.SelectByLOD(1) == 1);

    const glm::mat4 moved = glm::translate(glm::mat4(1.f), glm::vec3(5.f, 0.f, 0.f));
    shape.ProjectToWorld(glm::mat4(1.f));
    const PointSequence worldBefore = shape.GetWorldPoints();

    stats = DrawShapeGizmos(shape, moved, draw);
    TEST_CHECK(stats.pointMarkers == 4u);
    TEST_CHECK(stats.gridCells == 0u);  // drawGrid 默认 0，覆盖层关闭
    const auto& cmds = draw.GetCommands();
    TEST_CHECK(cmds.size() == 4u);
    // LOD 0 非选中：灰色 0.025
    TEST_CHECK(cmds[0].color == colors::kGrey);
    TEST_CHECK(cmds[0].size == glm::vec3(kOtherPointSize));
    TEST_CHECK(cmds[0].center == glm::vec3(5.f, 0.f, 0.f));
    // LOD 1 选中：红色 0.05
    for (size_t i = 1; i < cmds.size(); ++i) {
        TEST_CHECK(cmds[i].kind == DebugDrawCommand::Kind::Cube);
        TEST_CHECK(cmds[i].color == colors::kRed);
        TEST_CHECK(cmds[i].size == glm::vec3(kSelectedPointSize));
    }

    // 3. 开启网格：选中档 3 点落入 2 个单元
    draw.Clear();
    shape.SetDrawGrid(0.1f);
    stats = DrawShapeGizmos(shape, glm::mat4(1.f), draw);
    TEST_CHECK(stats.pointMarkers == 4u);
    TEST_CHECK(stats.gridCells == 2u);
    TEST_CHECK(draw.Count(DebugDrawCommand::Kind::WireCube) == 2u);
    TEST_CHECK(draw.Count(DebugDrawCommand::Kind::Cube) == 4u + 2u);

    // 4. 选中 LOD 0 时网格只覆盖该档
    shape.SelectByLOD(0);
    draw.Clear();
    stats = DrawShapeGizmos(shape, glm::mat4(1.f), draw);
    TEST_CHECK(stats.gridCells == 1u);
    shape.SelectByLOD(1);

    // 5. 绘制不改变选择状态与形状世界缓冲
    TEST_CHECK(shape.GetSelectedLOD() == 1);
    TEST_CHECK(shape.GetGizmoLOD() == 1);
    TEST_CHECK(shape.GetPointCount() == 3);
    TEST_CHECK(shape.GetWorldPoints() == worldBefore);

    std::cout << "test_shape_gizmo: all checks passed.\n";
    return 0;
}
