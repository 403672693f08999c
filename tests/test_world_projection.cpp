/**
 * @file test_world_projection.cpp
 * @brief WorldProjection 单元测试：单位矩阵、平移/旋转/缩放、缓冲复用不累积
 */

#include <sensa_shape/world_projection.hpp>

#include <cmath>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

static bool vec3_near(const glm::vec3& a, const glm::vec3& b, float eps = 1e-5f) {
    return std::fabs(a.x - b.x) <= eps && std::fabs(a.y - b.y) <= eps && std::fabs(a.z - b.z) <= eps;
}

int main() {
    using namespace sensa::shape;

    const PointSequence local = {
        glm::vec3(1.f, 0.f, 0.f),
        glm::vec3(0.f, 2.f, 0.f),
        glm::vec3(0.f, 0.f, -3.f),
    };

    // 1. 单位矩阵：与局部点相等
    WorldProjection projection;
    const PointSequence& identity = projection.Project(local, glm::mat4(1.f));
    if (identity.size() != local.size())
        return 1;
    for (size_t i = 0; i < local.size(); ++i)
        if (!vec3_near(identity[i], local[i]))
            return 2;

    // 2. 平移
    glm::mat4 translate = glm::translate(glm::mat4(1.f), glm::vec3(10.f, -1.f, 5.f));
    const PointSequence& moved = projection.Project(local, translate);
    if (moved.size() != 3u)
        return 3;  // 缓冲先清空，不累积
    if (!vec3_near(moved[0], glm::vec3(11.f, -1.f, 5.f)) ||
        !vec3_near(moved[1], glm::vec3(10.f, 1.f, 5.f)) ||
        !vec3_near(moved[2], glm::vec3(10.f, -1.f, 2.f)))
        return 4;

    // 3. 绕 Y 轴旋转 90 度：+X -> -Z
    glm::mat4 rotate = glm::rotate(glm::mat4(1.f), glm::radians(90.f), glm::vec3(0.f, 1.f, 0.f));
    const PointSequence& rotated = projection.Project(local, rotate);
    if (!vec3_near(rotated[0], glm::vec3(0.f, 0.f, -1.f)))
        return 5;
    if (!vec3_near(rotated[1], glm::vec3(0.f, 2.f, 0.f)))
        return 6;

    // 4. 平移 * 旋转 * 缩放组合
    glm::mat4 trs = glm::translate(glm::mat4(1.f), glm::vec3(1.f, 2.f, 3.f));
    trs = glm::rotate(trs, glm::radians(180.f), glm::vec3(0.f, 0.f, 1.f));
    trs = glm::scale(trs, glm::vec3(2.f));
    const PointSequence& combined = projection.Project(local, trs);
    if (!vec3_near(combined[0], glm::vec3(-1.f, 2.f, 3.f), 1e-4f))
        return 7;
    if (!vec3_near(combined[2], glm::vec3(1.f, 2.f, -3.f), 1e-4f))
        return 8;

    // 5. GetPoints 与最近一次结果一致；TransformPoint 与缓冲结果一致
    if (projection.GetPoints().size() != 3u)
        return 9;
    if (!vec3_near(TransformPoint(trs, local[1]), projection.GetPoints()[1]))
        return 10;

    // 6. 空输入与 Clear
    if (!projection.Project(PointSequence{}, translate).empty())
        return 11;
    projection.Project(local, translate);
    projection.Clear();
    if (!projection.GetPoints().empty())
        return 12;

    return 0;
}
