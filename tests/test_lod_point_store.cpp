/**
 * @file test_lod_point_store.cpp
 * @brief LODPointStore 单元测试
 *
 * 覆盖：SetScanResult 整体替换、结构校验失败时保留原数据、GetLevel clamp、maxLOD 之后的档不可访问、Clear。
 */

#include <sensa_shape/lod_point_store.hpp>

#include <glm/glm.hpp>
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
    using namespace sensa::shape;

    // 1. 初始为空：HasPoints false，GetLevel 返回空序列
    LODPointStore store;
    TEST_CHECK(!store.HasPoints());
    TEST_CHECK(store.GetMaxLOD() == 0);
    TEST_CHECK(store.GetLevel(0).empty());
    TEST_CHECK(store.GetLevel(5).empty());

    // 2. 合法扫描结果
    std::vector<PointSequence> levels = {
        {glm::vec3(0.f)},
        {glm::vec3(1.f, 0.f, 0.f), glm::vec3(-1.f, 0.f, 0.f)},
        {glm::vec3(1.f, 1.f, 0.f), glm::vec3(-1.f, 1.f, 0.f), glm::vec3(0.f, -1.f, 0.f)},
    };
    TEST_CHECK(store.SetScanResult(2, levels));
    TEST_CHECK(store.HasPoints());
    TEST_CHECK(store.GetMaxLOD() == 2);
    TEST_CHECK(store.GetLevelCount() == 3u);
    TEST_CHECK(store.GetLevel(0).size() == 1u);
    TEST_CHECK(store.GetLevel(1).size() == 2u);
    TEST_CHECK(store.GetLevel(2).size() == 3u);
    TEST_CHECK(store.GetLastError().empty());

    // 3. 越界索引 clamp 到 [0, maxLOD]
    TEST_CHECK(store.GetLevel(-3).size() == 1u);
    TEST_CHECK(store.GetLevel(99).size() == 3u);

    // 4. 档数不足：失败，原数据保留
    std::vector<PointSequence> tooFew = {{glm::vec3(5.f)}};
    TEST_CHECK(!store.SetScanResult(3, tooFew));
    TEST_CHECK(!store.GetLastError().empty());
    TEST_CHECK(store.GetMaxLOD() == 2);
    TEST_CHECK(store.GetLevelCount() == 3u);
    TEST_CHECK(store.GetLevel(0)[0] == glm::vec3(0.f));

    // 5. maxLOD 为负：失败
    TEST_CHECK(!store.SetScanResult(-1, levels));
    TEST_CHECK(store.GetMaxLOD() == 2);

    // 6. maxLOD 之后的档可以存在但不可访问
    std::vector<PointSequence> extra = {
        {glm::vec3(0.f, 0.f, 1.f)},
        {glm::vec3(0.f, 0.f, 2.f), glm::vec3(0.f, 0.f, 3.f)},
        {glm::vec3(9.f), glm::vec3(9.f), glm::vec3(9.f), glm::vec3(9.f)},
    };
    TEST_CHECK(store.SetScanResult(1, extra));
    TEST_CHECK(store.GetLastError().empty());
    TEST_CHECK(store.GetMaxLOD() == 1);
    TEST_CHECK(store.GetLevelCount() == 3u);
    TEST_CHECK(store.GetLevel(2).size() == 2u);  // clamp 到 LOD 1
    TEST_CHECK(store.GetLevel(0)[0] == glm::vec3(0.f, 0.f, 1.f));  // 旧数据已整体替换

    // 7. 单档扫描结果（maxLOD 0）
    TEST_CHECK(store.SetScanResult(0, {{glm::vec3(2.f)}}));
    TEST_CHECK(store.GetLevelCount() == 1u);
    TEST_CHECK(store.GetLevel(4)[0] == glm::vec3(2.f));

    // 8. Clear
    store.Clear();
    TEST_CHECK(!store.HasPoints());
    TEST_CHECK(store.GetMaxLOD() == 0);
    TEST_CHECK(store.GetLevel(0).empty());

    std::cout << "test_lod_point_store: all checks passed.\n";
    return 0;
}
