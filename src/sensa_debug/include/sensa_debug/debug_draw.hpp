/**
 * @file debug_draw.hpp
 * @brief 调试绘制纯虚接口与记录式实现
 *
 * 形状核心不依赖绘制后端；Gizmo/网格覆盖层只通过 IDebugDraw 录制命令。
 * RecordingDebugDraw 将命令保存在内存中，供无窗口环境（测试、命令行工具）使用。
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

namespace sensa::debug {

/** 常用颜色（RGBA） */
namespace colors {
inline const glm::vec4 kRed{1.f, 0.f, 0.f, 1.f};
inline const glm::vec4 kGrey{0.5f, 0.5f, 0.5f, 1.f};
inline const glm::vec4 kBlue{0.f, 0.f, 1.f, 1.f};
}  // namespace colors

/**
 * 调试绘制后端抽象。颜色为状态：SetColor 之后的绘制命令使用该颜色。
 * 坐标与尺寸均为世界空间。
 */
class IDebugDraw {
public:
    virtual ~IDebugDraw() = default;

    virtual void SetColor(const glm::vec4& color) = 0;

    /** 以 center 为中心、size 为各轴边长绘制实心立方体 */
    virtual void DrawCube(const glm::vec3& center, const glm::vec3& size) = 0;

    /** 以 center 为中心、size 为各轴边长绘制线框立方体 */
    virtual void DrawWireCube(const glm::vec3& center, const glm::vec3& size) = 0;
};

/** 记录的单条绘制命令 */
struct DebugDrawCommand {
    enum class Kind : std::uint8_t { Cube, WireCube };

    Kind kind = Kind::Cube;
    glm::vec3 center{0.f};
    glm::vec3 size{0.f};
    glm::vec4 color{1.f};
};

/** 将绘制命令按顺序记录到内存 */
class RecordingDebugDraw : public IDebugDraw {
public:
    void SetColor(const glm::vec4& color) override { color_ = color; }
    void DrawCube(const glm::vec3& center, const glm::vec3& size) override;
    void DrawWireCube(const glm::vec3& center, const glm::vec3& size) override;

    const std::vector<DebugDrawCommand>& GetCommands() const { return commands_; }

    /** 按种类计数 */
    size_t Count(DebugDrawCommand::Kind kind) const;

    void Clear() { commands_.clear(); }

private:
    glm::vec4 color_{1.f};
    std::vector<DebugDrawCommand> commands_;
};

}  // namespace sensa::debug
