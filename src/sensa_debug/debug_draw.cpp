/**
 * @file debug_draw.cpp
 * @brief RecordingDebugDraw 实现
 */

#include <sensa_debug/debug_draw.hpp>

#include <algorithm>

namespace sensa::debug {

void RecordingDebugDraw::DrawCube(const glm::vec3& center, const glm::vec3& size) {
    commands_.push_back(DebugDrawCommand{DebugDrawCommand::Kind::Cube, center, size, color_});
}

void RecordingDebugDraw::DrawWireCube(const glm::vec3& center, const glm::vec3& size) {
    commands_.push_back(DebugDrawCommand{DebugDrawCommand::Kind::WireCube, center, size, color_});
}

size_t RecordingDebugDraw::Count(DebugDrawCommand::Kind kind) const {
    return static_cast<size_t>(std::count_if(commands_.begin(), commands_.end(),
                                             [kind](const DebugDrawCommand& c) { return c.kind == kind; }));
}

}  // namespace sensa::debug
