/**
 * @file lod_point_store.cpp
 * @brief LODPointStore 实现：扫描结果校验与按档访问
 */

#include <sensa_shape/lod_point_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace sensa::shape {

namespace {

const PointSequence kEmptySequence;

}  // namespace

bool LODPointStore::SetScanResult(int maxLOD, std::vector<PointSequence> levels) {
    if (maxLOD < 0) {
        lastError_ = "LODPointStore: maxLOD must be >= 0, got " + std::to_string(maxLOD);
        spdlog::warn("{}", lastError_);
        return false;
    }
    const size_t required = static_cast<size_t>(maxLOD) + 1u;
    if (levels.size() < required) {
        lastError_ = "LODPointStore: scan result has " + std::to_string(levels.size()) +
                     " levels, maxLOD " + std::to_string(maxLOD) + " requires " +
                     std::to_string(required);
        spdlog::warn("{}", lastError_);
        return false;
    }

    lastError_.clear();
    Clear();
    levels_ = std::move(levels);
    maxLOD_ = maxLOD;
    return true;
}

void LODPointStore::Clear() {
    levels_.clear();
    maxLOD_ = 0;
}

const PointSequence& LODPointStore::GetLevel(int lod) const {
    if (levels_.empty()) return kEmptySequence;
    const int idx = std::clamp(lod, 0, maxLOD_);
    return levels_[static_cast<size_t>(idx)];
}

}  // namespace sensa::shape
