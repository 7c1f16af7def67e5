/**
 * @file activity_tracker.cpp
 * @brief 활동 추적기 구현
 */

#include "activity_tracker.h"
#include "data/session_repository.h"

#include <iostream>

namespace previewd::core {

ActivityTracker::ActivityTracker(std::shared_ptr<data::SessionRepository> repository,
                                 ClockFn clock)
    : repository_(std::move(repository))
    , clock_(std::move(clock)) {}

bool ActivityTracker::touch(const SessionKey& key) {
    bool updated = repository_->touchActivity(key.project_id, key.session_id.str(), clock_());
    if (!updated) {
        std::cerr << "[ActivityTracker] 활동 갱신 실패: " << key.toString() << std::endl;
    }
    return updated;
}

std::optional<int64_t> ActivityTracker::lastActivity(const SessionKey& key) const {
    auto record = repository_->findSession(key.project_id, key.session_id.str());
    if (!record) return std::nullopt;
    return record->last_activity_at;
}

} // namespace previewd::core
