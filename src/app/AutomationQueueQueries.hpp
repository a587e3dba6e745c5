#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>

#include "domain/domain_model.hpp"

namespace pp::core::app {

// The queue entry the backend scheduler is compressing right now.
// An unknown or empty queue and "no such entry" all mean none.
inline std::optional<domain::AutomationJob> activeAutomationJob(
    const std::optional<domain::AutomationQueue>& queue) {
    if (!queue || queue->empty()) {
        return std::nullopt;
    }
    const auto it = std::find_if(queue->begin(), queue->end(), [](const domain::AutomationJob& j) {
        return j.status == domain::AutomationJobStatus::Compressing;
    });
    if (it == queue->end()) {
        return std::nullopt;
    }
    return *it;
}

inline bool isPendingAutomationStatus(domain::AutomationJobStatus s) {
    return s == domain::AutomationJobStatus::Pending ||
           s == domain::AutomationJobStatus::WaitingForSettle ||
           s == domain::AutomationJobStatus::WaitingForIdle;
}

inline std::size_t pendingAutomationCount(const std::optional<domain::AutomationQueue>& queue) {
    if (!queue) {
        return 0;
    }
    return static_cast<std::size_t>(
        std::count_if(queue->begin(), queue->end(), [](const domain::AutomationJob& j) {
            return isPendingAutomationStatus(j.status);
        }));
}

} // namespace pp::core::app
