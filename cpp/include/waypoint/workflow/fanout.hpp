#pragma once

#include <functional>
#include <vector>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/types.hpp"

namespace waypoint::workflow {

using FanoutTask = std::function<waypoint::core::Status(waypoint::core::u32 index)>;

// Runs task(0) .. task(count - 1) on at most `max_concurrency` threads and
// joins them all before returning. results[i] is task(i)'s status; a task
// that throws reports {Unknown, External}. The calling thread is one of the
// workers, so every task runs even if no extra thread can be started.
[[nodiscard]] waypoint::core::Status run_bounded(waypoint::core::u32 count,
                                                 waypoint::core::u32 max_concurrency,
                                                 const FanoutTask& task,
                                                 std::vector<waypoint::core::Status>* results) noexcept;

} // namespace waypoint::workflow
