#include "waypoint/workflow/fanout.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <new>
#include <system_error>
#include <thread>

namespace waypoint::workflow {

using namespace waypoint::core;

Status run_bounded(u32 count, u32 max_concurrency, const FanoutTask& task, std::vector<Status>* results) noexcept {
    if (!results || !task) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid);
    }

    try {
        results->assign(count, make_status(StatusDomain::Workflow, StatusCode::Unavailable));
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Workflow, StatusCode::Unavailable);
    }
    if (count == 0) {
        return ok_status();
    }

    std::atomic<u32> next{0};
    auto worker = [&]() noexcept {
        while (true) {
            const u32 i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= count) {
                return;
            }
            Status s;
            try {
                s = task(i);
            } catch (const std::bad_alloc&) {
                s = make_status(StatusDomain::Workflow, StatusCode::Unavailable);
            } catch (const std::exception&) {
                s = make_status(StatusDomain::External, StatusCode::Unknown);
            }
            (*results)[i] = s;
        }
    };

    const u32 width = std::max<u32>(1, std::min(count, max_concurrency));
    if (width == 1) {
        worker();
        return ok_status();
    }

    // A failed spawn only narrows the pool: the calling thread drains the
    // queue as well.
    std::vector<std::thread> threads;
    try {
        threads.reserve(width - 1);
        for (u32 t = 0; t + 1 < width; ++t) {
            threads.emplace_back(worker);
        }
    } catch (const std::system_error&) {
    } catch (const std::bad_alloc&) {
    }

    worker();
    for (auto& t : threads) {
        t.join();
    }
    return ok_status();
}

} // namespace waypoint::workflow
