#include "ipod/runtime/runtime.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

#include <BS_thread_pool.hpp>
#include <spdlog/spdlog.h>

#include "ipod/exceptions.hpp"

namespace ipod::runtime {

class ThreadPoolRuntime::Pool {
public:
    explicit Pool(SizeType nthreads) : m_pool(nthreads) {}

    template <typename F> void detach(F&& task) {
        m_pool.detach_task(std::forward<F>(task));
    }
    void wait() { m_pool.wait(); }

private:
    // thread_pool is a class template from v5 on; let CTAD name it
    using PoolType = decltype(BS::thread_pool(std::size_t{1}));
    PoolType m_pool;
};

ThreadPoolRuntime::ThreadPoolRuntime(SizeType nthreads)
    : m_nthreads(nthreads) {
    error_check::check_greater_equal(
        m_nthreads, 1U, "ThreadPoolRuntime: nthreads must be at least 1");
    m_pool = std::make_unique<Pool>(m_nthreads);
    spdlog::debug("ThreadPoolRuntime started with {} threads", m_nthreads);
}

ThreadPoolRuntime::~ThreadPoolRuntime() {
    // Jobs whose results were never retrieved still run to completion
    m_pool->wait();
}

TaskId ThreadPoolRuntime::submit(ChunkJob job) {
    error_check::check(static_cast<bool>(job),
                       "ThreadPoolRuntime: cannot submit an empty job");
    auto task =
        std::make_shared<std::packaged_task<data::ResultBatches()>>(
            std::move(job));
    TaskId id{};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_next_id++;
        m_tasks.emplace(id, TaskState{.result = task->get_future()});
    }
    m_pool->detach([this, id, task]() {
        // The packaged task stores a thrown exception in its future
        (*task)();
        mark_completed(id);
    });
    return id;
}

void ThreadPoolRuntime::mark_completed(TaskId id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.at(id).completed_seq = ++m_completed_seq;
    }
    m_cv.notify_all();
}

WaitResult ThreadPoolRuntime::wait(std::span<const TaskId> pending,
                                   SizeType num_returns) {
    const auto target = std::min(num_returns, pending.size());
    std::unique_lock<std::mutex> lock(m_mutex);
    for (const auto id : pending) {
        if (!m_tasks.contains(id)) {
            throw std::out_of_range(
                std::format("ThreadPoolRuntime: unknown task id {}", id));
        }
    }
    m_cv.wait(lock, [&] {
        return std::ranges::count_if(pending, [&](TaskId id) {
                   return m_tasks.at(id).completed_seq != 0;
               }) >= static_cast<std::ptrdiff_t>(target);
    });

    std::vector<TaskId> done;
    for (const auto id : pending) {
        if (m_tasks.at(id).completed_seq != 0) {
            done.push_back(id);
        }
    }
    std::ranges::sort(done, [&](TaskId a, TaskId b) {
        return m_tasks.at(a).completed_seq < m_tasks.at(b).completed_seq;
    });
    done.resize(target);

    WaitResult result;
    result.ready = std::move(done);
    for (const auto id : pending) {
        if (std::ranges::find(result.ready, id) == result.ready.end()) {
            result.remaining.push_back(id);
        }
    }
    return result;
}

data::ResultBatches ThreadPoolRuntime::get(TaskId id) {
    std::future<data::ResultBatches> result;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_tasks.contains(id)) {
            throw std::out_of_range(
                std::format("ThreadPoolRuntime: unknown task id {}", id));
        }
        m_cv.wait(lock, [&] { return m_tasks.at(id).completed_seq != 0; });
        const auto it = m_tasks.find(id);
        result        = std::move(it->second.result);
        m_tasks.erase(it);
    }
    return result.get();
}

SizeType ThreadPoolRuntime::num_tasks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

} // namespace ipod::runtime
