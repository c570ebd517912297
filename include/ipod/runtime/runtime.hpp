#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <span>
#include <unordered_map>
#include <vector>

#include "ipod/common/types.hpp"
#include "ipod/data/results.hpp"
#include "ipod/runtime/object_store.hpp"

namespace ipod::runtime {

using TaskId   = std::uint64_t;
using ChunkJob = std::function<data::ResultBatches()>;

struct WaitResult {
    // Completed tasks, in completion order
    std::vector<TaskId> ready;
    // Still pending tasks, in the order they were passed in
    std::vector<TaskId> remaining;
};

/**
 * @brief Parallel task runtime that runs chunk jobs on remote workers.
 *
 * wait() is the only call that blocks for task progress. Results are
 * retrieved once; get() rethrows the exception a failed job raised.
 */
class TaskRuntime {
public:
    TaskRuntime()                              = default;
    virtual ~TaskRuntime()                     = default;
    TaskRuntime(const TaskRuntime&)            = delete;
    TaskRuntime& operator=(const TaskRuntime&) = delete;
    TaskRuntime(TaskRuntime&&)                 = delete;
    TaskRuntime& operator=(TaskRuntime&&)      = delete;

    [[nodiscard]] virtual TaskId submit(ChunkJob job) = 0;

    /**
     * @brief Block until at least @p num_returns of @p pending have
     * completed (or all of them, if fewer).
     *
     * @return At most @p num_returns ready tasks and the rest of
     * @p pending.
     */
    [[nodiscard]] virtual WaitResult wait(std::span<const TaskId> pending,
                                          SizeType num_returns) = 0;

    // Result of a completed task; rethrows the task's exception
    [[nodiscard]] virtual data::ResultBatches get(TaskId id) = 0;

    [[nodiscard]] virtual ObjectStore& object_store() = 0;
    [[nodiscard]] virtual SizeType num_workers() const = 0;
};

/**
 * @brief TaskRuntime backed by a local BS::thread_pool.
 *
 * Each job runs single-threaded on one pool thread. Completion is recorded
 * under a mutex and announced on a condition variable.
 */
class ThreadPoolRuntime final : public TaskRuntime {
public:
    explicit ThreadPoolRuntime(SizeType nthreads);
    ~ThreadPoolRuntime() override;
    ThreadPoolRuntime(const ThreadPoolRuntime&)            = delete;
    ThreadPoolRuntime& operator=(const ThreadPoolRuntime&) = delete;
    ThreadPoolRuntime(ThreadPoolRuntime&&)                 = delete;
    ThreadPoolRuntime& operator=(ThreadPoolRuntime&&)      = delete;

    [[nodiscard]] TaskId submit(ChunkJob job) override;
    [[nodiscard]] WaitResult wait(std::span<const TaskId> pending,
                                  SizeType num_returns) override;
    [[nodiscard]] data::ResultBatches get(TaskId id) override;
    [[nodiscard]] ObjectStore& object_store() override { return m_store; }
    [[nodiscard]] SizeType num_workers() const override { return m_nthreads; }

    // Number of submitted tasks whose result has not been retrieved yet
    [[nodiscard]] SizeType num_tasks() const;

    class Pool;

private:
    struct TaskState {
        std::future<data::ResultBatches> result;
        // Position in completion order, 0 while the job is running
        std::uint64_t completed_seq{};
    };

    void mark_completed(TaskId id);

    SizeType m_nthreads;
    ObjectStore m_store;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::unordered_map<TaskId, TaskState> m_tasks;
    TaskId m_next_id{1};
    std::uint64_t m_completed_seq{};
    // Declared last: destroyed first, so no job outlives the state it touches
    std::unique_ptr<Pool> m_pool;
};

} // namespace ipod::runtime
