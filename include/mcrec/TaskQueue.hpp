#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace mcrec {

// One background worker running posted tasks in order.
class TaskQueue {
public:
    TaskQueue();
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // The future carries the task's result or exception. Throws
    // std::logic_error after Shutdown().
    template <typename F>
    auto Post(F&& task) -> std::future<typename std::invoke_result<F>::type> {
        using Result = typename std::invoke_result<F>::type;

        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
        std::future<Result> result = packaged->get_future();
        Enqueue([packaged]() { (*packaged)(); });
        return result;
    }

    // Runs what is already queued, then joins the worker.
    void Shutdown();

    bool IsWorkerThread() const;

private:
    void Enqueue(std::function<void()> job);
    void Run();

    std::deque<std::function<void()>> _jobs;
    bool _stopping;
    std::mutex _mutex;
    std::condition_variable _wake;
    std::thread _thread;
};

} // namespace mcrec
