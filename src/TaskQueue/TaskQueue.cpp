#include "mcrec/TaskQueue.hpp"

namespace mcrec {

TaskQueue::TaskQueue()
    : _stopping(false) {
    _thread = std::thread([this]() { Run(); });
}

TaskQueue::~TaskQueue() {
    Shutdown();
}

void TaskQueue::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopping = true;
    }
    _wake.notify_all();

    if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id()) {
        _thread.join();
    }
}

bool TaskQueue::IsWorkerThread() const {
    return _thread.get_id() == std::this_thread::get_id();
}

void TaskQueue::Enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopping) {
            throw std::logic_error("TaskQueue is shut down");
        }
        _jobs.push_back(std::move(job));
    }
    _wake.notify_one();
}

void TaskQueue::Run() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _wake.wait(lock, [this]() { return _stopping || !_jobs.empty(); });
            if (_jobs.empty()) {
                return;
            }
            job = std::move(_jobs.front());
            _jobs.pop_front();
        }
        // packaged_task stores exceptions in the future
        job();
    }
}

} // namespace mcrec
