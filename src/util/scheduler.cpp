#include "util/scheduler.hpp"

#include <chrono>

#include "util/log.hpp"

namespace sched
{

TaskId TaskQueue::push(std::uint64_t due_ms, Task t)
{
    const TaskId id = next_id_++;
    queue_.emplace(std::make_pair(due_ms, id), std::move(t));
    by_id_.emplace(id, due_ms);
    return id;
}

bool TaskQueue::erase(TaskId id)
{
    auto it = by_id_.find(id);
    if (it == by_id_.end())
        return false;
    queue_.erase(std::make_pair(it->second, id));
    by_id_.erase(it);
    return true;
}

bool TaskQueue::pop_due(std::uint64_t now_ms, Task &out)
{
    if (queue_.empty())
        return false;
    auto it = queue_.begin();
    if (it->first.first > now_ms)
        return false;
    out = std::move(it->second);
    by_id_.erase(it->first.second);
    queue_.erase(it);
    return true;
}

bool TaskQueue::next_due(std::uint64_t &due_ms) const
{
    if (queue_.empty())
        return false;
    due_ms = queue_.begin()->first.first;
    return true;
}

void TaskQueue::clear()
{
    queue_.clear();
    by_id_.clear();
}

// ============== ThreadScheduler ==============

ThreadScheduler::~ThreadScheduler()
{
    stop();
}

std::uint64_t ThreadScheduler::now_ms() const
{
    using namespace std::chrono;
    return (std::uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch())
        .count();
}

bool ThreadScheduler::start()
{
    if (running_.exchange(true))
        return true;
    worker_ = std::thread([this] { run(); });
    return true;
}

void ThreadScheduler::stop()
{
    {
        // flip under mu_ so the worker is either before its running_ check or inside wait()
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_.exchange(false))
            return;
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();

    std::lock_guard<std::mutex> lk(mu_);
    if (tasks_.size() != 0)
        LOG_DEBUG("[SCHED] dropping %zu pending task(s)", tasks_.size());
    tasks_.clear();
}

TaskId ThreadScheduler::post(Task t)
{
    return post_after(0, std::move(t));
}

TaskId ThreadScheduler::post_after(std::uint64_t delay_ms, Task t)
{
    if (!t || !running_.load())
        return INVALID_TASK;
    TaskId id;
    {
        std::lock_guard<std::mutex> lk(mu_);
        id = tasks_.push(now_ms() + delay_ms, std::move(t));
    }
    cv_.notify_one();
    return id;
}

bool ThreadScheduler::cancel(TaskId id)
{
    if (id == INVALID_TASK)
        return false;
    std::lock_guard<std::mutex> lk(mu_);
    return tasks_.erase(id);
}

void ThreadScheduler::run()
{
    std::unique_lock<std::mutex> lk(mu_);
    while (running_.load())
    {
        std::uint64_t due = 0;
        if (!tasks_.next_due(due))
        {
            cv_.wait(lk);
            continue;
        }
        const std::uint64_t now = now_ms();
        if (due > now)
        {
            cv_.wait_for(lk, std::chrono::milliseconds(due - now));
            continue;
        }
        Task t;
        if (!tasks_.pop_due(now, t))
            continue;
        lk.unlock();
        t();
        lk.lock();
    }
}

// ============== ManualScheduler ==============

TaskId ManualScheduler::post(Task t)
{
    return post_after(0, std::move(t));
}

TaskId ManualScheduler::post_after(std::uint64_t delay_ms, Task t)
{
    if (!t)
        return INVALID_TASK;
    return tasks_.push(now_ + delay_ms, std::move(t));
}

bool ManualScheduler::cancel(TaskId id)
{
    return tasks_.erase(id);
}

void ManualScheduler::advance(std::uint64_t ms)
{
    const std::uint64_t target = now_ + ms;
    std::uint64_t       due    = 0;
    while (tasks_.next_due(due) && due <= target)
    {
        if (due > now_)
            now_ = due;
        Task t;
        if (tasks_.pop_due(now_, t))
            t();
    }
    now_ = target;
}

}  // namespace sched
