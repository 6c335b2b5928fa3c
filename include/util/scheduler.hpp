#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace sched
{

using TaskId = std::uint64_t;
using Task   = std::function<void()>;

inline constexpr TaskId INVALID_TASK = 0;

// Sequencing queue with deferred, cancellable tasks. Tasks never run concurrently with each
// other; anything that must observe a consistent session state is posted here.
struct IScheduler
{
    virtual TaskId        post(Task t)                              = 0;
    virtual TaskId        post_after(std::uint64_t delay_ms, Task t) = 0;
    virtual bool          cancel(TaskId id)                         = 0;  // false if already ran
    virtual std::uint64_t now_ms() const                            = 0;
    virtual ~IScheduler() = default;
};

// Base for both schedulers: ordered queue keyed by (due, id) so equal deadlines keep FIFO order.
class TaskQueue
{
  public:
    TaskId push(std::uint64_t due_ms, Task t);
    bool   erase(TaskId id);
    bool   pop_due(std::uint64_t now_ms, Task &out);
    bool   next_due(std::uint64_t &due_ms) const;
    void   clear();
    size_t size() const { return by_id_.size(); }

  private:
    std::map<std::pair<std::uint64_t, TaskId>, Task> queue_;
    std::unordered_map<TaskId, std::uint64_t>        by_id_;
    TaskId                                           next_id_{1};
};

// Worker-thread scheduler used by the daemon.
class ThreadScheduler final : public IScheduler
{
  public:
    ThreadScheduler() = default;
    ~ThreadScheduler() override;

    bool start();
    void stop();  // pending tasks are dropped; never call from a task (joins the worker)

    TaskId        post(Task t) override;
    TaskId        post_after(std::uint64_t delay_ms, Task t) override;
    bool          cancel(TaskId id) override;
    std::uint64_t now_ms() const override;

  private:
    void run();

    mutable std::mutex      mu_;
    std::condition_variable cv_;
    TaskQueue               tasks_;
    std::thread             worker_;
    std::atomic_bool        running_{false};
};

// Virtual-clock scheduler: nothing runs until advance()/run_ready() is called.
class ManualScheduler final : public IScheduler
{
  public:
    explicit ManualScheduler(std::uint64_t start_ms = 1000) : now_(start_ms) {}

    TaskId        post(Task t) override;
    TaskId        post_after(std::uint64_t delay_ms, Task t) override;
    bool          cancel(TaskId id) override;
    std::uint64_t now_ms() const override { return now_; }

    void   advance(std::uint64_t ms);
    void   run_ready() { advance(0); }
    size_t pending() const { return tasks_.size(); }

  private:
    TaskQueue     tasks_;
    std::uint64_t now_;
};

}  // namespace sched
