#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace medscribe {
namespace core {

/**
 * Thread-safe FIFO of work items. Items run in submission order, which keeps
 * segment recognition starting in index order.
 */
class TaskQueue {
public:
    using Task = std::function<void()>;

    TaskQueue();
    ~TaskQueue();

    // Non-copyable, non-movable
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;
    TaskQueue(TaskQueue&&) = delete;
    TaskQueue& operator=(TaskQueue&&) = delete;

    /**
     * Add a task. Returns false once the queue is shutting down.
     */
    bool enqueue(Task task);

    /**
     * Add a callable and get a future for its result. Exceptions thrown by
     * the callable surface from future::get().
     */
    template<typename F>
    auto enqueueWithFuture(F&& f) -> std::future<typename std::result_of<F()>::type>;

    /**
     * Next task, blocking while empty. Returns an empty function when the
     * queue is shut down and drained.
     */
    Task dequeue();

    size_t size() const;
    bool empty() const;

    /**
     * Stop accepting tasks and wake every waiting worker. Pending tasks are
     * still handed out.
     */
    void shutdown();
    bool isShuttingDown() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<Task> queue_;
    std::atomic<bool> shutdown_;
};

/**
 * Fixed set of worker threads draining a TaskQueue
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    void start(std::shared_ptr<TaskQueue> task_queue);

    /**
     * Shut the queue down and join the workers once they drained it
     */
    void stop();

    size_t getNumThreads() const { return num_threads_; }
    size_t getActiveThreads() const { return active_threads_; }
    bool isRunning() const { return running_; }

private:
    void workerLoop();

    size_t num_threads_;
    std::vector<std::thread> workers_;
    std::shared_ptr<TaskQueue> task_queue_;
    std::atomic<bool> running_;
    std::atomic<size_t> active_threads_;
};

template<typename F>
auto TaskQueue::enqueueWithFuture(F&& f) -> std::future<typename std::result_of<F()>::type> {
    using return_type = typename std::result_of<F()>::type;

    auto task_ptr = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task_ptr->get_future();

    if (!enqueue([task_ptr]() { (*task_ptr)(); })) {
        // Rejected: the packaged task is destroyed unrun and the future
        // reports broken_promise
        task_ptr.reset();
    }
    return result;
}

} // namespace core
} // namespace medscribe
