#include "core/task_queue.hpp"
#include "utils/logging.hpp"

namespace medscribe {
namespace core {

TaskQueue::TaskQueue() : shutdown_(false) {
}

TaskQueue::~TaskQueue() {
    shutdown();
}

bool TaskQueue::enqueue(Task task) {
    if (!task) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    condition_.notify_one();
    return true;
}

TaskQueue::Task TaskQueue::dequeue() {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty() || shutdown_; });

    if (queue_.empty()) {
        return Task();
    }

    Task task = std::move(queue_.front());
    queue_.pop_front();
    return task;
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool TaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

void TaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    condition_.notify_all();
}

bool TaskQueue::isShuttingDown() const {
    return shutdown_;
}

// ThreadPool implementation

ThreadPool::ThreadPool(size_t num_threads)
    : num_threads_(num_threads), running_(false), active_threads_(0) {
    if (num_threads_ == 0) {
        num_threads_ = 1;
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::start(std::shared_ptr<TaskQueue> task_queue) {
    if (running_ || !task_queue) {
        return;
    }

    task_queue_ = std::move(task_queue);
    running_ = true;

    workers_.reserve(num_threads_);
    for (size_t i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
}

void ThreadPool::stop() {
    if (!running_) {
        return;
    }

    task_queue_->shutdown();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers_.clear();
    task_queue_.reset();
    running_ = false;
}

void ThreadPool::workerLoop() {
    while (true) {
        TaskQueue::Task task = task_queue_->dequeue();
        if (!task) {
            break;
        }

        active_threads_++;
        try {
            task();
        } catch (const std::exception& e) {
            utils::Logger::error(std::string("Worker task failed: ") + e.what());
        }
        active_threads_--;
    }
}

} // namespace core
} // namespace medscribe
