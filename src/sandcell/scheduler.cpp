#include <sandcell/scheduler.h>

#include <algorithm>

#include <spdlog/spdlog.h>

int kMaxParallel = 4;

Scheduler::Scheduler(int workers) : stop_(false) {
  workers = std::max(1, workers);
  for (int i = 0; i < workers; i++) workers_.emplace_back([this]() { WorkLoop_(); });
  spdlog::debug("Scheduler started with {} workers", workers);
}

Scheduler::~Scheduler() {
  {
    std::lock_guard<std::mutex> lck(task_mtx_);
    stop_ = true;
  }
  task_cv_.notify_all();
  for (auto& i : workers_) i.join();
}

void Scheduler::Push_(TaskEntry&& task) {
  std::unique_lock<std::mutex> lck(task_mtx_);
  SessionKey key = task.key;
  auto& queue = pending_[key];
  queue.push_back(std::move(task));
  // otherwise the session is already ready, or its running task re-queues it
  if (queue.size() == 1 && !running_.count(key)) ready_.push_back(key);
  lck.unlock();
  task_cv_.notify_one();
}

void Scheduler::WorkLoop_() {
  std::unique_lock<std::mutex> lck(task_mtx_);
  while (true) {
    task_cv_.wait(lck, [this]() { return stop_ || !ready_.empty(); });
    if (ready_.empty()) return;
    SessionKey key = std::move(ready_.front());
    ready_.pop_front();
    auto& queue = pending_[key];
    TaskEntry task = std::move(queue.front());
    queue.pop_front();
    running_.insert(key);
    lck.unlock();
    {
      ScopedSession session(key);
      // exceptions are delivered through the future
      task.func();
    }
    lck.lock();
    running_.erase(key);
    auto it = pending_.find(key);
    if (it->second.empty()) {
      pending_.erase(it);
    } else {
      ready_.push_back(key);
      task_cv_.notify_one();
    }
  }
}

size_t Scheduler::QueueSize() {
  std::lock_guard<std::mutex> lck(task_mtx_);
  size_t ret = 0;
  for (auto& i : pending_) ret += i.second.size();
  return ret;
}
