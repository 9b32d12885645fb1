#ifndef INCLUDE_SANDCELL_SCHEDULER_H_
#define INCLUDE_SANDCELL_SCHEDULER_H_

#include <deque>
#include <mutex>
#include <thread>
#include <future>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <condition_variable>

#include "session.h"

extern int kMaxParallel;

// Runs blocking sandbox work on a fixed pool of workers. Tasks of the same
// session run one at a time in submission order; tasks of different sessions
// run in parallel. Each task runs with its session installed as current.
class Scheduler {
  struct TaskEntry {
    SessionKey key;
    std::function<void()> func;
  };

  std::mutex task_mtx_;
  std::condition_variable task_cv_;
  // sessions with queued tasks and no running task, in arrival order
  std::deque<SessionKey> ready_;
  std::unordered_map<SessionKey, std::deque<TaskEntry>, SessionKeyHash> pending_;
  std::unordered_set<SessionKey, SessionKeyHash> running_;
  std::vector<std::thread> workers_;
  bool stop_;

  void Push_(TaskEntry&&);
  void WorkLoop_();
 public:
  explicit Scheduler(int workers = kMaxParallel);
  ~Scheduler(); // drains queued tasks

  template <class Func>
  auto Submit(const SessionKey& key, Func&& func) -> std::future<decltype(func())> {
    using Ret = decltype(func());
    auto task = std::make_shared<std::packaged_task<Ret()>>(std::forward<Func>(func));
    std::future<Ret> ret = task->get_future();
    Push_({key, [task]() { (*task)(); }});
    return ret;
  }

  size_t QueueSize();
};

#endif  // INCLUDE_SANDCELL_SCHEDULER_H_
