#pragma once

#include "app/Actions.hpp"
#include "app/Refresh.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace svcdash::app {

struct Completion {
  enum class Kind { Action, Discovery };
  Kind kind{Kind::Action};
  ActionOutcome action;
  DiscoveryOutcome discovery;
};

// Results handed from worker threads to the event loop. post() is safe from
// any thread and makes fd() readable; take() runs on the loop thread.
class CompletionQueue {
public:
  CompletionQueue();  // throws std::system_error if eventfd() fails
  ~CompletionQueue();
  CompletionQueue(const CompletionQueue&) = delete;
  CompletionQueue& operator=(const CompletionQueue&) = delete;

  [[nodiscard]] int fd() const { return efd_; }
  void post(Completion c);
  std::vector<Completion> take();

private:
  std::mutex mu_;
  std::deque<Completion> items_;
  int efd_{-1};
};

// Single background thread running queued jobs in submission order.
class Worker {
public:
  using Job = std::function<void()>;

  explicit Worker(std::string name) : name_(std::move(name)) {}
  ~Worker();
  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  void start();
  // Finish the running job, drop queued ones, join.
  void stop();
  void submit(Job job);

  [[nodiscard]] const std::string& name() const { return name_; }

private:
  void run(std::stop_token st);

  std::string name_;
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::deque<Job> jobs_;
  std::jthread thread_;
};

} // namespace svcdash::app
