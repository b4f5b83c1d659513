#include "app/Worker.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <exception>
#include <sys/eventfd.h>
#include <system_error>
#include <unistd.h>

namespace svcdash::app {

CompletionQueue::CompletionQueue() {
  efd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (efd_ < 0) throw std::system_error(errno, std::generic_category(), "eventfd");
}

CompletionQueue::~CompletionQueue() {
  if (efd_ >= 0) ::close(efd_);
}

void CompletionQueue::post(Completion c) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    items_.push_back(std::move(c));
  }
  uint64_t one = 1;
  // EAGAIN means the counter is saturated, which still leaves the fd readable
  if (::write(efd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
    std::fprintf(stderr, "svcdash: completion queue: eventfd write: %s\n", std::strerror(errno));
  }
}

std::vector<Completion> CompletionQueue::take() {
  uint64_t count = 0;
  if (::read(efd_, &count, sizeof(count)) < 0 && errno != EAGAIN) {
    std::fprintf(stderr, "svcdash: completion queue: eventfd read: %s\n", std::strerror(errno));
  }
  std::vector<Completion> out;
  std::lock_guard<std::mutex> lk(mu_);
  out.reserve(items_.size());
  while (!items_.empty()) {
    out.push_back(std::move(items_.front()));
    items_.pop_front();
  }
  return out;
}

Worker::~Worker() { stop(); }

void Worker::start() {
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Worker::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    cv_.notify_all();
    thread_.join();
  }
  std::lock_guard<std::mutex> lk(mu_);
  jobs_.clear();
}

void Worker::submit(Job job) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
}

void Worker::run(std::stop_token st) {
  while (!st.stop_requested()) {
    Job job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      if (!cv_.wait(lk, st, [this]{ return !jobs_.empty(); })) break;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    try {
      job();
    } catch (const std::exception& e) {
      std::fprintf(stderr, "svcdash: %s worker: job failed: %s\n", name_.c_str(), e.what());
    }
  }
}

} // namespace svcdash::app
