#include "stexporter/fetch_pool.hpp"
#include "stexporter/log.hpp"

#include <exception>
#include <string>
#include <utility>

namespace stexporter {

FetchPool::FetchPool(std::size_t workers, Handler handler)
    : n_workers_(workers ? workers : 1), handler_(std::move(handler)),
      queue_(n_workers_ * 2) {}

FetchPool::~FetchPool() { stop(); }

void FetchPool::start() {
  if (running_.exchange(true))
    return;

  workers_.reserve(n_workers_);
  for (std::size_t i = 0; i < n_workers_; ++i) {
    workers_.emplace_back(
        std::make_unique<boost::thread>([this] { worker_loop(); }));
  }
}

void FetchPool::stop() {
  if (!running_.exchange(false))
    return;

  queue_.stop();

  for (auto &w : workers_) {
    if (w && w->joinable())
      w->join();
  }
  workers_.clear();
}

bool FetchPool::run_all(const std::vector<Device> &devices) {
  if (!running_)
    return false;
  if (devices.empty())
    return true;

  auto latch = std::make_shared<CycleLatch>(devices.size());
  std::size_t queued = 0;
  for (const auto &d : devices) {
    if (!queue_.push(FetchTask{d, latch}))
      break;
    ++queued;
  }
  // не поставленные в очередь задачи считаем завершёнными
  for (std::size_t i = queued; i < devices.size(); ++i)
    latch->count_down();

  latch->wait();
  return queued == devices.size();
}

void FetchPool::worker_loop() {
  for (;;) {
    auto task = queue_.pop();
    if (!task.has_value())
      break; // очередь остановлена и пуста

    try {
      handler_(task->device);
    } catch (const std::exception &e) {
      log_err("POLL", "device " + task->device.id +
                          ": unhandled error: " + e.what());
    }
    task->latch->count_down();
  }
}

} // namespace stexporter
