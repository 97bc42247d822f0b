#pragma once
#include "fetch_task.hpp"
#include "threadsafe_queue.hpp"
#include "types.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <vector>

namespace stexporter {

// Пул воркеров опроса устройств. Размер пула = лимит одновременных
// запросов к платформе.
class FetchPool {
public:
  using Handler = std::function<void(const Device &)>;

  FetchPool(std::size_t workers, Handler handler);
  ~FetchPool();

  void start();
  void stop();

  // Раздаёт устройства воркерам и ждёт, пока обработаются все.
  // false, если пул не запущен или остановлен посреди цикла.
  bool run_all(const std::vector<Device> &devices);

private:
  void worker_loop();

  const std::size_t n_workers_;
  Handler handler_;
  ThreadSafeQueue<FetchTask> queue_;
  std::vector<std::unique_ptr<boost::thread>> workers_;
  std::atomic<bool> running_{false};
};

} // namespace stexporter
