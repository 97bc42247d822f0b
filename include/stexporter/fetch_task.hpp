#pragma once
#include "types.hpp"

#include <boost/thread.hpp>
#include <cstddef>
#include <memory>

namespace stexporter {

// Ждёт, пока все задачи одного цикла опроса отработают
class CycleLatch {
public:
  explicit CycleLatch(std::size_t count) : remaining_(count) {}

  void count_down() {
    boost::lock_guard<boost::mutex> lk(m_);
    if (remaining_ > 0 && --remaining_ == 0)
      cv_.notify_all();
  }

  void wait() {
    boost::unique_lock<boost::mutex> lk(m_);
    cv_.wait(lk, [&] { return remaining_ == 0; });
  }

private:
  boost::mutex m_;
  boost::condition_variable cv_;
  std::size_t remaining_;
};

struct FetchTask {
  Device device;
  std::shared_ptr<CycleLatch> latch;
};

} // namespace stexporter
