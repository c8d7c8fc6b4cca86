#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/util/time.hpp"

namespace glucolumin::core {
class VisitManager;
}

namespace glucolumin::pipeline {

/*
  Periodic sweeper enforcing the collection window and the processing
  deadline.
*/
class VisitWatchdog {
 public:
  VisitWatchdog(std::shared_ptr<glucolumin::core::VisitManager> manager, std::chrono::milliseconds interval);
  ~VisitWatchdog();

  void Start();
  void Stop();

  void SweepOnce(util::TimePoint now);

 private:
  void Run();

  std::shared_ptr<glucolumin::core::VisitManager> manager_;
  std::chrono::milliseconds                       interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::thread             thread_;
};

} // namespace glucolumin::pipeline
