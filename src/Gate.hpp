#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

// Counting semaphore capping how many fetches run at once.
class Gate {
 public:
  explicit Gate(std::size_t permits) : avail_(permits > 0 ? permits : 1) {
  }
  Gate(const Gate&) = delete;
  Gate& operator=(const Gate&) = delete;

  void acquire() {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait(lk, [&] { return avail_ > 0; });
    --avail_;
  }
  void release() {
    {
      std::lock_guard<std::mutex> lk(m_);
      ++avail_;
    }
    cv_.notify_one();
  }

  // Holds one permit for its lifetime, so it is returned even when the
  // guarded work throws.
  class Permit {
   public:
    explicit Permit(Gate& g) : g_(g) {
      g_.acquire();
    }
    ~Permit() {
      g_.release();
    }
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

   private:
    Gate& g_;
  };

 private:
  std::mutex m_;
  std::condition_variable cv_;
  std::size_t avail_;
};
