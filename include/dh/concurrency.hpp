#pragma once

#include <atomic>
#include <functional>
#include <thread>

namespace dh {

// Simple cancellation handle
class Cancellation {
public:
  // Returns true only for the call that actually flipped the flag
  bool cancel() { return !flag_.exchange(true, std::memory_order_acq_rel); }
  bool is_cancelled() const { return flag_.load(std::memory_order_acquire); }
  const std::atomic<bool>& flag() const { return flag_; }
private:
  std::atomic<bool> flag_{false};
};

// Creates the thread running `body`; std::thread when left empty
using ThreadStarter = std::function<std::thread(std::function<void()>)>;

// Start `workers` threads running fn(worker_index, flag) and join them all.
// workers <= 1 runs fn(0, flag) on the calling thread.
// - fn is expected to loop until its work source is empty or `flag` is set.
// - The first exception thrown by any worker cancels the others and is
//   rethrown after every worker has joined.
// - If a thread cannot be created the pool keeps the workers already
//   running; the error is rethrown only when none started.
void run_workers(
    int workers,
    const std::function<void(int, const std::atomic<bool>&)>& fn,
    Cancellation* cancel = nullptr,
    const ThreadStarter& start = {});

} // namespace dh
