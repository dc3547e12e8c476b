#pragma once
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace lfx {

using Clock = std::chrono::steady_clock;

enum class CallStatus { Ok, Failed, TimedOut };

template <typename R>
struct CallOutcome {
  CallStatus  status = CallStatus::Failed;
  R           value{};
  std::string error;
};

// Runs `fn` on its own thread and waits for it until `deadline`. On
// timeout the thread is detached; it only ever writes into the shared
// slot below, which the caller no longer reads. `fn` must therefore own
// (or share) everything it touches.
//
// `fn` has the shape bool(R& out, std::string* error).
template <typename R>
CallOutcome<R> callWithDeadline(std::function<bool(R&, std::string*)> fn,
                                Clock::time_point deadline) {
  struct Slot {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    bool ok = false;
    R value{};
    std::string error;
  };
  auto slot = std::make_shared<Slot>();

  CallOutcome<R> outcome;
  if (Clock::now() >= deadline) {
    outcome.status = CallStatus::TimedOut;
    outcome.error = "deadline already passed";
    return outcome;
  }

  std::thread worker([slot, fn = std::move(fn)]() {
    R value{};
    std::string error;
    bool ok = false;
    try {
      ok = fn(value, &error);
    } catch (const std::exception& e) {
      ok = false;
      error = std::string("exception: ") + e.what();
    }
    std::lock_guard<std::mutex> lock(slot->mu);
    slot->ok = ok;
    slot->value = std::move(value);
    slot->error = std::move(error);
    slot->done = true;
    slot->cv.notify_all();
  });
  worker.detach();

  std::unique_lock<std::mutex> lock(slot->mu);
  if (!slot->cv.wait_until(lock, deadline, [&] { return slot->done; })) {
    outcome.status = CallStatus::TimedOut;
    outcome.error = "collaborator call timed out";
    return outcome;
  }
  outcome.status = slot->ok ? CallStatus::Ok : CallStatus::Failed;
  outcome.value = std::move(slot->value);
  outcome.error = slot->ok ? std::string() : slot->error;
  return outcome;
}

} // namespace lfx
