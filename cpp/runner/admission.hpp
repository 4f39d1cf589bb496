#ifndef RUNNER_ADMISSION_HPP
#define RUNNER_ADMISSION_HPP

#include <cstddef>
#include <deque>
#include <functional>

#include <kj/async.h>
#include <kj/debug.h>

namespace runner {

// Bounds the number of tasks that run at the same time. Tasks over the limit
// wait in FIFO order, and are rejected with an OVERLOADED exception if too
// many are already waiting. A limit of 0 means unbounded.
class Admission {
 public:
  Admission(size_t max_running, size_t max_waiting)
      : max_running_(max_running), max_waiting_(max_waiting) {}
  KJ_DISALLOW_COPY(Admission);

  // Runs f as soon as there is a free slot. The slot is given back when the
  // promise returned by f completes or the returned promise is dropped.
  template <typename T>
  kj::Promise<T> Schedule(std::function<kj::Promise<T>()> f) {
    DropCancelled();
    if (max_waiting_ != 0 && waiting_.size() >= max_waiting_) {
      return KJ_EXCEPTION(OVERLOADED, "Too many pending executions",
                          waiting_.size());
    }
    kj::PromiseFulfillerPair<void> pf = kj::newPromiseAndFulfiller<void>();
    auto ticket = kj::heap<Ticket>(this);
    waiting_.push_back({std::move(pf.fulfiller), ticket.get()});
    OnDone();
    return pf.promise.then([f]() { return kj::evalNow(f); })
        .attach(std::move(ticket));
  }

  size_t Running() const { return running_; }
  size_t Waiting() const { return waiting_.size(); }

 private:
  // Ties a running slot to the lifetime of a scheduled task.
  class Ticket {
   public:
    explicit Ticket(Admission* admission) : admission_(admission) {}
    KJ_DISALLOW_COPY(Ticket);
    ~Ticket() {
      if (!admitted_) return;
      admission_->running_--;
      admission_->OnDone();
    }
    void Admit() { admitted_ = true; }

   private:
    Admission* admission_;
    bool admitted_ = false;
  };

  struct Waiter {
    kj::Own<kj::PromiseFulfiller<void>> fulfiller;
    Ticket* ticket;
  };

  void OnDone();
  void DropCancelled();

  const size_t max_running_;
  const size_t max_waiting_;
  size_t running_ = 0;
  std::deque<Waiter> waiting_;
};

}  // namespace runner

#endif
