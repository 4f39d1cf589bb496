#include "runner/admission.hpp"

#include <algorithm>

namespace runner {

void Admission::OnDone() {
  while (!waiting_.empty()) {
    if (max_running_ != 0 && running_ >= max_running_) break;
    Waiter waiter = std::move(waiting_.front());
    waiting_.pop_front();
    // The task was dropped while waiting: its ticket is gone.
    if (!waiter.fulfiller->isWaiting()) continue;
    running_++;
    waiter.ticket->Admit();
    waiter.fulfiller->fulfill();
  }
}

void Admission::DropCancelled() {
  waiting_.erase(std::remove_if(waiting_.begin(), waiting_.end(),
                                [](const Waiter& waiter) {
                                  return !waiter.fulfiller->isWaiting();
                                }),
                 waiting_.end());
}

}  // namespace runner
