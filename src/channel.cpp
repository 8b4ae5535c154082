#include "channel.hpp"

#include <utility>

namespace webframe {

// ============================================================================
// Ticket
// ============================================================================

void Ticket::Complete(State state) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::kPending) {
      return;
    }
    state_ = state;
  }
  cv_.notify_all();
}

Ticket::State Ticket::Wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return state_ != State::kPending; });
  return state_;
}

// ============================================================================
// Task
// ============================================================================

Task::Task(std::function<void()> work, std::shared_ptr<Ticket> ticket)
  : work_(std::move(work)), ticket_(std::move(ticket)) {}

Task::~Task() {
  if (ticket_ && !consumed_) {
    ticket_->Complete(Ticket::State::kDropped);
  }
}

Task::Task(Task&& other) noexcept
  : work_(std::move(other.work_)), ticket_(std::move(other.ticket_)), consumed_(other.consumed_) {
  other.consumed_ = true;
}

Task& Task::operator=(Task&& other) noexcept {
  if (this != &other) {
    if (ticket_ && !consumed_) {
      ticket_->Complete(Ticket::State::kDropped);
    }
    work_ = std::move(other.work_);
    ticket_ = std::move(other.ticket_);
    consumed_ = other.consumed_;
    other.consumed_ = true;
  }
  return *this;
}

void Task::Run() {
  if (consumed_) {
    return;
  }
  consumed_ = true;

  // Complete the ticket even if the work throws, then let the exception reach the loop.
  struct Completion {
    Ticket* ticket;
    ~Completion() {
      if (ticket) {
        ticket->Complete(Ticket::State::kDone);
      }
    }
  } completion{ticket_.get()};

  if (work_) {
    work_();
  }
}

// ============================================================================
// EventChannel
// ============================================================================

EventChannel::EventChannel(WakeFn wake) : wake_(std::move(wake)) {}

bool EventChannel::Send(ProxyMessage message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }

  queue_.push_back(std::move(message));

  // Woken under the lock so Close() cannot tear the backend down mid-wake.
  if (wake_) {
    wake_();
  }
  return true;
}

std::deque<ProxyMessage> EventChannel::Drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::deque<ProxyMessage> drained;
  drained.swap(queue_);
  return drained;
}

bool EventChannel::Empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty();
}

std::size_t EventChannel::Close() {
  std::deque<ProxyMessage> dropped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    wake_ = nullptr;
    dropped.swap(queue_);
  }
  // Destroyed outside the lock; dropped tasks release their waiters here.
  return dropped.size();
}

bool EventChannel::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

}  // namespace webframe
