#pragma once

#include "events.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace webframe {

// ============================================================================
// Task
// A unit of work that runs at most once. A synchronous sender waits on the
// attached ticket, which is completed either by running the task or by
// destroying it unrun.
// ============================================================================

class Ticket {
public:
  enum class State { kPending, kDone, kDropped };

  void Complete(State state);

  // Blocks until the ticket leaves kPending.
  State Wait();

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  State state_ = State::kPending;
};

class Task {
public:
  Task(std::function<void()> work, std::shared_ptr<Ticket> ticket = nullptr);
  ~Task();

  Task(Task&& other) noexcept;
  Task& operator=(Task&& other) noexcept;

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  void Run();

private:
  std::function<void()> work_;
  std::shared_ptr<Ticket> ticket_;
  bool consumed_ = false;
};

// ============================================================================
// Proxy messages
// ============================================================================

namespace message {

struct Invoke {
  Task task;
};

struct SendToWebview {
  WindowId window = 0;
  std::string text;
};

struct DestroyWindow {
  WindowId window = 0;
};

struct Exit {};

}  // namespace message

using ProxyMessage = std::variant<
  message::Invoke,
  message::SendToWebview,
  message::DestroyWindow,
  message::Exit,
  event::UserEvent,
  event::MenuEvent,
  event::TrayEvent>;

// ============================================================================
// EventChannel
// Multi-producer queue drained by the loop thread. Producers wake the loop
// after every send. Once closed, sends fail and queued messages are dropped.
// ============================================================================

class EventChannel {
public:
  using WakeFn = std::function<void()>;

  explicit EventChannel(WakeFn wake);

  bool Send(ProxyMessage message);

  std::deque<ProxyMessage> Drain();

  bool Empty() const;

  // Returns the number of messages dropped.
  std::size_t Close();

  bool closed() const;

private:
  mutable std::mutex mutex_;
  std::deque<ProxyMessage> queue_;
  WakeFn wake_;
  bool closed_ = false;
};

}  // namespace webframe
