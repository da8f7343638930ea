#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <boost/asio.hpp>

namespace cfs::persistence {

class Checkpointer {
public:
  // Writes one checkpoint, throws on failure
  using SaveHandler = std::function<void()>;
  // Invoked once on SIGINT or SIGTERM, from the io thread. Must not call stop().
  using SignalHandler = std::function<void(int)>;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // An interval of zero disables periodic checkpoints
  Checkpointer(std::chrono::milliseconds interval, SaveHandler save_handler,
               SignalHandler signal_handler = nullptr);
  ~Checkpointer();

  Checkpointer(const Checkpointer&) = delete;
  Checkpointer& operator=(const Checkpointer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start();
  void stop();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  // Number of checkpoints written successfully
  std::size_t checkpoints() const { return checkpoints_; }
  std::size_t failures() const { return failures_; }

private:
  // ---- PARAMETERS ----
  const std::chrono::milliseconds interval_;
  SaveHandler save_handler_;
  SignalHandler signal_handler_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};
  std::atomic<bool> started_{false};
  std::atomic<bool> signal_seen_{false};
  std::atomic<std::size_t> checkpoints_{0};
  std::atomic<std::size_t> failures_{0};

  // Timer and signal handlers
  boost::asio::io_context io_context_;
  boost::asio::steady_timer timer_;
  boost::asio::signal_set signals_;


  // ---- EVENT HANDLING ----
  void schedule_checkpoint();
  void on_timer(const boost::system::error_code& error);
  void wait_for_signal();
  void on_signal(const boost::system::error_code& error, int signal_number);
};

} // namespace cfs::persistence
