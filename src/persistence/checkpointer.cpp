#include "persistence/checkpointer.hpp"
#include <boost/log/trivial.hpp>
#include <csignal>

namespace cfs::persistence {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Checkpointer::Checkpointer(std::chrono::milliseconds interval, SaveHandler save_handler,
                           SignalHandler signal_handler)
  : interval_(interval)
  , save_handler_(std::move(save_handler))
  , signal_handler_(std::move(signal_handler))
  , timer_(io_context_)
  , signals_(io_context_) {
  BOOST_LOG_TRIVIAL(info) << "Checkpointer: Initializing with interval of " << interval_.count() << " ms";
}

Checkpointer::~Checkpointer() {
  stop();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool Checkpointer::start() {
  if (started_.exchange(true)) {
    BOOST_LOG_TRIVIAL(warning) << "Checkpointer: Already started";
    return false;
  }

  try {
    if (signal_handler_) {
      signals_.add(SIGINT);
      signals_.add(SIGTERM);
      wait_for_signal();
    }

    if (interval_.count() > 0) {
      schedule_checkpoint();
    } else {
      BOOST_LOG_TRIVIAL(info) << "Checkpointer: Periodic checkpoints disabled";
    }

    is_running_ = true;

    // Run io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        boost::asio::io_context::work work(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Checkpointer: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "Checkpointer: Started";
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Checkpointer: Failed to start: " << e.what();
    is_running_ = false;
    return false;
  }
}

void Checkpointer::stop() {
  if (!is_running_.exchange(false) && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Checkpointer: Stopping";

  // Stop io_context; a checkpoint in progress finishes first
  io_context_.stop();

  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  BOOST_LOG_TRIVIAL(info) << "Checkpointer: Stopped after " << checkpoints_ << " checkpoints";
}


//==============================================
// EVENT HANDLING
//==============================================

void Checkpointer::schedule_checkpoint() {
  timer_.expires_after(interval_);
  timer_.async_wait([this](const boost::system::error_code& error) {
    on_timer(error);
  });
}

void Checkpointer::on_timer(const boost::system::error_code& error) {
  if (error == boost::asio::error::operation_aborted) {
    return;
  }
  if (error) {
    BOOST_LOG_TRIVIAL(error) << "Checkpointer: Timer error: " << error.message();
    return;
  }

  try {
    save_handler_();
    ++checkpoints_;
    BOOST_LOG_TRIVIAL(debug) << "Checkpointer: Checkpoint " << checkpoints_ << " written";
  } catch (const std::exception& e) {
    // Keep the schedule; the next tick retries
    ++failures_;
    BOOST_LOG_TRIVIAL(error) << "Checkpointer: Checkpoint failed: " << e.what();
  }

  schedule_checkpoint();
}

void Checkpointer::wait_for_signal() {
  signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
    on_signal(error, signal_number);
  });
}

void Checkpointer::on_signal(const boost::system::error_code& error, int signal_number) {
  if (error == boost::asio::error::operation_aborted) {
    return;
  }
  if (error) {
    BOOST_LOG_TRIVIAL(error) << "Checkpointer: Signal wait error: " << error.message();
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Checkpointer: Received signal " << signal_number;

  if (!signal_seen_.exchange(true)) {
    signal_handler_(signal_number);
  }

  // Keep intercepting so a repeated signal does not kill the process mid-shutdown
  wait_for_signal();
}

} // namespace cfs::persistence
