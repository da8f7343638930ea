#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include "store/store_registry.hpp"
#include "service/file_service.hpp"
#include "persistence/checkpointer.hpp"

namespace cfs {
namespace app {

class Bootstrap {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Bootstrap(const std::filesystem::path& snapshot_path,
            std::chrono::milliseconds autosave_interval,
            bool handle_signals = true);
  ~Bootstrap();

  Bootstrap(const Bootstrap&) = delete;
  Bootstrap& operator=(const Bootstrap&) = delete;


  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Restores the snapshot file if one exists, then starts checkpointing.
  // Returns false when the snapshot file cannot be read.
  bool start();
  // Stops checkpointing and writes the final snapshot. Returns whether it was saved.
  bool shutdown();


  // ---- STOP REQUESTS ----
  void request_stop();
  bool stop_requested() const { return stop_requested_; }
  // Blocks until request_stop() is called
  void wait_for_stop();


  // ---- GETTERS AND SETTERS ----
  store::StoreRegistry& get_registry() { return *registry_; }
  service::FileService& get_file_service() { return *file_service_; }
  const std::filesystem::path& get_snapshot_path() const { return snapshot_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path snapshot_path_;
  std::chrono::milliseconds autosave_interval_;
  bool handle_signals_;

  // Lifecycle state
  bool started_ = false;
  bool shut_down_ = false;
  std::atomic<bool> stop_requested_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  // System components
  std::unique_ptr<store::StoreRegistry> registry_;
  std::unique_ptr<service::FileService> file_service_;
  std::unique_ptr<persistence::Checkpointer> checkpointer_;
};

} // namespace app
} // namespace cfs
