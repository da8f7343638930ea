#include "app/bootstrap.hpp"
#include "persistence/persistence_error.hpp"
#include <boost/log/trivial.hpp>

namespace cfs {
namespace app {

Bootstrap::Bootstrap(const std::filesystem::path& snapshot_path,
                     std::chrono::milliseconds autosave_interval,
                     bool handle_signals)
    : snapshot_path_(snapshot_path)
    , autosave_interval_(autosave_interval)
    , handle_signals_(handle_signals) {

    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Initializing with snapshot: " << snapshot_path_.string();

    try {
        // Registry first (no dependencies)
        registry_ = std::make_unique<store::StoreRegistry>();
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Store registry created successfully";

        file_service_ = std::make_unique<service::FileService>(*registry_);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: File service created successfully";

        // Checkpointer last as it writes through the file service
        persistence::Checkpointer::SignalHandler on_signal = nullptr;
        if (handle_signals_) {
            on_signal = [this](int signal_number) {
                BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Stop requested by signal " << signal_number;
                request_stop();
            };
        }
        checkpointer_ = std::make_unique<persistence::Checkpointer>(
            autosave_interval_,
            [this]() { file_service_->save(snapshot_path_); },
            on_signal);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Checkpointer created successfully";

        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Successfully created all components";
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to initialize components: " << e.what();
        throw;
    }
}

Bootstrap::~Bootstrap() {
    if (started_) {
        shutdown();
    }
}

bool Bootstrap::start() {
    if (started_) {
        BOOST_LOG_TRIVIAL(warning) << "Bootstrap program: Already started";
        return false;
    }

    try {
        if (file_service_->load(snapshot_path_)) {
            BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Restored " << registry_->size()
                                    << " tenants from " << snapshot_path_.string();
        } else {
            BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Starting with an empty store";
        }
    }
    catch (const persistence::SnapshotError& e) {
        BOOST_LOG_TRIVIAL(fatal) << "Bootstrap program: Cannot restore snapshot "
                                 << snapshot_path_.string() << ": " << e.what();
        return false;
    }

    if (!checkpointer_->start()) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to start checkpointer";
        return false;
    }

    started_ = true;
    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Started";
    return true;
}

bool Bootstrap::shutdown() {
    if (!started_) {
        // Never overwrite a snapshot that was not loaded
        BOOST_LOG_TRIVIAL(warning) << "Bootstrap program: Shutdown without start, nothing saved";
        return false;
    }
    if (shut_down_) {
        return true;
    }
    shut_down_ = true;

    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Shutting down";
    checkpointer_->stop();

    try {
        file_service_->save(snapshot_path_);
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Final snapshot failed: " << e.what();
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Shutdown complete";
    return true;
}

void Bootstrap::request_stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
}

void Bootstrap::wait_for_stop() {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stop_cv_.wait(lock, [this]() { return stop_requested_.load(); });
}

} // namespace app
} // namespace cfs
