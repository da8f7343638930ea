#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace cfs::logging {

std::optional<severity_level> parse_severity(const std::string& name) {
    if (name == "trace")   return severity_level::trace;
    if (name == "debug")   return severity_level::debug;
    if (name == "info")    return severity_level::info;
    if (name == "warning") return severity_level::warning;
    if (name == "error")   return severity_level::error;
    if (name == "fatal")   return severity_level::fatal;
    return std::nullopt;
}

void init_logging(const std::string& log_file, severity_level min_level) {
    try {
        // Clear any existing sinks
        boost::log::core::get()->remove_all_sinks();

        // Create and configure text file sink backend
        auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        backend->set_file_name_pattern(log_path.string());
        backend->set_open_mode(std::ios::out | std::ios::app);  // Keep history across restarts
        backend->auto_flush(true);

        using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
        auto sink = boost::make_shared<text_sink>(backend);

        namespace expr = boost::log::expressions;
        sink->set_formatter(
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                << " [" << expr::attr<severity_level>("Severity") << "] "
                << expr::smessage
        );

        boost::log::core::get()->add_sink(sink);
        boost::log::add_common_attributes();

        set_log_level(min_level);
        boost::log::core::get()->set_logging_enabled(true);

        BOOST_LOG_TRIVIAL(info) << "Logging initialized at " << boost::log::trivial::to_string(min_level)
                                << " with file: " << log_path.string();
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_log_level(severity_level min_level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

} // namespace cfs::logging
