#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/keywords/file_name.hpp>
#include <boost/log/keywords/open_mode.hpp>
#include <boost/log/keywords/auto_flush.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace pwv::logging {

namespace {

using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;

// Vault sessions are short, so each run gets one truncated file and no rotation
boost::shared_ptr<file_sink> make_session_sink(const std::filesystem::path& log_path) {
    auto backend = boost::make_shared<boost::log::sinks::text_file_backend>(
        boost::log::keywords::file_name = log_path.string(),
        boost::log::keywords::open_mode = std::ios::out | std::ios::trunc,
        boost::log::keywords::auto_flush = true);

    auto sink = boost::make_shared<file_sink>(backend);

    namespace expr = boost::log::expressions;
    sink->set_formatter(
        expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << boost::log::trivial::severity << "] "
            << expr::smessage);
    return sink;
}

} // namespace

void init_logging(const std::string& log_file, severity_level min_level) {
    auto core = boost::log::core::get();
    std::filesystem::path log_path = std::filesystem::absolute(log_file);

    try {
        // Re-initializing replaces the previous session file
        core->remove_all_sinks();
        core->add_sink(make_session_sink(log_path));
        boost::log::add_common_attributes();
    }
    catch (const std::exception& e) {
        std::cerr << "pwvault: cannot open log file " << log_path.string() << ": " << e.what() << std::endl;
        throw;
    }

    set_log_level(min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(info) << "Logging system initialized with file: " << log_path.string();
}

void set_log_level(severity_level min_level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void enable_logging() {
    boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    boost::log::core::get()->set_logging_enabled(false);
}

} // namespace pwv::logging
