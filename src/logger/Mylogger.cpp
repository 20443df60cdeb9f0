#include "Mylogger.hpp"

#include <boost/log/trivial.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <iostream>
#include <stdexcept>

namespace logging = boost::log;

namespace chunkstream
{

    namespace
    {
        logging::trivial::severity_level parse_level(const std::string &level)
        {
            if (level == "debug")
                return logging::trivial::debug;
            if (level == "info")
                return logging::trivial::info;
            if (level == "warning")
                return logging::trivial::warning;
            if (level == "error")
                return logging::trivial::error;
            throw std::runtime_error("Unknown log level: " + level);
        }
    } // namespace

    void MyLogger::init(const std::string &level, const std::string &log_file)
    {
        const auto severity = parse_level(level);
        const std::string format = "[%TimeStamp%] [%Severity%]: %Message%";

        auto core = logging::core::get();
        core->remove_all_sinks();

        logging::add_console_log(std::clog, logging::keywords::format = format);
        if (!log_file.empty())
        {
            logging::add_file_log(
                logging::keywords::file_name = log_file,
                logging::keywords::open_mode = std::ios_base::app,
                logging::keywords::auto_flush = true,
                logging::keywords::format = format);
        }

        core->set_filter(logging::trivial::severity >= severity);
        logging::add_common_attributes();
    }

    void MyLogger::debug(const std::string &msg)
    {
        BOOST_LOG_TRIVIAL(debug) << msg;
    }

    void MyLogger::info(const std::string &msg)
    {
        BOOST_LOG_TRIVIAL(info) << msg;
    }

    void MyLogger::warning(const std::string &msg)
    {
        BOOST_LOG_TRIVIAL(warning) << msg;
    }

    void MyLogger::error(const std::string &msg)
    {
        BOOST_LOG_TRIVIAL(error) << msg;
    }

} // namespace chunkstream
