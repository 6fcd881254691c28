#pragma once
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/attributes/mutable_constant.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <filesystem>
#include <string>

#ifndef MULTITEST_DEFAULT_LOG_COLOR
#define MULTITEST_DEFAULT_LOG_COLOR 1
#endif

#define LOG(LEVEL)                                                                         \
BOOST_LOG_SEV(::boost::log::trivial::logger::get(), boost::log::trivial::LEVEL)            \
  << boost::log::add_value("Line", __LINE__)                                               \
  << boost::log::add_value("File", std::filesystem::path(__FILE__).filename().string())    \

namespace multitest {

/**
 * Installs the console sink and, when a file pattern is given, a rotating file sink in directory p.
 *
 * level names the minimum severity to record ("trace" ... "fatal"). An empty or unknown
 * level falls back to info in release builds and trace otherwise.
 */
void initialize_logging( const std::filesystem::path& p, const std::string& file_pattern, bool color = MULTITEST_DEFAULT_LOG_COLOR, const std::string& level = {} );

} // multitest
