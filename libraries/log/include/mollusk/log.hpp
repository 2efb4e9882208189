#pragma once
#include <boost/log/trivial.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <filesystem>
#include <optional>
#include <string>

#define LOG(LEVEL)                                                                         \
BOOST_LOG_SEV(::boost::log::trivial::logger::get(), boost::log::trivial::LEVEL)            \
  << boost::log::add_value("Line", __LINE__)                                               \
  << boost::log::add_value("File", std::filesystem::path(__FILE__).filename().string())    \

namespace mollusk {

/**
 * Install the console sink (and optionally a rotating file sink in log_dir).
 * level is a severity name, "trace" through "fatal"; anything else means info.
 *
 * Only the first call in a process has an effect; every harness calls this on
 * construction so repeated construction is safe.
 */
void initialize_logging(
   const std::string& level = "info",
   const std::optional< std::filesystem::path >& log_dir = std::nullopt,
   bool color = true );

} // mollusk
