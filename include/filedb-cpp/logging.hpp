/// @file logging.hpp
/// @brief Control over the library's easylogging++ output.

#pragma once

#include <filesystem>

namespace filedb_cpp {

/// Configure all loggers from an easylogging++ configuration file.
/// @throws Exception with ErrorKind::io_error if the file cannot be read.
void configure_logging(const std::filesystem::path& config_file);

/// Enable or disable DEBUG level output for all loggers.
void set_verbose_logging(bool enabled);

}  // namespace filedb_cpp
