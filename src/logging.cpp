#include <filedb-cpp/logging.hpp>
#include <filedb-cpp/error.hpp>

#include <easylogging++.h>

#include <string>
#include <system_error>

INITIALIZE_EASYLOGGINGPP

namespace filedb_cpp {

void configure_logging(const std::filesystem::path& config_file) {
    auto ec = std::error_code{};
    if (!std::filesystem::is_regular_file(config_file, ec)) {
        throw Exception{ErrorKind::io_error,
                        "cannot read logging configuration '" + config_file.string() + "'"};
    }
    auto conf = el::Configurations{config_file.string()};
    el::Loggers::reconfigureAllLoggers(conf);
}

void set_verbose_logging(bool enabled) {
    el::Loggers::reconfigureAllLoggers(el::Level::Debug, el::ConfigurationType::Enabled,
                                       enabled ? "true" : "false");
}

}  // namespace filedb_cpp
