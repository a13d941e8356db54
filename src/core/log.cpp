#include "log.h"

#include <iostream>

namespace imgopt::core {

namespace {
constexpr const char* k_log_prefix = "[imgopt] ";
}

Logger::Logger() : out_(&std::cout), err_(&std::cerr) {}

Logger::Logger(std::ostream& out, std::ostream& err) : out_(&out), err_(&err) {}

void Logger::info(const std::string& message) {
    if (quiet_) {
        if (verbose_) {
            write(*err_, k_log_prefix + message);
        }
        return;
    }
    write(*out_, k_log_prefix + message);
}

void Logger::detail(const std::string& message) {
    if (!verbose_) {
        return;
    }
    write(quiet_ ? *err_ : *out_, k_log_prefix + message);
}

void Logger::error(const std::string& message) {
    write(*err_, std::string(k_log_prefix) + "Error: " + message);
}

void Logger::write(std::ostream& stream, const std::string& line) {
    std::scoped_lock lock(mutex_);
    stream << line << "\n";
    stream.flush();
}

} // namespace imgopt::core
