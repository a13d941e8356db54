#pragma once

#include <iosfwd>
#include <mutex>
#include <string>

namespace imgopt::core {

// Line-oriented console log shared by worker threads.
class Logger {
public:
    Logger();
    Logger(std::ostream& out, std::ostream& err);

    void set_verbose(bool verbose) { verbose_ = verbose; }
    bool verbose() const { return verbose_; }

    // Suppresses info lines; errors are always written.
    void set_quiet(bool quiet) { quiet_ = quiet; }

    void info(const std::string& message);
    void detail(const std::string& message);
    void error(const std::string& message);

private:
    void write(std::ostream& stream, const std::string& line);

    std::ostream* out_;
    std::ostream* err_;
    std::mutex mutex_;
    bool verbose_ = false;
    bool quiet_ = false;
};

} // namespace imgopt::core
