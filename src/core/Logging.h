#pragma once
#include <string>
#include <mutex>
#include <ostream>

namespace secscrub {

enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3, Trace=4 };

const char* log_level_name(LogLevel lvl);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel lvl);
    LogLevel level() const;
    // Redirect output; nullptr restores std::cerr. Stream must outlive its use.
    void set_stream(std::ostream* os);

    void log(LogLevel lvl, const std::string& msg);
    void error(const std::string& m){ log(LogLevel::Error, m); }
    void warn(const std::string& m){ log(LogLevel::Warn, m); }
    void info(const std::string& m){ log(LogLevel::Info, m); }
    void debug(const std::string& m){ log(LogLevel::Debug, m); }
    void trace(const std::string& m){ log(LogLevel::Trace, m); }
private:
    Logger() = default;
    mutable std::mutex mu_;
    LogLevel level_ = LogLevel::Info;
    std::ostream* out_ = nullptr;
};

}
