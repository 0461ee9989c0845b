#include "Logging.h"
#include "LogSecurity.h"
#include <iostream>

namespace secscrub {

const char* log_level_name(LogLevel lvl){
    switch(lvl){
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "INFO";
}

Logger& Logger::instance(){
    static Logger inst;
    return inst;
}

void Logger::set_level(LogLevel lvl){
    std::lock_guard<std::mutex> lk(mu_);
    level_ = lvl;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lk(mu_);
    return level_;
}

void Logger::set_stream(std::ostream* os){
    std::lock_guard<std::mutex> lk(mu_);
    out_ = os;
}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(static_cast<int>(lvl) > static_cast<int>(level())) return;
    // messages may carry attacker-influenced text; never let them forge lines
    std::string line = sanitize_log_output(msg);
    std::lock_guard<std::mutex> lk(mu_);
    std::ostream& os = out_ ? *out_ : std::cerr;
    os << "[" << log_level_name(lvl) << "] " << line << "\n";
}

}
