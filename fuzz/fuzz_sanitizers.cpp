#include "sanitizers/InputThreatAnalyzer.h"
#include "sanitizers/MessageRedactor.h"
#include "sanitizers/StackTraceRedactor.h"
#include "core/LogSecurity.h"
#include "core/Logging.h"
#include <cstddef>
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    secscrub::Logger::instance().set_level(secscrub::LogLevel::Error);
    std::string input(reinterpret_cast<const char*>(data), size);

    secscrub::analyze_input_security(input);
    secscrub::sanitize_error_message(input);
    secscrub::sanitize_log_output(input);

    // First byte picks the stack level so every state is reached.
    secscrub::ErrorSanitizationConfig cfg;
    if(!input.empty()) cfg.stack_trace_level = static_cast<secscrub::StackTraceLevel>(static_cast<uint8_t>(input[0]) % 4);
    secscrub::sanitize_stack_trace(input, cfg);

    return 0; // Non-zero return values are reserved for future use.
}
