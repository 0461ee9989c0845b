#pragma once
#include "../core/Config.h"
#include "../core/ContextValue.h"

namespace secscrub {

// Production-safe copy of an error: message and stack redacted, error codes kept when
// configured, string properties redacted and structured properties flattened to
// redacted JSON text.
ErrorInfo sanitize_error_for_production(const ErrorInfo& error, const ErrorSanitizationConfig& config = {});
// nullptr yields a generic "Unknown error occurred" error
ErrorInfo sanitize_error_for_production(const ErrorInfo* error, const ErrorSanitizationConfig& config = {});

}
