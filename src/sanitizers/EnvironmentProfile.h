#pragma once
#include "../core/Config.h"

namespace secscrub {

// Preset for a deployment environment, then caller overrides (validated merge).
ErrorSanitizationConfig create_environment_config(Environment env, const ErrorSanitizationOverrides& overrides = {});

// Production always wins over debug flags.
bool should_show_detailed_errors(const RuntimeSignals& signals);
bool should_show_detailed_errors();
bool is_debug_mode(const RuntimeSignals& signals);
bool is_debug_mode();

}
