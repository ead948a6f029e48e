/**
 * @file generator.cpp
 * @brief Generator status names
 */

#include "dailyd/llm/generator.h"

namespace dailyd {

const char* to_string(GeneratorStatus status) {
    switch (status) {
        case GeneratorStatus::OK: return "ok";
        case GeneratorStatus::TIMEOUT: return "timeout";
        case GeneratorStatus::TRANSIENT: return "transient";
        case GeneratorStatus::NO_QUOTA: return "no_quota";
        case GeneratorStatus::UNREACHABLE: return "unreachable";
        case GeneratorStatus::REJECTED: return "rejected";
        default: return "unknown";
    }
}

} // namespace dailyd
