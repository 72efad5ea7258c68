#pragma once
#include <string>

namespace openfang::kernel {

// Request-level failures reported by the orchestrator facade
enum class OrchestratorError {
    NONE,
    NOT_FOUND,          // Unknown or deleted agent / unknown run
    QUEUE_FULL,         // Backlog at queue_capacity
    INVALID_ARGUMENT,
    AGENT_IN_USE,       // Non-terminal runs still reference the agent
    SHUTTING_DOWN,
    STORE_FAILED,       // Durable commit failed
    INVALID_STATE
};

inline const char* orchestrator_error_to_string(OrchestratorError error) {
    switch (error) {
        case OrchestratorError::NONE:             return "NONE";
        case OrchestratorError::NOT_FOUND:        return "NOT_FOUND";
        case OrchestratorError::QUEUE_FULL:       return "QUEUE_FULL";
        case OrchestratorError::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case OrchestratorError::AGENT_IN_USE:     return "AGENT_IN_USE";
        case OrchestratorError::SHUTTING_DOWN:    return "SHUTTING_DOWN";
        case OrchestratorError::STORE_FAILED:     return "STORE_FAILED";
        case OrchestratorError::INVALID_STATE:    return "INVALID_STATE";
        default: return "UNKNOWN";
    }
}

} // namespace openfang::kernel
