#include "models/FillTypes.hpp"

#include <cmath>

auto WriteJobConfig::validate() const -> util::Result<void> {
    if (!std::isfinite(target_size_bytes)) {
        return util::make_error("Target size must be a finite number");
    }
    if (target_size_bytes <= 0.0) {
        return util::make_error("Target size must be greater than zero");
    }
    if (chunk_size_bytes <= 0) {
        return util::make_error("Chunk size must be greater than zero");
    }
    if (work_dir.empty()) {
        return util::make_error("Working directory is not set");
    }
    return {};
}

auto terminal_state_to_string(TerminalState state) -> std::string {
    switch (state) {
        case TerminalState::NONE:
            return "NONE";
        case TerminalState::DONE:
            return "DONE";
        case TerminalState::STOPPED:
            return "STOPPED";
    }
    return "UNKNOWN";
}
