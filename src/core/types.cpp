#include "types.hpp"

const char* phase_name(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Phase1: return "phase1";
        case TransferPhase::Phase2: return "phase2";
        case TransferPhase::Phase3: return "phase3";
    }
    return "phase1";
}

std::optional<TransferPhase> parse_phase(const std::string& name) {
    if (name == "phase1") return TransferPhase::Phase1;
    if (name == "phase2") return TransferPhase::Phase2;
    if (name == "phase3") return TransferPhase::Phase3;
    return std::nullopt;
}

const char* phase_description(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Phase1: return "Transferring all files in the repository (1/3)";
        case TransferPhase::Phase2: return "Transferring newly created and modified files (2/3)";
        case TransferPhase::Phase3: return "Retrying transfer failures (3/3)";
    }
    return "";
}
