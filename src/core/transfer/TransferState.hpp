#pragma once

/**
 * TransferState.hpp
 *
 * States of a single FTP retrieval and the two subsets callers care about.
 */

#include <cstddef>
#include <ostream>
#include <string_view>

namespace ftpget::core::transfer {

/**
 * Transfer state
 *
 * Queued -> Connecting -> Running -> {Done | Aborted | Failed}
 * Aborting is reachable from Connecting and Running and leads only to Aborted.
 * Queued may go directly to Aborted.
 */
enum class TransferState {
    Queued,
    Connecting,
    Running,
    Aborting,
    Done,
    Aborted,
    Failed
};

/**
 * True for the states from which abort() still has an effect
 * (Queued, Connecting, Running).
 */
constexpr bool isAbortableState(TransferState state) {
    switch (state) {
        case TransferState::Queued:
        case TransferState::Connecting:
        case TransferState::Running:
            return true;
        case TransferState::Aborting:
        case TransferState::Done:
        case TransferState::Aborted:
        case TransferState::Failed:
            return false;
    }
    return false;
}

/**
 * True for the terminal states (Done, Aborted, Failed).
 */
constexpr bool isDoneState(TransferState state) {
    switch (state) {
        case TransferState::Done:
        case TransferState::Aborted:
        case TransferState::Failed:
            return true;
        case TransferState::Queued:
        case TransferState::Connecting:
        case TransferState::Running:
        case TransferState::Aborting:
            return false;
    }
    return false;
}

constexpr std::string_view toString(TransferState state) {
    switch (state) {
        case TransferState::Queued:     return "Queued";
        case TransferState::Connecting: return "Connecting";
        case TransferState::Running:    return "Running";
        case TransferState::Aborting:   return "Aborting";
        case TransferState::Done:       return "Done";
        case TransferState::Aborted:    return "Aborted";
        case TransferState::Failed:     return "Failed";
    }
    return "Unknown";
}

// Width of the longest state name, for aligned progress columns.
constexpr std::size_t kMaxStateNameLength = 10;

inline std::ostream& operator<<(std::ostream& os, TransferState state) {
    return os << toString(state);
}

} // namespace ftpget::core::transfer
