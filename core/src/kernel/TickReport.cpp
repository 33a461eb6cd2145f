#include "kernel/TickReport.h"

const char* toString(Failure failure) {
    switch (failure) {
        case Failure::ReferentGone: return "referent_gone";
        case Failure::OutOfRange: return "out_of_range";
        case Failure::ActionRejected: return "action_rejected";
        case Failure::CreationRejected: return "creation_rejected";
        case Failure::EmptyCandidateSet: return "empty_candidate_set";
        default: break;
    }
    return "unknown";
}

Failure classifyAction(ActionResult result) {
    return (result == ActionResult::NotInRange) ? Failure::OutOfRange : Failure::ActionRejected;
}
