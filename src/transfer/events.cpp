#include "transfer/events.hpp"

namespace ingest {

const char* PhaseName(Phase p) {
    switch (p) {
        case Phase::Start: return "START";
        case Phase::Downloading: return "DOWNLOADING";
        case Phase::Verifying: return "VERIFYING";
        case Phase::Expanding: return "EXPANDING";
        case Phase::Uploading: return "UPLOADING";
        case Phase::Cleanup: return "CLEANUP";
        case Phase::Done: return "DONE";
        case Phase::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

const char* EventTypeName(EventType t) {
    switch (t) {
        case EventType::PhaseChanged: return "phase";
        case EventType::Progress: return "progress";
        case EventType::Retry: return "retry";
        case EventType::UnitUploaded: return "unit_uploaded";
        case EventType::Completed: return "completed";
        case EventType::Failed: return "failed";
    }
    return "unknown";
}

} // namespace ingest
