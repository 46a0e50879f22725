#include "activity_event.hpp"

static ActivityEvent make_event(ActivityEvent::Kind kind, std::string detail) {
    ActivityEvent e;
    e.timestamp = std::chrono::system_clock::now();
    e.kind = kind;
    e.detail = std::move(detail);
    return e;
}

const char* ActivityEvent::kind_name() const {
    switch (kind) {
        case Kind::FileRead:    return "read";
        case Kind::CommandRun:  return "run";
        case Kind::AgentStatus: return "status";
    }
    return "status";
}

ActivityEvent ActivityEvent::file_read(std::string path) {
    return make_event(Kind::FileRead, std::move(path));
}

ActivityEvent ActivityEvent::command_run(std::string command) {
    return make_event(Kind::CommandRun, std::move(command));
}

ActivityEvent ActivityEvent::agent_status(std::string status) {
    return make_event(Kind::AgentStatus, std::move(status));
}

// Timestamps are ignored: two detections of the same action are equal.
bool operator==(const ActivityEvent& a, const ActivityEvent& b) {
    return a.kind == b.kind && a.detail == b.detail;
}
