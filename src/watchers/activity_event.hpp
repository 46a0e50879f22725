#pragma once

#include <chrono>
#include <string>

// One agent action recognized on a terminal row.
struct ActivityEvent {
    enum class Kind {
        FileRead,       // detail = path
        CommandRun,     // detail = command line
        AgentStatus,    // detail = status text
    };

    std::chrono::system_clock::time_point timestamp;
    Kind kind = Kind::AgentStatus;
    std::string detail;

    // Text shown in the feed.
    const std::string& label() const { return detail; }

    // "read", "run" or "status".
    const char* kind_name() const;

    static ActivityEvent file_read(std::string path);
    static ActivityEvent command_run(std::string command);
    static ActivityEvent agent_status(std::string status);
};

bool operator==(const ActivityEvent& a, const ActivityEvent& b);
