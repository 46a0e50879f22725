#include "activity_event_watcher.hpp"
#include "ui_queue.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <parsers/pattern.hpp>
#include <terminal/terminal_text.hpp>
#include <util/string_utils.hpp>
#include <cctype>

namespace {

// Each pattern captures the event detail in group 1.
const std::vector<Pattern>& file_read_patterns() {
    static const std::vector<Pattern> patterns = {
        Pattern(R"(reading file[:\s]+(.+))", true),
        Pattern(R"(opening file[:\s]+(.+))", true),
        Pattern(R"(\bread[:\s]+([^\s].+\.\w{1,10})\b)", true),
    };
    return patterns;
}

const std::vector<Pattern>& command_run_patterns() {
    static const std::vector<Pattern> patterns = {
        Pattern(R"(running[:\s]+(.+))", true),
        Pattern(R"(executing[:\s]+(.+))", true),
        Pattern(R"(^>\s+(.+))"),
        Pattern(R"(^\$\s+(.+))"),
    };
    return patterns;
}

const char* const STATUS_KEYWORDS[] = {
    "thinking", "working", "planning", "analyzing",
    "searching", "generating", "processing",
};

std::optional<std::string> first_capture(const std::vector<Pattern>& patterns,
                                         const std::string& line) {
    std::smatch m;
    for (const auto& p : patterns) {
        if (!p.search(line, m)) continue;
        std::string captured = StringUtils::trim(m[1]);
        if (!captured.empty()) return captured;
    }
    return std::nullopt;
}

std::optional<std::string> match_agent_status(const std::string& line, int max_length) {
    if (utf8_length(line) < static_cast<size_t>(max_length)) {
        std::string lower = StringUtils::to_lower(line);
        for (const char* keyword : STATUS_KEYWORDS) {
            if (StringUtils::contains(lower, keyword)) return line;
        }
    }

    // "✓ Done", "⠋ Loading" ...: glyph, whitespace, text
    size_t glyph = TerminalText::leading_glyph_length(line);
    if (glyph > 0 && glyph < line.size() && std::isspace(static_cast<unsigned char>(line[glyph]))) {
        std::string rest = StringUtils::trim(line.substr(glyph));
        if (!rest.empty()) return rest;
    }
    return std::nullopt;
}

} // namespace

ActivityEventWatcher::ActivityEventWatcher(UiQueue& ui, Callback on_events,
                                           int max_status_length,
                                           std::chrono::milliseconds interval)
    : ui_(ui), on_events_(std::move(on_events)),
      max_status_length_(max_status_length > 0 ? max_status_length : ACTIVITY_STATUS_MAX_CHARS),
      interval_(interval) {}

ActivityEventWatcher::~ActivityEventWatcher() {
    detach();
}

// ── Lifecycle ───────────────────────────────────────────────

void ActivityEventWatcher::attach(std::weak_ptr<TerminalGrid> grid) {
    detach();
    grid_.attach(std::move(grid));
}

void ActivityEventWatcher::detach() {
    stop();
    grid_.detach();
    std::lock_guard<std::mutex> lock(scan_mutex_);
    scanner_.reset();
}

bool ActivityEventWatcher::start() {
    if (!timer_.start(interval_, [this] { poll_once(); })) return false;
    ts_logf("activity: polling every {}ms", interval_.count());
    return true;
}

void ActivityEventWatcher::stop() {
    gate_.invalidate();
    timer_.stop();
}

// ── Polling ─────────────────────────────────────────────────

std::vector<ActivityEvent> ActivityEventWatcher::poll_once() {
    std::vector<ActivityEvent> events;
    const uint64_t gen = gate_.generation();
    auto grid = grid_.lock();
    if (!grid) return events;

    // Held through the post so concurrent polls reach the UI in scan order.
    std::lock_guard<std::mutex> lock(scan_mutex_);
    for (const auto& changed : scanner_.scan(*grid)) {
        std::string clean = StringUtils::trim(TerminalText::strip_ansi(changed.text));
        if (clean.empty()) continue;
        if (auto event = parse_line(clean, max_status_length_)) {
            events.push_back(std::move(*event));
        }
    }

    if (events.empty()) return events;

    ts_logf("activity: {} events", events.size());
    gate_.post(ui_, gen, [cb = on_events_, events] {
        if (cb) cb(events);
    });
    return events;
}

std::optional<ActivityEvent> ActivityEventWatcher::parse_line(const std::string& line,
                                                              int max_status_length) {
    if (auto path = first_capture(file_read_patterns(), line)) {
        return ActivityEvent::file_read(std::move(*path));
    }
    if (auto command = first_capture(command_run_patterns(), line)) {
        return ActivityEvent::command_run(std::move(*command));
    }
    if (auto status = match_agent_status(line, max_status_length)) {
        return ActivityEvent::agent_status(std::move(*status));
    }
    return std::nullopt;
}
