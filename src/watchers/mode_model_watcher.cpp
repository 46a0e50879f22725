#include "mode_model_watcher.hpp"
#include "ui_queue.hpp"
#include <core/log.hpp>
#include <util/string_utils.hpp>
#include <vector>

namespace {

struct ModeToken {
    const char* token;
    AgentMode mode;
};

// Checked in this order within each marker style.
const ModeToken MODE_TOKENS[] = {
    {"interactive", AgentMode::Interactive},
    {"ask",         AgentMode::Interactive},
    {"plan",        AgentMode::Plan},
    {"autopilot",   AgentMode::Autopilot},
    {"agent",       AgentMode::Autopilot},
};

struct Marker {
    const char* before;
    const char* after;
};

// Marker styles in priority order: prompt tags, status lines, transitions.
const std::vector<std::vector<Marker>> MODE_MARKERS = {
    {{"(", ")"}, {"[", "]"}},
    {{"mode: ", ""}, {"mode:", ""}},
    {{"switched to ", ""}},
};

// Longest first so "using model: " wins over "model: ".
const char* const MODEL_PREFIXES[] = {
    "using model: ", "using model:", "model: ", "model:",
};

std::string trim_model_token(const std::string& token) {
    static const char* const PUNCT = ".,;)>";
    auto start = token.find_first_not_of(PUNCT);
    if (start == std::string::npos) return "";
    auto end = token.find_last_not_of(PUNCT);
    return token.substr(start, end - start + 1);
}

} // namespace

ModeModelWatcher::ModeModelWatcher(UiQueue& ui, ModeCallback on_mode, ModelCallback on_model,
                                   int scan_rows)
    : ui_(ui), on_mode_(std::move(on_mode)), on_model_(std::move(on_model)),
      scan_rows_(scan_rows > 0 ? scan_rows : 1) {}

ModeModelWatcher::~ModeModelWatcher() {
    detach();
}

void ModeModelWatcher::attach(std::weak_ptr<TerminalGrid> grid) {
    detach();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        mode_.reset();
        model_.reset();
    }
    grid_.attach(std::move(grid));
    ts_logf("mode_model: attached, scanning bottom {} rows", scan_rows_);
}

void ModeModelWatcher::detach() {
    gate_.invalidate();
    grid_.detach();
}

std::optional<AgentMode> ModeModelWatcher::mode() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return mode_;
}

std::optional<std::string> ModeModelWatcher::model() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return model_;
}

void ModeModelWatcher::range_changed(int /*start_row*/, int end_row) {
    const uint64_t gen = gate_.generation();
    auto grid = grid_.lock();
    if (!grid) return;

    std::lock_guard<std::mutex> lock(state_mutex_);
    const int rows = grid->rows();
    if (rows <= 0) return;

    const int window_start = bottom_window_start(rows, scan_rows_);
    if (end_row < window_start) return;

    // The bottom-most indicator is the current one.
    std::optional<AgentMode> found_mode;
    std::optional<std::string> found_model;
    for (int row = window_start; row < rows; ++row) {
        auto text = grid->line_at(row);
        if (!text || text->empty()) continue;
        if (auto m = detect_mode(*text)) found_mode = m;
        if (auto m = detect_model(*text)) found_model = std::move(m);
    }

    if (found_mode && found_mode != mode_) {
        mode_ = found_mode;
        AgentMode value = *found_mode;
        ts_logf("mode_model: mode -> {}", to_string(value));
        gate_.post(ui_, gen, [cb = on_mode_, value] {
            if (cb) cb(value);
        });
    }

    if (found_model && found_model != model_) {
        model_ = found_model;
        std::string value = *found_model;
        ts_logf("mode_model: model -> {}", value);
        gate_.post(ui_, gen, [cb = on_model_, value] {
            if (cb) cb(value);
        });
    }
}

std::optional<AgentMode> ModeModelWatcher::detect_mode(const std::string& line) {
    std::string lower = StringUtils::to_lower(line);
    for (const auto& style : MODE_MARKERS) {
        for (const auto& entry : MODE_TOKENS) {
            for (const auto& marker : style) {
                if (StringUtils::contains(lower, marker.before + std::string(entry.token) + marker.after)) {
                    return entry.mode;
                }
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> ModeModelWatcher::detect_model(const std::string& line) {
    // to_lower keeps byte offsets, so positions in `lower` index `line` too.
    std::string lower = StringUtils::to_lower(line);
    for (const char* prefix : MODEL_PREFIXES) {
        auto pos = lower.find(prefix);
        if (pos == std::string::npos) continue;

        std::string rest = StringUtils::trim(line.substr(pos + std::string(prefix).size()));
        std::string token = rest.substr(0, rest.find_first_of(" \t"));
        std::string model = trim_model_token(token);
        if (!model.empty()) return model;
    }
    return std::nullopt;
}
