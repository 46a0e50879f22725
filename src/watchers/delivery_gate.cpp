#include "delivery_gate.hpp"
#include "ui_queue.hpp"

DeliveryGate::DeliveryGate() : state_(std::make_shared<State>()) {}

void DeliveryGate::post(UiQueue& ui, uint64_t gen, std::function<void()> fn) const {
    if (generation() != gen) return;
    // The closure keeps the state alive; the watcher may be gone by the time it runs.
    ui.post([state = state_, gen, fn = std::move(fn)] {
        std::lock_guard<std::recursive_mutex> lock(state->lock);
        if (state->generation != gen) return;
        fn();
    });
}

void DeliveryGate::invalidate() {
    std::lock_guard<std::recursive_mutex> lock(state_->lock);
    state_->generation++;
}

uint64_t DeliveryGate::generation() const {
    return state_->generation.load();
}
