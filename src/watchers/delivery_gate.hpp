#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

class UiQueue;

// Generation token guarding deliveries from a watcher to the UI queue.
//
// Each posted callback remembers the generation it was created under and
// only runs if the gate is still on that generation when the UI gets to it.
// invalidate() bumps the generation while holding the delivery lock, so once
// it returns no callback from an earlier generation is running or will run.
// Callbacks may invalidate their own gate.
class DeliveryGate {
public:
    DeliveryGate();

    // Post `fn` to `ui` under generation `gen`, normally read with
    // generation() before the scan that produced the value started.
    void post(UiQueue& ui, uint64_t gen, std::function<void()> fn) const;

    void invalidate();
    uint64_t generation() const;

private:
    struct State {
        std::recursive_mutex lock;          // held while a delivery runs
        std::atomic<uint64_t> generation{0};
    };
    std::shared_ptr<State> state_;
};
