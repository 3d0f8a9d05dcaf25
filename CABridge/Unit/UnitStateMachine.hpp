#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace CAB::Unit {

enum class UnitState : uint8_t {
    kCreated,
    kInitialized,
    kStarted,
    kDisposed
};

struct StateTransition {
    UnitState from{UnitState::kCreated};
    UnitState to{UnitState::kCreated};
    std::string reason;
    uint64_t timestamp{0};
};

// Lightweight state tracker owned by UnitLifecycle.
class UnitStateMachine {
public:
    UnitStateMachine();

    UnitState CurrentState() const;
    std::optional<StateTransition> LastTransition() const;

    bool IsInitialized() const;
    bool IsStarted() const;

    void TransitionTo(UnitState next, std::string_view reason, uint64_t now);

    // Teardown path: moves to kDisposed without recording a transition (no allocation).
    void MarkDisposed() noexcept;

private:
    UnitState state_;
    std::optional<StateTransition> last_;
};

std::string_view ToString(UnitState state);

} // namespace CAB::Unit
