#include "UnitStateMachine.hpp"

#include <string>

namespace CAB::Unit {

namespace {
constexpr std::string_view kCreatedStr{"Created"};
constexpr std::string_view kInitializedStr{"Initialized"};
constexpr std::string_view kStartedStr{"Started"};
constexpr std::string_view kDisposedStr{"Disposed"};
} // namespace

UnitStateMachine::UnitStateMachine()
    : state_(UnitState::kCreated) {}

UnitState UnitStateMachine::CurrentState() const {
    return state_;
}

std::optional<StateTransition> UnitStateMachine::LastTransition() const {
    return last_;
}

bool UnitStateMachine::IsInitialized() const {
    return state_ == UnitState::kInitialized || state_ == UnitState::kStarted;
}

bool UnitStateMachine::IsStarted() const {
    return state_ == UnitState::kStarted;
}

void UnitStateMachine::TransitionTo(UnitState next, std::string_view reason, uint64_t now) {
    StateTransition transition{state_, next, std::string(reason), now};
    last_ = transition;
    state_ = next;
}

void UnitStateMachine::MarkDisposed() noexcept {
    state_ = UnitState::kDisposed;
}

std::string_view ToString(UnitState state) {
    switch (state) {
    case UnitState::kCreated:
        return kCreatedStr;
    case UnitState::kInitialized:
        return kInitializedStr;
    case UnitState::kStarted:
        return kStartedStr;
    case UnitState::kDisposed:
        return kDisposedStr;
    }
    return kDisposedStr;
}

} // namespace CAB::Unit
