#pragma once

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "../Core/Error.hpp"
#include "../Logging/Logging.hpp"

namespace CAB::Bridge {

template <typename Signature>
class CallbackBridge;

/**
 * @brief Owns a type-erased closure at a stable heap address for a C callback.
 *
 * Register() moves the closure into a heap box and returns its address as the
 * opaque context token handed to the host. The host calls Trampoline(token,
 * args...), which dereferences the token and invokes the box through one
 * virtual call. The box lives until Release() or destruction, which must only
 * happen after the host guarantees no further invocations (stopped and
 * disposed).
 *
 * Closures run synchronously on the host thread. They must not throw and must
 * not tear down the object that owns the bridge.
 */
template <typename R, typename... Args>
class CallbackBridge<R(Args...)> {
public:
    using HostCallback = R (*)(void*, Args...);

    CallbackBridge() = default;
    ~CallbackBridge() = default;

    CallbackBridge(const CallbackBridge&) = delete;
    CallbackBridge& operator=(const CallbackBridge&) = delete;
    CallbackBridge(CallbackBridge&&) = delete;
    CallbackBridge& operator=(CallbackBridge&&) = delete;

    /// Box the closure and return its token. A second registration is rejected.
    template <typename F>
        requires std::is_invocable_r_v<R, std::decay_t<F>&, Args...>
    [[nodiscard]] Result<void*> Register(F&& closure) {
        if (box_) {
            CAB_LOG_ERROR(Bridge, "Rejecting second registration (token=%p)", Token());
            return CAB_ERROR_FATAL("Callback already registered");
        }
        box_ = std::make_unique<Box<std::decay_t<F>>>(std::forward<F>(closure));
        CAB_LOG_V3(Bridge, "Registered callback token=%p", Token());
        return Token();
    }

    [[nodiscard]] void* Token() const noexcept { return static_cast<void*>(box_.get()); }
    [[nodiscard]] bool IsRegistered() const noexcept { return box_ != nullptr; }

    void Release() noexcept {
        if (box_) {
            CAB_LOG_V3(Bridge, "Releasing callback token=%p", Token());
            box_.reset();
        }
    }

    /// C entry point handed to the host alongside Token().
    static R Trampoline(void* token, Args... args) noexcept {
        if (token == nullptr) {
            if constexpr (std::is_void_v<R>) {
                return;
            } else {
                return R{};
            }
        }
        return static_cast<Holder*>(token)->Call(std::forward<Args>(args)...);
    }

private:
    struct Holder {
        virtual ~Holder() = default;
        virtual R Call(Args... args) = 0;
    };

    template <typename F>
    struct Box final : Holder {
        template <typename G>
        explicit Box(G&& closure) : fn(std::forward<G>(closure)) {}

        R Call(Args... args) override {
            return std::invoke(fn, std::forward<Args>(args)...);
        }

        F fn;
    };

    std::unique_ptr<Holder> box_;
};

} // namespace CAB::Bridge
