#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include "../Bridge/CallbackBridge.hpp"
#include "../Buffers/BufferList.hpp"
#include "../Core/Error.hpp"
#include "../Format/SampleFormat.hpp"
#include "../Format/StreamFormat.hpp"
#include "../Host/IAudioUnitHost.hpp"
#include "../Host/IComponentRegistry.hpp"
#include "../Logging/Logging.hpp"
#include "ActionFlags.hpp"
#include "Description.hpp"
#include "RenderArgs.hpp"
#include "UnitStateMachine.hpp"

namespace CAB::Unit {

/**
 * @brief Owns one host processing unit and drives its lifecycle.
 *
 * Created -> Initialized -> Started, with Stop() returning to Initialized and
 * Uninitialize() returning to Created. Every transition is idempotent and a
 * failed host call leaves the state unchanged. Property mutation is rejected
 * while started. Destruction stops, uninitializes and disposes the unit on a
 * best-effort basis, then frees the render bridge.
 *
 * Render closures run on the host's real-time thread and must never call
 * Stop/Uninitialize or destroy this object.
 */
class UnitLifecycle {
public:
    [[nodiscard]] static Result<std::unique_ptr<UnitLifecycle>> Create(Host::IAudioUnitHost& host,
                                                                       Host::ComponentRef component);

    [[nodiscard]] static Result<std::unique_ptr<UnitLifecycle>> Create(Host::IAudioUnitHost& host,
                                                                       Host::IComponentRegistry& registry,
                                                                       const Description& description);

    ~UnitLifecycle();

    UnitLifecycle(const UnitLifecycle&) = delete;
    UnitLifecycle& operator=(const UnitLifecycle&) = delete;

    [[nodiscard]] Result<void> Initialize();
    [[nodiscard]] Result<void> Start();
    [[nodiscard]] Result<void> Stop();
    [[nodiscard]] Result<void> Uninitialize();

    [[nodiscard]] UnitState State() const noexcept { return state_.CurrentState(); }
    [[nodiscard]] bool IsInitialized() const noexcept { return state_.IsInitialized(); }
    [[nodiscard]] bool IsStarted() const noexcept { return state_.IsStarted(); }
    [[nodiscard]] std::optional<StateTransition> LastTransition() const { return state_.LastTransition(); }
    [[nodiscard]] Host::UnitRef Handle() const noexcept { return unit_; }

    /**
     * @brief Install the render callback for @p scope / @p element.
     *
     * The closure is invoked as `Host::Status(RenderArgs<S>&)` with a borrowed
     * BufferList over the host's buffers. Flag changes made by the closure are
     * written back to the host. Only one render callback may be registered.
     */
    template <Format::Sample S, typename F>
        requires std::is_invocable_r_v<Host::Status, std::decay_t<F>&, RenderArgs<S>&>
    [[nodiscard]] Result<void> SetRenderCallback(F&& callback,
                                                 Host::Scope scope = Host::Scope::kInput,
                                                 Host::Element element = 0) {
        CAB_TRY(RequireNotStarted("SetRenderCallback"));

        void* token = CAB_TRY(renderBridge_.Register(
            [fn = std::forward<F>(callback)](uint32_t* ioActionFlags, const Host::AudioTimeStamp* timeStamp,
                                             uint32_t busNumber, uint32_t numberFrames,
                                             Host::AudioBufferList* ioData) mutable -> Host::Status {
                ActionFlags flags = ioActionFlags ? static_cast<ActionFlags>(*ioActionFlags) : ActionFlags::kNone;
                const Host::AudioTimeStamp stamp = timeStamp ? *timeStamp : Host::AudioTimeStamp{};
                auto data = Buffers::BufferList<S>::Borrow(ioData);
                RenderArgs<S> args{flags, stamp, busNumber, numberFrames, data};
                const Host::Status status = std::invoke(fn, args);
                if (ioActionFlags) {
                    *ioActionFlags = ToRaw(flags);
                }
                return status;
            }));

        auto installed = InstallRenderCallback(token, scope, element);
        if (!installed) {
            renderBridge_.Release();
            return std::unexpected(installed.error());
        }
        return {};
    }

    [[nodiscard]] bool HasRenderCallback() const noexcept { return renderBridge_.IsRegistered(); }

    [[nodiscard]] Result<void> SetStreamFormat(const Format::StreamFormat& format,
                                               Host::Scope scope, Host::Element element = 0);
    [[nodiscard]] Result<Format::StreamFormat> GetStreamFormat(Host::Scope scope,
                                                               Host::Element element = 0) const;

    template <typename T>
        requires std::is_trivially_copyable_v<T>
    [[nodiscard]] Result<void> SetProperty(Host::PropertyId id, Host::Scope scope, Host::Element element,
                                           const T& value) {
        return SetPropertyRaw(id, scope, element, &value, static_cast<uint32_t>(sizeof(T)));
    }

    template <typename T>
        requires std::is_trivially_copyable_v<T> && std::is_default_constructible_v<T>
    [[nodiscard]] Result<T> GetProperty(Host::PropertyId id, Host::Scope scope, Host::Element element) const {
        T value{};
        CAB_TRY(GetPropertyRaw(id, scope, element, &value, static_cast<uint32_t>(sizeof(T))));
        return value;
    }

    /**
     * @brief Pull @p numberFrames from the unit into a caller-owned list.
     *
     * Requires an initialized unit and a non-empty list.
     */
    template <Format::Sample S>
    [[nodiscard]] Result<void> Render(ActionFlags& flags, const Host::AudioTimeStamp& timeStamp,
                                      uint32_t busNumber, uint32_t numberFrames,
                                      Buffers::BufferList<S>& data) {
        if (!IsInitialized()) {
            return CAB_ERROR_CODE(AudioUnitError::kUninitialized, "Render requires an initialized unit");
        }
        if (data.Empty()) {
            return CAB_ERROR_CODE(AudioError::kParam, "Render requires at least one buffer");
        }
        uint32_t rawFlags = ToRaw(flags);
        const Host::Status status =
            host_.Render(unit_, &rawFlags, &timeStamp, busNumber, numberFrames, data.HostList());
        flags = static_cast<ActionFlags>(rawFlags);
        return ToResult(status, "AudioUnitRender failed");
    }

private:
    using RenderBridge = Bridge::CallbackBridge<Host::Status(uint32_t*, const Host::AudioTimeStamp*,
                                                             uint32_t, uint32_t, Host::AudioBufferList*)>;

    UnitLifecycle(Host::IAudioUnitHost& host, Host::UnitRef unit);

    Result<void> RequireNotStarted(const char* operation) const;
    Result<void> InstallRenderCallback(void* token, Host::Scope scope, Host::Element element);
    Result<void> SetPropertyRaw(Host::PropertyId id, Host::Scope scope, Host::Element element,
                                const void* data, uint32_t size);
    Result<void> GetPropertyRaw(Host::PropertyId id, Host::Scope scope, Host::Element element,
                                void* data, uint32_t size) const;
    void Transition(UnitState next, std::string_view reason);

    Host::IAudioUnitHost& host_;
    Host::UnitRef unit_;
    UnitStateMachine state_;
    RenderBridge renderBridge_;
};

} // namespace CAB::Unit
