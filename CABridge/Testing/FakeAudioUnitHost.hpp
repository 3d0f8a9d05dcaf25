#pragma once

#include "../Core/StatusCodes.hpp"
#include "../Host/IAudioUnitHost.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <tuple>
#include <vector>

namespace CAB::Testing {

/**
 * @brief In-process AudioUnit stand-in for host-side tests.
 *
 * Tracks per-unit initialize/start state and call counts, stores properties as
 * raw bytes keyed by (id, scope, element) and keeps the installed render
 * callback so tests can drive it the way the host's I/O thread would.
 * Render() pulls from the installed callback; without one it writes silence
 * and sets kAudioUnitRenderAction_OutputIsSilence.
 */
class FakeAudioUnitHost final : public Host::IAudioUnitHost {
public:
    enum class Op : uint8_t {
        kNewInstance,
        kDispose,
        kInitialize,
        kUninitialize,
        kStart,
        kStop,
        kSetProperty,
        kGetProperty,
        kRender,
    };

    struct Counters {
        size_t initialize{0};
        size_t uninitialize{0};
        size_t start{0};
        size_t stop{0};
        size_t dispose{0};
        size_t setProperty{0};
        size_t render{0};
    };

    // ------------------------------------------------------------------
    // IAudioUnitHost
    // ------------------------------------------------------------------

    Host::Status NewInstance(Host::ComponentRef component, Host::UnitRef& outUnit) noexcept override {
        if (auto status = ConsumeFailure(Op::kNewInstance)) return status;
        std::lock_guard lock(mutex_);
        auto unit = std::make_unique<FakeUnit>();
        unit->component = component;
        outUnit = reinterpret_cast<Host::UnitRef>(unit.get());
        units_.emplace(outUnit, std::move(unit));
        ++instancesCreated_;
        return Host::kNoErr;
    }

    Host::Status DisposeInstance(Host::UnitRef ref) noexcept override {
        if (auto status = ConsumeFailure(Op::kDispose)) return status;
        std::lock_guard lock(mutex_);
        ++counters_.dispose;
        return units_.erase(ref) == 1 ? Host::kNoErr : kBadUnit;
    }

    Host::Status Initialize(Host::UnitRef ref) noexcept override {
        if (auto status = ConsumeFailure(Op::kInitialize)) return status;
        std::lock_guard lock(mutex_);
        FakeUnit* unit = FindLocked(ref);
        if (unit == nullptr) return kBadUnit;
        ++counters_.initialize;
        unit->initialized = true;
        return Host::kNoErr;
    }

    Host::Status Uninitialize(Host::UnitRef ref) noexcept override {
        if (auto status = ConsumeFailure(Op::kUninitialize)) return status;
        std::lock_guard lock(mutex_);
        FakeUnit* unit = FindLocked(ref);
        if (unit == nullptr) return kBadUnit;
        ++counters_.uninitialize;
        unit->initialized = false;
        return Host::kNoErr;
    }

    Host::Status OutputStart(Host::UnitRef ref) noexcept override {
        if (auto status = ConsumeFailure(Op::kStart)) return status;
        std::lock_guard lock(mutex_);
        FakeUnit* unit = FindLocked(ref);
        if (unit == nullptr) return kBadUnit;
        if (!unit->initialized) return static_cast<Host::Status>(AudioUnitError::kUninitialized);
        ++counters_.start;
        unit->started = true;
        return Host::kNoErr;
    }

    Host::Status OutputStop(Host::UnitRef ref) noexcept override {
        if (auto status = ConsumeFailure(Op::kStop)) return status;
        std::lock_guard lock(mutex_);
        FakeUnit* unit = FindLocked(ref);
        if (unit == nullptr) return kBadUnit;
        ++counters_.stop;
        unit->started = false;
        return Host::kNoErr;
    }

    Host::Status SetProperty(Host::UnitRef ref, Host::PropertyId id, Host::Scope scope,
                             Host::Element element, const void* data, uint32_t dataSize) noexcept override {
        if (auto status = ConsumeFailure(Op::kSetProperty)) return status;
        std::lock_guard lock(mutex_);
        FakeUnit* unit = FindLocked(ref);
        if (unit == nullptr) return kBadUnit;
        ++counters_.setProperty;

        if (id == Host::Property::kSetRenderCallback) {
            if (dataSize != sizeof(Host::RenderCallbackStruct)) {
                return static_cast<Host::Status>(AudioUnitError::kInvalidPropertyValue);
            }
            std::memcpy(&unit->renderCallback, data, sizeof(Host::RenderCallbackStruct));
        }
        if (id == Host::Property::kStreamFormat && dataSize != sizeof(Host::StreamBasicDescription)) {
            return static_cast<Host::Status>(AudioUnitError::kInvalidPropertyValue);
        }

        const auto* bytes = static_cast<const std::byte*>(data);
        unit->properties[{id, static_cast<uint32_t>(scope), element}] =
            std::vector<std::byte>(bytes, bytes + dataSize);
        return Host::kNoErr;
    }

    Host::Status GetProperty(Host::UnitRef ref, Host::PropertyId id, Host::Scope scope,
                             Host::Element element, void* outData, uint32_t& ioDataSize) noexcept override {
        if (auto status = ConsumeFailure(Op::kGetProperty)) return status;
        std::lock_guard lock(mutex_);
        FakeUnit* unit = FindLocked(ref);
        if (unit == nullptr) return kBadUnit;
        auto it = unit->properties.find({id, static_cast<uint32_t>(scope), element});
        if (it == unit->properties.end()) {
            return static_cast<Host::Status>(AudioUnitError::kInvalidProperty);
        }
        const auto size = static_cast<uint32_t>(it->second.size());
        std::memcpy(outData, it->second.data(), std::min(size, ioDataSize));
        ioDataSize = size;
        return Host::kNoErr;
    }

    Host::Status Render(Host::UnitRef ref, uint32_t* ioActionFlags, const Host::AudioTimeStamp* timeStamp,
                        uint32_t outputBus, uint32_t numberFrames,
                        Host::AudioBufferList* ioData) noexcept override {
        if (auto status = ConsumeFailure(Op::kRender)) return status;
        Host::RenderCallbackStruct callback{};
        {
            std::lock_guard lock(mutex_);
            FakeUnit* unit = FindLocked(ref);
            if (unit == nullptr) return kBadUnit;
            if (!unit->initialized) return static_cast<Host::Status>(AudioUnitError::kUninitialized);
            ++counters_.render;
            callback = unit->renderCallback;
        }
        if (callback.inputProc != nullptr) {
            return callback.inputProc(callback.inputProcRefCon, ioActionFlags, timeStamp, outputBus,
                                      numberFrames, ioData);
        }
        for (uint32_t i = 0; i < ioData->numberBuffers; ++i) {
            Host::AudioBuffer& buffer = ioData->buffers[i];
            if (buffer.data != nullptr) std::memset(buffer.data, 0, buffer.dataByteSize);
        }
        if (ioActionFlags != nullptr) *ioActionFlags |= kOutputIsSilenceBit;
        return Host::kNoErr;
    }

    // ------------------------------------------------------------------
    // Test controls and observation
    // ------------------------------------------------------------------

    static constexpr Host::Status kBadUnit = -50;
    static constexpr uint32_t kOutputIsSilenceBit = 1u << 4;

    void FailNext(Op op, Host::Status status) {
        std::lock_guard lock(mutex_);
        failures_[op] = status;
    }

    /// Invoke the installed render callback as the host I/O thread would.
    Host::Status DriveRenderCallback(Host::UnitRef ref, uint32_t* ioActionFlags,
                                     const Host::AudioTimeStamp* timeStamp, uint32_t busNumber,
                                     uint32_t numberFrames, Host::AudioBufferList* ioData) {
        Host::RenderCallbackStruct callback{};
        {
            std::lock_guard lock(mutex_);
            FakeUnit* unit = FindLocked(ref);
            if (unit == nullptr) return kBadUnit;
            callback = unit->renderCallback;
        }
        if (callback.inputProc == nullptr) return static_cast<Host::Status>(AudioUnitError::kNoConnection);
        return callback.inputProc(callback.inputProcRefCon, ioActionFlags, timeStamp, busNumber,
                                  numberFrames, ioData);
    }

    Counters GetCounters() const {
        std::lock_guard lock(mutex_);
        return counters_;
    }

    size_t LiveUnitCount() const {
        std::lock_guard lock(mutex_);
        return units_.size();
    }

    size_t InstancesCreated() const {
        std::lock_guard lock(mutex_);
        return instancesCreated_;
    }

    std::optional<Host::RenderCallbackStruct> InstalledRenderCallback(Host::UnitRef ref) const {
        std::lock_guard lock(mutex_);
        FakeUnit* unit = FindLocked(ref);
        if (unit == nullptr || unit->renderCallback.inputProc == nullptr) return std::nullopt;
        return unit->renderCallback;
    }

    bool IsStarted(Host::UnitRef ref) const {
        std::lock_guard lock(mutex_);
        FakeUnit* unit = FindLocked(ref);
        return unit != nullptr && unit->started;
    }

    bool IsInitialized(Host::UnitRef ref) const {
        std::lock_guard lock(mutex_);
        FakeUnit* unit = FindLocked(ref);
        return unit != nullptr && unit->initialized;
    }

private:
    using PropertyKey = std::tuple<Host::PropertyId, uint32_t, Host::Element>;

    struct FakeUnit {
        Host::ComponentRef component{nullptr};
        bool initialized{false};
        bool started{false};
        Host::RenderCallbackStruct renderCallback{};
        std::map<PropertyKey, std::vector<std::byte>> properties;
    };

    FakeUnit* FindLocked(Host::UnitRef ref) const {
        auto it = units_.find(ref);
        return it == units_.end() ? nullptr : it->second.get();
    }

    Host::Status ConsumeFailure(Op op) {
        std::lock_guard lock(mutex_);
        auto it = failures_.find(op);
        if (it == failures_.end()) return Host::kNoErr;
        const Host::Status status = it->second;
        failures_.erase(it);
        return status;
    }

    mutable std::mutex mutex_;
    std::map<Host::UnitRef, std::unique_ptr<FakeUnit>> units_;
    std::map<Op, Host::Status> failures_;
    Counters counters_;
    size_t instancesCreated_{0};
};

} // namespace CAB::Testing
