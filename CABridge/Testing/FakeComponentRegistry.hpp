#pragma once

#include "../Host/IComponentRegistry.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CAB::Testing {

/**
 * @brief In-memory component registry for host-side tests.
 *
 * Components are matched in insertion order. Zero type, subtype or
 * manufacturer in the search description act as wildcards, as the host does.
 */
class FakeComponentRegistry final : public Host::IComponentRegistry {
public:
    Host::ComponentRef Add(const Host::ComponentDescription& description, std::string name, uint32_t version) {
        auto entry = std::make_unique<Entry>();
        entry->description = description;
        entry->name = std::move(name);
        entry->version = version;
        entries_.push_back(std::move(entry));
        return RefOf(entries_.size() - 1);
    }

    Host::ComponentRef FindNext(Host::ComponentRef previous,
                                const Host::ComponentDescription& search) noexcept override {
        size_t start = 0;
        if (previous != nullptr) {
            auto index = IndexOf(previous);
            if (!index) return nullptr;
            start = *index + 1;
        }
        for (size_t i = start; i < entries_.size(); ++i) {
            if (Matches(entries_[i]->description, search)) return RefOf(i);
        }
        return nullptr;
    }

    Host::Status CopyName(Host::ComponentRef component, std::string& outName) override {
        if (failNameStatus_ != Host::kNoErr) return failNameStatus_;
        auto index = IndexOf(component);
        if (!index) return kBadComponent;
        outName = entries_[*index]->name;
        return Host::kNoErr;
    }

    Host::Status GetVersion(Host::ComponentRef component, uint32_t& outVersion) noexcept override {
        auto index = IndexOf(component);
        if (!index) return kBadComponent;
        outVersion = entries_[*index]->version;
        return Host::kNoErr;
    }

    Host::Status GetDescription(Host::ComponentRef component,
                                Host::ComponentDescription& outDescription) noexcept override {
        auto index = IndexOf(component);
        if (!index) return kBadComponent;
        outDescription = entries_[*index]->description;
        return Host::kNoErr;
    }

    static constexpr Host::Status kBadComponent = -50;

    void FailCopyName(Host::Status status) { failNameStatus_ = status; }

private:
    struct Entry {
        Host::ComponentDescription description{};
        std::string name;
        uint32_t version{0};
    };

    static bool Matches(const Host::ComponentDescription& candidate,
                        const Host::ComponentDescription& search) noexcept {
        auto fieldMatches = [](uint32_t want, uint32_t have) { return want == 0 || want == have; };
        return fieldMatches(search.componentType, candidate.componentType) &&
               fieldMatches(search.componentSubType, candidate.componentSubType) &&
               fieldMatches(search.componentManufacturer, candidate.componentManufacturer);
    }

    Host::ComponentRef RefOf(size_t index) const noexcept {
        return reinterpret_cast<Host::ComponentRef>(entries_[index].get());
    }

    std::optional<size_t> IndexOf(Host::ComponentRef ref) const noexcept {
        for (size_t i = 0; i < entries_.size(); ++i) {
            if (RefOf(i) == ref) return i;
        }
        return std::nullopt;
    }

    std::vector<std::unique_ptr<Entry>> entries_;
    Host::Status failNameStatus_{Host::kNoErr};
};

} // namespace CAB::Testing
