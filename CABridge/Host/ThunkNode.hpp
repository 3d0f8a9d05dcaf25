#pragma once

#include <memory>
#include <new>
#include <utility>

namespace CAB::Host {

/**
 * @brief Allocate a default-constructed value together with its map node.
 *
 * Host backends stage the node before creating the host object, then re-key
 * and insert it once the handle is known. Node insertion and extraction never
 * allocate, so nothing can fail after the host object exists. Returns an empty
 * node when allocation fails.
 */
template <typename Map>
[[nodiscard]] typename Map::node_type StageNode() noexcept {
    using Value = typename Map::mapped_type::element_type;
    try {
        Map staging;
        staging.emplace(typename Map::key_type{}, std::make_unique<Value>());
        return staging.extract(staging.begin());
    } catch (const std::bad_alloc&) {
        return {};
    }
}

/// Move the entry at @p it into @p to without allocating.
template <typename From, typename To>
void MoveNode(From& from, typename From::iterator it, To& to) noexcept {
    to.insert(from.extract(it));
}

} // namespace CAB::Host
