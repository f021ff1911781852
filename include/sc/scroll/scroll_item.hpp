#pragma once

#include "sc/scroll/geometry.hpp"

#include <memory>

namespace sc::scroll
{

// Retained per-item state. Survives across frames for as long as the item's key
// stays in the list, so decode caches, wrap results and animation progress of a
// line are not rebuilt when unrelated lines are inserted or removed.
class ItemState
{
public:
    virtual ~ItemState() = default;
};

class ScrollItem
{
public:
    virtual ~ScrollItem() = default;

    virtual std::unique_ptr<ItemState> createState() const { return std::make_unique<ItemState>(); }

    // Called when an existing state is matched to this item by key.
    virtual void syncState(ItemState &state) const { (void)state; }

    virtual Size layout(ItemState &state, const Limits &limits) const = 0;
};

} // namespace sc::scroll
