#include "sc/scroll/viewport_registry.hpp"

#include "sc/log.hpp"

#include <utility>

namespace sc::scroll
{

void ViewportRegistry::attach(const ViewportId &id, ScrollTarget &target)
{
    auto [it, inserted] = targets_.insert_or_assign(id, &target);
    (void)it;
    if (!inserted)
        sc::log::warn("viewport '" + id + "' registered twice; the newer instance wins");
}

void ViewportRegistry::detach(const ViewportId &id, const ScrollTarget &target) noexcept
{
    auto it = targets_.find(id);
    if (it != targets_.end() && it->second == &target)
        targets_.erase(it);
}

ScrollTarget *ViewportRegistry::find(const ViewportId &id) const noexcept
{
    auto it = targets_.find(id);
    if (it == targets_.end())
        return nullptr;
    return it->second;
}

ScrollTarget *ViewportRegistry::lookup(const ViewportId &id, const char *operation) const
{
    ScrollTarget *target = find(id);
    if (!target)
        sc::log::warn(std::string(operation) + ": no viewport registered as '" + id + "'");
    return target;
}

bool ViewportRegistry::scrollToItem(const ViewportId &id, std::ptrdiff_t index)
{
    ScrollTarget *target = lookup(id, "scrollToItem");
    if (!target)
        return false;
    target->scrollToItem(index);
    return true;
}

bool ViewportRegistry::snapTo(const ViewportId &id, float fraction)
{
    ScrollTarget *target = lookup(id, "snapTo");
    if (!target)
        return false;
    target->snapTo(fraction);
    return true;
}

bool ViewportRegistry::scrollTo(const ViewportId &id, float offset)
{
    ScrollTarget *target = lookup(id, "scrollTo");
    if (!target)
        return false;
    target->scrollTo(offset);
    return true;
}

bool ViewportRegistry::scrollBy(const ViewportId &id, float delta)
{
    ScrollTarget *target = lookup(id, "scrollBy");
    if (!target)
        return false;
    target->scrollBy(delta);
    return true;
}

ViewportRegistration::ViewportRegistration(ViewportRegistry &registry, ViewportId id, ScrollTarget &target)
    : registry_(registry), id_(std::move(id)), target_(target)
{
    registry_.attach(id_, target_);
}

ViewportRegistration::~ViewportRegistration()
{
    registry_.detach(id_, target_);
}

} // namespace sc::scroll
