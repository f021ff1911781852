#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace sc::scroll
{

using ViewportId = std::string;

// Scroll operations a viewport accepts from outside the view tree. All of them
// apply immediately, cancel any running animation and clamp the result.
class ScrollTarget
{
public:
    virtual ~ScrollTarget() = default;

    // Moves the top of item `index` to the top of the viewport. Negative or
    // out-of-range indices are ignored.
    virtual void scrollToItem(std::ptrdiff_t index) = 0;
    // `fraction` of the content height, clamped to [0, 1].
    virtual void snapTo(float fraction) = 0;
    virtual void scrollTo(float offset) = 0;
    virtual void scrollBy(float delta) = 0;
};

class ViewportRegistry
{
public:
    ViewportRegistry() = default;
    ViewportRegistry(const ViewportRegistry &) = delete;
    ViewportRegistry &operator=(const ViewportRegistry &) = delete;

    void attach(const ViewportId &id, ScrollTarget &target);
    // Only detaches if `id` is still bound to `target`.
    void detach(const ViewportId &id, const ScrollTarget &target) noexcept;

    ScrollTarget *find(const ViewportId &id) const noexcept;
    bool contains(const ViewportId &id) const noexcept { return find(id) != nullptr; }
    std::size_t size() const noexcept { return targets_.size(); }

    // Each returns false when no viewport is registered under `id`.
    bool scrollToItem(const ViewportId &id, std::ptrdiff_t index);
    bool snapTo(const ViewportId &id, float fraction);
    bool scrollTo(const ViewportId &id, float offset);
    bool scrollBy(const ViewportId &id, float delta);
    bool snapToStart(const ViewportId &id) { return snapTo(id, 0.0f); }
    bool snapToEnd(const ViewportId &id) { return snapTo(id, 1.0f); }

private:
    ScrollTarget *lookup(const ViewportId &id, const char *operation) const;

    std::unordered_map<ViewportId, ScrollTarget *> targets_;
};

// Keeps a target registered for its own lifetime.
class ViewportRegistration
{
public:
    ViewportRegistration(ViewportRegistry &registry, ViewportId id, ScrollTarget &target);
    ~ViewportRegistration();

    ViewportRegistration(const ViewportRegistration &) = delete;
    ViewportRegistration &operator=(const ViewportRegistration &) = delete;

private:
    ViewportRegistry &registry_;
    ViewportId id_;
    ScrollTarget &target_;
};

} // namespace sc::scroll
