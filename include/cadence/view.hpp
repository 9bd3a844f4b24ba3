#pragma once

#include <cadence/affine.hpp>
#include <cadence/color.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cadence
{

using ViewId = uint64_t;

inline constexpr ViewId INVALID_VIEW_ID = 0;

// Backing layer of a view. `corner_radius` is the model value; the
// presentation value is what a LayerAnimator shows while it animates.
struct Layer
{
    float corner_radius              = 0.0f;
    float presentation_corner_radius = 0.0f;
};

// Headless view: the state leaf effects mutate.
struct View
{
    std::string name;
    Affine2D    transform;
    Color       background = colors::clear;
    Layer       layer;
};

/**
 * ViewRegistry: owns views and hands out stable ids.
 *
 * Ids are monotonic and never reused, so an id that outlived its view simply
 * stops resolving (get() returns nullptr) instead of aliasing a newer view.
 * Effects hold ids, not pointers, which is what makes a destroyed view a
 * no-op for any chain still targeting it.
 *
 * Thread-safe: all public methods lock an internal mutex. Pointers returned by
 * get() stay valid until the view is destroyed.
 */
class ViewRegistry
{
   public:
    ViewRegistry()  = default;
    ~ViewRegistry() = default;

    ViewRegistry(const ViewRegistry&)            = delete;
    ViewRegistry& operator=(const ViewRegistry&) = delete;

    ViewId create(std::string name = {});

    // Returns false if the id is unknown.
    bool destroy(ViewId id);

    // nullptr if the view is gone.
    View* get(ViewId id) const;

    bool contains(ViewId id) const;

    // Ids in creation order.
    std::vector<ViewId> all_ids() const;

    size_t count() const;

    void clear();

   private:
    mutable std::mutex                                mutex_;
    std::unordered_map<ViewId, std::unique_ptr<View>> views_;
    std::vector<ViewId>                               creation_order_;
    ViewId                                            next_id_ = 1;
};

}   // namespace cadence
