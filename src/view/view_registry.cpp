#include <algorithm>
#include <cadence/logger.hpp>
#include <cadence/view.hpp>

namespace cadence
{

ViewId ViewRegistry::create(std::string name)
{
    auto view  = std::make_unique<View>();
    view->name = std::move(name);

    std::lock_guard lock(mutex_);
    ViewId          id = next_id_++;
    CADENCE_LOG_TRACE("views", "create view {} '{}'", id, view->name);
    views_.emplace(id, std::move(view));
    creation_order_.push_back(id);
    return id;
}

bool ViewRegistry::destroy(ViewId id)
{
    std::lock_guard lock(mutex_);
    auto            it = views_.find(id);
    if (it == views_.end())
        return false;

    CADENCE_LOG_TRACE("views", "destroy view {}", id);
    views_.erase(it);
    std::erase(creation_order_, id);
    return true;
}

View* ViewRegistry::get(ViewId id) const
{
    std::lock_guard lock(mutex_);
    auto            it = views_.find(id);
    return it != views_.end() ? it->second.get() : nullptr;
}

bool ViewRegistry::contains(ViewId id) const
{
    std::lock_guard lock(mutex_);
    return views_.count(id) > 0;
}

std::vector<ViewId> ViewRegistry::all_ids() const
{
    std::lock_guard lock(mutex_);
    return creation_order_;
}

size_t ViewRegistry::count() const
{
    std::lock_guard lock(mutex_);
    return views_.size();
}

void ViewRegistry::clear()
{
    std::lock_guard lock(mutex_);
    views_.clear();
    creation_order_.clear();
}

}   // namespace cadence
