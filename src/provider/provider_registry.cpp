/**
 * @file provider_registry.cpp
 * @brief Implementation of provider_registry
 */

#include <kcenon/unified_fs/provider/provider_registry.h>

namespace kcenon::unified_fs {

provider_registry::provider_registry(std::shared_ptr<filesystem_provider> local)
    : local_(std::move(local)) {
    providers_.emplace(local_->handle().id(), local_);
}

auto provider_registry::add(std::shared_ptr<filesystem_provider> provider) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = provider->handle().id();
    providers_[id] = std::move(provider);
}

auto provider_registry::remove(const provider_handle& handle) -> bool {
    if (handle.is_local()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.erase(handle.id()) > 0;
}

auto provider_registry::find(const provider_handle& handle) const
    -> result<std::shared_ptr<filesystem_provider>> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(handle.id());
    if (it == providers_.end()) {
        return unexpected{error{error_code::connectivity_error,
                                "provider " + handle.label() + " is not connected"}};
    }
    return it->second;
}

auto provider_registry::local() const -> std::shared_ptr<filesystem_provider> {
    return local_;
}

auto provider_registry::handles() const -> std::vector<provider_handle> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<provider_handle> out;
    out.reserve(providers_.size());
    for (const auto& [id, provider] : providers_) {
        out.push_back(provider->handle());
    }
    return out;
}

}  // namespace kcenon::unified_fs
