/**
 * @file provider_registry.h
 * @brief Lookup of live providers by handle
 */

#ifndef KCENON_UNIFIED_FS_PROVIDER_PROVIDER_REGISTRY_H
#define KCENON_UNIFIED_FS_PROVIDER_PROVIDER_REGISTRY_H

#include <kcenon/unified_fs/provider/filesystem_provider.h>

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace kcenon::unified_fs {

/**
 * @brief Maps provider handles to provider instances
 *
 * The local provider is registered for the whole lifetime of the registry.
 * Remote providers are added by connection_manager on connect and removed
 * on disconnect. Looking up a handle that is not registered fails with
 * connectivity_error.
 */
class provider_registry {
public:
    explicit provider_registry(std::shared_ptr<filesystem_provider> local);

    auto add(std::shared_ptr<filesystem_provider> provider) -> void;

    /**
     * @return true if a provider was registered under @p handle
     */
    auto remove(const provider_handle& handle) -> bool;

    [[nodiscard]] auto find(const provider_handle& handle) const
        -> result<std::shared_ptr<filesystem_provider>>;

    [[nodiscard]] auto local() const -> std::shared_ptr<filesystem_provider>;

    [[nodiscard]] auto handles() const -> std::vector<provider_handle>;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<filesystem_provider> local_;
    std::unordered_map<uint64_t, std::shared_ptr<filesystem_provider>> providers_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_PROVIDER_PROVIDER_REGISTRY_H
