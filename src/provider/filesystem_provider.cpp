/**
 * @file filesystem_provider.cpp
 * @brief Shared helpers of filesystem_provider
 */

#include <kcenon/unified_fs/provider/filesystem_provider.h>

namespace kcenon::unified_fs {

auto filesystem_provider::list(const std::string& path) -> result<std::vector<entry_metadata>> {
    auto stream = open_directory(path);
    if (!stream) {
        return unexpected{stream.error()};
    }

    std::vector<entry_metadata> entries;
    while (true) {
        auto entry = stream.value()->next();
        if (!entry) {
            return unexpected{entry.error()};
        }
        if (!entry.value()) {
            break;
        }
        entries.push_back(std::move(*entry.value()));
    }
    return entries;
}

auto filesystem_provider::probe(const std::string& path)
    -> result<std::optional<entry_metadata>> {
    auto meta = stat(path);
    if (meta) {
        return std::optional<entry_metadata>{std::move(meta.value())};
    }
    if (meta.error().code == error_code::not_found) {
        return std::optional<entry_metadata>{};
    }
    return unexpected{meta.error()};
}

}  // namespace kcenon::unified_fs
