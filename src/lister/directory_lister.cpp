/**
 * @file directory_lister.cpp
 * @brief Implementation of directory_lister and entry_sequence
 */

#include <kcenon/unified_fs/lister/directory_lister.h>
#include <kcenon/unified_fs/core/logging.h>
#include <kcenon/unified_fs/provider/provider_registry.h>

namespace kcenon::unified_fs {

entry_sequence::entry_sequence(std::shared_ptr<filesystem_provider> provider,
                               std::string path,
                               std::unique_ptr<directory_stream> stream,
                               std::size_t page_size)
    : provider_(std::move(provider))
    , path_(std::move(path))
    , stream_(std::move(stream))
    , page_size_(page_size == 0 ? default_page_size : page_size) {}

auto entry_sequence::next() -> result<std::optional<entry_metadata>> {
    if (!stream_) {
        return std::optional<entry_metadata>{};
    }
    auto entry = stream_->next();
    if (!entry) {
        return unexpected{entry.error()};
    }
    if (!entry.value()) {
        stream_.reset();
        return std::optional<entry_metadata>{};
    }
    ++consumed_;
    return entry;
}

auto entry_sequence::next_page() -> result<std::vector<entry_metadata>> {
    std::vector<entry_metadata> page;
    page.reserve(page_size_);
    while (page.size() < page_size_) {
        auto entry = next();
        if (!entry) {
            return unexpected{entry.error()};
        }
        if (!entry.value()) {
            break;
        }
        page.push_back(std::move(*entry.value()));
    }
    return page;
}

auto entry_sequence::restart() -> result<void> {
    auto stream = provider_->open_directory(path_);
    if (!stream) {
        return unexpected{stream.error()};
    }
    stream_ = std::move(stream.value());
    consumed_ = 0;
    return {};
}

auto entry_sequence::collect() -> result<std::vector<entry_metadata>> {
    std::vector<entry_metadata> all;
    while (true) {
        auto page = next_page();
        if (!page) {
            return unexpected{page.error()};
        }
        if (page.value().empty()) {
            return all;
        }
        for (auto& entry : page.value()) {
            all.push_back(std::move(entry));
        }
    }
}

directory_lister::directory_lister(provider_registry& registry) : registry_(registry) {}

auto directory_lister::list(const provider_handle& provider,
                            const std::string& path,
                            std::optional<std::size_t> page_size) -> result<entry_sequence> {
    auto target = registry_.find(provider);
    if (!target) {
        return unexpected{target.error()};
    }

    auto stream = target.value()->open_directory(path);
    if (!stream) {
        UFS_LOG_DEBUG(log_category::lister,
                      "Cannot list " + path + " on " + provider.label() + ": " +
                          stream.error().describe());
        return unexpected{stream.error()};
    }
    return entry_sequence(target.value(), path, std::move(stream.value()),
                          page_size.value_or(entry_sequence::default_page_size));
}

}  // namespace kcenon::unified_fs
