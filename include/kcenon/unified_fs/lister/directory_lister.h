/**
 * @file directory_lister.h
 * @brief Paged directory enumeration over any provider
 */

#ifndef KCENON_UNIFIED_FS_LISTER_DIRECTORY_LISTER_H
#define KCENON_UNIFIED_FS_LISTER_DIRECTORY_LISTER_H

#include <kcenon/unified_fs/core/entry_metadata.h>
#include <kcenon/unified_fs/core/provider_handle.h>
#include <kcenon/unified_fs/core/types.h>
#include <kcenon/unified_fs/provider/filesystem_provider.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::unified_fs {

class provider_registry;

/**
 * @brief Lazily evaluated listing of one directory
 *
 * Entries are fetched from the provider page by page as they are
 * consumed, so huge directories never have to fit in memory at once.
 * The sequence is single-pass; restart() re-opens the directory.
 */
class entry_sequence {
public:
    static constexpr std::size_t default_page_size = 256;

    entry_sequence(std::shared_ptr<filesystem_provider> provider,
                   std::string path,
                   std::unique_ptr<directory_stream> stream,
                   std::size_t page_size);

    entry_sequence(entry_sequence&&) noexcept = default;
    entry_sequence& operator=(entry_sequence&&) noexcept = default;

    /**
     * @brief Up to page_size() entries; empty once the directory is exhausted
     */
    [[nodiscard]] auto next_page() -> result<std::vector<entry_metadata>>;

    /**
     * @brief The next single entry, or nullopt at the end
     */
    [[nodiscard]] auto next() -> result<std::optional<entry_metadata>>;

    /**
     * @brief Start over from the first entry
     */
    [[nodiscard]] auto restart() -> result<void>;

    /**
     * @brief Drain the remaining entries
     */
    [[nodiscard]] auto collect() -> result<std::vector<entry_metadata>>;

    [[nodiscard]] auto exhausted() const -> bool { return !stream_; }
    [[nodiscard]] auto page_size() const -> std::size_t { return page_size_; }
    [[nodiscard]] auto path() const -> const std::string& { return path_; }
    [[nodiscard]] auto consumed() const -> std::size_t { return consumed_; }

private:
    std::shared_ptr<filesystem_provider> provider_;
    std::string path_;
    std::unique_ptr<directory_stream> stream_;
    std::size_t page_size_;
    std::size_t consumed_ = 0;
};

/**
 * @brief Opens entry_sequence objects on registered providers
 */
class directory_lister {
public:
    explicit directory_lister(provider_registry& registry);

    /**
     * @brief Start listing @p path on @p provider
     *
     * The directory is opened immediately, so a missing path or a lost
     * session is reported here rather than on the first page.
     */
    [[nodiscard]] auto list(const provider_handle& provider,
                            const std::string& path,
                            std::optional<std::size_t> page_size = std::nullopt)
        -> result<entry_sequence>;

private:
    provider_registry& registry_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_LISTER_DIRECTORY_LISTER_H
