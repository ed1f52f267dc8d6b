/**
 * @file entry_metadata.h
 * @brief Immutable snapshot of one directory entry
 */

#ifndef KCENON_UNIFIED_FS_CORE_ENTRY_METADATA_H
#define KCENON_UNIFIED_FS_CORE_ENTRY_METADATA_H

#include <kcenon/unified_fs/core/provider_handle.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::unified_fs {

/**
 * @brief Timestamp type used for modification times on every provider
 */
using file_time = std::chrono::system_clock::time_point;

enum class entry_kind {
    file,
    directory,
    symlink,
    special
};

[[nodiscard]] constexpr auto to_string(entry_kind kind) -> const char* {
    switch (kind) {
        case entry_kind::file:
            return "file";
        case entry_kind::directory:
            return "directory";
        case entry_kind::symlink:
            return "symlink";
        case entry_kind::special:
            return "special";
        default:
            return "unknown";
    }
}

/**
 * @brief Metadata of a file, directory, symlink or special entry
 *
 * Records are snapshots: they are never updated in place. A changed
 * file shows up as a new record on the next listing or stat.
 */
class entry_metadata {
public:
    entry_metadata(provider_handle owner,
                   std::string parent,
                   std::string name,
                   entry_kind kind,
                   uint64_t size,
                   file_time modified,
                   uint32_t permissions,
                   std::optional<std::string> link_target = std::nullopt);

    [[nodiscard]] auto name() const -> const std::string& { return name_; }
    [[nodiscard]] auto parent() const -> const std::string& { return parent_; }

    /**
     * @brief Normalized full path (parent joined with name)
     */
    [[nodiscard]] auto path() const -> const std::string& { return path_; }

    [[nodiscard]] auto kind() const noexcept -> entry_kind { return kind_; }
    [[nodiscard]] auto size() const noexcept -> uint64_t { return size_; }
    [[nodiscard]] auto modified() const noexcept -> file_time { return modified_; }

    /**
     * @brief POSIX permission bits (lower 12 bits of st_mode)
     */
    [[nodiscard]] auto permissions() const noexcept -> uint32_t { return permissions_; }

    [[nodiscard]] auto owner() const -> const provider_handle& { return owner_; }

    /**
     * @brief Unresolved symlink target; empty for other kinds
     */
    [[nodiscard]] auto link_target() const -> const std::optional<std::string>& {
        return link_target_;
    }

    [[nodiscard]] auto is_file() const noexcept -> bool { return kind_ == entry_kind::file; }
    [[nodiscard]] auto is_directory() const noexcept -> bool {
        return kind_ == entry_kind::directory;
    }
    [[nodiscard]] auto is_symlink() const noexcept -> bool {
        return kind_ == entry_kind::symlink;
    }

private:
    provider_handle owner_;
    std::string parent_;
    std::string name_;
    std::string path_;
    entry_kind kind_;
    uint64_t size_;
    file_time modified_;
    uint32_t permissions_;
    std::optional<std::string> link_target_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_CORE_ENTRY_METADATA_H
