/**
 * @file path_identity.h
 * @brief Path normalization and comparison across filesystem kinds
 *
 * Local paths follow the native path model, remote paths are POSIX paths
 * as spoken by SFTP. All functions are pure and perform no I/O.
 */

#ifndef KCENON_UNIFIED_FS_CORE_PATH_IDENTITY_H
#define KCENON_UNIFIED_FS_CORE_PATH_IDENTITY_H

#include <kcenon/unified_fs/core/provider_handle.h>

#include <optional>
#include <string>
#include <string_view>

namespace kcenon::unified_fs {

/**
 * @brief Path utilities shared by providers, the lister and the transfer engine
 *
 * @code
 * path_identity::normalize(provider_kind::remote, "/srv//data/./in/..");  // "/srv/data"
 * path_identity::with_collision_suffix("report.pdf", 1);                 // "report (1).pdf"
 * @endcode
 */
class path_identity {
public:
    /**
     * @brief Normalize a path for the given filesystem kind
     *
     * Collapses repeated separators and "." / ".." components and strips a
     * trailing separator (except for the root). Remote paths are always
     * absolute; an empty remote path is "/". An empty local path is ".".
     */
    [[nodiscard]] static auto normalize(provider_kind kind, std::string_view path) -> std::string;

    /**
     * @brief Append a relative path ("b/c.txt") to a base directory
     */
    [[nodiscard]] static auto join(provider_kind kind,
                                   std::string_view base,
                                   std::string_view relative) -> std::string;

    /**
     * @brief Parent directory; the root is its own parent
     */
    [[nodiscard]] static auto parent(provider_kind kind, std::string_view path) -> std::string;

    /**
     * @brief Last path component; empty for the root
     */
    [[nodiscard]] static auto filename(provider_kind kind, std::string_view path) -> std::string;

    /**
     * @brief Relative path of @p path below @p base, using '/' separators
     * @return The relative path ("" when equal), or nullopt when @p path is
     *         not inside @p base
     */
    [[nodiscard]] static auto relative(provider_kind kind,
                                       std::string_view base,
                                       std::string_view path) -> std::optional<std::string>;

    /**
     * @brief True when @p path equals @p base or lies below it
     */
    [[nodiscard]] static auto is_within(provider_kind kind,
                                        std::string_view base,
                                        std::string_view path) -> bool;

    /**
     * @brief Whether two (provider, path) pairs denote the same entry
     */
    [[nodiscard]] static auto same_entry(const provider_handle& a,
                                         std::string_view a_path,
                                         const provider_handle& b,
                                         std::string_view b_path) -> bool;

    /**
     * @brief Name used to resolve a collision: "name (n).ext"
     *
     * The extension is the part after the last dot. Dot files such as
     * ".profile" have no extension and become ".profile (n)".
     */
    [[nodiscard]] static auto with_collision_suffix(std::string_view name, unsigned n)
        -> std::string;

    /**
     * @brief Check a single path component entered by a user
     *
     * Rejects empty names, "." and "..", and names containing any of
     * < > " / \ | * ? : or control characters.
     */
    [[nodiscard]] static auto is_valid_filename(std::string_view name) -> bool;

    /**
     * @brief Location string for display, e.g. "sftp://alice@host:22/srv/data"
     *
     * Local paths are returned unchanged.
     */
    [[nodiscard]] static auto to_display_uri(const provider_handle& handle,
                                             std::string_view path) -> std::string;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_CORE_PATH_IDENTITY_H
