/**
 * @file filesystem_provider.h
 * @brief Capability interface implemented by every filesystem backend
 */

#ifndef KCENON_UNIFIED_FS_PROVIDER_FILESYSTEM_PROVIDER_H
#define KCENON_UNIFIED_FS_PROVIDER_FILESYSTEM_PROVIDER_H

#include <kcenon/unified_fs/core/entry_metadata.h>
#include <kcenon/unified_fs/core/provider_handle.h>
#include <kcenon/unified_fs/core/types.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::unified_fs {

enum class write_mode {
    truncate,
    append,
    create_new  ///< Fails with name_collision when the path exists
};

/**
 * @brief Readable byte stream, closed when destroyed
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Number of bytes read; 0 at end of file
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;
};

/**
 * @brief Writable byte stream, closed when destroyed
 *
 * Data is only guaranteed to be durable after commit() succeeded.
 * Destroying an uncommitted sink closes it without flushing guarantees.
 */
class byte_sink {
public:
    virtual ~byte_sink() = default;

    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<void> = 0;

    /**
     * @brief Flush, make durable and close
     *
     * No further writes are accepted afterwards.
     */
    [[nodiscard]] virtual auto commit() -> result<void> = 0;
};

/**
 * @brief Incremental directory reader
 *
 * Entries come in provider order. "." and ".." are never returned.
 */
class directory_stream {
public:
    virtual ~directory_stream() = default;

    /**
     * @return The next entry, or nullopt at the end of the directory
     */
    [[nodiscard]] virtual auto next() -> result<std::optional<entry_metadata>> = 0;
};

/**
 * @brief Concurrency a provider tolerates
 */
struct provider_capabilities {
    /// Maximum number of requests that may run against the provider at once
    std::size_t max_concurrency = 1;

    /// Whether protocol messages may be in flight concurrently
    bool multiplexed = false;
};

/**
 * @brief Uniform filesystem operations over local and remote roots
 *
 * Errors use the shared taxonomy: not_found, permission_denied,
 * name_collision, directory_not_empty, not_a_directory. Remote providers
 * may additionally fail any call with connectivity_error, which callers
 * may retry after the session is re-established.
 *
 * Paths are strings in the provider's own path model (see path_identity).
 */
class filesystem_provider {
public:
    virtual ~filesystem_provider() = default;

    [[nodiscard]] virtual auto handle() const -> const provider_handle& = 0;

    [[nodiscard]] virtual auto capabilities() const -> provider_capabilities = 0;

    /**
     * @brief Start reading a directory
     */
    [[nodiscard]] virtual auto open_directory(const std::string& path)
        -> result<std::unique_ptr<directory_stream>> = 0;

    /**
     * @brief Read a whole directory
     *
     * Default implementation drains open_directory().
     */
    [[nodiscard]] virtual auto list(const std::string& path)
        -> result<std::vector<entry_metadata>>;

    /**
     * @brief Metadata of @p path; symlinks are not followed
     */
    [[nodiscard]] virtual auto stat(const std::string& path) -> result<entry_metadata> = 0;

    [[nodiscard]] virtual auto open_for_read(const std::string& path)
        -> result<std::unique_ptr<byte_source>> = 0;

    [[nodiscard]] virtual auto open_for_write(const std::string& path, write_mode mode)
        -> result<std::unique_ptr<byte_sink>> = 0;

    /**
     * @brief Remove a file, symlink or empty directory
     */
    [[nodiscard]] virtual auto remove(const std::string& path) -> result<void> = 0;

    /**
     * @brief Rename within this provider
     * @param replace_existing When false an existing target fails with
     *        name_collision and is left untouched
     */
    [[nodiscard]] virtual auto rename(const std::string& from,
                                      const std::string& to,
                                      bool replace_existing = false) -> result<void> = 0;

    /**
     * @brief Create a directory
     * @param recursive Create missing parents; an existing directory is
     *        not an error. Without it an existing entry is name_collision.
     */
    [[nodiscard]] virtual auto mkdir(const std::string& path, bool recursive)
        -> result<void> = 0;

    [[nodiscard]] virtual auto set_modified_time(const std::string& path, file_time time)
        -> result<void> = 0;

    /**
     * @brief stat() that reports a missing entry as nullopt instead of an error
     */
    [[nodiscard]] auto probe(const std::string& path) -> result<std::optional<entry_metadata>>;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_PROVIDER_FILESYSTEM_PROVIDER_H
