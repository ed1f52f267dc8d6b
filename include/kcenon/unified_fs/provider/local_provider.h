/**
 * @file local_provider.h
 * @brief Filesystem provider for the local machine
 */

#ifndef KCENON_UNIFIED_FS_PROVIDER_LOCAL_PROVIDER_H
#define KCENON_UNIFIED_FS_PROVIDER_LOCAL_PROVIDER_H

#include <kcenon/unified_fs/provider/filesystem_provider.h>

#include <string>

namespace kcenon::unified_fs {

/**
 * @brief Native file I/O behind the provider interface
 *
 * Stateless apart from its concurrency setting; one instance serves the
 * whole process under provider_handle::local().
 */
class local_provider : public filesystem_provider {
public:
    /**
     * @param max_concurrency Requests allowed to run against local disks at
     *        once (0 = hardware concurrency)
     */
    explicit local_provider(std::size_t max_concurrency = 0);

    [[nodiscard]] auto handle() const -> const provider_handle& override;
    [[nodiscard]] auto capabilities() const -> provider_capabilities override;

    [[nodiscard]] auto open_directory(const std::string& path)
        -> result<std::unique_ptr<directory_stream>> override;
    [[nodiscard]] auto stat(const std::string& path) -> result<entry_metadata> override;
    [[nodiscard]] auto open_for_read(const std::string& path)
        -> result<std::unique_ptr<byte_source>> override;
    [[nodiscard]] auto open_for_write(const std::string& path, write_mode mode)
        -> result<std::unique_ptr<byte_sink>> override;
    [[nodiscard]] auto remove(const std::string& path) -> result<void> override;
    [[nodiscard]] auto rename(const std::string& from,
                              const std::string& to,
                              bool replace_existing = false) -> result<void> override;
    [[nodiscard]] auto mkdir(const std::string& path, bool recursive) -> result<void> override;
    [[nodiscard]] auto set_modified_time(const std::string& path, file_time time)
        -> result<void> override;

private:
    provider_handle handle_;
    std::size_t max_concurrency_;
};

/**
 * @brief Map an errno value to the error taxonomy
 */
[[nodiscard]] auto error_from_errno(int err, const std::string& what) -> error;

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_PROVIDER_LOCAL_PROVIDER_H
