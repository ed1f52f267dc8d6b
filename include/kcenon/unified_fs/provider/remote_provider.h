/**
 * @file remote_provider.h
 * @brief Filesystem provider backed by an SFTP session
 */

#ifndef KCENON_UNIFIED_FS_PROVIDER_REMOTE_PROVIDER_H
#define KCENON_UNIFIED_FS_PROVIDER_REMOTE_PROVIDER_H

#include <kcenon/unified_fs/provider/filesystem_provider.h>
#include <kcenon/unified_fs/session/remote_connection.h>

#include <memory>
#include <string>

namespace kcenon::unified_fs {

/**
 * @brief SFTP operations behind the provider interface
 *
 * All protocol traffic goes through the shared remote_connection, which
 * serializes message exchanges and reports transport loss to the
 * connection manager. Open files and directory handles are bound to the
 * session generation they were opened on.
 */
class remote_provider : public filesystem_provider {
public:
    /**
     * @param connection Session owner for this handle
     * @param multiplexed_concurrency Concurrency granted when the session
     *        declares multiplexing; otherwise 1
     */
    explicit remote_provider(std::shared_ptr<remote_connection> connection,
                             std::size_t multiplexed_concurrency = 4);

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

    [[nodiscard]] auto connection() const -> const std::shared_ptr<remote_connection>& {
        return connection_;
    }

private:
    auto lstat(const std::string& path) -> result<sftp::file_attributes>;

    std::shared_ptr<remote_connection> connection_;
    std::size_t multiplexed_concurrency_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_PROVIDER_REMOTE_PROVIDER_H
