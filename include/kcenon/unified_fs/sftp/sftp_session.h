/**
 * @file sftp_session.h
 * @brief Transport seam between the remote provider and an SFTP client library
 *
 * Errors returned through this interface are already classified:
 * transport failures and timeouts are connectivity_error, rejected
 * credentials are authentication_error, and SFTP status codes map to
 * not_found, permission_denied, name_collision and so on.
 */

#ifndef KCENON_UNIFIED_FS_SFTP_SFTP_SESSION_H
#define KCENON_UNIFIED_FS_SFTP_SFTP_SESSION_H

#include <kcenon/unified_fs/core/entry_metadata.h>
#include <kcenon/unified_fs/core/provider_handle.h>
#include <kcenon/unified_fs/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

namespace kcenon::unified_fs::sftp {

struct file_attributes {
    entry_kind kind = entry_kind::file;
    uint64_t size = 0;
    file_time modified{};
    uint32_t permissions = 0;
};

struct directory_entry {
    std::string name;
    file_attributes attributes;
};

enum class open_mode {
    read,
    write_truncate,
    write_append,
    write_exclusive
};

/**
 * @brief Open remote file; closed when destroyed
 */
class remote_file {
public:
    virtual ~remote_file() = default;

    /**
     * @return Bytes read, 0 at end of file
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    /**
     * @return Bytes accepted by the server (may be fewer than requested)
     */
    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<std::size_t> = 0;

    /**
     * @brief Ask the server to flush to stable storage
     *
     * Servers without the fsync extension succeed without doing anything.
     */
    [[nodiscard]] virtual auto sync() -> result<void> = 0;

    [[nodiscard]] virtual auto close() -> result<void> = 0;
};

/**
 * @brief Open remote directory handle; closed when destroyed
 */
class remote_directory {
public:
    virtual ~remote_directory() = default;

    /**
     * @brief Read the next entry (one SSH_FXP_READDIR batch is buffered)
     * @return The entry, or nullopt at the end
     */
    [[nodiscard]] virtual auto next() -> result<std::optional<directory_entry>> = 0;
};

/**
 * @brief One authenticated SFTP session
 *
 * Not thread-safe: remote_connection serializes every call.
 */
class sftp_session {
public:
    virtual ~sftp_session() = default;

    /**
     * @brief Attributes of @p path without following symlinks
     */
    [[nodiscard]] virtual auto lstat(const std::string& path) -> result<file_attributes> = 0;

    [[nodiscard]] virtual auto read_link(const std::string& path) -> result<std::string> = 0;

    [[nodiscard]] virtual auto open_directory(const std::string& path)
        -> result<std::unique_ptr<remote_directory>> = 0;

    [[nodiscard]] virtual auto open_file(const std::string& path, open_mode mode)
        -> result<std::unique_ptr<remote_file>> = 0;

    [[nodiscard]] virtual auto make_directory(const std::string& path) -> result<void> = 0;
    [[nodiscard]] virtual auto remove_directory(const std::string& path) -> result<void> = 0;
    [[nodiscard]] virtual auto remove_file(const std::string& path) -> result<void> = 0;

    /**
     * @brief SSH_FXP_RENAME; fails when @p to exists
     */
    [[nodiscard]] virtual auto rename(const std::string& from, const std::string& to)
        -> result<void> = 0;

    [[nodiscard]] virtual auto set_modified_time(const std::string& path, file_time time)
        -> result<void> = 0;

    /**
     * @brief Round trip used as heartbeat
     */
    [[nodiscard]] virtual auto keepalive() -> result<void> = 0;

    /**
     * @brief Whether several requests may be outstanding at once
     */
    [[nodiscard]] virtual auto multiplexed() const -> bool { return false; }

    /**
     * @brief Abort blocking I/O from another thread
     *
     * Must be safe to call while another thread is inside a session call.
     */
    virtual void interrupt() noexcept = 0;

    /**
     * @brief Orderly teardown; the session is unusable afterwards
     */
    virtual void close() noexcept = 0;
};

/**
 * @brief Secret material resolved from a credential_ref
 *
 * Authentication is attempted in the order: agent, public key, password.
 */
struct credential {
    std::string password;
    std::string private_key_path;
    std::string public_key_path;
    std::string passphrase;
    bool use_agent = false;
};

/**
 * @brief Resolves opaque credential references supplied by the embedder
 */
class credential_store {
public:
    virtual ~credential_store() = default;

    /**
     * @return The credential, or authentication_error when unknown
     */
    [[nodiscard]] virtual auto resolve(const credential_ref& ref) -> result<credential> = 0;
};

/**
 * @brief credential_store backed by an in-memory map
 */
class static_credential_store : public credential_store {
public:
    auto add(const std::string& id, credential secret) -> void {
        std::lock_guard<std::mutex> lock(mutex_);
        secrets_[id] = std::move(secret);
    }

    auto resolve(const credential_ref& ref) -> result<credential> override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = secrets_.find(ref.id);
        if (it == secrets_.end()) {
            return unexpected{error{error_code::authentication_error,
                                    "no credential registered for '" + ref.id + "'"}};
        }
        return it->second;
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, credential> secrets_;
};

struct session_options {
    /// Bound on TCP connect, handshake and authentication together
    std::chrono::milliseconds connect_timeout{10000};

    /// Bound on any single protocol exchange
    std::chrono::milliseconds io_timeout{10000};
};

/**
 * @brief Opens sessions: TCP connect, SSH handshake, authentication, SFTP init
 */
class session_factory {
public:
    virtual ~session_factory() = default;

    [[nodiscard]] virtual auto open(const remote_endpoint& endpoint,
                                    const credential& secret,
                                    const session_options& options)
        -> result<std::unique_ptr<sftp_session>> = 0;
};

}  // namespace kcenon::unified_fs::sftp

#endif  // KCENON_UNIFIED_FS_SFTP_SFTP_SESSION_H
