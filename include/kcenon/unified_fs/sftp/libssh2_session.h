/**
 * @file libssh2_session.h
 * @brief SFTP sessions backed by libssh2
 *
 * Only built when libssh2 is available (UNIFIED_FS_HAS_SFTP).
 */

#ifndef KCENON_UNIFIED_FS_SFTP_LIBSSH2_SESSION_H
#define KCENON_UNIFIED_FS_SFTP_LIBSSH2_SESSION_H

#include <kcenon/unified_fs/sftp/sftp_session.h>

#include <string>

namespace kcenon::unified_fs::sftp {

/**
 * @brief How the server host key is checked against known_hosts
 */
enum class host_key_policy {
    off,         ///< No verification
    accept_new,  ///< Unknown hosts are added, changed keys are rejected
    strict       ///< Host must already be listed with a matching key
};

struct libssh2_options {
    host_key_policy host_keys = host_key_policy::accept_new;

    /// Empty means $HOME/.ssh/known_hosts
    std::string known_hosts_path;

    /// Interval of SSH-level keepalive messages; 0 disables them
    int keepalive_seconds = 30;
};

/**
 * @brief session_factory that opens TCP + SSH + SFTP through libssh2
 *
 * Authentication is attempted with the agent, then the private key, then
 * the password (falling back to keyboard-interactive when the server
 * offers it). A rejected credential is authentication_error; everything
 * that goes wrong on the wire is connectivity_error.
 */
class libssh2_session_factory : public session_factory {
public:
    explicit libssh2_session_factory(libssh2_options options = {});

    [[nodiscard]] auto open(const remote_endpoint& endpoint,
                            const credential& secret,
                            const session_options& options)
        -> result<std::unique_ptr<sftp_session>> override;

private:
    libssh2_options options_;
};

}  // namespace kcenon::unified_fs::sftp

#endif  // KCENON_UNIFIED_FS_SFTP_LIBSSH2_SESSION_H
