/**
 * @file libssh2_session.cpp
 * @brief libssh2 implementation of the sftp_session seam
 */

#include <kcenon/unified_fs/sftp/libssh2_session.h>
#include <kcenon/unified_fs/core/logging.h>

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <vector>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace kcenon::unified_fs::sftp {

namespace {

std::once_flag libssh2_init_flag;

constexpr long default_file_mode = 0644;
constexpr long default_dir_mode = 0755;
constexpr std::size_t name_buffer_size = 1024;
constexpr int max_agent_identities = 3;

/**
 * @brief Socket, SSH session and SFTP channel shared by a session and the
 *        files and directories it opened
 *
 * Once closed, handles opened from it turn into no-ops.
 */
struct session_core {
    int sock = -1;
    LIBSSH2_SESSION* session = nullptr;
    LIBSSH2_SFTP* sftp = nullptr;
    bool closed = false;
    std::atomic<bool> interrupted{false};

    ~session_core() { shutdown(); }

    auto shutdown() noexcept -> void {
        if (closed) {
            return;
        }
        closed = true;
        if (sftp != nullptr) {
            libssh2_sftp_shutdown(sftp);
            sftp = nullptr;
        }
        if (session != nullptr) {
            libssh2_session_disconnect(session, "bye");
            libssh2_session_free(session);
            session = nullptr;
        }
        if (sock != -1) {
            ::close(sock);
            sock = -1;
        }
    }
};

auto status_to_code(unsigned long status) -> error_code {
    switch (status) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:
            return error_code::not_found;
        case LIBSSH2_FX_PERMISSION_DENIED:
        case LIBSSH2_FX_WRITE_PROTECT:
            return error_code::permission_denied;
        case LIBSSH2_FX_FILE_ALREADY_EXISTS:
            return error_code::name_collision;
        case LIBSSH2_FX_DIR_NOT_EMPTY:
            return error_code::directory_not_empty;
        case LIBSSH2_FX_NOT_A_DIRECTORY:
            return error_code::not_a_directory;
        case LIBSSH2_FX_NO_CONNECTION:
        case LIBSSH2_FX_CONNECTION_LOST:
            return error_code::connectivity_error;
        default:
            return error_code::unknown_failure;
    }
}

auto last_error_text(LIBSSH2_SESSION* session) -> std::string {
    if (session == nullptr) {
        return {};
    }
    char* message = nullptr;
    int length = 0;
    (void)libssh2_session_last_error(session, &message, &length, 0);
    if (message == nullptr || length <= 0) {
        return {};
    }
    return std::string(message, static_cast<std::size_t>(length));
}

/**
 * @brief Classify the last libssh2 failure on @p core
 */
auto failure(const session_core& core, const std::string& what) -> error {
    if (core.interrupted.load() || core.closed) {
        return error{error_code::connectivity_error, what, "session closed"};
    }
    auto cause = last_error_text(core.session);
    auto rc = libssh2_session_last_errno(core.session);
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && core.sftp != nullptr) {
        auto status = libssh2_sftp_last_error(core.sftp);
        return error{status_to_code(status), what, "sftp status " + std::to_string(status)};
    }
    if (rc == LIBSSH2_ERROR_AUTHENTICATION_FAILED || rc == LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED) {
        return error{error_code::authentication_error, what, cause};
    }
    return error{error_code::connectivity_error, what, cause};
}

auto to_attributes(const LIBSSH2_SFTP_ATTRIBUTES& attrs) -> file_attributes {
    file_attributes out;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        out.permissions = static_cast<uint32_t>(attrs.permissions & 07777);
        switch (attrs.permissions & LIBSSH2_SFTP_S_IFMT) {
            case LIBSSH2_SFTP_S_IFDIR:
                out.kind = entry_kind::directory;
                break;
            case LIBSSH2_SFTP_S_IFLNK:
                out.kind = entry_kind::symlink;
                break;
            case LIBSSH2_SFTP_S_IFREG:
                out.kind = entry_kind::file;
                break;
            default:
                out.kind = entry_kind::special;
                break;
        }
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) {
        out.size = attrs.filesize;
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
        out.modified = std::chrono::system_clock::from_time_t(static_cast<time_t>(attrs.mtime));
    }
    return out;
}

// ============================================================================
// Files and directories
// ============================================================================

class libssh2_file : public remote_file {
public:
    libssh2_file(std::shared_ptr<session_core> core, LIBSSH2_SFTP_HANDLE* handle, std::string path)
        : core_(std::move(core)), handle_(handle), path_(std::move(path)) {}

    ~libssh2_file() override { (void)close(); }

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (!usable()) {
            return unexpected{failure(*core_, "read " + path_)};
        }
        auto n = libssh2_sftp_read(handle_, reinterpret_cast<char*>(buffer.data()), buffer.size());
        if (n < 0) {
            return unexpected{failure(*core_, "read " + path_)};
        }
        return static_cast<std::size_t>(n);
    }

    auto write(std::span<const std::byte> data) -> result<std::size_t> override {
        if (!usable()) {
            return unexpected{failure(*core_, "write " + path_)};
        }
        auto n = libssh2_sftp_write(handle_, reinterpret_cast<const char*>(data.data()), data.size());
        if (n < 0) {
            return unexpected{failure(*core_, "write " + path_)};
        }
        return static_cast<std::size_t>(n);
    }

    auto sync() -> result<void> override {
        if (!usable()) {
            return unexpected{failure(*core_, "fsync " + path_)};
        }
        if (libssh2_sftp_fsync(handle_) != 0) {
            if (libssh2_session_last_errno(core_->session) == LIBSSH2_ERROR_SFTP_PROTOCOL &&
                libssh2_sftp_last_error(core_->sftp) == LIBSSH2_FX_OP_UNSUPPORTED) {
                return {};
            }
            return unexpected{failure(*core_, "fsync " + path_)};
        }
        return {};
    }

    auto close() -> result<void> override {
        if (handle_ == nullptr) {
            return {};
        }
        auto* handle = handle_;
        handle_ = nullptr;
        if (core_->closed) {
            return {};
        }
        if (libssh2_sftp_close(handle) != 0) {
            return unexpected{failure(*core_, "close " + path_)};
        }
        return {};
    }

private:
    [[nodiscard]] auto usable() const -> bool { return handle_ != nullptr && !core_->closed; }

    std::shared_ptr<session_core> core_;
    LIBSSH2_SFTP_HANDLE* handle_;
    std::string path_;
};

class libssh2_directory : public remote_directory {
public:
    libssh2_directory(std::shared_ptr<session_core> core,
                      LIBSSH2_SFTP_HANDLE* handle,
                      std::string path)
        : core_(std::move(core)), handle_(handle), path_(std::move(path)) {}

    ~libssh2_directory() override {
        if (handle_ != nullptr && !core_->closed) {
            (void)libssh2_sftp_closedir(handle_);
        }
    }

    auto next() -> result<std::optional<directory_entry>> override {
        if (handle_ == nullptr || core_->closed) {
            return unexpected{failure(*core_, "readdir " + path_)};
        }
        std::vector<char> name(name_buffer_size);
        std::vector<char> longentry(name_buffer_size);
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        std::memset(&attrs, 0, sizeof(attrs));
        auto rc = libssh2_sftp_readdir_ex(handle_, name.data(), name.size(), longentry.data(),
                                          longentry.size(), &attrs);
        if (rc < 0) {
            return unexpected{failure(*core_, "readdir " + path_)};
        }
        if (rc == 0) {
            return std::optional<directory_entry>{};
        }
        directory_entry entry;
        entry.name.assign(name.data(), static_cast<std::size_t>(rc));
        entry.attributes = to_attributes(attrs);
        return std::optional<directory_entry>{std::move(entry)};
    }

private:
    std::shared_ptr<session_core> core_;
    LIBSSH2_SFTP_HANDLE* handle_;
    std::string path_;
};

// ============================================================================
// Session
// ============================================================================

class libssh2_sftp_session : public sftp_session {
public:
    explicit libssh2_sftp_session(std::shared_ptr<session_core> core) : core_(std::move(core)) {}

    ~libssh2_sftp_session() override { close(); }

    auto lstat(const std::string& path) -> result<file_attributes> override {
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        std::memset(&attrs, 0, sizeof(attrs));
        if (!open() || libssh2_sftp_stat_ex(core_->sftp, path.c_str(),
                                            static_cast<unsigned int>(path.size()),
                                            LIBSSH2_SFTP_LSTAT, &attrs) != 0) {
            return unexpected{failure(*core_, "lstat " + path)};
        }
        return to_attributes(attrs);
    }

    auto read_link(const std::string& path) -> result<std::string> override {
        std::vector<char> target(name_buffer_size);
        if (!open()) {
            return unexpected{failure(*core_, "readlink " + path)};
        }
        auto rc = libssh2_sftp_readlink(core_->sftp, path.c_str(), target.data(),
                                        static_cast<unsigned int>(target.size()));
        if (rc < 0) {
            return unexpected{failure(*core_, "readlink " + path)};
        }
        return std::string(target.data(), static_cast<std::size_t>(rc));
    }

    auto open_directory(const std::string& path)
        -> result<std::unique_ptr<remote_directory>> override {
        auto* handle = open() ? libssh2_sftp_opendir(core_->sftp, path.c_str()) : nullptr;
        if (handle == nullptr) {
            return unexpected{failure(*core_, "opendir " + path)};
        }
        return std::unique_ptr<remote_directory>(
            std::make_unique<libssh2_directory>(core_, handle, path));
    }

    auto open_file(const std::string& path, open_mode mode)
        -> result<std::unique_ptr<remote_file>> override {
        unsigned long flags = LIBSSH2_FXF_READ;
        switch (mode) {
            case open_mode::write_truncate:
                flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
                break;
            case open_mode::write_append:
                flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_APPEND;
                break;
            case open_mode::write_exclusive:
                flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_EXCL;
                break;
            case open_mode::read:
            default:
                break;
        }
        auto* handle = open() ? libssh2_sftp_open_ex(core_->sftp, path.c_str(),
                                                     static_cast<unsigned int>(path.size()),
                                                     flags, default_file_mode,
                                                     LIBSSH2_SFTP_OPENFILE)
                              : nullptr;
        if (handle == nullptr) {
            return unexpected{failure(*core_, "open " + path)};
        }
        return std::unique_ptr<remote_file>(std::make_unique<libssh2_file>(core_, handle, path));
    }

    auto make_directory(const std::string& path) -> result<void> override {
        if (!open() || libssh2_sftp_mkdir(core_->sftp, path.c_str(), default_dir_mode) != 0) {
            return unexpected{failure(*core_, "mkdir " + path)};
        }
        return {};
    }

    auto remove_directory(const std::string& path) -> result<void> override {
        if (!open() || libssh2_sftp_rmdir(core_->sftp, path.c_str()) != 0) {
            return unexpected{failure(*core_, "rmdir " + path)};
        }
        return {};
    }

    auto remove_file(const std::string& path) -> result<void> override {
        if (!open() || libssh2_sftp_unlink(core_->sftp, path.c_str()) != 0) {
            return unexpected{failure(*core_, "unlink " + path)};
        }
        return {};
    }

    auto rename(const std::string& from, const std::string& to) -> result<void> override {
        long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
        if (!open() ||
            libssh2_sftp_rename_ex(core_->sftp, from.c_str(), static_cast<unsigned int>(from.size()),
                                   to.c_str(), static_cast<unsigned int>(to.size()), flags) != 0) {
            return unexpected{failure(*core_, "rename " + from + " -> " + to)};
        }
        return {};
    }

    auto set_modified_time(const std::string& path, file_time time) -> result<void> override {
        LIBSSH2_SFTP_ATTRIBUTES current;
        std::memset(&current, 0, sizeof(current));
        if (!open() || libssh2_sftp_stat_ex(core_->sftp, path.c_str(),
                                            static_cast<unsigned int>(path.size()),
                                            LIBSSH2_SFTP_STAT, &current) != 0) {
            return unexpected{failure(*core_, "stat " + path)};
        }

        auto mtime = static_cast<unsigned long>(std::chrono::system_clock::to_time_t(time));
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        std::memset(&attrs, 0, sizeof(attrs));
        attrs.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
        attrs.atime = (current.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? current.atime : mtime;
        attrs.mtime = mtime;
        if (libssh2_sftp_stat_ex(core_->sftp, path.c_str(), static_cast<unsigned int>(path.size()),
                                 LIBSSH2_SFTP_SETSTAT, &attrs) != 0) {
            return unexpected{failure(*core_, "setstat " + path)};
        }
        return {};
    }

    auto keepalive() -> result<void> override {
        // An lstat of the working directory is a full request/response round trip
        auto probe = lstat(".");
        if (!probe) {
            return unexpected{probe.error()};
        }
        return {};
    }

    void interrupt() noexcept override {
        core_->interrupted.store(true);
        if (core_->sock != -1) {
            ::shutdown(core_->sock, SHUT_RDWR);
        }
    }

    void close() noexcept override { core_->shutdown(); }

private:
    [[nodiscard]] auto open() const -> bool {
        return !core_->closed && !core_->interrupted.load() && core_->sftp != nullptr;
    }

    std::shared_ptr<session_core> core_;
};

// ============================================================================
// Connection setup
// ============================================================================

auto tcp_connect(const remote_endpoint& endpoint, std::chrono::milliseconds timeout)
    -> result<int> {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* found = nullptr;
    auto port = std::to_string(endpoint.port);
    int gai = ::getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &found);
    if (gai != 0) {
        return unexpected{error{error_code::connectivity_error,
                                "cannot resolve " + endpoint.host, ::gai_strerror(gai)}};
    }

    std::string last_error = "no usable address";
    for (auto* rp = found; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            last_error = std::strerror(errno);
            continue;
        }

        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, interval = 10, count = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &count, sizeof(count));
#endif

        // Non-blocking connect bounded by the timeout, then back to blocking
        int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            pollfd pfd{s, POLLOUT, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (ready == 1) {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                ::getsockopt(s, SOL_SOCKET, SO_ERROR, &so_error, &len);
                rc = so_error == 0 ? 0 : -1;
                errno = so_error;
            } else {
                rc = -1;
                if (ready == 0) {
                    errno = ETIMEDOUT;
                }
            }
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, flags);
            ::freeaddrinfo(found);
            return s;
        }
        last_error = std::strerror(errno);
        ::close(s);
    }
    ::freeaddrinfo(found);
    return unexpected{error{error_code::connectivity_error,
                            "cannot connect to " + endpoint.host + ":" + port, last_error}};
}

auto known_hosts_file(const libssh2_options& options) -> std::string {
    if (!options.known_hosts_path.empty()) {
        return options.known_hosts_path;
    }
    const char* home = std::getenv("HOME");
    return home != nullptr ? std::string(home) + "/.ssh/known_hosts" : std::string{};
}

auto key_algorithm(int keytype) -> int {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:
            return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS:
            return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519:
            return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default:
            return 0;
    }
}

auto verify_host_key(LIBSSH2_SESSION* session,
                     const remote_endpoint& endpoint,
                     const libssh2_options& options) -> result<void> {
    if (options.host_keys == host_key_policy::off) {
        return {};
    }

    LIBSSH2_KNOWNHOSTS* hosts = libssh2_knownhost_init(session);
    if (hosts == nullptr) {
        return unexpected{error{error_code::connectivity_error, "cannot initialize known_hosts"}};
    }

    auto path = known_hosts_file(options);
    bool loaded = !path.empty() &&
                  libssh2_knownhost_readfile(hosts, path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!loaded && options.host_keys == host_key_policy::strict) {
        libssh2_knownhost_free(hosts);
        return unexpected{error{error_code::authentication_error,
                                "known_hosts unavailable: " + path}};
    }

    std::size_t key_length = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session, &key_length, &key_type);
    if (key == nullptr || key_length == 0) {
        libssh2_knownhost_free(hosts);
        return unexpected{error{error_code::connectivity_error, "server sent no host key"}};
    }

    int algorithm = key_algorithm(key_type);
    int plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | algorithm;
    int hashed = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | algorithm;

    libssh2_knownhost* match = nullptr;
    int check = libssh2_knownhost_checkp(hosts, endpoint.host.c_str(), endpoint.port, key,
                                         key_length, plain, &match);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(hosts, endpoint.host.c_str(), endpoint.port, key,
                                         key_length, hashed, &match);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(hosts);
        return {};
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND &&
        options.host_keys == host_key_policy::accept_new && !path.empty()) {
        int added = libssh2_knownhost_addc(hosts, endpoint.host.c_str(), nullptr, key, key_length,
                                           nullptr, 0, plain, nullptr);
        if (added != 0 ||
            libssh2_knownhost_writefile(hosts, path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            UFS_LOG_WARN(log_category::session, "Cannot record host key in " + path);
        } else {
            UFS_LOG_INFO(log_category::session, "Added host key of " + endpoint.host);
        }
        libssh2_knownhost_free(hosts);
        return {};
    }

    libssh2_knownhost_free(hosts);
    return unexpected{error{error_code::authentication_error,
                            check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH
                                ? "host key of " + endpoint.host + " does not match known_hosts"
                                : "host " + endpoint.host + " not in known_hosts"}};
}

struct keyboard_context {
    const std::string* password;
};

void answer_with_password(const char*, int, const char*, int, int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT*,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses, void** abstract) {
    const auto* ctx = (abstract != nullptr && *abstract != nullptr)
                          ? static_cast<const keyboard_context*>(*abstract)
                          : nullptr;
    for (int i = 0; i < num_prompts; ++i) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (ctx == nullptr || ctx->password->empty()) {
            continue;
        }
        // libssh2 frees the response with its allocator (malloc by default)
        auto* text = static_cast<char*>(std::malloc(ctx->password->size() + 1));
        if (text == nullptr) {
            continue;
        }
        std::memcpy(text, ctx->password->data(), ctx->password->size());
        text[ctx->password->size()] = '\0';
        responses[i].text = text;
        responses[i].length = static_cast<unsigned int>(ctx->password->size());
    }
}

auto auth_with_agent(LIBSSH2_SESSION* session, const std::string& user) -> bool {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session);
    if (agent == nullptr) {
        return false;
    }
    bool authed = false;
    if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        libssh2_agent_publickey* identity = nullptr;
        libssh2_agent_publickey* previous = nullptr;
        int tries = 0;
        while (tries < max_agent_identities &&
               libssh2_agent_get_identity(agent, &identity, previous) == 0) {
            previous = identity;
            ++tries;
            if (libssh2_agent_userauth(agent, user.c_str(), identity) == 0) {
                authed = true;
                break;
            }
        }
        libssh2_agent_disconnect(agent);
    }
    libssh2_agent_free(agent);
    return authed;
}

auto is_transport_error(int rc) -> bool {
    return rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_SEND ||
           rc == LIBSSH2_ERROR_SOCKET_RECV || rc == LIBSSH2_ERROR_TIMEOUT;
}

auto authenticate(LIBSSH2_SESSION* session,
                  const remote_endpoint& endpoint,
                  const credential& secret) -> result<void> {
    const auto& user = endpoint.username;
    std::string methods;
    if (char* list = libssh2_userauth_list(session, user.c_str(),
                                           static_cast<unsigned int>(user.size()))) {
        methods = list;
    } else if (libssh2_userauth_authenticated(session)) {
        return {};
    }
    auto offers = [&](const char* method) { return methods.find(method) != std::string::npos; };

    if (secret.use_agent && offers("publickey") && auth_with_agent(session, user)) {
        return {};
    }

    if (!secret.private_key_path.empty() && offers("publickey")) {
        const char* public_key =
            secret.public_key_path.empty() ? nullptr : secret.public_key_path.c_str();
        const char* passphrase = secret.passphrase.empty() ? nullptr : secret.passphrase.c_str();
        int rc = libssh2_userauth_publickey_fromfile(session, user.c_str(), public_key,
                                                     secret.private_key_path.c_str(), passphrase);
        if (rc == 0) {
            return {};
        }
        if (is_transport_error(rc)) {
            return unexpected{error{error_code::connectivity_error,
                                    "connection lost during authentication",
                                    last_error_text(session)}};
        }
    }

    if (!secret.password.empty()) {
        if (offers("password")) {
            int rc = libssh2_userauth_password(session, user.c_str(), secret.password.c_str());
            if (rc == 0) {
                return {};
            }
            if (is_transport_error(rc)) {
                return unexpected{error{error_code::connectivity_error,
                                        "connection lost during authentication",
                                        last_error_text(session)}};
            }
        }
        if (offers("keyboard-interactive")) {
            keyboard_context ctx{&secret.password};
            void** abstract = libssh2_session_abstract(session);
            if (abstract != nullptr) {
                *abstract = &ctx;
            }
            int rc = libssh2_userauth_keyboard_interactive(session, user.c_str(),
                                                           answer_with_password);
            if (abstract != nullptr) {
                *abstract = nullptr;
            }
            if (rc == 0) {
                return {};
            }
        }
    }

    return unexpected{error{error_code::authentication_error,
                            "authentication failed for " + user + "@" + endpoint.host,
                            methods.empty() ? last_error_text(session)
                                            : "server offers: " + methods}};
}

}  // namespace

// ============================================================================
// libssh2_session_factory
// ============================================================================

libssh2_session_factory::libssh2_session_factory(libssh2_options options)
    : options_(std::move(options)) {
    std::call_once(libssh2_init_flag, [] { (void)libssh2_init(0); });
}

auto libssh2_session_factory::open(const remote_endpoint& endpoint,
                                   const credential& secret,
                                   const session_options& options)
    -> result<std::unique_ptr<sftp_session>> {
    auto started = std::chrono::steady_clock::now();
    auto sock = tcp_connect(endpoint, options.connect_timeout);
    if (!sock) {
        return unexpected{sock.error()};
    }

    auto core = std::make_shared<session_core>();
    core->sock = sock.value();
    core->session = libssh2_session_init();
    if (core->session == nullptr) {
        return unexpected{error{error_code::unknown_failure, "libssh2_session_init failed"}};
    }

    libssh2_session_set_blocking(core->session, 1);
    libssh2_session_set_timeout(core->session, static_cast<long>(options.connect_timeout.count()));

    if (libssh2_session_handshake(core->session, core->sock) != 0) {
        return unexpected{error{error_code::connectivity_error, "SSH handshake failed",
                                last_error_text(core->session)}};
    }

    auto verified = verify_host_key(core->session, endpoint, options_);
    if (!verified) {
        return unexpected{verified.error()};
    }

    auto authed = authenticate(core->session, endpoint, secret);
    if (!authed) {
        return unexpected{authed.error()};
    }

    core->sftp = libssh2_sftp_init(core->session);
    if (core->sftp == nullptr) {
        return unexpected{error{error_code::connectivity_error, "cannot start SFTP subsystem",
                                last_error_text(core->session)}};
    }

    libssh2_session_set_timeout(core->session, static_cast<long>(options.io_timeout.count()));
    if (options_.keepalive_seconds > 0) {
        libssh2_keepalive_config(core->session, 1,
                                 static_cast<unsigned int>(options_.keepalive_seconds));
    }

    if (std::chrono::steady_clock::now() - started > options.connect_timeout) {
        return unexpected{error{error_code::connectivity_error,
                                "connect to " + endpoint.host + " timed out"}};
    }

    UFS_LOG_DEBUG(log_category::session, "SFTP session open to " + endpoint.host + ":" +
                                             std::to_string(endpoint.port));
    return std::unique_ptr<sftp_session>(std::make_unique<libssh2_sftp_session>(std::move(core)));
}

}  // namespace kcenon::unified_fs::sftp
