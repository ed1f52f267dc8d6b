/**
 * @file memory_sftp.h
 * @brief In-memory SFTP server and session factory for tests
 *
 * The server keeps a POSIX tree in memory and implements the sftp_session
 * seam against it. Tests use it to inject failures, simulate connectivity
 * loss and detect overlapping protocol operations on one session.
 */

#ifndef KCENON_UNIFIED_FS_TESTS_SUPPORT_MEMORY_SFTP_H
#define KCENON_UNIFIED_FS_TESTS_SUPPORT_MEMORY_SFTP_H

#include <kcenon/unified_fs/sftp/sftp_session.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::unified_fs::test {

/**
 * @brief Protocol operations that can be targeted by failure injection
 */
enum class sftp_op {
    any,
    lstat,
    read_link,
    open_directory,
    read_directory,
    open_file,
    read,
    write,
    close,
    make_directory,
    remove_directory,
    remove_file,
    rename,
    set_modified_time,
    keepalive
};

class memory_sftp_server {
public:
    struct node {
        entry_kind kind = entry_kind::file;
        std::string content;
        file_time modified{};
        uint32_t permissions = 0644;
        std::string link_target;
    };

    memory_sftp_server();

    // Tree setup and inspection
    auto add_directory(const std::string& path) -> void;
    auto add_file(const std::string& path, const std::string& content,
                  std::optional<file_time> modified = std::nullopt) -> void;
    auto add_symlink(const std::string& path, const std::string& target) -> void;
    auto remove(const std::string& path) -> void;

    [[nodiscard]] auto exists(const std::string& path) const -> bool;
    [[nodiscard]] auto kind(const std::string& path) const -> std::optional<entry_kind>;
    [[nodiscard]] auto content(const std::string& path) const -> std::optional<std::string>;
    [[nodiscard]] auto modified(const std::string& path) const -> std::optional<file_time>;
    /// Names of the direct children, sorted
    [[nodiscard]] auto children(const std::string& dir) const -> std::vector<std::string>;
    /// Every path in the tree, sorted
    [[nodiscard]] auto paths() const -> std::vector<std::string>;

    // Failure injection
    /**
     * @brief Fail the next @p count calls of @p op with @p code
     */
    auto fail_next(sftp_op op, error_code code, int count = 1) -> void;

    /**
     * @brief Fail writes with connectivity_error once @p bytes were written
     *        in total from now on
     */
    auto fail_writes_after(std::size_t bytes) -> void;

    /**
     * @brief Flip the first byte of the next non-empty write while
     *        reporting success
     */
    auto corrupt_next_write() -> void;

    /**
     * @brief Drop every open session and refuse new ones while offline
     */
    auto set_offline(bool offline) -> void;
    [[nodiscard]] auto offline() const -> bool { return offline_.load(); }

    /**
     * @brief Delay every protocol operation, widening race windows
     */
    auto set_operation_delay(std::chrono::milliseconds delay) -> void;

    auto set_multiplexed(bool enable) -> void { multiplexed_ = enable; }
    [[nodiscard]] auto multiplexed() const -> bool { return multiplexed_.load(); }

    // Observations
    [[nodiscard]] auto overlap_detected() const -> bool { return overlap_.load(); }
    [[nodiscard]] auto operation_count() const -> std::size_t { return operations_.load(); }
    [[nodiscard]] auto bytes_written() const -> std::size_t { return bytes_written_.load(); }

    /**
     * @brief Generation that increases each time the server goes offline
     *
     * Sessions opened in an earlier generation stay broken.
     */
    [[nodiscard]] auto epoch() const -> uint64_t { return epoch_.load(); }

    // Used by memory_sftp_session
    /**
     * @brief Consume a pending injected failure for @p op, if any
     */
    [[nodiscard]] auto take_failure(sftp_op op) -> std::optional<error>;
    [[nodiscard]] auto delay() const -> std::chrono::milliseconds;
    auto note_overlap() -> void { overlap_ = true; }
    auto note_operation() -> void { ++operations_; }

    [[nodiscard]] auto lstat(const std::string& path) -> result<sftp::file_attributes>;
    [[nodiscard]] auto read_link(const std::string& path) -> result<std::string>;
    [[nodiscard]] auto snapshot_directory(const std::string& path)
        -> result<std::vector<sftp::directory_entry>>;
    [[nodiscard]] auto open_file(const std::string& path, sftp::open_mode mode) -> result<void>;
    [[nodiscard]] auto read_at(const std::string& path, std::size_t offset,
                               std::span<std::byte> buffer) -> result<std::size_t>;
    [[nodiscard]] auto write_at(const std::string& path, std::size_t offset,
                                std::span<const std::byte> data) -> result<std::size_t>;
    [[nodiscard]] auto make_directory(const std::string& path) -> result<void>;
    [[nodiscard]] auto remove_directory(const std::string& path) -> result<void>;
    [[nodiscard]] auto remove_file(const std::string& path) -> result<void>;
    [[nodiscard]] auto rename(const std::string& from, const std::string& to) -> result<void>;
    [[nodiscard]] auto set_modified_time(const std::string& path, file_time time)
        -> result<void>;

private:
    static auto parent_of(const std::string& path) -> std::string;
    static auto attributes_of(const node& n) -> sftp::file_attributes;

    mutable std::mutex mutex_;
    std::map<std::string, node> tree_;
    std::map<sftp_op, std::pair<error_code, int>> failures_;
    std::optional<std::size_t> write_budget_;
    bool corrupt_next_ = false;
    std::chrono::milliseconds delay_{0};

    std::atomic<bool> offline_{false};
    std::atomic<bool> multiplexed_{false};
    std::atomic<bool> overlap_{false};
    std::atomic<std::size_t> operations_{0};
    std::atomic<std::size_t> bytes_written_{0};
    std::atomic<uint64_t> epoch_{0};
};

/**
 * @brief Liveness and overlap bookkeeping shared by a session and the
 *        files and directories it opened
 */
struct memory_session_state {
    std::shared_ptr<memory_sftp_server> server;
    uint64_t epoch = 0;
    std::atomic<bool> closed{false};
    std::atomic<int> active{0};

    [[nodiscard]] auto check_alive() const -> std::optional<error> {
        if (closed.load()) {
            return error{error_code::connectivity_error, "session closed"};
        }
        if (server->offline() || server->epoch() != epoch) {
            return error{error_code::connectivity_error, "connection lost"};
        }
        return std::nullopt;
    }

    /**
     * @brief Run one protocol operation with failure injection, liveness
     *        checks and overlap detection
     */
    template <typename Fn>
    auto guarded(sftp_op op, Fn&& fn) -> decltype(fn()) {
        auto now_active = ++active;
        if (now_active > 1 && !server->multiplexed()) {
            server->note_overlap();
        }
        server->note_operation();
        struct leave {
            std::atomic<int>& counter;
            ~leave() { --counter; }
        } guard{active};

        auto pause = server->delay();
        if (pause.count() > 0) {
            std::this_thread::sleep_for(pause);
        }
        if (auto broken = check_alive()) {
            return unexpected{*broken};
        }
        if (auto injected = server->take_failure(op)) {
            return unexpected{*injected};
        }
        return fn();
    }
};

/**
 * @brief sftp_session bound to a memory_sftp_server
 */
class memory_sftp_session : public sftp::sftp_session {
public:
    explicit memory_sftp_session(std::shared_ptr<memory_sftp_server> server);
    ~memory_sftp_session() override;

    auto lstat(const std::string& path) -> result<sftp::file_attributes> override;
    auto read_link(const std::string& path) -> result<std::string> override;
    auto open_directory(const std::string& path)
        -> result<std::unique_ptr<sftp::remote_directory>> override;
    auto open_file(const std::string& path, sftp::open_mode mode)
        -> result<std::unique_ptr<sftp::remote_file>> override;
    auto make_directory(const std::string& path) -> result<void> override;
    auto remove_directory(const std::string& path) -> result<void> override;
    auto remove_file(const std::string& path) -> result<void> override;
    auto rename(const std::string& from, const std::string& to) -> result<void> override;
    auto set_modified_time(const std::string& path, file_time time) -> result<void> override;
    auto keepalive() -> result<void> override;
    [[nodiscard]] auto multiplexed() const -> bool override;
    void interrupt() noexcept override;
    void close() noexcept override;

private:
    std::shared_ptr<memory_session_state> state_;
};

/**
 * @brief session_factory opening memory_sftp_session objects
 *
 * Credentials are checked against an optional expected password.
 */
class memory_session_factory : public sftp::session_factory {
public:
    explicit memory_session_factory(std::shared_ptr<memory_sftp_server> server,
                                    std::optional<std::string> password = std::nullopt);

    auto open(const remote_endpoint& endpoint,
              const sftp::credential& secret,
              const sftp::session_options& options)
        -> result<std::unique_ptr<sftp::sftp_session>> override;

    /**
     * @brief Make the next @p count opens fail with connectivity_error
     */
    auto fail_next_opens(int count) -> void { failing_opens_ = count; }

    [[nodiscard]] auto open_count() const -> int { return opens_.load(); }

private:
    std::shared_ptr<memory_sftp_server> server_;
    std::optional<std::string> password_;
    std::atomic<int> failing_opens_{0};
    std::atomic<int> opens_{0};
};

}  // namespace kcenon::unified_fs::test

#endif  // KCENON_UNIFIED_FS_TESTS_SUPPORT_MEMORY_SFTP_H
