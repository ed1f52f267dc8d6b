/**
 * @file provider_handle.h
 * @brief Opaque identifiers for filesystem roots and their connection parameters
 */

#ifndef KCENON_UNIFIED_FS_CORE_PROVIDER_HANDLE_H
#define KCENON_UNIFIED_FS_CORE_PROVIDER_HANDLE_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::unified_fs {

/**
 * @brief Filesystem family of a provider
 *
 * Decides the path model (native vs POSIX) used by path_identity.
 */
enum class provider_kind {
    local,
    remote
};

[[nodiscard]] constexpr auto to_string(provider_kind kind) -> const char* {
    switch (kind) {
        case provider_kind::local:
            return "local";
        case provider_kind::remote:
            return "remote";
        default:
            return "unknown";
    }
}

/**
 * @brief Opaque reference to a credential held by the embedding application
 *
 * The core never stores secrets itself. The id is resolved through a
 * credential_store each time a session is (re)established.
 */
struct credential_ref {
    std::string id;

    [[nodiscard]] auto operator==(const credential_ref& other) const -> bool = default;
};

/**
 * @brief Connection parameters of a remote filesystem root
 */
struct remote_endpoint {
    std::string host;
    uint16_t port = 22;
    std::string username;
    credential_ref credential;
    std::string initial_path = "/";

    [[nodiscard]] auto operator==(const remote_endpoint& other) const -> bool = default;
};

/**
 * @brief Identifier of one filesystem root
 *
 * Id 0 is the local filesystem, a process-lifetime singleton. Remote
 * handles are issued by connection_manager::connect and carry the
 * endpoint they were opened with.
 */
class provider_handle {
public:
    provider_handle() : id_(0) {}

    provider_handle(uint64_t id, remote_endpoint endpoint)
        : id_(id), endpoint_(std::move(endpoint)) {}

    [[nodiscard]] static auto local() -> provider_handle { return provider_handle{}; }

    [[nodiscard]] auto id() const noexcept -> uint64_t { return id_; }

    [[nodiscard]] auto kind() const noexcept -> provider_kind {
        return endpoint_ ? provider_kind::remote : provider_kind::local;
    }

    [[nodiscard]] auto is_local() const noexcept -> bool { return !endpoint_.has_value(); }

    [[nodiscard]] auto endpoint() const -> const std::optional<remote_endpoint>& {
        return endpoint_;
    }

    /**
     * @brief Short label for logs, e.g. "local" or "alice@example.org:22"
     */
    [[nodiscard]] auto label() const -> std::string {
        if (!endpoint_) {
            return "local";
        }
        return endpoint_->username + "@" + endpoint_->host + ":" +
               std::to_string(endpoint_->port);
    }

    [[nodiscard]] auto operator==(const provider_handle& other) const -> bool {
        return id_ == other.id_;
    }

private:
    uint64_t id_;
    std::optional<remote_endpoint> endpoint_;
};

}  // namespace kcenon::unified_fs

template <>
struct std::hash<kcenon::unified_fs::provider_handle> {
    auto operator()(const kcenon::unified_fs::provider_handle& handle) const noexcept
        -> std::size_t {
        return std::hash<uint64_t>{}(handle.id());
    }
};

#endif  // KCENON_UNIFIED_FS_CORE_PROVIDER_HANDLE_H
