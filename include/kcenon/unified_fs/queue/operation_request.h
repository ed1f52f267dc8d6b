/**
 * @file operation_request.h
 * @brief Immutable description of one user operation
 */

#ifndef KCENON_UNIFIED_FS_QUEUE_OPERATION_REQUEST_H
#define KCENON_UNIFIED_FS_QUEUE_OPERATION_REQUEST_H

#include <kcenon/unified_fs/core/operation_types.h>
#include <kcenon/unified_fs/core/provider_handle.h>
#include <kcenon/unified_fs/core/types.h>

#include <optional>
#include <string>
#include <vector>

namespace kcenon::unified_fs {

/**
 * @brief A path on a specific provider
 */
struct location {
    provider_handle provider;
    std::string path;
};

struct operation_options {
    overwrite_policy overwrite = overwrite_policy::prompt;

    /// Expand directories (copy/move) or remove whole trees (remove)
    bool recursive = false;

    bool preserve_timestamps = false;

    /// Stop at the first failed item; remaining items become cancelled
    bool abort_on_error = false;

    /// Re-read every committed file and compare its SHA-256
    bool verify_checksum = false;
};

class operation_queue;

/**
 * @brief List, copy, move, remove, rename or mkdir request
 *
 * Built and validated through operation_request::builder. The id is
 * assigned by operation_queue::submit().
 *
 * Destination semantics:
 * - copy / move: destination is the target directory
 * - rename: destination is the new full path on the same provider
 * - mkdir: the single source is the directory to create
 *
 * @code
 * auto request = operation_request::builder(operation_kind::copy)
 *     .add_source(provider_handle::local(), "/home/me/a")
 *     .with_destination(remote, "/srv")
 *     .with_recursive(true)
 *     .with_overwrite(overwrite_policy::skip)
 *     .build();
 * @endcode
 */
class operation_request {
public:
    class builder {
    public:
        explicit builder(operation_kind kind);

        auto add_source(provider_handle provider, std::string path) -> builder&;
        auto with_destination(provider_handle provider, std::string path) -> builder&;
        auto with_overwrite(overwrite_policy policy) -> builder&;
        auto with_recursive(bool enable) -> builder&;
        auto with_preserve_timestamps(bool enable) -> builder&;
        auto with_abort_on_error(bool enable) -> builder&;
        auto with_verify_checksum(bool enable) -> builder&;
        auto with_options(const operation_options& options) -> builder&;

        /**
         * @brief Validate and create the request
         * @return invalid_argument when the request is malformed for its kind
         */
        [[nodiscard]] auto build() -> result<operation_request>;

    private:
        operation_kind kind_;
        std::vector<location> sources_;
        std::optional<location> destination_;
        operation_options options_;
    };

    [[nodiscard]] auto id() const -> request_id { return id_; }
    [[nodiscard]] auto kind() const -> operation_kind { return kind_; }
    [[nodiscard]] auto sources() const -> const std::vector<location>& { return sources_; }
    [[nodiscard]] auto destination() const -> const std::optional<location>& {
        return destination_;
    }
    [[nodiscard]] auto options() const -> const operation_options& { return options_; }

    /**
     * @brief Every provider the request touches, without duplicates
     */
    [[nodiscard]] auto providers() const -> std::vector<provider_handle>;

    /**
     * @brief Copy of this request carrying @p id
     */
    [[nodiscard]] auto with_id(request_id id) const -> operation_request;

private:
    operation_request(operation_kind kind,
                      std::vector<location> sources,
                      std::optional<location> destination,
                      operation_options options);

    request_id id_;
    operation_kind kind_;
    std::vector<location> sources_;
    std::optional<location> destination_;
    operation_options options_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_QUEUE_OPERATION_REQUEST_H
