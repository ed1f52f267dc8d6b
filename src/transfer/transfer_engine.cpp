/**
 * @file transfer_engine.cpp
 * @brief Implementation of transfer_engine
 */

#include <kcenon/unified_fs/transfer/transfer_engine.h>
#include <kcenon/unified_fs/adapters/thread_pool_adapter.h>
#include <kcenon/unified_fs/core/bandwidth_limiter.h>
#include <kcenon/unified_fs/core/checksum.h>
#include <kcenon/unified_fs/core/logging.h>
#include <kcenon/unified_fs/core/path_identity.h>
#include <kcenon/unified_fs/events/event_bus.h>
#include <kcenon/unified_fs/provider/filesystem_provider.h>
#include <kcenon/unified_fs/provider/provider_registry.h>
#include <kcenon/unified_fs/transfer/conflict_resolver.h>
#include <kcenon/unified_fs/transfer/transfer_session.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <set>
#include <vector>

namespace kcenon::unified_fs {

namespace {

constexpr const char* temp_suffix = ".ufs-part";
constexpr int max_temp_candidates = 16;
constexpr auto decision_poll_interval = std::chrono::milliseconds{100};

/**
 * @brief One resolved unit of work
 *
 * Files become transferable items. Entries that cannot be transferred
 * (skipped directories, symlinks, stat failures) or that were moved by a
 * direct rename carry their outcome in @c resolved.
 */
struct work_item {
    std::string source;
    std::string destination;
    uint64_t size = 0;
    file_time modified{};
    std::optional<item_result> resolved;
};

struct transfer_plan {
    std::vector<work_item> items;

    /// Destination directories in pre-order, including empty ones
    std::vector<std::string> directories;

    /// Expanded source directories in pre-order (move cleanup)
    std::vector<std::pair<filesystem_provider*, std::string>> source_directories;

    uint64_t total_bytes = 0;
};

auto make_result(const work_item& item, item_outcome outcome, std::optional<error> reason = {})
    -> item_result {
    item_result r;
    r.source = item.source;
    r.destination = item.destination;
    r.outcome = outcome;
    r.reason = std::move(reason);
    return r;
}

/**
 * @brief Staging name of @p destination; attempt n > 0 gives ".<name>.<n>.ufs-part"
 */
auto temp_path_for(provider_kind kind, const std::string& destination, int attempt)
    -> std::string {
    auto name = "." + path_identity::filename(kind, destination);
    if (attempt > 0) {
        name += "." + std::to_string(attempt);
    }
    return path_identity::join(kind, path_identity::parent(kind, destination),
                               name + temp_suffix);
}

/**
 * @brief Collision that waits for a user decision
 */
struct parked_item {
    std::size_t index;
    std::optional<entry_metadata> existing;
    std::shared_ptr<decision_channel> channel;
};

/**
 * @brief State of one execute() call
 */
class transfer_run {
public:
    transfer_run(const operation_request& request,
                 const cancellation_token& token,
                 const engine_config& config,
                 event_bus& events,
                 bandwidth_limiter& limiter,
                 std::shared_ptr<filesystem_provider> destination)
        : request_(request)
        , config_(config)
        , events_(events)
        , limiter_(limiter)
        , destination_(std::move(destination))
        , session_(request.id(), token)
        , resolver_(request.id(), request.options().overwrite, &events) {}

    auto session() -> transfer_session& { return session_; }

    // ========================================================================
    // Planning
    // ========================================================================

    auto plan_source(filesystem_provider& source, const location& from) -> void {
        auto src_kind = source.handle().kind();
        auto dst_kind = destination_->handle().kind();
        const auto& dest_dir = request_.destination()->path;

        work_item top;
        top.source = path_identity::normalize(src_kind, from.path);
        top.destination = path_identity::join(dst_kind, dest_dir,
                                              path_identity::filename(src_kind, top.source));

        auto meta = source.stat(top.source);
        if (!meta) {
            top.resolved = make_result(top, item_outcome::failed, meta.error());
            plan_.items.push_back(std::move(top));
            return;
        }

        const auto& entry = meta.value();
        if (entry.is_directory() && !request_.options().recursive) {
            top.resolved = make_result(
                top, item_outcome::skipped,
                error{error_code::skipped_directory, "directory needs recursive: " + top.source});
            plan_.items.push_back(std::move(top));
            return;
        }

        if (request_.kind() == operation_kind::move && try_direct_rename(source, entry, top)) {
            plan_.items.push_back(std::move(top));
            return;
        }

        if (entry.is_directory()) {
            expand_directory(source, top.source, top.destination);
            return;
        }
        add_entry(entry, top);
    }

    /**
     * @brief Record a source that was not planned because of cancellation
     */
    auto plan_cancelled(filesystem_provider& source, const location& from) -> void {
        auto src_kind = source.handle().kind();
        work_item item;
        item.source = path_identity::normalize(src_kind, from.path);
        item.destination =
            path_identity::join(destination_->handle().kind(), request_.destination()->path,
                                path_identity::filename(src_kind, item.source));
        item.resolved = make_result(item, item_outcome::cancelled, stop_reason());
        plan_.items.push_back(std::move(item));
    }

    auto add_entry(const entry_metadata& entry, work_item item) -> void {
        if (!entry.is_file()) {
            item.resolved = make_result(
                item, item_outcome::skipped,
                error{error_code::invalid_argument,
                      std::string(to_string(entry.kind())) + " not transferred: " + item.source});
        } else {
            item.size = entry.size();
            item.modified = entry.modified();
            plan_.total_bytes += item.size;
        }
        plan_.items.push_back(std::move(item));
    }

    auto expand_directory(filesystem_provider& source,
                          const std::string& source_dir,
                          const std::string& destination_dir) -> void {
        auto src_kind = source.handle().kind();
        auto dst_kind = destination_->handle().kind();

        plan_.source_directories.emplace_back(&source, source_dir);
        plan_.directories.push_back(destination_dir);

        auto stream = source.open_directory(source_dir);
        if (!stream) {
            work_item failed;
            failed.source = source_dir;
            failed.destination = destination_dir;
            failed.resolved = make_result(failed, item_outcome::failed, stream.error());
            plan_.items.push_back(std::move(failed));
            return;
        }

        while (true) {
            if (session_.cancelled()) {
                work_item rest;
                rest.source = source_dir;
                rest.destination = destination_dir;
                rest.resolved = make_result(rest, item_outcome::cancelled, stop_reason());
                plan_.items.push_back(std::move(rest));
                return;
            }
            auto next = stream.value()->next();
            if (!next) {
                work_item failed;
                failed.source = source_dir;
                failed.destination = destination_dir;
                failed.resolved = make_result(failed, item_outcome::failed, next.error());
                plan_.items.push_back(std::move(failed));
                return;
            }
            if (!next.value()) {
                return;
            }

            const auto& entry = *next.value();
            work_item item;
            item.source = path_identity::join(src_kind, source_dir, entry.name());
            item.destination = path_identity::join(dst_kind, destination_dir, entry.name());

            if (entry.is_directory()) {
                expand_directory(source, item.source, item.destination);
            } else {
                add_entry(entry, std::move(item));
            }
        }
    }

    /**
     * @brief Same-provider move by rename
     * @return true when the source was moved
     */
    auto try_direct_rename(filesystem_provider& source,
                           const entry_metadata& entry,
                           work_item& item) -> bool {
        if (!(source.handle() == destination_->handle())) {
            return false;
        }
        if (path_identity::same_entry(source.handle(), item.source, destination_->handle(),
                                      item.destination)) {
            return false;
        }

        auto parent = path_identity::parent(source.handle().kind(), item.destination);
        auto prepared = ensure_directory(parent);
        if (!prepared) {
            return false;
        }

        auto renamed = source.rename(item.source, item.destination, false);
        if (!renamed) {
            UFS_LOG_DEBUG(log_category::transfer,
                          "Direct rename of " + item.source + " not possible (" +
                              renamed.error().describe() + "), copying instead");
            return false;
        }

        item.size = entry.is_file() ? entry.size() : 0;
        item.resolved = make_result(item, item_outcome::succeeded);
        item.resolved->bytes = item.size;
        return true;
    }

    auto plan() -> transfer_plan& { return plan_; }

    // ========================================================================
    // Execution
    // ========================================================================

    auto ensure_directory(const std::string& path) -> result<void> {
        {
            std::lock_guard<std::mutex> lock(directories_mutex_);
            if (created_.count(path) > 0) {
                return {};
            }
        }
        auto made = destination_->mkdir(path, true);
        if (!made) {
            return made;
        }
        std::lock_guard<std::mutex> lock(directories_mutex_);
        created_.insert(path);
        return {};
    }

    auto record(std::size_t index, item_result r) -> void {
        std::lock_guard<std::mutex> lock(results_mutex_);
        results_[index] = std::move(r);
    }

    auto park(parked_item parked) -> void {
        std::lock_guard<std::mutex> lock(results_mutex_);
        parked_.push_back(std::move(parked));
    }

    auto take_parked() -> std::vector<parked_item> {
        std::lock_guard<std::mutex> lock(results_mutex_);
        auto out = std::move(parked_);
        parked_.clear();
        std::sort(out.begin(), out.end(),
                  [](const parked_item& a, const parked_item& b) { return a.index < b.index; });
        return out;
    }

    auto should_stop() const -> bool { return session_.cancelled() || aborted_.load(); }

    auto stop_reason() const -> error {
        if (aborted_.load()) {
            return error{error_code::cancelled, "batch aborted after a failed item"};
        }
        return error{error_code::cancelled, "request cancelled"};
    }

    /**
     * @brief Handle item @p index up to the collision decision
     */
    auto process(filesystem_provider& source, std::size_t index) -> void {
        const auto& item = plan_.items[index];
        session_.set_current_item(index);

        if (item.resolved) {
            record(index, *item.resolved);
            note_failure(*item.resolved);
            return;
        }
        if (should_stop()) {
            record(index, make_result(item, item_outcome::cancelled, stop_reason()));
            return;
        }

        auto existing = probe_with_retry(index);
        if (!existing) {
            auto failed = make_result(item, item_outcome::failed, existing.error());
            record(index, failed);
            note_failure(failed);
            return;
        }

        if (!existing.value()) {
            finish(source, index, item.destination, false);
            return;
        }

        auto action = resolver_.decide_without_prompt();
        if (!action) {
            auto channel = resolver_.ask(item.source, item.destination, *existing.value());
            if (!channel) {
                record(index, make_result(item, item_outcome::skipped,
                                          error{error_code::name_collision,
                                                "destination exists: " + item.destination}));
                return;
            }
            park(parked_item{index, existing.value(), std::move(channel)});
            return;
        }
        apply(source, index, *action);
    }

    /**
     * @brief Carry out a collision decision for item @p index
     */
    auto apply(filesystem_provider& source, std::size_t index, conflict_action action) -> void {
        const auto& item = plan_.items[index];
        switch (action) {
            case conflict_action::skip:
                // Declining a prompt fails the item; the skip policy only skips it
                record(index, make_result(item,
                                          request_.options().overwrite == overwrite_policy::prompt
                                              ? item_outcome::failed
                                              : item_outcome::skipped,
                                          error{error_code::name_collision,
                                                "destination exists: " + item.destination}));
                return;

            case conflict_action::cancel: {
                auto shared = session_.token();
                shared.cancel();
                record(index, make_result(item, item_outcome::cancelled,
                                          error{error_code::cancelled, "cancelled at collision"}));
                return;
            }

            case conflict_action::rename: {
                auto free = conflict_resolver::free_name(*destination_, item.destination);
                if (!free) {
                    auto failed = make_result(item, item_outcome::failed, free.error());
                    record(index, failed);
                    note_failure(failed);
                    return;
                }
                finish(source, index, free.value(), false);
                return;
            }

            case conflict_action::overwrite:
            default:
                if (path_identity::same_entry(source.handle(), item.source,
                                              destination_->handle(), item.destination)) {
                    record(index, make_result(item, item_outcome::skipped,
                                              error{error_code::name_collision,
                                                    "source and destination are the same: " +
                                                        item.source}));
                    return;
                }
                finish(source, index, item.destination, true);
                return;
        }
    }

    /**
     * @brief Wait for the answers of parked collisions, in item order
     */
    template <typename SourceOf>
    auto drain_parked(SourceOf&& source_of) -> void {
        for (auto& parked : take_parked()) {
            const auto& item = plan_.items[parked.index];
            std::optional<conflict_action> action;

            while (!action) {
                if (should_stop()) {
                    break;
                }
                if (auto sticky = resolver_.decide_without_prompt()) {
                    parked.channel->answer(conflict_decision{*sticky, true});
                    action = sticky;
                    break;
                }
                if (auto answer = parked.channel->wait_for(decision_poll_interval)) {
                    resolver_.record(*answer);
                    action = answer->action;
                }
            }

            if (!action) {
                parked.channel->answer(conflict_decision{conflict_action::cancel, false});
                record(parked.index, make_result(item, item_outcome::cancelled, stop_reason()));
                continue;
            }
            apply(source_of(parked.index), parked.index, *action);
        }
    }

    auto note_failure(const item_result& r) -> void {
        if (r.outcome == item_outcome::failed && request_.options().abort_on_error) {
            if (!aborted_.exchange(true)) {
                UFS_LOG_WARN(log_category::transfer,
                             "Aborting " + request_.id().to_string() + " after failure of " +
                                 r.source);
            }
        }
    }

    auto probe_with_retry(std::size_t index) -> result<std::optional<entry_metadata>> {
        uint32_t failures = 0;
        while (true) {
            auto existing = destination_->probe(plan_.items[index].destination);
            if (existing || existing.error().code != error_code::connectivity_error) {
                return existing;
            }
            auto delay = config_.retry.next_delay(++failures, existing.error().code);
            if (!delay || !session_.token().sleep_for(*delay)) {
                return existing;
            }
        }
    }

    /**
     * @brief Transfer item @p index to @p target with retries, then finish a move
     */
    auto finish(filesystem_provider& source,
                std::size_t index,
                const std::string& target,
                bool replacing) -> void {
        const auto& item = plan_.items[index];
        item_result r = make_result(item, item_outcome::succeeded);
        r.destination = target;

        operation_log_context ctx;
        ctx.request_id = request_.id().to_string();
        ctx.path = item.source;
        ctx.size = item.size;

        uint32_t failures = 0;
        while (true) {
            uint64_t moved = 0;
            auto copied = copy_file(source, index, target, moved);
            if (copied) {
                r.bytes = item.size;
                break;
            }

            session_.remove_bytes(moved);
            if (copied.error().code == error_code::cancelled) {
                r.outcome = item_outcome::cancelled;
                r.reason = copied.error();
                record(index, r);
                return;
            }

            auto delay = config_.retry.next_delay(++failures, copied.error().code);
            if (!delay) {
                r.outcome = item_outcome::failed;
                r.reason = copied.error();
                ctx.error_message = copied.error().describe();
                ctx.attempt = failures;
                UFS_LOG_ERROR_CTX(log_category::transfer, "Item failed", ctx);
                record(index, r);
                note_failure(r);
                return;
            }

            session_.record_retry(index);
            (void)session_.transition(session_state::running);
            ctx.attempt = failures;
            ctx.error_message = copied.error().describe();
            UFS_LOG_WARN_CTX(log_category::transfer,
                             "Retrying item in " + std::to_string(delay->count()) + "ms", ctx);
            if (!session_.token().sleep_for(*delay)) {
                r.outcome = item_outcome::cancelled;
                r.reason = error{error_code::cancelled, "request cancelled"};
                record(index, r);
                return;
            }
        }

        if (request_.kind() == operation_kind::move) {
            auto removed = source.remove(item.source);
            if (!removed) {
                r.outcome = item_outcome::failed;
                r.reason = error{removed.error().code,
                                 "copied but source not removed: " + removed.error().message,
                                 removed.error().cause};
                record(index, r);
                note_failure(r);
                return;
            }
        }

        UFS_LOG_DEBUG(log_category::transfer,
                      std::string(replacing ? "Replaced " : "Wrote ") + target);
        record(index, r);
    }

    /**
     * @brief One attempt at streaming a file
     * @param moved Batch bytes counted by this attempt
     */
    auto copy_file(filesystem_provider& source,
                   std::size_t index,
                   const std::string& target,
                   uint64_t& moved) -> result<void> {
        const auto& item = plan_.items[index];
        auto dst_kind = destination_->handle().kind();

        auto prepared = ensure_directory(path_identity::parent(dst_kind, target));
        if (!prepared) {
            return prepared;
        }

        auto reader = source.open_for_read(item.source);
        if (!reader) {
            return unexpected{reader.error()};
        }

        std::string temp;
        auto writer = open_staging(target, temp);
        if (!writer) {
            return unexpected{writer.error()};
        }

        auto abandon = [&](const error& why) -> result<void> {
            writer.value().reset();
            discard(temp);
            return unexpected{why};
        };

        sha256_hasher hasher;
        std::vector<std::byte> buffer(config_.chunk_size);
        uint64_t item_bytes = 0;
        auto item_count = plan_.items.size();

        while (true) {
            if (session_.cancelled()) {
                return abandon(error{error_code::cancelled, "request cancelled"});
            }

            auto n = reader.value()->read(buffer);
            if (!n) {
                return abandon(n.error());
            }
            if (n.value() == 0) {
                break;
            }

            if (!limiter_.acquire(n.value(), session_.token())) {
                return abandon(error{error_code::cancelled, "request cancelled"});
            }

            std::span<const std::byte> chunk(buffer.data(), n.value());
            auto written = writer.value()->write(chunk);
            if (!written) {
                return abandon(written.error());
            }
            if (request_.options().verify_checksum) {
                hasher.update(chunk);
            }

            item_bytes += n.value();
            moved += n.value();
            auto batch = session_.add_bytes(n.value());
            events_.publish(progress_event{request_.id(), item.source, item_bytes, item.size,
                                           batch, plan_.total_bytes, index, item_count});
        }

        if (item_bytes == 0) {
            events_.publish(progress_event{request_.id(), item.source, 0, 0,
                                           session_.bytes_so_far(), plan_.total_bytes, index,
                                           item_count});
        }

        auto committed = writer.value()->commit();
        if (!committed) {
            return abandon(committed.error());
        }
        writer.value().reset();
        reader.value().reset();

        // The target is only replaced by a staged file that passed every check
        if (request_.options().preserve_timestamps) {
            auto stamped = destination_->set_modified_time(temp, item.modified);
            if (!stamped) {
                return abandon(stamped.error());
            }
        }

        if (request_.options().verify_checksum) {
            auto verified = verify(temp, hasher.finish());
            if (!verified) {
                return abandon(verified.error());
            }
        }

        auto placed = destination_->rename(temp, target, true);
        if (!placed) {
            discard(temp);
            return placed;
        }
        return {};
    }

    /**
     * @brief Create a staging file next to @p target without touching any
     *        existing entry
     * @param temp Receives the chosen staging path
     */
    auto open_staging(const std::string& target, std::string& temp)
        -> result<std::unique_ptr<byte_sink>> {
        auto dst_kind = destination_->handle().kind();
        for (int attempt = 0; attempt < max_temp_candidates; ++attempt) {
            temp = temp_path_for(dst_kind, target, attempt);
            auto existing = destination_->probe(temp);
            if (!existing) {
                return unexpected{existing.error()};
            }
            if (existing.value()) {
                continue;
            }
            auto writer = destination_->open_for_write(temp, write_mode::create_new);
            if (writer || writer.error().code != error_code::name_collision) {
                return writer;
            }
        }
        return unexpected{error{error_code::name_collision,
                                "no free staging name next to " + target}};
    }

    auto verify(const std::string& target, const std::string& expected) -> result<void> {
        auto reader = destination_->open_for_read(target);
        if (!reader) {
            return unexpected{reader.error()};
        }
        sha256_hasher hasher;
        std::vector<std::byte> buffer(config_.chunk_size);
        while (true) {
            auto n = reader.value()->read(buffer);
            if (!n) {
                return unexpected{n.error()};
            }
            if (n.value() == 0) {
                break;
            }
            hasher.update(std::span<const std::byte>(buffer.data(), n.value()));
        }
        auto actual = hasher.finish();
        if (actual != expected) {
            return unexpected{error{error_code::unknown_failure, "checksum mismatch: " + target,
                                    "expected " + expected + ", got " + actual}};
        }
        return {};
    }

    /**
     * @brief Remove a temporary file after a failed or cancelled attempt
     */
    auto discard(const std::string& temp) -> void {
        auto removed = destination_->remove(temp);
        if (!removed && removed.error().code != error_code::not_found) {
            UFS_LOG_WARN(log_category::transfer,
                         "Cannot remove partial file " + temp + ": " + removed.error().describe());
        }
    }

    /**
     * @brief Recreate directories that received no files (empty source directories)
     */
    auto create_remaining_directories() -> void {
        for (const auto& dir : plan_.directories) {
            if (should_stop()) {
                return;
            }
            auto made = ensure_directory(dir);
            if (!made) {
                item_result failed;
                failed.destination = dir;
                failed.outcome = item_outcome::failed;
                failed.reason = made.error();
                std::lock_guard<std::mutex> lock(results_mutex_);
                extra_results_.push_back(std::move(failed));
            }
        }
    }

    /**
     * @brief Remove source directories emptied by a move, deepest first
     */
    auto remove_emptied_sources() -> void {
        for (auto it = plan_.source_directories.rbegin(); it != plan_.source_directories.rend();
             ++it) {
            auto& [source, dir] = *it;
            auto removed = source->remove(dir);
            if (!removed && removed.error().code != error_code::directory_not_empty &&
                removed.error().code != error_code::not_found) {
                UFS_LOG_WARN(log_category::transfer,
                             "Cannot remove source directory " + dir + ": " +
                                 removed.error().describe());
            }
        }
    }

    auto allocate_results() -> void { results_.assign(plan_.items.size(), std::nullopt); }

    auto collect_results() -> std::vector<item_result> {
        std::lock_guard<std::mutex> lock(results_mutex_);
        std::vector<item_result> out;
        out.reserve(results_.size() + extra_results_.size());
        for (std::size_t i = 0; i < results_.size(); ++i) {
            if (results_[i]) {
                out.push_back(std::move(*results_[i]));
            } else {
                out.push_back(make_result(plan_.items[i], item_outcome::cancelled, stop_reason()));
            }
        }
        for (auto& extra : extra_results_) {
            out.push_back(std::move(extra));
        }
        return out;
    }

    [[nodiscard]] auto aborted() const -> bool { return aborted_.load(); }

private:
    const operation_request& request_;
    const engine_config& config_;
    event_bus& events_;
    bandwidth_limiter& limiter_;
    std::shared_ptr<filesystem_provider> destination_;
    transfer_session session_;
    conflict_resolver resolver_;
    transfer_plan plan_;

    std::mutex directories_mutex_;
    std::set<std::string> created_;

    std::mutex results_mutex_;
    std::vector<std::optional<item_result>> results_;
    std::vector<item_result> extra_results_;
    std::vector<parked_item> parked_;

    std::atomic<bool> aborted_{false};
};

}  // namespace

struct transfer_engine::impl {
    provider_registry& registry;
    event_bus& events;
    engine_config config;
    bandwidth_limiter limiter;

    impl(provider_registry& r, event_bus& e, engine_config cfg)
        : registry(r), events(e), config(std::move(cfg)), limiter(config.bandwidth_limit) {}
};

transfer_engine::transfer_engine(provider_registry& registry, event_bus& events, engine_config config)
    : impl_(std::make_unique<impl>(registry, events, std::move(config))) {}

transfer_engine::~transfer_engine() = default;

auto transfer_engine::set_bandwidth_limit(std::size_t bytes_per_second) -> void {
    impl_->limiter.set_limit(bytes_per_second);
}

auto transfer_engine::config() const -> const engine_config& {
    return impl_->config;
}

auto transfer_engine::execute(const operation_request& request, const cancellation_token& token)
    -> operation_result {
    operation_result outcome;
    outcome.id = request.id();
    outcome.kind = request.kind();
    auto started = std::chrono::steady_clock::now();

    auto fail_all = [&](const error& why) {
        for (const auto& source : request.sources()) {
            item_result r;
            r.source = source.path;
            r.outcome = item_outcome::failed;
            r.reason = why;
            outcome.items.push_back(std::move(r));
        }
        outcome.status = operation_status::failed;
        outcome.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        return outcome;
    };

    if (request.kind() != operation_kind::copy && request.kind() != operation_kind::move) {
        return fail_all(error{error_code::invalid_argument,
                              std::string("transfer engine cannot run ") +
                                  to_string(request.kind())});
    }
    if (!request.destination()) {
        return fail_all(error{error_code::invalid_argument, "missing destination"});
    }

    auto destination = impl_->registry.find(request.destination()->provider);
    if (!destination) {
        return fail_all(destination.error());
    }

    // All source providers must be reachable before anything is touched
    std::vector<std::shared_ptr<filesystem_provider>> sources;
    for (const auto& source : request.sources()) {
        auto provider = impl_->registry.find(source.provider);
        if (!provider) {
            return fail_all(provider.error());
        }
        sources.push_back(provider.value());
    }

    transfer_run run(request, token, impl_->config, impl_->events, impl_->limiter,
                     destination.value());
    (void)run.session().transition(session_state::running);

    operation_log_context ctx;
    ctx.request_id = request.id().to_string();
    ctx.path = request.destination()->path;
    UFS_LOG_INFO_CTX(log_category::transfer,
                     std::string("Starting ") + to_string(request.kind()) + " of " +
                         std::to_string(request.sources().size()) + " source(s)",
                     ctx);

    // Plan per source so that each item remembers its provider
    std::vector<std::pair<std::size_t, std::size_t>> ranges;
    for (std::size_t i = 0; i < sources.size(); ++i) {
        auto first = run.plan().items.size();
        if (token.is_cancelled()) {
            run.plan_cancelled(*sources[i], request.sources()[i]);
        } else {
            run.plan_source(*sources[i], request.sources()[i]);
        }
        ranges.emplace_back(first, run.plan().items.size());
    }
    run.session().set_batch_total(run.plan().total_bytes);
    run.allocate_results();

    auto item_source = [&](std::size_t index) -> filesystem_provider& {
        for (std::size_t s = 0; s < ranges.size(); ++s) {
            if (index >= ranges[s].first && index < ranges[s].second) {
                return *sources[s];
            }
        }
        return *sources.front();
    };

    std::size_t parallel = std::max<std::size_t>(1, impl_->config.max_parallel_items);
    parallel = std::min(parallel, destination.value()->capabilities().max_concurrency);
    for (const auto& source : sources) {
        parallel = std::min(parallel, source->capabilities().max_concurrency);
    }
    parallel = std::min(parallel, std::max<std::size_t>(1, run.plan().items.size()));

    if (parallel <= 1) {
        for (std::size_t i = 0; i < run.plan().items.size(); ++i) {
            run.process(item_source(i), i);
        }
    } else {
        // A pool of its own per request: the queue's workers may be the
        // callers here, so sharing theirs could leave the item loops unscheduled
        std::atomic<std::size_t> next{0};
        auto pool = adapters::task_pool_factory::create(parallel, "unified_fs_items");
        std::vector<std::future<void>> loops;
        loops.reserve(parallel);
        for (std::size_t w = 0; w < parallel; ++w) {
            loops.push_back(pool->submit([&] {
                while (true) {
                    auto i = next.fetch_add(1);
                    if (i >= run.plan().items.size()) {
                        return;
                    }
                    run.process(item_source(i), i);
                }
            }));
        }
        for (auto& loop : loops) {
            loop.get();
        }
    }

    run.drain_parked(item_source);
    run.create_remaining_directories();
    if (request.kind() == operation_kind::move) {
        run.remove_emptied_sources();
    }

    outcome.items = run.collect_results();
    for (const auto& item : outcome.items) {
        if (item.outcome == item_outcome::succeeded) {
            outcome.bytes_transferred += item.bytes;
        }
    }

    bool every_failed = !outcome.items.empty() &&
                        outcome.count(item_outcome::failed) == outcome.items.size();
    if (token.is_cancelled()) {
        outcome.status = operation_status::cancelled;
    } else if (run.aborted() || every_failed) {
        outcome.status = operation_status::failed;
    } else {
        outcome.status = operation_status::completed;
    }

    auto terminal = outcome.status == operation_status::completed ? session_state::completed
                    : outcome.status == operation_status::cancelled ? session_state::cancelled
                                                                    : session_state::failed;
    (void)run.session().transition(terminal);

    outcome.wall_time = run.session().elapsed();
    ctx.bytes_transferred = outcome.bytes_transferred;
    ctx.duration_ms = static_cast<uint64_t>(outcome.wall_time.count());
    UFS_LOG_INFO_CTX(log_category::transfer,
                     std::string("Finished ") + to_string(request.kind()) + " as " +
                         to_string(outcome.status),
                     ctx);
    return outcome;
}

}  // namespace kcenon::unified_fs
