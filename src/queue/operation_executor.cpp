/**
 * @file operation_executor.cpp
 * @brief Implementation of operation_executor
 */

#include <kcenon/unified_fs/queue/operation_executor.h>
#include <kcenon/unified_fs/core/logging.h>
#include <kcenon/unified_fs/core/path_identity.h>
#include <kcenon/unified_fs/events/event_bus.h>
#include <kcenon/unified_fs/provider/filesystem_provider.h>
#include <kcenon/unified_fs/provider/provider_registry.h>
#include <kcenon/unified_fs/transfer/conflict_resolver.h>
#include <kcenon/unified_fs/transfer/transfer_engine.h>

#include <chrono>

namespace kcenon::unified_fs {

namespace {

constexpr auto decision_poll_interval = std::chrono::milliseconds{100};

auto item_for(const location& at, item_outcome outcome, std::optional<error> reason = {})
    -> item_result {
    item_result r;
    r.source = at.path;
    r.outcome = outcome;
    r.reason = std::move(reason);
    return r;
}

auto cancelled_error() -> error {
    return error{error_code::cancelled, "request cancelled"};
}

}  // namespace

operation_executor::operation_executor(provider_registry& registry,
                                       event_bus& events,
                                       transfer_engine& engine)
    : registry_(registry), events_(events), engine_(engine) {}

auto operation_executor::execute(const operation_request& request, const cancellation_token& token)
    -> operation_result {
    if (request.kind() == operation_kind::copy || request.kind() == operation_kind::move) {
        return engine_.execute(request, token);
    }

    auto started = std::chrono::steady_clock::now();
    operation_result out;
    out.id = request.id();
    out.kind = request.kind();

    switch (request.kind()) {
        case operation_kind::list:
            run_list(request, out);
            break;
        case operation_kind::remove:
            run_remove(request, token, out);
            break;
        case operation_kind::rename:
            run_rename(request, token, out);
            break;
        case operation_kind::mkdir:
            run_mkdir(request, out);
            break;
        default:
            for (const auto& source : request.sources()) {
                out.items.push_back(item_for(
                    source, item_outcome::failed,
                    error{error_code::invalid_argument, "unsupported operation kind"}));
            }
            break;
    }

    bool every_failed = !out.items.empty() && out.count(item_outcome::failed) == out.items.size();
    if (token.is_cancelled() && out.count(item_outcome::cancelled) > 0) {
        out.status = operation_status::cancelled;
    } else if (every_failed) {
        out.status = operation_status::failed;
    } else {
        out.status = operation_status::completed;
    }
    out.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    operation_log_context ctx;
    ctx.request_id = request.id().to_string();
    ctx.path = request.sources().front().path;
    ctx.duration_ms = static_cast<uint64_t>(out.wall_time.count());
    UFS_LOG_INFO_CTX(log_category::queue,
                     std::string(to_string(request.kind())) + " finished as " +
                         to_string(out.status),
                     ctx);
    return out;
}

auto operation_executor::run_list(const operation_request& request, operation_result& out)
    -> void {
    const auto& dir = request.sources().front();
    auto provider = registry_.find(dir.provider);
    if (!provider) {
        out.items.push_back(item_for(dir, item_outcome::failed, provider.error()));
        return;
    }
    auto entries = provider.value()->list(dir.path);
    if (!entries) {
        out.items.push_back(item_for(dir, item_outcome::failed, entries.error()));
        return;
    }
    out.entries = std::move(entries.value());
    out.items.push_back(item_for(dir, item_outcome::succeeded));
}

auto operation_executor::remove_tree(filesystem_provider& provider,
                                     const std::string& path,
                                     const cancellation_token& token) -> result<void> {
    auto children = provider.list(path);
    if (!children) {
        return unexpected{children.error()};
    }
    for (const auto& child : children.value()) {
        if (token.is_cancelled()) {
            return unexpected{cancelled_error()};
        }
        if (child.is_directory()) {
            auto cleared = remove_tree(provider, child.path(), token);
            if (!cleared) {
                return cleared;
            }
            continue;
        }
        auto removed = provider.remove(child.path());
        if (!removed) {
            return removed;
        }
    }
    return provider.remove(path);
}

auto operation_executor::run_remove(const operation_request& request,
                                    const cancellation_token& token,
                                    operation_result& out) -> void {
    for (const auto& target : request.sources()) {
        if (token.is_cancelled()) {
            out.items.push_back(item_for(target, item_outcome::cancelled, cancelled_error()));
            continue;
        }

        auto provider = registry_.find(target.provider);
        if (!provider) {
            out.items.push_back(item_for(target, item_outcome::failed, provider.error()));
            continue;
        }

        auto meta = provider.value()->stat(target.path);
        if (!meta) {
            out.items.push_back(item_for(target, item_outcome::failed, meta.error()));
            continue;
        }

        auto removed = meta.value().is_directory() && request.options().recursive
                           ? remove_tree(*provider.value(), meta.value().path(), token)
                           : provider.value()->remove(meta.value().path());
        if (removed) {
            out.items.push_back(item_for(target, item_outcome::succeeded));
        } else if (removed.error().code == error_code::cancelled) {
            out.items.push_back(item_for(target, item_outcome::cancelled, removed.error()));
        } else {
            UFS_LOG_WARN(log_category::queue,
                         "Cannot remove " + target.path + ": " + removed.error().describe());
            out.items.push_back(item_for(target, item_outcome::failed, removed.error()));
        }
    }
}

auto operation_executor::run_rename(const operation_request& request,
                                    const cancellation_token& token,
                                    operation_result& out) -> void {
    const auto& from = request.sources().front();
    const auto& to = *request.destination();
    auto provider = registry_.find(from.provider);
    if (!provider) {
        out.items.push_back(item_for(from, item_outcome::failed, provider.error()));
        return;
    }
    auto& fs = *provider.value();

    auto done = [&](item_outcome outcome, const std::string& target,
                    std::optional<error> reason = {}) {
        auto r = item_for(from, outcome, std::move(reason));
        r.destination = target;
        out.items.push_back(std::move(r));
    };

    if (path_identity::same_entry(from.provider, from.path, to.provider, to.path)) {
        done(item_outcome::succeeded, to.path);
        return;
    }

    auto renamed = fs.rename(from.path, to.path, false);
    if (renamed) {
        done(item_outcome::succeeded, to.path);
        return;
    }
    if (renamed.error().code != error_code::name_collision) {
        done(item_outcome::failed, to.path, renamed.error());
        return;
    }

    conflict_resolver resolver(request.id(), request.options().overwrite, &events_);
    auto action = resolver.decide_without_prompt();
    bool prompted = request.options().overwrite == overwrite_policy::prompt;
    if (!action) {
        auto existing = fs.probe(to.path);
        if (!existing) {
            done(item_outcome::failed, to.path, existing.error());
            return;
        }
        if (!existing.value()) {
            // Target vanished in between
            auto retried = fs.rename(from.path, to.path, false);
            if (retried) {
                done(item_outcome::succeeded, to.path);
            } else {
                done(item_outcome::failed, to.path, retried.error());
            }
            return;
        }

        auto channel = resolver.ask(from.path, to.path, *existing.value());
        if (!channel) {
            action = conflict_action::skip;
            prompted = false;
        }
        while (!action) {
            if (token.is_cancelled()) {
                channel->answer(conflict_decision{conflict_action::cancel, false});
                done(item_outcome::cancelled, to.path, cancelled_error());
                return;
            }
            if (auto answer = channel->wait_for(decision_poll_interval)) {
                action = answer->action;
            }
        }
    }

    switch (*action) {
        case conflict_action::skip:
            done(prompted ? item_outcome::failed : item_outcome::skipped, to.path,
                 error{error_code::name_collision, "target exists: " + to.path});
            return;
        case conflict_action::cancel: {
            auto shared = token;
            shared.cancel();
            done(item_outcome::cancelled, to.path,
                 error{error_code::cancelled, "cancelled at collision"});
            return;
        }
        case conflict_action::overwrite: {
            auto replaced = fs.rename(from.path, to.path, true);
            if (replaced) {
                done(item_outcome::succeeded, to.path);
            } else {
                done(item_outcome::failed, to.path, replaced.error());
            }
            return;
        }
        case conflict_action::rename:
        default: {
            auto free = conflict_resolver::free_name(fs, to.path);
            if (!free) {
                done(item_outcome::failed, to.path, free.error());
                return;
            }
            auto moved = fs.rename(from.path, free.value(), false);
            if (moved) {
                done(item_outcome::succeeded, free.value());
            } else {
                done(item_outcome::failed, free.value(), moved.error());
            }
            return;
        }
    }
}

auto operation_executor::run_mkdir(const operation_request& request, operation_result& out)
    -> void {
    const auto& target = request.sources().front();
    auto provider = registry_.find(target.provider);
    if (!provider) {
        out.items.push_back(item_for(target, item_outcome::failed, provider.error()));
        return;
    }
    auto made = provider.value()->mkdir(target.path, request.options().recursive);
    if (made) {
        out.items.push_back(item_for(target, item_outcome::succeeded));
    } else {
        out.items.push_back(item_for(target, item_outcome::failed, made.error()));
    }
}

}  // namespace kcenon::unified_fs
