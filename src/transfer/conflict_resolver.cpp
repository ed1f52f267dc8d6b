/**
 * @file conflict_resolver.cpp
 * @brief Implementation of conflict_resolver
 */

#include <kcenon/unified_fs/transfer/conflict_resolver.h>
#include <kcenon/unified_fs/core/logging.h>
#include <kcenon/unified_fs/core/path_identity.h>
#include <kcenon/unified_fs/events/event_bus.h>
#include <kcenon/unified_fs/provider/filesystem_provider.h>

namespace kcenon::unified_fs {

namespace {

constexpr unsigned max_suffix = 10000;

}  // namespace

conflict_resolver::conflict_resolver(request_id request, overwrite_policy policy, event_bus* events)
    : request_(request), policy_(policy), events_(events) {}

auto conflict_resolver::decide_without_prompt() const -> std::optional<conflict_action> {
    switch (policy_) {
        case overwrite_policy::skip:
            return conflict_action::skip;
        case overwrite_policy::overwrite:
            return conflict_action::overwrite;
        case overwrite_policy::rename_with_suffix:
            return conflict_action::rename;
        case overwrite_policy::prompt:
        default: {
            std::lock_guard<std::mutex> lock(mutex_);
            return sticky_;
        }
    }
}

auto conflict_resolver::ask(const std::string& source_path,
                            const std::string& destination_path,
                            const entry_metadata& existing) -> std::shared_ptr<decision_channel> {
    if (events_ == nullptr || events_->subscriber_count() == 0) {
        UFS_LOG_DEBUG(log_category::transfer,
                      "No subscriber to decide on " + destination_path + ", skipping");
        return nullptr;
    }

    auto channel = std::make_shared<decision_channel>();
    decision_request_event prompt;
    prompt.request = request_;
    prompt.source_path = source_path;
    prompt.destination_path = destination_path;
    prompt.existing = existing;
    prompt.channel = channel;
    events_->publish(std::move(prompt));
    return channel;
}

auto conflict_resolver::record(const conflict_decision& decision) -> void {
    if (!decision.apply_to_all) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sticky_) {
        sticky_ = decision.action;
    }
}

auto conflict_resolver::free_name(filesystem_provider& provider, const std::string& destination)
    -> result<std::string> {
    auto kind = provider.handle().kind();
    auto dir = path_identity::parent(kind, destination);
    auto name = path_identity::filename(kind, destination);

    for (unsigned n = 1; n <= max_suffix; ++n) {
        auto candidate = path_identity::join(kind, dir, path_identity::with_collision_suffix(name, n));
        auto existing = provider.probe(candidate);
        if (!existing) {
            return unexpected{existing.error()};
        }
        if (!existing.value()) {
            return candidate;
        }
    }
    return unexpected{error{error_code::name_collision,
                            "no free name left for " + destination}};
}

}  // namespace kcenon::unified_fs
