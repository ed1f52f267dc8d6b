/**
 * @file operation_request.cpp
 * @brief Implementation of operation_request and its builder
 */

#include <kcenon/unified_fs/queue/operation_request.h>
#include <kcenon/unified_fs/core/path_identity.h>

#include <algorithm>

namespace kcenon::unified_fs {

namespace {

auto invalid(const std::string& message) -> unexpected {
    return unexpected{error{error_code::invalid_argument, message}};
}

}  // namespace

operation_request::builder::builder(operation_kind kind) : kind_(kind) {}

auto operation_request::builder::add_source(provider_handle provider, std::string path)
    -> builder& {
    sources_.push_back(location{std::move(provider), std::move(path)});
    return *this;
}

auto operation_request::builder::with_destination(provider_handle provider, std::string path)
    -> builder& {
    destination_ = location{std::move(provider), std::move(path)};
    return *this;
}

auto operation_request::builder::with_overwrite(overwrite_policy policy) -> builder& {
    options_.overwrite = policy;
    return *this;
}

auto operation_request::builder::with_recursive(bool enable) -> builder& {
    options_.recursive = enable;
    return *this;
}

auto operation_request::builder::with_preserve_timestamps(bool enable) -> builder& {
    options_.preserve_timestamps = enable;
    return *this;
}

auto operation_request::builder::with_abort_on_error(bool enable) -> builder& {
    options_.abort_on_error = enable;
    return *this;
}

auto operation_request::builder::with_verify_checksum(bool enable) -> builder& {
    options_.verify_checksum = enable;
    return *this;
}

auto operation_request::builder::with_options(const operation_options& options) -> builder& {
    options_ = options;
    return *this;
}

auto operation_request::builder::build() -> result<operation_request> {
    if (sources_.empty()) {
        return invalid(std::string(to_string(kind_)) + " needs at least one source");
    }
    for (const auto& source : sources_) {
        if (source.path.empty()) {
            return invalid("source path is empty");
        }
    }

    switch (kind_) {
        case operation_kind::copy:
        case operation_kind::move:
            if (!destination_ || destination_->path.empty()) {
                return invalid(std::string(to_string(kind_)) + " needs a destination directory");
            }
            for (const auto& source : sources_) {
                auto kind = source.provider.kind();
                if (source.provider == destination_->provider &&
                    path_identity::is_within(kind, source.path, destination_->path)) {
                    return invalid("destination " + destination_->path + " is inside source " +
                                   source.path);
                }
            }
            break;

        case operation_kind::rename: {
            if (sources_.size() != 1) {
                return invalid("rename takes exactly one source");
            }
            if (!destination_ || destination_->path.empty()) {
                return invalid("rename needs the new path");
            }
            if (!(destination_->provider == sources_.front().provider)) {
                return invalid("rename cannot cross providers");
            }
            auto name = path_identity::filename(destination_->provider.kind(), destination_->path);
            if (!path_identity::is_valid_filename(name)) {
                return invalid("invalid file name: '" + name + "'");
            }
            break;
        }

        case operation_kind::mkdir: {
            if (sources_.size() != 1) {
                return invalid("mkdir takes exactly one path");
            }
            if (destination_) {
                return invalid("mkdir takes no destination");
            }
            const auto& target = sources_.front();
            auto name = path_identity::filename(target.provider.kind(), target.path);
            if (!path_identity::is_valid_filename(name)) {
                return invalid("invalid directory name: '" + name + "'");
            }
            break;
        }

        case operation_kind::list:
            if (sources_.size() != 1) {
                return invalid("list takes exactly one directory");
            }
            if (destination_) {
                return invalid("list takes no destination");
            }
            break;

        case operation_kind::remove:
            if (destination_) {
                return invalid("remove takes no destination");
            }
            break;

        default:
            return invalid("unknown operation kind");
    }

    return operation_request(kind_, std::move(sources_), std::move(destination_), options_);
}

operation_request::operation_request(operation_kind kind,
                                     std::vector<location> sources,
                                     std::optional<location> destination,
                                     operation_options options)
    : kind_(kind)
    , sources_(std::move(sources))
    , destination_(std::move(destination))
    , options_(options) {}

auto operation_request::providers() const -> std::vector<provider_handle> {
    std::vector<provider_handle> out;
    auto add = [&out](const provider_handle& handle) {
        if (std::find(out.begin(), out.end(), handle) == out.end()) {
            out.push_back(handle);
        }
    };
    for (const auto& source : sources_) {
        add(source.provider);
    }
    if (destination_) {
        add(destination_->provider);
    }
    return out;
}

auto operation_request::with_id(request_id id) const -> operation_request {
    operation_request copy = *this;
    copy.id_ = id;
    return copy;
}

}  // namespace kcenon::unified_fs
