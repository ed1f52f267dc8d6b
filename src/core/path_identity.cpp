/**
 * @file path_identity.cpp
 * @brief Implementation of path normalization and comparison
 */

#include <kcenon/unified_fs/core/path_identity.h>

#include <filesystem>
#include <vector>

namespace kcenon::unified_fs {

namespace {

constexpr std::string_view forbidden_filename_chars = "<>\"/\\|*?:";

auto split_components(std::string_view path) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        auto part = path.substr(pos, next - pos);
        if (!part.empty()) {
            parts.push_back(part);
        }
        pos = next + 1;
    }
    return parts;
}

auto normalize_posix(std::string_view path) -> std::string {
    std::vector<std::string_view> stack;
    for (auto part : split_components(path)) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            // ".." at the root stays at the root
            if (!stack.empty()) {
                stack.pop_back();
            }
            continue;
        }
        stack.push_back(part);
    }

    std::string out;
    for (auto part : stack) {
        out += '/';
        out += part;
    }
    return out.empty() ? std::string("/") : out;
}

auto normalize_local(std::string_view path) -> std::string {
    if (path.empty()) {
        return ".";
    }
    auto normal = std::filesystem::path(std::string(path)).lexically_normal().generic_string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal.empty() ? std::string(".") : normal;
}

}  // namespace

auto path_identity::normalize(provider_kind kind, std::string_view path) -> std::string {
    return kind == provider_kind::remote ? normalize_posix(path) : normalize_local(path);
}

auto path_identity::join(provider_kind kind,
                         std::string_view base,
                         std::string_view relative) -> std::string {
    if (relative.empty()) {
        return normalize(kind, base);
    }
    std::string combined(base);
    if (combined.empty() || combined.back() != '/') {
        combined += '/';
    }
    combined += relative;
    return normalize(kind, combined);
}

auto path_identity::parent(provider_kind kind, std::string_view path) -> std::string {
    auto normal = normalize(kind, path);
    if (normal == "/" || normal == ".") {
        return normal;
    }
    auto sep = normal.find_last_of('/');
    if (sep == std::string::npos) {
        return ".";
    }
    if (sep == 0) {
        return "/";
    }
    return normal.substr(0, sep);
}

auto path_identity::filename(provider_kind kind, std::string_view path) -> std::string {
    auto normal = normalize(kind, path);
    if (normal == "/" || normal == ".") {
        return {};
    }
    auto sep = normal.find_last_of('/');
    return sep == std::string::npos ? normal : normal.substr(sep + 1);
}

auto path_identity::relative(provider_kind kind,
                             std::string_view base,
                             std::string_view path) -> std::optional<std::string> {
    auto normal_base = normalize(kind, base);
    auto normal_path = normalize(kind, path);

    if (normal_base == normal_path) {
        return std::string{};
    }
    if (normal_base == "/") {
        if (normal_path.front() != '/') {
            return std::nullopt;
        }
        return normal_path.substr(1);
    }
    if (normal_path.size() <= normal_base.size() ||
        normal_path.compare(0, normal_base.size(), normal_base) != 0 ||
        normal_path[normal_base.size()] != '/') {
        return std::nullopt;
    }
    return normal_path.substr(normal_base.size() + 1);
}

auto path_identity::is_within(provider_kind kind,
                              std::string_view base,
                              std::string_view path) -> bool {
    return relative(kind, base, path).has_value();
}

auto path_identity::same_entry(const provider_handle& a,
                               std::string_view a_path,
                               const provider_handle& b,
                               std::string_view b_path) -> bool {
    return a == b && normalize(a.kind(), a_path) == normalize(b.kind(), b_path);
}

auto path_identity::with_collision_suffix(std::string_view name, unsigned n) -> std::string {
    auto suffix = " (" + std::to_string(n) + ")";
    auto dot = name.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0) {
        return std::string(name) + suffix;
    }
    return std::string(name.substr(0, dot)) + suffix + std::string(name.substr(dot));
}

auto path_identity::is_valid_filename(std::string_view name) -> bool {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    for (char c : name) {
        if (static_cast<unsigned char>(c) < 0x20 ||
            forbidden_filename_chars.find(c) != std::string_view::npos) {
            return false;
        }
    }
    return true;
}

auto path_identity::to_display_uri(const provider_handle& handle,
                                   std::string_view path) -> std::string {
    const auto& endpoint = handle.endpoint();
    if (!endpoint) {
        return std::string(path);
    }
    std::string uri = "sftp://";
    if (!endpoint->username.empty()) {
        uri += endpoint->username + "@";
    }
    uri += endpoint->host + ":" + std::to_string(endpoint->port);
    uri += normalize(provider_kind::remote, path);
    return uri;
}

}  // namespace kcenon::unified_fs
