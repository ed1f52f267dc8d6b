/**
 * @file copy_tree.cpp
 * @brief Recursive local copy with progress and collision prompts
 *
 * This example demonstrates:
 * - Building a file_manager_core
 * - Submitting a recursive copy request
 * - Following progress events
 * - Answering collision prompts from the console
 *
 * Usage: copy_tree <source> <destination-directory> [skip|overwrite|rename|prompt]
 */

#include <kcenon/unified_fs/unified_fs.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>

using namespace kcenon::unified_fs;

namespace {

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto parse_policy(const std::string& name) -> overwrite_policy {
    if (name == "overwrite") {
        return overwrite_policy::overwrite;
    }
    if (name == "rename") {
        return overwrite_policy::rename_with_suffix;
    }
    if (name == "prompt") {
        return overwrite_policy::prompt;
    }
    return overwrite_policy::skip;
}

auto ask_user(const decision_request_event& prompt) -> conflict_decision {
    std::cout << "\n" << prompt.destination_path << " already exists ("
              << format_bytes(prompt.existing->size()) << ").\n"
              << "[s]kip, [o]verwrite, [r]ename, [c]ancel; uppercase applies to all: ";
    std::string answer;
    std::getline(std::cin, answer);
    char c = answer.empty() ? 's' : answer.front();
    bool all = std::isupper(static_cast<unsigned char>(c)) != 0;
    switch (std::tolower(static_cast<unsigned char>(c))) {
        case 'o':
            return {conflict_action::overwrite, all};
        case 'r':
            return {conflict_action::rename, all};
        case 'c':
            return {conflict_action::cancel, false};
        default:
            return {conflict_action::skip, all};
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0]
                  << " <source> <destination-directory> [skip|overwrite|rename|prompt]\n";
        return 1;
    }

    auto core_result = file_manager_core::builder()
                           .with_worker_count(2)
                           .with_chunk_size(256 * 1024)
                           .build();
    if (!core_result) {
        std::cerr << "Failed to create core: " << core_result.error().describe() << "\n";
        return 1;
    }
    auto& core = core_result.value();

    std::atomic<uint64_t> last_reported{0};
    auto subscription = core.subscribe([&](const event& e) {
        if (const auto* progress = std::get_if<progress_event>(&e)) {
            // One line per MiB keeps the console readable
            if (progress->batch_bytes_so_far - last_reported.load() >= 1024 * 1024 ||
                progress->batch_bytes_so_far == progress->batch_bytes_total) {
                last_reported = progress->batch_bytes_so_far;
                std::cout << "[" << progress->item_index + 1 << "/" << progress->item_count
                          << "] " << format_bytes(progress->batch_bytes_so_far) << " / "
                          << format_bytes(progress->batch_bytes_total) << "\n";
            }
        } else if (const auto* prompt = std::get_if<decision_request_event>(&e)) {
            (void)prompt->respond(ask_user(*prompt));
        }
    });

    auto request = operation_request::builder(operation_kind::copy)
                       .add_source(file_manager_core::local_handle(), argv[1])
                       .with_destination(file_manager_core::local_handle(), argv[2])
                       .with_recursive(true)
                       .with_preserve_timestamps(true)
                       .with_overwrite(parse_policy(argc > 3 ? argv[3] : "skip"))
                       .build();
    if (!request) {
        std::cerr << "Invalid request: " << request.error().describe() << "\n";
        return 1;
    }

    auto id = core.submit(request.value());
    auto outcome = core.wait(id, std::chrono::hours{24});
    (void)core.flush_events();
    (void)core.unsubscribe(subscription);

    if (!outcome) {
        std::cerr << "Timed out waiting for " << id.to_string() << "\n";
        return 1;
    }

    const auto& r = *outcome;
    std::cout << "\n" << id.to_string() << " " << to_string(r.status) << ": "
              << r.count(item_outcome::succeeded) << " copied, "
              << r.count(item_outcome::skipped) << " skipped, "
              << r.count(item_outcome::failed) << " failed, "
              << format_bytes(r.bytes_transferred) << " in " << r.wall_time.count() << " ms\n";

    for (const auto& item : r.items) {
        if (item.outcome == item_outcome::failed && item.reason) {
            std::cout << "  " << item.source << ": " << item.reason->describe() << "\n";
        }
    }
    return r.status == operation_status::completed ? 0 : 2;
}
