/**
 * @file sftp_browse.cpp
 * @brief Connect to an SFTP server and browse a directory page by page
 *
 * This example demonstrates:
 * - Registering a credential and connecting a remote endpoint
 * - Watching connection state changes
 * - Paged listing of a remote directory
 *
 * Usage: sftp_browse <user@host[:port]> <path> [page-size]
 * The password is read from the UFS_PASSWORD environment variable; without
 * it the SSH agent is used.
 */

#include <kcenon/unified_fs/unified_fs.h>
#include <kcenon/unified_fs/sftp/sftp_session.h>

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <variant>

using namespace kcenon::unified_fs;

namespace {

auto parse_target(const std::string& target) -> std::optional<remote_endpoint> {
    auto at = target.find('@');
    if (at == std::string::npos || at == 0) {
        return std::nullopt;
    }
    remote_endpoint ep;
    ep.username = target.substr(0, at);
    auto host = target.substr(at + 1);
    auto colon = host.rfind(':');
    if (colon != std::string::npos) {
        ep.port = static_cast<uint16_t>(std::strtoul(host.c_str() + colon + 1, nullptr, 10));
        host.resize(colon);
    }
    if (host.empty() || ep.port == 0) {
        return std::nullopt;
    }
    ep.host = host;
    ep.credential = credential_ref{"cli"};
    return ep;
}

auto format_time(file_time t) -> std::string {
    auto raw = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&raw, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return oss.str();
}

auto print_entry(const entry_metadata& entry) -> void {
    char type = entry.is_directory() ? 'd' : entry.is_symlink() ? 'l' : '-';
    std::cout << type << " " << std::setw(12) << entry.size() << "  "
              << format_time(entry.modified()) << "  " << entry.name();
    if (entry.link_target()) {
        std::cout << " -> " << *entry.link_target();
    }
    std::cout << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <user@host[:port]> <path> [page-size]\n";
        return 1;
    }

    auto endpoint = parse_target(argv[1]);
    if (!endpoint) {
        std::cerr << "Cannot parse target '" << argv[1] << "'\n";
        return 1;
    }
    endpoint->initial_path = argv[2];
    std::size_t page_size = argc > 3 ? std::strtoul(argv[3], nullptr, 10) : 50;

    auto credentials = std::make_shared<sftp::static_credential_store>();
    sftp::credential secret;
    if (const char* password = std::getenv("UFS_PASSWORD")) {
        secret.password = password;
    } else {
        secret.use_agent = true;
    }
    credentials->add("cli", secret);

    auto core_result = file_manager_core::builder()
                           .with_credential_store(credentials)
                           .with_connect_timeout(std::chrono::seconds{15})
                           .build();
    if (!core_result) {
        std::cerr << "Failed to create core: " << core_result.error().describe() << "\n";
        return 1;
    }
    auto& core = core_result.value();

    (void)core.subscribe([](const event& e) {
        if (const auto* change = std::get_if<connectivity_event>(&e)) {
            std::cerr << "[" << change->handle.label() << "] "
                      << to_string(change->state);
            if (change->reason) {
                std::cerr << ": " << change->reason->describe();
            }
            std::cerr << "\n";
        }
    });

    auto handle = core.connect(*endpoint);
    if (!handle) {
        std::cerr << "Connect failed: " << handle.error().describe() << "\n";
        return 1;
    }

    auto listing = core.list(handle.value(), argv[2], page_size);
    if (!listing) {
        std::cerr << "Cannot list " << argv[2] << ": " << listing.error().describe() << "\n";
        (void)core.disconnect(handle.value());
        return 1;
    }

    auto& entries = listing.value();
    std::size_t page_number = 0;
    while (!entries.exhausted()) {
        auto page = entries.next_page();
        if (!page) {
            std::cerr << "Listing interrupted: " << page.error().describe() << "\n";
            break;
        }
        if (page.value().empty()) {
            break;
        }
        std::cout << "-- page " << ++page_number << " --\n";
        for (const auto& entry : page.value()) {
            print_entry(entry);
        }
    }
    std::cout << entries.consumed() << " entries\n";

    (void)core.disconnect(handle.value());
    (void)core.flush_events();
    return 0;
}
