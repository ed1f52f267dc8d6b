/**
 * @file unified_fs.h
 * @brief Main header for unified_fs_system library
 * @version 0.1.0
 *
 * Include this header to access the whole filesystem core: providers,
 * remote sessions, listing, transfers and the request queue.
 *
 * @code
 * #include <kcenon/unified_fs/unified_fs.h>
 *
 * using namespace kcenon::unified_fs;
 *
 * auto core = file_manager_core::builder()
 *     .with_worker_count(4)
 *     .build();
 * @endcode
 */

#ifndef KCENON_UNIFIED_FS_UNIFIED_FS_H
#define KCENON_UNIFIED_FS_UNIFIED_FS_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/unified_fs/core/types.h"
#include "kcenon/unified_fs/core/entry_metadata.h"
#include "kcenon/unified_fs/core/operation_types.h"
#include "kcenon/unified_fs/core/path_identity.h"
#include "kcenon/unified_fs/core/provider_handle.h"

// Facade
#include "kcenon/unified_fs/core/file_manager_core.h"

// Providers
#include "kcenon/unified_fs/provider/filesystem_provider.h"
#include "kcenon/unified_fs/provider/local_provider.h"

// Events
#include "kcenon/unified_fs/events/event_types.h"

// Adapters
#include "kcenon/unified_fs/adapters/thread_pool_adapter.h"

namespace kcenon::unified_fs {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_UNIFIED_FS_H
