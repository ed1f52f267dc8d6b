/**
 * @file entry_metadata.cpp
 * @brief Implementation of entry_metadata
 */

#include <kcenon/unified_fs/core/entry_metadata.h>
#include <kcenon/unified_fs/core/path_identity.h>

namespace kcenon::unified_fs {

entry_metadata::entry_metadata(provider_handle owner,
                               std::string parent,
                               std::string name,
                               entry_kind kind,
                               uint64_t size,
                               file_time modified,
                               uint32_t permissions,
                               std::optional<std::string> link_target)
    : owner_(std::move(owner))
    , parent_(path_identity::normalize(owner_.kind(), parent))
    , name_(std::move(name))
    , path_(path_identity::join(owner_.kind(), parent_, name_))
    , kind_(kind)
    , size_(size)
    , modified_(modified)
    , permissions_(permissions & 07777)
    , link_target_(kind == entry_kind::symlink ? std::move(link_target) : std::nullopt) {}

}  // namespace kcenon::unified_fs
