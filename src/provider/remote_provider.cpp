/**
 * @file remote_provider.cpp
 * @brief Implementation of remote_provider
 */

#include <kcenon/unified_fs/provider/remote_provider.h>
#include <kcenon/unified_fs/core/logging.h>
#include <kcenon/unified_fs/core/path_identity.h>

#include <algorithm>

namespace kcenon::unified_fs {

namespace {

auto make_entry(const provider_handle& owner,
                const std::string& parent,
                const std::string& name,
                const sftp::file_attributes& attrs,
                std::optional<std::string> target) -> entry_metadata {
    return entry_metadata(owner, parent, name, attrs.kind,
                          attrs.kind == entry_kind::file ? attrs.size : 0, attrs.modified,
                          attrs.permissions, std::move(target));
}

class remote_directory_stream : public directory_stream {
public:
    remote_directory_stream(std::shared_ptr<remote_connection> connection,
                            uint64_t generation,
                            std::string path,
                            std::unique_ptr<sftp::remote_directory> dir)
        : connection_(std::move(connection))
        , generation_(generation)
        , path_(std::move(path))
        , dir_(std::move(dir)) {}

    ~remote_directory_stream() override {
        connection_->with_io_lock([this] { dir_.reset(); });
    }

    auto next() -> result<std::optional<entry_metadata>> override {
        while (true) {
            auto entry = connection_->execute_bound(
                generation_, [this](sftp::sftp_session&) { return dir_->next(); });
            if (!entry) {
                return unexpected{entry.error()};
            }
            if (!entry.value()) {
                return std::optional<entry_metadata>{};
            }

            auto& item = *entry.value();
            if (item.name == "." || item.name == ".." || item.name.empty()) {
                continue;
            }

            std::optional<std::string> target;
            if (item.attributes.kind == entry_kind::symlink) {
                auto full = path_identity::join(provider_kind::remote, path_, item.name);
                auto link = connection_->execute_bound(
                    generation_, [&full](sftp::sftp_session& s) { return s.read_link(full); });
                if (link) {
                    target = std::move(link.value());
                } else if (link.error().code == error_code::connectivity_error) {
                    return unexpected{link.error()};
                }
            }
            return std::optional<entry_metadata>{
                make_entry(connection_->handle(), path_, item.name, item.attributes, target)};
        }
    }

private:
    std::shared_ptr<remote_connection> connection_;
    uint64_t generation_;
    std::string path_;
    std::unique_ptr<sftp::remote_directory> dir_;
};

class remote_byte_source : public byte_source {
public:
    remote_byte_source(std::shared_ptr<remote_connection> connection,
                       uint64_t generation,
                       std::unique_ptr<sftp::remote_file> file)
        : connection_(std::move(connection)), generation_(generation), file_(std::move(file)) {}

    ~remote_byte_source() override {
        connection_->with_io_lock([this] {
            auto closed = file_->close();
            if (!closed) {
                UFS_LOG_DEBUG(log_category::provider,
                              "Closing remote file failed: " + closed.error().describe());
            }
            file_.reset();
        });
    }

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        return connection_->execute_bound(
            generation_, [this, buffer](sftp::sftp_session&) { return file_->read(buffer); });
    }

private:
    std::shared_ptr<remote_connection> connection_;
    uint64_t generation_;
    std::unique_ptr<sftp::remote_file> file_;
};

class remote_byte_sink : public byte_sink {
public:
    remote_byte_sink(std::shared_ptr<remote_connection> connection,
                     uint64_t generation,
                     std::string path,
                     std::unique_ptr<sftp::remote_file> file)
        : connection_(std::move(connection))
        , generation_(generation)
        , path_(std::move(path))
        , file_(std::move(file)) {}

    ~remote_byte_sink() override {
        connection_->with_io_lock([this] {
            if (!committed_) {
                auto closed = file_->close();
                if (!closed) {
                    UFS_LOG_DEBUG(log_category::provider,
                                  "Closing " + path_ + " failed: " + closed.error().describe());
                }
            }
            file_.reset();
        });
    }

    auto write(std::span<const std::byte> data) -> result<void> override {
        if (committed_) {
            return unexpected{error{error_code::invalid_argument, "sink already committed: " + path_}};
        }
        return connection_->execute_bound(
            generation_, [this, data](sftp::sftp_session&) -> result<void> {
                std::size_t offset = 0;
                while (offset < data.size()) {
                    auto n = file_->write(data.subspan(offset));
                    if (!n) {
                        return unexpected{n.error()};
                    }
                    if (n.value() == 0) {
                        return unexpected{error{error_code::unknown_failure,
                                                "server accepted no data for " + path_}};
                    }
                    offset += n.value();
                }
                return {};
            });
    }

    auto commit() -> result<void> override {
        if (committed_) {
            return {};
        }
        auto done = connection_->execute_bound(
            generation_, [this](sftp::sftp_session&) -> result<void> {
                auto synced = file_->sync();
                if (!synced) {
                    return synced;
                }
                return file_->close();
            });
        if (done) {
            committed_ = true;
        }
        return done;
    }

private:
    std::shared_ptr<remote_connection> connection_;
    uint64_t generation_;
    std::string path_;
    std::unique_ptr<sftp::remote_file> file_;
    bool committed_ = false;
};

}  // namespace

remote_provider::remote_provider(std::shared_ptr<remote_connection> connection,
                                 std::size_t multiplexed_concurrency)
    : connection_(std::move(connection))
    , multiplexed_concurrency_(std::max<std::size_t>(1, multiplexed_concurrency)) {}

auto remote_provider::handle() const -> const provider_handle& {
    return connection_->handle();
}

auto remote_provider::capabilities() const -> provider_capabilities {
    bool multiplexed = connection_->multiplexed();
    return provider_capabilities{multiplexed ? multiplexed_concurrency_ : 1, multiplexed};
}

auto remote_provider::lstat(const std::string& path) -> result<sftp::file_attributes> {
    return connection_->execute([&path](sftp::sftp_session& s) { return s.lstat(path); });
}

auto remote_provider::open_directory(const std::string& path)
    -> result<std::unique_ptr<directory_stream>> {
    auto normal = path_identity::normalize(provider_kind::remote, path);
    uint64_t generation = 0;
    auto dir = connection_->execute([&](sftp::sftp_session& s) {
        generation = connection_->generation();
        return s.open_directory(normal);
    });
    if (!dir) {
        return unexpected{dir.error()};
    }
    return std::unique_ptr<directory_stream>(std::make_unique<remote_directory_stream>(
        connection_, generation, normal, std::move(dir.value())));
}

auto remote_provider::stat(const std::string& path) -> result<entry_metadata> {
    auto normal = path_identity::normalize(provider_kind::remote, path);
    auto attrs = lstat(normal);
    if (!attrs) {
        return unexpected{attrs.error()};
    }

    std::optional<std::string> target;
    if (attrs.value().kind == entry_kind::symlink) {
        auto link = connection_->execute([&normal](sftp::sftp_session& s) {
            return s.read_link(normal);
        });
        if (link) {
            target = std::move(link.value());
        } else if (link.error().code == error_code::connectivity_error) {
            return unexpected{link.error()};
        }
    }
    return make_entry(handle(), path_identity::parent(provider_kind::remote, normal),
                      path_identity::filename(provider_kind::remote, normal), attrs.value(),
                      std::move(target));
}

auto remote_provider::open_for_read(const std::string& path)
    -> result<std::unique_ptr<byte_source>> {
    auto normal = path_identity::normalize(provider_kind::remote, path);
    auto attrs = lstat(normal);
    if (!attrs) {
        return unexpected{attrs.error()};
    }
    if (attrs.value().kind == entry_kind::directory) {
        return unexpected{error{error_code::invalid_argument, "cannot read a directory: " + normal}};
    }

    uint64_t generation = 0;
    auto file = connection_->execute([&](sftp::sftp_session& s) {
        generation = connection_->generation();
        return s.open_file(normal, sftp::open_mode::read);
    });
    if (!file) {
        return unexpected{file.error()};
    }
    return std::unique_ptr<byte_source>(
        std::make_unique<remote_byte_source>(connection_, generation, std::move(file.value())));
}

auto remote_provider::open_for_write(const std::string& path, write_mode mode)
    -> result<std::unique_ptr<byte_sink>> {
    auto normal = path_identity::normalize(provider_kind::remote, path);
    auto open_as = sftp::open_mode::write_truncate;
    if (mode == write_mode::append) {
        open_as = sftp::open_mode::write_append;
    } else if (mode == write_mode::create_new) {
        open_as = sftp::open_mode::write_exclusive;
    }
    uint64_t generation = 0;
    auto file = connection_->execute([&](sftp::sftp_session& s) {
        generation = connection_->generation();
        return s.open_file(normal, open_as);
    });
    if (!file) {
        return unexpected{file.error()};
    }
    return std::unique_ptr<byte_sink>(std::make_unique<remote_byte_sink>(
        connection_, generation, normal, std::move(file.value())));
}

auto remote_provider::remove(const std::string& path) -> result<void> {
    auto normal = path_identity::normalize(provider_kind::remote, path);
    auto removed = connection_->execute([&normal](sftp::sftp_session& s) -> result<void> {
        auto attrs = s.lstat(normal);
        if (!attrs) {
            return unexpected{attrs.error()};
        }
        if (attrs.value().kind == entry_kind::directory) {
            return s.remove_directory(normal);
        }
        return s.remove_file(normal);
    });
    if (removed) {
        UFS_LOG_DEBUG(log_category::provider, "Removed " + normal + " on " + handle().label());
    }
    return removed;
}

auto remote_provider::rename(const std::string& from, const std::string& to, bool replace_existing)
    -> result<void> {
    auto src = path_identity::normalize(provider_kind::remote, from);
    auto dst = path_identity::normalize(provider_kind::remote, to);
    return connection_->execute([&](sftp::sftp_session& s) -> result<void> {
        auto existing = s.lstat(dst);
        if (existing) {
            if (!replace_existing) {
                return unexpected{error{error_code::name_collision, "target exists: " + dst}};
            }
            // SSH_FXP_RENAME refuses to overwrite; drop the target first
            auto dropped = existing.value().kind == entry_kind::directory
                               ? s.remove_directory(dst)
                               : s.remove_file(dst);
            if (!dropped) {
                return dropped;
            }
        } else if (existing.error().code != error_code::not_found) {
            return unexpected{existing.error()};
        }
        return s.rename(src, dst);
    });
}

auto remote_provider::mkdir(const std::string& path, bool recursive) -> result<void> {
    auto normal = path_identity::normalize(provider_kind::remote, path);
    return connection_->execute([&](sftp::sftp_session& s) -> result<void> {
        if (!recursive) {
            auto existing = s.lstat(normal);
            if (existing) {
                return unexpected{error{error_code::name_collision, "entry exists: " + normal}};
            }
            if (existing.error().code != error_code::not_found) {
                return unexpected{existing.error()};
            }
            return s.make_directory(normal);
        }

        std::string current;
        std::size_t pos = 1;
        while (pos <= normal.size()) {
            auto next = normal.find('/', pos);
            if (next == std::string::npos) {
                next = normal.size();
            }
            current = normal.substr(0, next);
            pos = next + 1;
            if (current.empty() || current == "/") {
                continue;
            }

            auto existing = s.lstat(current);
            if (existing) {
                if (existing.value().kind != entry_kind::directory) {
                    return unexpected{error{error_code::not_a_directory,
                                            "path exists and is not a directory: " + current}};
                }
                continue;
            }
            if (existing.error().code != error_code::not_found) {
                return unexpected{existing.error()};
            }
            auto made = s.make_directory(current);
            if (!made) {
                return made;
            }
        }
        return {};
    });
}

auto remote_provider::set_modified_time(const std::string& path, file_time time)
    -> result<void> {
    auto normal = path_identity::normalize(provider_kind::remote, path);
    return connection_->execute([&](sftp::sftp_session& s) {
        return s.set_modified_time(normal, time);
    });
}

}  // namespace kcenon::unified_fs
