/**
 * @file local_provider.cpp
 * @brief Native file I/O provider
 */

#include <kcenon/unified_fs/provider/local_provider.h>
#include <kcenon/unified_fs/core/logging.h>
#include <kcenon/unified_fs/core/path_identity.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <system_error>
#include <thread>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kcenon::unified_fs {

namespace {

auto to_file_time(const struct timespec& ts) -> file_time {
    auto since_epoch = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return file_time(std::chrono::duration_cast<file_time::duration>(since_epoch));
}

auto to_timespec(file_time time) -> struct timespec {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch());
    auto secs = std::chrono::floor<std::chrono::seconds>(ns);
    struct timespec ts {};
    ts.tv_sec = static_cast<time_t>(secs.count());
    ts.tv_nsec = static_cast<long>((ns - secs).count());
    return ts;
}

auto kind_of(mode_t mode) -> entry_kind {
    if (S_ISREG(mode)) return entry_kind::file;
    if (S_ISDIR(mode)) return entry_kind::directory;
    if (S_ISLNK(mode)) return entry_kind::symlink;
    return entry_kind::special;
}

auto read_link_target(const std::string& path) -> std::optional<std::string> {
    std::error_code ec;
    auto target = std::filesystem::read_symlink(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return target.string();
}

auto make_entry(const std::string& parent, const std::string& name, const struct stat& st)
    -> entry_metadata {
    auto kind = kind_of(st.st_mode);
    std::optional<std::string> target;
    if (kind == entry_kind::symlink) {
        target = read_link_target(path_identity::join(provider_kind::local, parent, name));
    }
    return entry_metadata(provider_handle::local(), parent, name, kind,
                          kind == entry_kind::file ? static_cast<uint64_t>(st.st_size) : 0,
                          to_file_time(st.st_mtim), static_cast<uint32_t>(st.st_mode), target);
}

struct dir_closer {
    void operator()(DIR* dir) const noexcept { ::closedir(dir); }
};

class local_directory_stream : public directory_stream {
public:
    local_directory_stream(std::string path, DIR* dir) : path_(std::move(path)), dir_(dir) {}

    auto next() -> result<std::optional<entry_metadata>> override {
        while (true) {
            errno = 0;
            struct dirent* ent = ::readdir(dir_.get());
            if (ent == nullptr) {
                if (errno != 0) {
                    return unexpected{error_from_errno(errno, "cannot read directory " + path_)};
                }
                return std::optional<entry_metadata>{};
            }

            std::string name = ent->d_name;
            if (name == "." || name == "..") {
                continue;
            }

            struct stat st {};
            auto full = path_identity::join(provider_kind::local, path_, name);
            if (::lstat(full.c_str(), &st) != 0) {
                if (errno == ENOENT) {
                    // Removed between readdir and lstat
                    continue;
                }
                return unexpected{error_from_errno(errno, "cannot stat " + full)};
            }
            return std::optional<entry_metadata>{make_entry(path_, name, st)};
        }
    }

private:
    std::string path_;
    std::unique_ptr<DIR, dir_closer> dir_;
};

class fd_guard {
public:
    explicit fd_guard(int fd) : fd_(fd) {}
    ~fd_guard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    fd_guard(const fd_guard&) = delete;
    fd_guard& operator=(const fd_guard&) = delete;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }

    /**
     * @brief Close now and report the result
     */
    auto close() -> int {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

class local_byte_source : public byte_source {
public:
    local_byte_source(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        while (true) {
            auto n = ::read(fd_.get(), buffer.data(), buffer.size());
            if (n >= 0) {
                return static_cast<std::size_t>(n);
            }
            if (errno != EINTR) {
                return unexpected{error_from_errno(errno, "read failed: " + path_)};
            }
        }
    }

private:
    std::string path_;
    fd_guard fd_;
};

class local_byte_sink : public byte_sink {
public:
    local_byte_sink(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

    auto write(std::span<const std::byte> data) -> result<void> override {
        if (fd_.get() < 0) {
            return unexpected{error{error_code::invalid_argument, "sink already committed: " + path_}};
        }
        std::size_t offset = 0;
        while (offset < data.size()) {
            auto n = ::write(fd_.get(), data.data() + offset, data.size() - offset);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return unexpected{error_from_errno(errno, "write failed: " + path_)};
            }
            offset += static_cast<std::size_t>(n);
        }
        return {};
    }

    auto commit() -> result<void> override {
        if (fd_.get() < 0) {
            return {};
        }
        if (::fsync(fd_.get()) != 0) {
            return unexpected{error_from_errno(errno, "fsync failed: " + path_)};
        }
        if (fd_.close() != 0) {
            return unexpected{error_from_errno(errno, "close failed: " + path_)};
        }
        return {};
    }

private:
    std::string path_;
    fd_guard fd_;
};

}  // namespace

auto error_from_errno(int err, const std::string& what) -> error {
    auto cause = std::generic_category().message(err);
    switch (err) {
        case ENOENT:
            return error{error_code::not_found, what, cause};
        case EACCES:
        case EPERM:
        case EROFS:
            return error{error_code::permission_denied, what, cause};
        case EEXIST:
            return error{error_code::name_collision, what, cause};
        case ENOTEMPTY:
            return error{error_code::directory_not_empty, what, cause};
        case ENOTDIR:
            return error{error_code::not_a_directory, what, cause};
        case EISDIR:
        case EINVAL:
        case ENAMETOOLONG:
            return error{error_code::invalid_argument, what, cause};
        default:
            return error{error_code::unknown_failure, what, cause};
    }
}

local_provider::local_provider(std::size_t max_concurrency)
    : handle_(provider_handle::local()), max_concurrency_(max_concurrency) {
    if (max_concurrency_ == 0) {
        max_concurrency_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

auto local_provider::handle() const -> const provider_handle& {
    return handle_;
}

auto local_provider::capabilities() const -> provider_capabilities {
    return provider_capabilities{max_concurrency_, true};
}

auto local_provider::open_directory(const std::string& path)
    -> result<std::unique_ptr<directory_stream>> {
    auto normal = path_identity::normalize(provider_kind::local, path);
    DIR* dir = ::opendir(normal.c_str());
    if (dir == nullptr) {
        return unexpected{error_from_errno(errno, "cannot open directory " + normal)};
    }
    return std::unique_ptr<directory_stream>(
        std::make_unique<local_directory_stream>(normal, dir));
}

auto local_provider::stat(const std::string& path) -> result<entry_metadata> {
    auto normal = path_identity::normalize(provider_kind::local, path);
    struct stat st {};
    if (::lstat(normal.c_str(), &st) != 0) {
        return unexpected{error_from_errno(errno, "cannot stat " + normal)};
    }
    return make_entry(path_identity::parent(provider_kind::local, normal),
                      path_identity::filename(provider_kind::local, normal), st);
}

auto local_provider::open_for_read(const std::string& path)
    -> result<std::unique_ptr<byte_source>> {
    auto normal = path_identity::normalize(provider_kind::local, path);
    int fd = ::open(normal.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return unexpected{error_from_errno(errno, "cannot open " + normal)};
    }
    auto source = std::make_unique<local_byte_source>(normal, fd);

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        return unexpected{error_from_errno(errno, "cannot stat " + normal)};
    }
    if (S_ISDIR(st.st_mode)) {
        return unexpected{error_from_errno(EISDIR, "cannot read a directory: " + normal)};
    }
    return std::unique_ptr<byte_source>(std::move(source));
}

auto local_provider::open_for_write(const std::string& path, write_mode mode)
    -> result<std::unique_ptr<byte_sink>> {
    auto normal = path_identity::normalize(provider_kind::local, path);
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    switch (mode) {
        case write_mode::append:
            flags |= O_APPEND;
            break;
        case write_mode::create_new:
            flags |= O_EXCL;
            break;
        case write_mode::truncate:
        default:
            flags |= O_TRUNC;
            break;
    }
    int fd = ::open(normal.c_str(), flags, 0644);
    if (fd < 0) {
        return unexpected{error_from_errno(errno, "cannot open for writing " + normal)};
    }
    return std::unique_ptr<byte_sink>(std::make_unique<local_byte_sink>(normal, fd));
}

auto local_provider::remove(const std::string& path) -> result<void> {
    auto normal = path_identity::normalize(provider_kind::local, path);
    struct stat st {};
    if (::lstat(normal.c_str(), &st) != 0) {
        return unexpected{error_from_errno(errno, "cannot stat " + normal)};
    }
    int rc = S_ISDIR(st.st_mode) ? ::rmdir(normal.c_str()) : ::unlink(normal.c_str());
    if (rc != 0) {
        int err = errno == EEXIST ? ENOTEMPTY : errno;
        return unexpected{error_from_errno(err, "cannot remove " + normal)};
    }
    UFS_LOG_DEBUG(log_category::provider, "Removed " + normal);
    return {};
}

auto local_provider::rename(const std::string& from, const std::string& to, bool replace_existing)
    -> result<void> {
    auto src = path_identity::normalize(provider_kind::local, from);
    auto dst = path_identity::normalize(provider_kind::local, to);
    if (!replace_existing) {
        struct stat st {};
        if (::lstat(dst.c_str(), &st) == 0) {
            return unexpected{error{error_code::name_collision, "target exists: " + dst}};
        }
    }
    if (::rename(src.c_str(), dst.c_str()) != 0) {
        return unexpected{error_from_errno(errno, "cannot rename " + src + " to " + dst)};
    }
    return {};
}

auto local_provider::mkdir(const std::string& path, bool recursive) -> result<void> {
    auto normal = path_identity::normalize(provider_kind::local, path);
    if (!recursive) {
        if (::mkdir(normal.c_str(), 0777) != 0) {
            return unexpected{error_from_errno(errno, "cannot create directory " + normal)};
        }
        return {};
    }

    std::error_code ec;
    std::filesystem::create_directories(normal, ec);
    if (ec) {
        if (ec == std::errc::file_exists || ec == std::errc::not_a_directory) {
            return unexpected{error{error_code::not_a_directory,
                                    "path exists and is not a directory: " + normal,
                                    ec.message()}};
        }
        return unexpected{error_from_errno(ec.value(), "cannot create directory " + normal)};
    }
    return {};
}

auto local_provider::set_modified_time(const std::string& path, file_time time)
    -> result<void> {
    auto normal = path_identity::normalize(provider_kind::local, path);
    struct timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT;
    times[1] = to_timespec(time);
    if (::utimensat(AT_FDCWD, normal.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        return unexpected{error_from_errno(errno, "cannot set modification time of " + normal)};
    }
    return {};
}

}  // namespace kcenon::unified_fs
