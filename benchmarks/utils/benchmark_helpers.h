/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_UNIFIED_FS_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_UNIFIED_FS_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::unified_fs::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Scratch directory removed with everything in it on destruction
 */
class bench_workspace {
public:
    explicit bench_workspace(const std::string& name);
    ~bench_workspace();

    bench_workspace(const bench_workspace&) = delete;
    auto operator=(const bench_workspace&) -> bench_workspace& = delete;

    /**
     * @brief Create a file of random bytes, parent directories included
     * @param relative Path below the workspace root
     */
    auto create_random_file(const std::string& relative, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Create @p file_count files spread over @p dir_count subdirectories
     * @return Root of the tree
     */
    auto create_tree(const std::string& relative,
                     std::size_t dir_count,
                     std::size_t file_count,
                     std::size_t file_size) -> std::filesystem::path;

    /**
     * @brief Remove and recreate a directory below the root
     */
    auto reset_directory(const std::string& relative) -> std::filesystem::path;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    std::filesystem::path root_;
};

auto format_bytes(uint64_t bytes) -> std::string;

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 10 * MB;
constexpr std::size_t large_file = 100 * MB;

constexpr std::size_t min_chunk = 4 * KB;
constexpr std::size_t default_chunk = 64 * KB;
constexpr std::size_t max_chunk = 1 * MB;
}  // namespace sizes

}  // namespace kcenon::unified_fs::benchmark

#endif  // KCENON_UNIFIED_FS_BENCHMARKS_BENCHMARK_HELPERS_H
