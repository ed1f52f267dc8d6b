/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::unified_fs::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }
    return data;
}

bench_workspace::bench_workspace(const std::string& name)
    : root_(std::filesystem::temp_directory_path() / ("unified_fs_bench_" + name)) {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
}

bench_workspace::~bench_workspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
}

auto bench_workspace::create_random_file(const std::string& relative,
                                         std::size_t size,
                                         uint32_t seed) -> std::filesystem::path {
    auto path = root_ / relative;
    std::filesystem::create_directories(path.parent_path());
    auto data = generate_random_data(size, seed);
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    return path;
}

auto bench_workspace::create_tree(const std::string& relative,
                                  std::size_t dir_count,
                                  std::size_t file_count,
                                  std::size_t file_size) -> std::filesystem::path {
    auto base = root_ / relative;
    std::filesystem::create_directories(base);
    dir_count = dir_count == 0 ? 1 : dir_count;
    for (std::size_t i = 0; i < file_count; ++i) {
        auto dir = "d" + std::to_string(i % dir_count);
        (void)create_random_file(relative + "/" + dir + "/f" + std::to_string(i) + ".bin",
                                 file_size, static_cast<uint32_t>(i + 1));
    }
    return base;
}

auto bench_workspace::reset_directory(const std::string& relative) -> std::filesystem::path {
    auto path = root_ / relative;
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::filesystem::create_directories(path);
    return path;
}

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(sizes::MB) << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(sizes::KB) << " KB";
    } else {
        oss << bytes << " B";
    }
    return oss.str();
}

}  // namespace kcenon::unified_fs::benchmark
