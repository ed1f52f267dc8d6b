/**
 * @file checksum.h
 * @brief SHA-256 hashing for post-copy verification
 */

#ifndef KCENON_UNIFIED_FS_CORE_CHECKSUM_H
#define KCENON_UNIFIED_FS_CORE_CHECKSUM_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace kcenon::unified_fs {

/**
 * @brief Incremental SHA-256
 *
 * Fed chunk by chunk while a file streams through the transfer engine, so
 * the source never has to be read twice.
 *
 * @code
 * sha256_hasher hasher;
 * hasher.update(chunk);
 * auto hex = hasher.finish();
 * @endcode
 */
class sha256_hasher {
public:
    sha256_hasher();

    auto update(std::span<const std::byte> data) -> void;

    /**
     * @brief Finalize and return the lowercase hex digest
     *
     * The hasher is reset afterwards and can be reused.
     */
    [[nodiscard]] auto finish() -> std::string;

    auto reset() -> void;

    /**
     * @brief One-shot digest of a buffer
     */
    [[nodiscard]] static auto digest(std::span<const std::byte> data) -> std::string;

private:
    std::array<uint32_t, 8> state_;
    std::array<uint8_t, 64> block_;
    std::size_t block_size_;
    uint64_t total_bytes_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_CORE_CHECKSUM_H
