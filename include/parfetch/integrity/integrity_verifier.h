#pragma once

#include <parfetch/core/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include <openssl/sha.h>

namespace parfetch::integrity {

/**
 * Persistable state of a segment accumulator.
 *
 * `covered` is the number of bytes hashed from the segment start, `digestHex`
 * the digest of exactly that prefix and `midstate` the serialized compression
 * state that lets a clean resume continue without rereading the prefix.
 * `format` names the midstate layout (see midstateFormat).
 */
struct Checkpoint {
    std::uint64_t covered{0};
    std::string digestHex;
    std::string midstate; // hex; empty when not available
    std::string format;
};

/**
 * Layout tag of a serialized midstate: OpenSSL major version, context
 * struct and size, byte order. A midstate is only restored under the tag it
 * was written with; anything else is rehashed from disk.
 */
std::string midstateFormat(HashAlgo algo);

/**
 * Incremental SHA-2 accumulator for one segment. MD5 requests fall back to
 * SHA-256 (segment checkpoints are always SHA-2).
 */
class SegmentHasher {
public:
    explicit SegmentHasher(HashAlgo algo = HashAlgo::Sha256);

    void update(std::span<const std::byte> data);
    void reset();

    [[nodiscard]] std::uint64_t covered() const noexcept { return covered_; }
    [[nodiscard]] HashAlgo algo() const noexcept { return algo_; }

    // Digest of the bytes seen so far; the accumulator keeps running.
    [[nodiscard]] std::string digestHex() const;
    [[nodiscard]] Checkpoint checkpoint() const;

    /**
     * Rebuild an accumulator from a checkpoint's midstate. Fails with
     * ManifestCorrupt when the midstate is missing, malformed, written under
     * another midstateFormat or does not reproduce the recorded digest.
     */
    static Expected<SegmentHasher> restore(HashAlgo algo, const Checkpoint& cp);

private:
    HashAlgo algo_;
    std::variant<SHA256_CTX, SHA512_CTX> ctx_;
    std::uint64_t covered_{0};
};

/**
 * Hash `length` bytes of `path` starting at `offset` into a fresh accumulator.
 * Used to rebuild segment state from disk after an unclean shutdown.
 */
Expected<SegmentHasher> rehashRange(const std::filesystem::path& path, std::uint64_t offset,
                                    std::uint64_t length, HashAlgo algo,
                                    const ShouldCancel& shouldCancel = {});

// Whole-file digest through OpenSSL EVP (SHA-256, SHA-512 or MD5).
Expected<std::string> hashFile(const std::filesystem::path& path, HashAlgo algo,
                               const ShouldCancel& shouldCancel = {});

/**
 * Final gate: compute the file digest and compare it with `expected` when
 * given (ChecksumMismatch otherwise). Returns the computed digest.
 */
Expected<Checksum> verifyFile(const std::filesystem::path& path,
                              const std::optional<Checksum>& expected, HashAlgo fallbackAlgo,
                              const ShouldCancel& shouldCancel = {});

[[nodiscard]] bool digestEquals(std::string_view a, std::string_view b) noexcept;

std::string toHex(std::span<const unsigned char> bytes);

} // namespace parfetch::integrity
