/*
 * integrity_verifier.cpp
 *
 * Segment accumulators use the low-level SHA-2 contexts because their state is
 * a plain struct that can be checkpointed and restored; EVP contexts are
 * opaque. Whole-file verification goes through EVP.
 */

#define OPENSSL_SUPPRESS_DEPRECATED

#include <parfetch/integrity/integrity_verifier.h>

#include <openssl/evp.h>
#include <openssl/opensslv.h>
#include <openssl/sha.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <bit>
#include <cctype>
#include <cstring>
#include <fstream>
#include <vector>

namespace parfetch::integrity {

namespace {

constexpr std::size_t kReadChunk = 1 << 20;

// RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256:
            return EVP_sha256();
        case HashAlgo::Sha512:
            return EVP_sha512();
        case HashAlgo::Md5:
            return EVP_md5();
    }
    return EVP_sha256();
}

HashAlgo segmentAlgo(HashAlgo algo) {
    return algo == HashAlgo::Sha512 ? HashAlgo::Sha512 : HashAlgo::Sha256;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::optional<std::vector<unsigned char>> fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0)
        return std::nullopt;
    std::vector<unsigned char> out(hex.size() / 2);
    for (std::size_t i = 0; i < out.size(); ++i) {
        int hi = hexValue(hex[2 * i]);
        int lo = hexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        out[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    return out;
}

template <typename Ctx> std::string serializeCtx(const Ctx& ctx) {
    std::array<unsigned char, sizeof(Ctx)> raw{};
    std::memcpy(raw.data(), &ctx, sizeof(Ctx));
    return toHex(raw);
}

} // namespace

std::string toHex(std::span<const unsigned char> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

bool digestEquals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

std::string midstateFormat(HashAlgo algo) {
    const bool sha512 = segmentAlgo(algo) == HashAlgo::Sha512;
    std::string tag = "openssl" + std::to_string(OPENSSL_VERSION_NUMBER >> 28);
    tag += sha512 ? "-sha512ctx" + std::to_string(sizeof(SHA512_CTX))
                  : "-sha256ctx" + std::to_string(sizeof(SHA256_CTX));
    tag += std::endian::native == std::endian::little ? "-le" : "-be";
    return tag;
}

// ---------------- SegmentHasher ----------------

SegmentHasher::SegmentHasher(HashAlgo algo) : algo_(segmentAlgo(algo)) {
    reset();
}

void SegmentHasher::reset() {
    covered_ = 0;
    if (algo_ == HashAlgo::Sha512) {
        SHA512_CTX c;
        SHA512_Init(&c);
        ctx_ = c;
    } else {
        SHA256_CTX c;
        SHA256_Init(&c);
        ctx_ = c;
    }
}

void SegmentHasher::update(std::span<const std::byte> data) {
    if (data.empty())
        return;
    if (auto* c = std::get_if<SHA512_CTX>(&ctx_))
        SHA512_Update(c, data.data(), data.size());
    else
        SHA256_Update(&std::get<SHA256_CTX>(ctx_), data.data(), data.size());
    covered_ += data.size();
}

std::string SegmentHasher::digestHex() const {
    if (const auto* c = std::get_if<SHA512_CTX>(&ctx_)) {
        SHA512_CTX copy = *c;
        std::array<unsigned char, SHA512_DIGEST_LENGTH> md{};
        SHA512_Final(md.data(), &copy);
        return toHex(md);
    }
    SHA256_CTX copy = std::get<SHA256_CTX>(ctx_);
    std::array<unsigned char, SHA256_DIGEST_LENGTH> md{};
    SHA256_Final(md.data(), &copy);
    return toHex(md);
}

Checkpoint SegmentHasher::checkpoint() const {
    Checkpoint cp;
    cp.covered = covered_;
    cp.digestHex = digestHex();
    cp.midstate = std::visit([](const auto& c) { return serializeCtx(c); }, ctx_);
    cp.format = midstateFormat(algo_);
    return cp;
}

Expected<SegmentHasher> SegmentHasher::restore(HashAlgo algo, const Checkpoint& cp) {
    SegmentHasher h(algo);
    if (cp.covered == 0)
        return h;
    if (cp.midstate.empty())
        return Error{ErrorCode::ManifestCorrupt, "checkpoint has no midstate"};
    if (const auto want = midstateFormat(h.algo_); cp.format != want) {
        return Error{ErrorCode::ManifestCorrupt,
                     "checkpoint midstate format '" + cp.format + "' is not '" + want + "'"};
    }
    auto raw = fromHex(cp.midstate);
    if (!raw)
        return Error{ErrorCode::ManifestCorrupt, "checkpoint midstate is not hex"};

    std::uint64_t bits = 0;
    if (h.algo_ == HashAlgo::Sha512) {
        if (raw->size() != sizeof(SHA512_CTX))
            return Error{ErrorCode::ManifestCorrupt, "checkpoint midstate has wrong size"};
        SHA512_CTX c;
        std::memcpy(&c, raw->data(), sizeof(c));
        bits = static_cast<std::uint64_t>(c.Nl);
        h.ctx_ = c;
    } else {
        if (raw->size() != sizeof(SHA256_CTX))
            return Error{ErrorCode::ManifestCorrupt, "checkpoint midstate has wrong size"};
        SHA256_CTX c;
        std::memcpy(&c, raw->data(), sizeof(c));
        bits = (static_cast<std::uint64_t>(c.Nh) << 32) | static_cast<std::uint64_t>(c.Nl);
        h.ctx_ = c;
    }
    if (bits != cp.covered * 8)
        return Error{ErrorCode::ManifestCorrupt, "checkpoint midstate length disagrees"};
    h.covered_ = cp.covered;
    if (!digestEquals(h.digestHex(), cp.digestHex))
        return Error{ErrorCode::ManifestCorrupt, "checkpoint midstate does not match digest"};
    return h;
}

// ---------------- File hashing ----------------

Expected<SegmentHasher> rehashRange(const std::filesystem::path& path, std::uint64_t offset,
                                    std::uint64_t length, HashAlgo algo,
                                    const ShouldCancel& shouldCancel) {
    SegmentHasher h(algo);
    if (length == 0)
        return h;

    std::ifstream is(path, std::ios::binary);
    if (!is.good())
        return Error{ErrorCode::IoError, "rehash: cannot open " + path.string()};
    is.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!is.good())
        return Error{ErrorCode::IoError, "rehash: seek failed on " + path.string()};

    std::vector<char> buf(kReadChunk);
    std::uint64_t left = length;
    while (left > 0) {
        if (shouldCancel && shouldCancel())
            return Error{ErrorCode::Cancelled, "rehash cancelled"};
        const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(left, buf.size()));
        is.read(buf.data(), want);
        const auto got = is.gcount();
        if (got <= 0)
            break;
        h.update(std::as_bytes(std::span<const char>(buf.data(), static_cast<std::size_t>(got))));
        left -= static_cast<std::uint64_t>(got);
    }
    if (left > 0) {
        return Error{ErrorCode::IoError, "rehash: " + path.string() + " is shorter than " +
                                             std::to_string(offset + length) + " bytes"};
    }
    return h;
}

Expected<std::string> hashFile(const std::filesystem::path& path, HashAlgo algo,
                               const ShouldCancel& shouldCancel) {
    EvpMdCtx ctx;
    const EVP_MD* md = resolve_algo(algo);
    if (!ctx || !md || EVP_DigestInit_ex(ctx.ctx, md, nullptr) != 1)
        return Error{ErrorCode::Unknown, "EVP digest initialization failed"};

    std::ifstream is(path, std::ios::binary);
    if (!is.good())
        return Error{ErrorCode::IoError, "hash: cannot open " + path.string()};

    std::vector<char> buf(kReadChunk);
    while (is.good()) {
        if (shouldCancel && shouldCancel())
            return Error{ErrorCode::Cancelled, "hash cancelled"};
        is.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = is.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.ctx, buf.data(), static_cast<std::size_t>(got)) != 1)
            return Error{ErrorCode::Unknown, "EVP_DigestUpdate failed"};
    }
    if (!is.eof())
        return Error{ErrorCode::IoError, "hash: read failed on " + path.string()};

    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned len = 0;
    if (EVP_DigestFinal_ex(ctx.ctx, out.data(), &len) != 1)
        return Error{ErrorCode::Unknown, "EVP_DigestFinal_ex failed"};
    return toHex(std::span<const unsigned char>(out.data(), len));
}

Expected<Checksum> verifyFile(const std::filesystem::path& path,
                              const std::optional<Checksum>& expected, HashAlgo fallbackAlgo,
                              const ShouldCancel& shouldCancel) {
    const HashAlgo algo = expected ? expected->algo : fallbackAlgo;
    auto digest = hashFile(path, algo, shouldCancel);
    if (!digest)
        return digest.error();

    Checksum actual{algo, digest.value()};
    if (expected && !digestEquals(expected->hex, actual.hex)) {
        spdlog::warn("checksum mismatch for {}: expected {} got {}", path.string(), expected->hex,
                     actual.hex);
        return Error{ErrorCode::ChecksumMismatch, std::string(hashAlgoToString(algo)) +
                                                      " mismatch: expected " + expected->hex +
                                                      ", got " + actual.hex};
    }
    return actual;
}

} // namespace parfetch::integrity
