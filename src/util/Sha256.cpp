#include "util/Sha256.hpp"

#include "util/FileDescriptor.hpp"
#include "util/IoHelpers.hpp"

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <vector>

namespace util {

namespace {

constexpr size_t HASH_BUFFER_SIZE = 1'024 * 1'024;  // 1MB buffer

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

auto to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    static constexpr std::array<char, 16> HEX{'0', '1', '2', '3', '4', '5', '6', '7',
                                              '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string out;
    out.reserve(static_cast<size_t>(length) * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(HEX[digest[i] >> 4]);
        out.push_back(HEX[digest[i] & 0x0F]);
    }
    return out;
}

auto new_sha256_context() -> std::expected<EvpMdCtxPtr, Error> {
    EvpMdCtxPtr ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        return std::unexpected(Error{"EVP_MD_CTX_new failed", ENOMEM});
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::unexpected(Error{"EVP_DigestInit_ex failed"});
    }
    return ctx;
}

auto finish(EVP_MD_CTX* ctx) -> std::expected<std::string, Error> {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
        return std::unexpected(Error{"EVP_DigestFinal_ex failed"});
    }
    return to_hex(digest, length);
}

}  // namespace

auto sha256_hex(std::span<const uint8_t> data) -> std::expected<std::string, Error> {
    auto ctx = new_sha256_context();
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    if (EVP_DigestUpdate(ctx->get(), data.data(), data.size()) != 1) {
        return std::unexpected(Error{"EVP_DigestUpdate failed"});
    }
    return finish(ctx->get());
}

auto sha256_file(const std::filesystem::path& path) -> std::expected<std::string, Error> {
    auto fd = FileDescriptor::open(path, O_RDONLY | O_NOFOLLOW);
    if (!fd) {
        return std::unexpected(fd.error());
    }

    auto ctx = new_sha256_context();
    if (!ctx) {
        return std::unexpected(ctx.error());
    }

    std::vector<uint8_t> buffer(HASH_BUFFER_SIZE);
    while (true) {
        const auto n = read_with_retry(fd->get(), buffer.data(), buffer.size());
        if (n < 0) {
            return std::unexpected(Error::from_errno("read " + path.string()));
        }
        if (n == 0) {
            break;
        }
        if (EVP_DigestUpdate(ctx->get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            return std::unexpected(Error{"EVP_DigestUpdate failed"});
        }
    }

    return finish(ctx->get());
}

}  // namespace util
