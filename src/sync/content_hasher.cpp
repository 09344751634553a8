#include "content_hasher.hpp"
#include "cancellation.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <openssl/evp.h>
#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

MdCtxPtr new_sha256_ctx() {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
    return ctx;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex += fmt::format("{:02x}", digest[i]);
    }
    return hex;
}

} // namespace

std::string sha256_file(const std::filesystem::path& path, const CancellationToken& token) {
    token.throw_if_cancelled();

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error(fmt::format("Cannot open {} for hashing", path.string()));
    }

    auto ctx = new_sha256_ctx();
    std::vector<char> buf(HASH_READ_BUF_SIZE);

    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
        token.throw_if_cancelled();
    }
    if (in.bad()) {
        throw std::runtime_error(fmt::format("Read error while hashing {}", path.string()));
    }

    return finish_hex(ctx.get());
}

std::unordered_map<std::string, std::string> compute_hashes(
    const std::vector<LocalFile>& files,
    const CancellationToken& token,
    const StatusCallback& callback) {
    std::unordered_map<std::string, std::string> hashes;
    hashes.reserve(files.size());

    size_t done = 0;
    for (const auto& file : files) {
        hashes[file.absolute_path] = sha256_file(file.absolute_path, token);
        ++done;
        if (callback && (done % 100 == 0 || done == files.size())) {
            callback(fmt::format("Hashed {}/{} files", done, files.size()));
        }
    }

    gemindex_log(fmt::format("hash: computed {} digest(s)", hashes.size()));
    return hashes;
}
