/**
 * @file checksum.cpp
 * @brief MD5 digests via OpenSSL EVP
 */

#include <xnat/transfer/checksum.hpp>

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <fstream>
#include <memory>

namespace xnat::transfer {

namespace {

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
struct evp_md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;

auto to_hex(const unsigned char* data, unsigned int length) -> std::string {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(hex[data[i] >> 4]);
        out.push_back(hex[data[i] & 0x0F]);
    }
    return out;
}

auto new_md5_context() -> Result<evp_md_ctx_ptr> {
    evp_md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return xnat_error<evp_md_ctx_ptr>(error_codes::verification_failed,
                                          "Failed to allocate digest context");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return xnat_error<evp_md_ctx_ptr>(error_codes::verification_failed,
                                          "Failed to initialise MD5 digest");
    }
    return Result<evp_md_ctx_ptr>::ok(std::move(ctx));
}

auto finish(EVP_MD_CTX* ctx) -> Result<std::string> {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
        return xnat_error<std::string>(error_codes::verification_failed,
                                       "Failed to finalise MD5 digest");
    }
    return ok(to_hex(digest.data(), length));
}

}  // namespace

auto md5_file(const std::filesystem::path& path) -> Result<std::string> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return xnat_error<std::string>(error_codes::file_io_error,
                                       "Cannot open file for checksum", path.string());
    }

    auto ctx = new_md5_context();
    if (ctx.is_err()) {
        return forward_error<std::string>(ctx.error());
    }
    EVP_MD_CTX* raw = ctx.value().get();

    std::array<char, 64 * 1024> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(raw, buffer.data(), static_cast<std::size_t>(got)) != 1) {
            return xnat_error<std::string>(error_codes::verification_failed,
                                           "MD5 update failed", path.string());
        }
    }
    if (in.bad()) {
        return xnat_error<std::string>(error_codes::file_io_error,
                                       "Read error during checksum", path.string());
    }
    return finish(raw);
}

auto md5_hex(std::string_view data) -> Result<std::string> {
    auto ctx = new_md5_context();
    if (ctx.is_err()) {
        return forward_error<std::string>(ctx.error());
    }
    EVP_MD_CTX* raw = ctx.value().get();
    if (EVP_DigestUpdate(raw, data.data(), data.size()) != 1) {
        return xnat_error<std::string>(error_codes::verification_failed, "MD5 update failed");
    }
    return finish(raw);
}

bool digest_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace xnat::transfer
