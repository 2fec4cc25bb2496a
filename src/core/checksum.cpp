/**
 * @file checksum.cpp
 * @brief SHA-256 digests through the OpenSSL EVP interface
 */

#include <kcenon/object_batch/core/checksum.h>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <iomanip>
#include <sstream>

namespace kcenon::object_batch {

namespace {

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
class evp_md_ctx_wrapper {
public:
    evp_md_ctx_wrapper() : ctx_(EVP_MD_CTX_new()) {}

    ~evp_md_ctx_wrapper() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    evp_md_ctx_wrapper(const evp_md_ctx_wrapper&) = delete;
    auto operator=(const evp_md_ctx_wrapper&) -> evp_md_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_MD_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

auto to_hex(const unsigned char* data, unsigned int len) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

}  // namespace

auto checksum::sha256(std::span<const std::byte> data) -> result<std::string> {
    evp_md_ctx_wrapper ctx;
    if (!ctx) {
        return unexpected(error(error_code::internal_error,
            "failed to allocate digest context"));
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return unexpected(error(error_code::internal_error, get_openssl_error()));
    }

    if (!data.empty() &&
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return unexpected(error(error_code::internal_error, get_openssl_error()));
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        return unexpected(error(error_code::internal_error, get_openssl_error()));
    }

    return to_hex(digest.data(), digest_len);
}

auto checksum::sha256(std::string_view text) -> result<std::string> {
    return sha256(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

}  // namespace kcenon::object_batch
