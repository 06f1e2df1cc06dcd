/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <kcenon/file_organizer/core/checksum.h>

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>

namespace kcenon::file_organizer {

namespace {

constexpr std::size_t read_buffer_size = 64 * 1024;

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

auto to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

auto new_sha256_context() -> md_ctx_ptr {
    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

auto finish_digest(EVP_MD_CTX* ctx) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
        return {};
    }
    return to_hex(digest.data(), length);
}

}  // namespace

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    auto ctx = new_sha256_context();
    if (!ctx) {
        return {};
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return {};
    }
    return finish_digest(ctx.get());
}

auto checksum::sha256_file(const std::filesystem::path& path)
    -> result<std::string> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected{error{error_code::file_not_found,
                                "file not found: " + path.string()}};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_access_denied,
                                "cannot open file: " + path.string()}};
    }

    auto ctx = new_sha256_context();
    if (!ctx) {
        return unexpected{error{error_code::internal_error,
                                "failed to initialize SHA-256 context"}};
    }

    std::array<char, read_buffer_size> buffer{};
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = file.gcount();
        if (count > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(),
                             static_cast<std::size_t>(count)) != 1) {
            return unexpected{error{error_code::internal_error,
                                    "SHA-256 update failed"}};
        }
    }

    if (file.bad()) {
        return unexpected{error{error_code::file_read_error,
                                "error reading file: " + path.string()}};
    }

    auto hex = finish_digest(ctx.get());
    if (hex.empty()) {
        return unexpected{error{error_code::internal_error,
                                "SHA-256 finalization failed"}};
    }
    return hex;
}

auto checksum::verify_sha256(const std::filesystem::path& path,
                             const std::string& expected) -> bool {
    auto digest = sha256_file(path);
    if (!digest) {
        return false;
    }
    return digest.value() == expected;
}

auto checksum::files_identical(const std::filesystem::path& lhs,
                               const std::filesystem::path& rhs)
    -> result<bool> {
    std::error_code ec;
    auto lhs_size = std::filesystem::file_size(lhs, ec);
    if (ec) {
        return unexpected{error{error_code::file_read_error,
                                "cannot stat " + lhs.string() + ": " + ec.message()}};
    }
    auto rhs_size = std::filesystem::file_size(rhs, ec);
    if (ec) {
        return unexpected{error{error_code::file_read_error,
                                "cannot stat " + rhs.string() + ": " + ec.message()}};
    }
    if (lhs_size != rhs_size) {
        return false;
    }

    auto lhs_digest = sha256_file(lhs);
    if (!lhs_digest) {
        return unexpected{lhs_digest.error()};
    }
    auto rhs_digest = sha256_file(rhs);
    if (!rhs_digest) {
        return unexpected{rhs_digest.error()};
    }
    return lhs_digest.value() == rhs_digest.value();
}

}  // namespace kcenon::file_organizer
