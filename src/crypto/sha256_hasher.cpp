#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>
#include <array>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <docindex/crypto/hasher.h>

namespace docindex::crypto {

namespace {

std::string toHex(const unsigned char* digest, size_t length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex(length * 2, '0');
    for (size_t i = 0; i < length; ++i) {
        hex[2 * i] = kDigits[digest[i] >> 4];
        hex[2 * i + 1] = kDigits[digest[i] & 0x0f];
    }
    return hex;
}

void check(int rc, const char* stage) {
    if (rc != 1) {
        throw std::runtime_error(fmt::format("SHA-256 {} failed", stage));
    }
}

} // namespace

void SHA256Hasher::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

SHA256Hasher::SHA256Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("Unable to allocate digest context");
    }
    init();
}

SHA256Hasher::~SHA256Hasher() = default;
SHA256Hasher::SHA256Hasher(SHA256Hasher&&) noexcept = default;
SHA256Hasher& SHA256Hasher::operator=(SHA256Hasher&&) noexcept = default;

void SHA256Hasher::init() {
    check(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr), "init");
}

void SHA256Hasher::update(std::span<const std::byte> data) {
    if (data.empty())
        return;
    check(EVP_DigestUpdate(ctx_.get(), data.data(), data.size()), "update");
}

std::string SHA256Hasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    check(EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length), "finalize");
    init();
    return toHex(digest.data(), length);
}

std::string SHA256Hasher::hashFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error(fmt::format("Cannot open {} for hashing", path.string()));
    }

    init();
    std::vector<char> chunk(DEFAULT_BUFFER_SIZE);
    while (in.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || in.gcount() > 0) {
        update(std::as_bytes(std::span(chunk.data(), static_cast<size_t>(in.gcount()))));
        if (in.eof())
            break;
    }

    if (in.bad()) {
        init();
        throw std::runtime_error(fmt::format("I/O error while hashing {}", path.string()));
    }
    return finalize();
}

std::string SHA256Hasher::hash(std::span<const std::byte> data) {
    SHA256Hasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

std::unique_ptr<IContentHasher> createSHA256Hasher() {
    return std::make_unique<SHA256Hasher>();
}

} // namespace docindex::crypto
