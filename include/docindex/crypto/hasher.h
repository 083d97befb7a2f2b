#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <docindex/core/types.h>

struct evp_md_ctx_st;

namespace docindex::crypto {

/**
 * @brief Incremental digest producing lower-case hex strings
 *
 * init() starts a digest, update() feeds bytes, finalize() returns the hex
 * digest and leaves the hasher ready for the next one. Failures inside the
 * crypto backend throw std::runtime_error.
 */
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    /// Digest of a file's bytes; throws std::runtime_error when unreadable
    virtual std::string hashFile(const std::filesystem::path& path) = 0;

    virtual std::string_view algorithm() const = 0;

    std::string hash(std::string_view text) {
        init();
        update(std::as_bytes(std::span(text.data(), text.size())));
        return finalize();
    }
};

class SHA256Hasher final : public IContentHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher() override;

    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;
    std::string hashFile(const std::filesystem::path& path) override;

    std::string_view algorithm() const override { return "sha256"; }

    using IContentHasher::hash;
    static std::string hash(std::span<const std::byte> data);

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
};

std::unique_ptr<IContentHasher> createSHA256Hasher();

} // namespace docindex::crypto
