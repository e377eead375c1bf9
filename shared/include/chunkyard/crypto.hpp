/**
 * Chunkyard - Digest, MAC and identifier helpers built on libsodium, with OpenSSL for MD5 and SHA-1.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace chunkyard::crypto
{

    enum class DigestAlgorithm : std::uint8_t
    {
        Sha256,
        Sha512,
        Blake2b,
        // Legacy digests for comparing against S3 ETags and older manifests.
        Md5,
        Sha1
    };

    std::string_view to_string(DigestAlgorithm algorithm) noexcept;
    std::optional<DigestAlgorithm> digest_algorithm_from_string(std::string_view value) noexcept;

    void ensure_sodium_init();

    // Incremental digest; finish() may be called once.
    class Digest
    {
    public:
        explicit Digest(DigestAlgorithm algorithm = DigestAlgorithm::Sha256);
        ~Digest();

        Digest(Digest &&) noexcept;
        Digest &operator=(Digest &&) noexcept;
        Digest(const Digest &) = delete;
        Digest &operator=(const Digest &) = delete;

        void update(std::span<const std::byte> data);
        void update(std::string_view data);

        std::string finish_hex();

        DigestAlgorithm algorithm() const noexcept { return algorithm_; }

    private:
        struct State;

        DigestAlgorithm algorithm_;
        std::unique_ptr<State> state_;
        bool finished_{false};
    };

    std::string to_hex(std::span<const unsigned char> data);

    std::string sha256_hex(std::span<const std::byte> data);
    std::string sha256_hex(std::string_view data);

    // Raw 32-byte HMAC-SHA256; any key length is accepted.
    std::string hmac_sha256(std::string_view key, std::string_view message);

    std::string hash_stream(std::istream &input, DigestAlgorithm algorithm = DigestAlgorithm::Sha256);

    std::string hash_file(const std::filesystem::path &path, DigestAlgorithm algorithm = DigestAlgorithm::Sha256);

    // Random RFC 4122 version 4 identifier.
    std::string random_uuid();

    // 8-4-4-4-12 hex groups; any version.
    bool is_uuid(std::string_view text) noexcept;

} // namespace chunkyard::crypto
