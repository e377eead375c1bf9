#include "chunkyard/crypto.hpp"

#include <array>
#include <memory>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <variant>
#include <vector>

#include <openssl/evp.h>
#include <sodium.h>

namespace chunkyard::crypto
{

    namespace
    {

        struct AlgorithmMapping
        {
            DigestAlgorithm algorithm;
            std::string_view label;
        };

        constexpr std::array<AlgorithmMapping, 5> kAlgorithmMappings{{
            {DigestAlgorithm::Sha256, "sha256"},
            {DigestAlgorithm::Sha512, "sha512"},
            {DigestAlgorithm::Blake2b, "blake2b"},
            {DigestAlgorithm::Md5, "md5"},
            {DigestAlgorithm::Sha1, "sha1"},
        }};

        struct EvpContextDeleter
        {
            void operator()(EVP_MD_CTX *context) const noexcept { EVP_MD_CTX_free(context); }
        };

        using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

        // libsodium has no MD5 or SHA-1; those go through OpenSSL.
        EvpContext make_evp_context(const EVP_MD *md)
        {
            EvpContext context(EVP_MD_CTX_new());
            if (!context || EVP_DigestInit_ex(context.get(), md, nullptr) != 1)
            {
                throw std::runtime_error("EVP_DigestInit_ex failed");
            }
            return context;
        }

        void throw_if_failed(int status, const char *operation)
        {
            if (status != 0)
            {
                throw std::runtime_error(std::string(operation) + " failed");
            }
        }

        void ensure_initialized_once()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (sodium_init() < 0)
                {
                    throw std::runtime_error("libsodium initialization failed");
                } });
        }

    } // namespace

    std::string_view to_string(DigestAlgorithm algorithm) noexcept
    {
        for (const auto &mapping : kAlgorithmMappings)
        {
            if (mapping.algorithm == algorithm)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<DigestAlgorithm> digest_algorithm_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kAlgorithmMappings)
        {
            if (mapping.label == value)
            {
                return mapping.algorithm;
            }
        }
        return std::nullopt;
    }

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    struct Digest::State
    {
        std::variant<crypto_hash_sha256_state, crypto_hash_sha512_state, crypto_generichash_state, EvpContext> value;
    };

    Digest::Digest(DigestAlgorithm algorithm)
        : algorithm_(algorithm), state_(std::make_unique<State>())
    {
        ensure_initialized_once();
        switch (algorithm_)
        {
        case DigestAlgorithm::Sha256:
            state_->value.emplace<crypto_hash_sha256_state>();
            throw_if_failed(crypto_hash_sha256_init(&std::get<crypto_hash_sha256_state>(state_->value)),
                            "crypto_hash_sha256_init");
            break;
        case DigestAlgorithm::Sha512:
            state_->value.emplace<crypto_hash_sha512_state>();
            throw_if_failed(crypto_hash_sha512_init(&std::get<crypto_hash_sha512_state>(state_->value)),
                            "crypto_hash_sha512_init");
            break;
        case DigestAlgorithm::Blake2b:
            state_->value.emplace<crypto_generichash_state>();
            throw_if_failed(crypto_generichash_init(&std::get<crypto_generichash_state>(state_->value), nullptr, 0,
                                                    crypto_generichash_BYTES_MAX),
                            "crypto_generichash_init");
            break;
        case DigestAlgorithm::Md5:
            state_->value = make_evp_context(EVP_md5());
            break;
        case DigestAlgorithm::Sha1:
            state_->value = make_evp_context(EVP_sha1());
            break;
        }
    }

    Digest::~Digest() = default;
    Digest::Digest(Digest &&) noexcept = default;
    Digest &Digest::operator=(Digest &&) noexcept = default;

    void Digest::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("digest already finished");
        }
        const auto *bytes = reinterpret_cast<const unsigned char *>(data.data());
        const auto length = static_cast<unsigned long long>(data.size());
        switch (algorithm_)
        {
        case DigestAlgorithm::Sha256:
            throw_if_failed(crypto_hash_sha256_update(&std::get<crypto_hash_sha256_state>(state_->value), bytes, length),
                            "crypto_hash_sha256_update");
            break;
        case DigestAlgorithm::Sha512:
            throw_if_failed(crypto_hash_sha512_update(&std::get<crypto_hash_sha512_state>(state_->value), bytes, length),
                            "crypto_hash_sha512_update");
            break;
        case DigestAlgorithm::Blake2b:
            throw_if_failed(crypto_generichash_update(&std::get<crypto_generichash_state>(state_->value), bytes, length),
                            "crypto_generichash_update");
            break;
        case DigestAlgorithm::Md5:
        case DigestAlgorithm::Sha1:
            if (EVP_DigestUpdate(std::get<EvpContext>(state_->value).get(), bytes, data.size()) != 1)
            {
                throw std::runtime_error("EVP_DigestUpdate failed");
            }
            break;
        }
    }

    void Digest::update(std::string_view data)
    {
        update(std::as_bytes(std::span<const char>(data.data(), data.size())));
    }

    std::string Digest::finish_hex()
    {
        if (finished_)
        {
            throw std::logic_error("digest already finished");
        }
        finished_ = true;
        std::vector<unsigned char> digest;
        switch (algorithm_)
        {
        case DigestAlgorithm::Sha256:
            digest.resize(crypto_hash_sha256_BYTES);
            throw_if_failed(crypto_hash_sha256_final(&std::get<crypto_hash_sha256_state>(state_->value), digest.data()),
                            "crypto_hash_sha256_final");
            break;
        case DigestAlgorithm::Sha512:
            digest.resize(crypto_hash_sha512_BYTES);
            throw_if_failed(crypto_hash_sha512_final(&std::get<crypto_hash_sha512_state>(state_->value), digest.data()),
                            "crypto_hash_sha512_final");
            break;
        case DigestAlgorithm::Blake2b:
            digest.resize(crypto_generichash_BYTES_MAX);
            throw_if_failed(crypto_generichash_final(&std::get<crypto_generichash_state>(state_->value), digest.data(),
                                                     digest.size()),
                            "crypto_generichash_final");
            break;
        case DigestAlgorithm::Md5:
        case DigestAlgorithm::Sha1:
        {
            digest.resize(EVP_MAX_MD_SIZE);
            unsigned int length = 0;
            if (EVP_DigestFinal_ex(std::get<EvpContext>(state_->value).get(), digest.data(), &length) != 1)
            {
                throw std::runtime_error("EVP_DigestFinal_ex failed");
            }
            digest.resize(length);
            break;
        }
        }
        return to_hex(digest);
    }

    std::string to_hex(std::span<const unsigned char> data)
    {
        static constexpr char kHexDigits[] = "0123456789abcdef";
        std::string result;
        result.resize(data.size() * 2);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto byte = data[i];
            result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
            result[2 * i + 1] = kHexDigits[byte & 0x0F];
        }
        return result;
    }

    std::string sha256_hex(std::span<const std::byte> data)
    {
        Digest digest(DigestAlgorithm::Sha256);
        digest.update(data);
        return digest.finish_hex();
    }

    std::string sha256_hex(std::string_view data)
    {
        Digest digest(DigestAlgorithm::Sha256);
        digest.update(data);
        return digest.finish_hex();
    }

    std::string hmac_sha256(std::string_view key, std::string_view message)
    {
        ensure_initialized_once();
        crypto_auth_hmacsha256_state state;
        throw_if_failed(crypto_auth_hmacsha256_init(&state, reinterpret_cast<const unsigned char *>(key.data()),
                                                    key.size()),
                        "crypto_auth_hmacsha256_init");
        throw_if_failed(crypto_auth_hmacsha256_update(&state, reinterpret_cast<const unsigned char *>(message.data()),
                                                      message.size()),
                        "crypto_auth_hmacsha256_update");
        std::string mac(crypto_auth_hmacsha256_BYTES, '\0');
        throw_if_failed(crypto_auth_hmacsha256_final(&state, reinterpret_cast<unsigned char *>(mac.data())),
                        "crypto_auth_hmacsha256_final");
        return mac;
    }

    std::string hash_stream(std::istream &input, DigestAlgorithm algorithm)
    {
        Digest digest(algorithm);
        std::vector<char> buffer(64 * 1024);
        while (input)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                digest.update(std::string_view(buffer.data(), read_count));
            }
        }
        return digest.finish_hex();
    }

    std::string hash_file(const std::filesystem::path &path, DigestAlgorithm algorithm)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file, algorithm);
    }

    std::string random_uuid()
    {
        ensure_initialized_once();
        std::array<unsigned char, 16> bytes{};
        randombytes_buf(bytes.data(), bytes.size());
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        const auto hex = to_hex(bytes);
        std::string uuid;
        uuid.reserve(36);
        uuid.append(hex, 0, 8).push_back('-');
        uuid.append(hex, 8, 4).push_back('-');
        uuid.append(hex, 12, 4).push_back('-');
        uuid.append(hex, 16, 4).push_back('-');
        uuid.append(hex, 20, 12);
        return uuid;
    }

    bool is_uuid(std::string_view text) noexcept
    {
        if (text.size() != 36)
        {
            return false;
        }
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            const char c = text[i];
            if (i == 8 || i == 13 || i == 18 || i == 23)
            {
                if (c != '-')
                {
                    return false;
                }
            }
            else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F')))
            {
                return false;
            }
        }
        return true;
    }

} // namespace chunkyard::crypto
