#include "xlbook/security/PasswordHasher.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <openssl/opensslv.h>
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
#include <openssl/provider.h>
#endif
#include <utf8.h>
#include <cstdint>
#include <iterator>
#include <memory>
#include <mutex>
#include <vector>

namespace xlbook {
namespace security {

namespace {

struct AlgorithmEntry {
    const char* name;
    HashAlgorithm algorithm;
};

constexpr AlgorithmEntry kAlgorithms[] = {
    {"XOR", HashAlgorithm::XOR},
    {"MD4", HashAlgorithm::MD4},
    {"MD5", HashAlgorithm::MD5},
    {"SHA-1", HashAlgorithm::SHA1},
    {"SHA-256", HashAlgorithm::SHA256},
    {"SHA-384", HashAlgorithm::SHA384},
    {"SHA-512", HashAlgorithm::SHA512},
};

constexpr size_t kLegacyPasswordLength = 15;

uint16_t rotateLeft15(uint16_t value) {
    return static_cast<uint16_t>(((value >> 14) & 0x01) | ((value << 1) & 0x7FFF));
}

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string lastOpenSSLError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

// OpenSSL 3 中 MD4 位于 legacy provider
void ensureLegacyProvider() {
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    static std::once_flag once;
    std::call_once(once, [] {
        if (!OSSL_PROVIDER_try_load(nullptr, "legacy", 1)) {
            SECURITY_WARN("OpenSSL legacy provider unavailable, MD4 hashing will fail");
        }
    });
#endif
}

const EVP_MD* digestFor(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::MD4:
            ensureLegacyProvider();
            return EVP_md4();
        case HashAlgorithm::MD5:    return EVP_md5();
        case HashAlgorithm::SHA1:   return EVP_sha1();
        case HashAlgorithm::SHA256: return EVP_sha256();
        case HashAlgorithm::SHA384: return EVP_sha384();
        case HashAlgorithm::SHA512: return EVP_sha512();
        case HashAlgorithm::XOR:    break;
    }
    return nullptr;
}

bool digestOnce(EVP_MD_CTX* ctx, const EVP_MD* md,
                const unsigned char* first, size_t first_len,
                const unsigned char* second, size_t second_len,
                std::vector<unsigned char>& out) {
    unsigned int out_len = 0;
    out.resize(static_cast<size_t>(EVP_MD_size(md)));
    return EVP_DigestInit_ex(ctx, md, nullptr) == 1 &&
           EVP_DigestUpdate(ctx, first, first_len) == 1 &&
           EVP_DigestUpdate(ctx, second, second_len) == 1 &&
           EVP_DigestFinal_ex(ctx, out.data(), &out_len) == 1 &&
           out_len == out.size();
}

} // namespace

core::Result<HashAlgorithm> PasswordHasher::parseAlgorithm(const std::string& name) {
    for (const auto& entry : kAlgorithms) {
        if (name == entry.name) {
            return entry.algorithm;
        }
    }
    SECURITY_ERROR("Unsupported hash algorithm: '{}'", name);
    return core::makeError(core::ErrorCode::UnsupportedHashAlgorithm,
                           fmt::format("Unsupported hash algorithm: '{}'", name));
}

const char* PasswordHasher::algorithmName(HashAlgorithm algorithm) {
    for (const auto& entry : kAlgorithms) {
        if (entry.algorithm == algorithm) {
            return entry.name;
        }
    }
    return "";
}

core::Result<PasswordHash> PasswordHasher::derivePasswordHash(const std::string& password,
                                                              const std::string& algorithm,
                                                              const std::string& salt,
                                                              int spin_count) {
    auto parsed = parseAlgorithm(algorithm);
    if (!parsed) {
        return parsed.error();
    }

    auto utf16 = toUtf16(password);
    if (!utf16) {
        return utf16.error();
    }
    if (utf16->empty() || utf16->size() > core::Constants::kMaxPasswordLength) {
        SECURITY_ERROR("Password length {} outside 1-{}", utf16->size(), core::Constants::kMaxPasswordLength);
        return core::makeError(core::ErrorCode::InvalidArgument,
                               fmt::format("Password length must be between 1 and {} characters",
                                           core::Constants::kMaxPasswordLength));
    }

    if (*parsed == HashAlgorithm::XOR) {
        return PasswordHash{legacyPasswordHash(*utf16), ""};
    }

    if (spin_count < 0) {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               fmt::format("Invalid spin count: {}", spin_count));
    }

    std::string salt_bytes;
    if (salt.empty()) {
        auto generated = randomBytes(core::Constants::kPasswordSaltLength);
        if (!generated) {
            return generated.error();
        }
        salt_bytes = std::move(generated).value();
    } else {
        auto decoded = decodeBase64(salt);
        if (!decoded) {
            return decoded.error();
        }
        salt_bytes = std::move(decoded).value();
    }

    auto digest = iteratedDigest(*parsed, salt_bytes, *utf16, spin_count);
    if (!digest) {
        return digest.error();
    }

    SECURITY_DEBUG("Derived {} password hash with {} iterations", algorithm, spin_count);
    return PasswordHash{encodeBase64(*digest), encodeBase64(salt_bytes)};
}

core::Result<std::string> PasswordHasher::iteratedDigest(HashAlgorithm algorithm, const std::string& salt,
                                                         const std::u16string& password, int spin_count) {
    const EVP_MD* md = digestFor(algorithm);
    if (!md) {
        return core::makeError(core::ErrorCode::UnsupportedHashAlgorithm,
                               fmt::format("No digest for algorithm {}", algorithmName(algorithm)));
    }

    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        return core::makeError(core::ErrorCode::OutOfMemory, "EVP_MD_CTX_new failed");
    }

    std::vector<unsigned char> encoded;
    encoded.reserve(password.size() * 2);
    for (char16_t ch : password) {
        encoded.push_back(static_cast<unsigned char>(ch & 0xFF));
        encoded.push_back(static_cast<unsigned char>((ch >> 8) & 0xFF));
    }

    std::vector<unsigned char> key;
    if (!digestOnce(ctx.get(), md,
                    reinterpret_cast<const unsigned char*>(salt.data()), salt.size(),
                    encoded.data(), encoded.size(), key)) {
        std::string message = lastOpenSSLError();
        SECURITY_ERROR("Initial {} digest failed: {}", algorithmName(algorithm), message);
        return core::makeError(core::ErrorCode::CryptoFailure, message);
    }

    std::vector<unsigned char> next;
    for (int i = 0; i < spin_count; ++i) {
        const uint32_t n = static_cast<uint32_t>(i);
        const unsigned char iterator[4] = {
            static_cast<unsigned char>(n & 0xFF),
            static_cast<unsigned char>((n >> 8) & 0xFF),
            static_cast<unsigned char>((n >> 16) & 0xFF),
            static_cast<unsigned char>((n >> 24) & 0xFF)
        };
        if (!digestOnce(ctx.get(), md, key.data(), key.size(), iterator, sizeof(iterator), next)) {
            std::string message = lastOpenSSLError();
            SECURITY_ERROR("{} digest failed at iteration {}: {}", algorithmName(algorithm), i, message);
            return core::makeError(core::ErrorCode::CryptoFailure, message);
        }
        key.swap(next);
    }

    return std::string(key.begin(), key.end());
}

std::string PasswordHasher::legacyPasswordHash(const std::u16string& password) {
    // 旧式校验值只取前 15 个字符，每个字符取低字节（低字节为 0 时取高字节）
    std::vector<uint8_t> bytes;
    for (char16_t ch : password.substr(0, kLegacyPasswordLength)) {
        uint8_t low = static_cast<uint8_t>(ch & 0xFF);
        bytes.push_back(low != 0 ? low : static_cast<uint8_t>((ch >> 8) & 0xFF));
    }

    uint16_t verifier = 0;
    for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
        verifier = rotateLeft15(verifier);
        verifier ^= *it;
    }
    verifier = rotateLeft15(verifier);
    verifier ^= static_cast<uint16_t>(bytes.size());
    verifier ^= 0xCE4B;
    return fmt::format("{:04X}", verifier);
}

std::string PasswordHasher::encodeBase64(const std::string& bytes) {
    if (bytes.empty()) {
        return std::string();
    }
    std::string out(4 * ((bytes.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(bytes.data()),
                                  static_cast<int>(bytes.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

core::Result<std::string> PasswordHasher::decodeBase64(const std::string& text) {
    if (text.empty() || text.size() % 4 != 0) {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               fmt::format("Invalid base64 value: '{}'", text));
    }

    std::string out(3 * text.size() / 4, '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               fmt::format("Invalid base64 value: '{}'", text));
    }

    // EVP_DecodeBlock 不去除填充产生的零字节
    size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

core::Result<std::string> PasswordHasher::randomBytes(size_t length) {
    std::string bytes(length, '\0');
    if (length > 0 && RAND_bytes(reinterpret_cast<unsigned char*>(&bytes[0]), static_cast<int>(length)) != 1) {
        std::string message = lastOpenSSLError();
        SECURITY_ERROR("RAND_bytes failed: {}", message);
        return core::makeError(core::ErrorCode::CryptoFailure, message);
    }
    return bytes;
}

core::Result<std::u16string> PasswordHasher::toUtf16(const std::string& password) {
    std::u16string result;
    try {
        utf8::utf8to16(password.begin(), password.end(), std::back_inserter(result));
    } catch (const utf8::exception& e) {
        SECURITY_ERROR("Password is not valid UTF-8: {}", e.what());
        return core::makeError(core::ErrorCode::InvalidArgument,
                               fmt::format("Password is not valid UTF-8: {}", e.what()));
    }
    return result;
}

}} // namespace xlbook::security
