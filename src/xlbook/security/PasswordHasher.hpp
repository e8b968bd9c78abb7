#pragma once

#include "xlbook/core/Expected.hpp"
#include "xlbook/core/Constants.hpp"
#include <string>

namespace xlbook {
namespace security {

/**
 * @brief 工作簿保护支持的哈希算法
 */
enum class HashAlgorithm {
    XOR,      // ECMA-376 旧式 16 位校验值
    MD4,
    MD5,
    SHA1,
    SHA256,
    SHA384,
    SHA512
};

/**
 * @brief 派生结果（均为部件中存储的文本形式）
 */
struct PasswordHash {
    std::string hash;
    std::string salt;   // base64，XOR 算法为空
};

/**
 * @brief 工作簿保护密码哈希
 *
 * 摘要计算委托给 OpenSSL EVP，随机盐来自 RAND_bytes，
 * 密码按 UTF-16LE 编码（utfcpp）参与计算。
 */
class PasswordHasher {
public:
    /**
     * @brief 解析算法名（XOR、MD4、MD5、SHA-1、SHA-256、SHA-384、SHA-512）
     * @return 不支持的名称返回 UnsupportedHashAlgorithm
     */
    static core::Result<HashAlgorithm> parseAlgorithm(const std::string& name);

    static const char* algorithmName(HashAlgorithm algorithm);

    /**
     * @brief 派生密码哈希
     *
     * H0 = H(salt || UTF16LE(password))，随后 spin_count 轮 H = H(H || uint32_le(i))。
     *
     * @param password 明文密码（UTF-8），长度 1-255 个字符
     * @param algorithm 算法名
     * @param salt base64 盐，为空时生成 16 字节随机盐
     * @param spin_count 迭代次数
     */
    static core::Result<PasswordHash> derivePasswordHash(const std::string& password,
                                                         const std::string& algorithm,
                                                         const std::string& salt = "",
                                                         int spin_count = core::Constants::kWorkbookProtectionSpinCount);

    /**
     * @brief ECMA-376 旧式密码校验值，4 位大写十六进制
     */
    static std::string legacyPasswordHash(const std::u16string& password);

    static std::string encodeBase64(const std::string& bytes);
    static core::Result<std::string> decodeBase64(const std::string& text);

    /**
     * @brief 生成随机字节
     */
    static core::Result<std::string> randomBytes(size_t length);

private:
    static core::Result<std::u16string> toUtf16(const std::string& password);
    static core::Result<std::string> iteratedDigest(HashAlgorithm algorithm, const std::string& salt,
                                                    const std::u16string& password, int spin_count);
};

}} // namespace xlbook::security
