#include "EncryptionManager.hpp"
#include "EncryptionErrors.hpp"
#include "Encoding.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <cstring>
#include <memory>

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

std::string SealedField::serialize() const {
    nlohmann::json j;
    j["ciphertext"] = toBase64(encAndTag);
    j["iv"] = toBase64(iv);
    return j.dump();
}

SealedField SealedField::parse(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()
        || !j.contains("ciphertext") || !j["ciphertext"].is_string()
        || !j.contains("iv") || !j["iv"].is_string()) {
        throw std::invalid_argument("SealedField: not a {ciphertext, iv} pair");
    }
    SealedField out;
    out.encAndTag = fromBase64(j["ciphertext"].get<std::string>());
    out.iv        = fromBase64(j["iv"].get<std::string>());
    return out;
}

EncryptionManager::EncryptionManager(const std::vector<std::uint8_t>& key)
: m_key(key)
{
    if (m_key.size() != KEY_LEN) {
        OPENSSL_cleanse(m_key.data(), m_key.size());
        throw std::invalid_argument("EncryptionManager: key must be 32 bytes");
    }
}

EncryptionManager::~EncryptionManager() {
    OPENSSL_cleanse(m_key.data(), m_key.size());
}

SealedField EncryptionManager::encrypt(const std::vector<std::uint8_t>& plaintext) const {
    SealedField out;
    out.iv.resize(IV_LEN);
    if (RAND_bytes(out.iv.data(), static_cast<int>(out.iv.size())) != 1) {
        throw std::runtime_error("encrypt: RAND_bytes(IV) failed");
    }

    out.encAndTag.resize(plaintext.size() + TAG_LEN);

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw std::runtime_error("EncryptInit cipher failed");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_LEN, nullptr) != 1)
        throw std::runtime_error("SET_IVLEN failed");
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), out.iv.data()) != 1)
        throw std::runtime_error("EncryptInit key/iv failed");

    int outLen1 = 0;
    if (!plaintext.empty()
        && EVP_EncryptUpdate(ctx.get(),
                             out.encAndTag.data(), &outLen1,
                             plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("EncryptUpdate data failed");
    }

    int outLen2 = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.encAndTag.data() + outLen1, &outLen2) != 1) {
        throw std::runtime_error("EncryptFinal failed");
    }

    std::uint8_t tag[TAG_LEN];
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_LEN, tag) != 1)
        throw std::runtime_error("GET_TAG failed");

    out.encAndTag.resize(static_cast<std::size_t>(outLen1 + outLen2) + TAG_LEN);
    std::memcpy(out.encAndTag.data() + (out.encAndTag.size() - TAG_LEN), tag, TAG_LEN);

    return out;
}

std::vector<std::uint8_t> EncryptionManager::decrypt(const SealedField& sealed) const {
    if (sealed.iv.size() != IV_LEN) {
        throw std::invalid_argument("decrypt: IV must be 12 bytes");
    }
    if (sealed.encAndTag.size() < TAG_LEN) {
        throw std::invalid_argument("decrypt: input too short");
    }

    const std::size_t cLen = sealed.encAndTag.size() - TAG_LEN;
    const std::uint8_t* ciphertext = sealed.encAndTag.data();
    const std::uint8_t* tag        = sealed.encAndTag.data() + cLen;

    std::vector<std::uint8_t> plaintext(cLen);

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw std::runtime_error("DecryptInit cipher failed");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_LEN, nullptr) != 1)
        throw std::runtime_error("SET_IVLEN failed");
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), sealed.iv.data()) != 1)
        throw std::runtime_error("DecryptInit key/iv failed");

    int pLen1 = 0;
    if (cLen > 0
        && EVP_DecryptUpdate(ctx.get(), plaintext.data(), &pLen1,
                             ciphertext, static_cast<int>(cLen)) != 1)
        throw std::runtime_error("DecryptUpdate data failed");

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_LEN,
                            const_cast<std::uint8_t*>(tag)) != 1)
        throw std::runtime_error("SET_TAG failed");

    int pLen2 = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + pLen1, &pLen2) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw AuthenticationError();
    }

    plaintext.resize(static_cast<std::size_t>(pLen1 + pLen2));
    return plaintext;
}

std::string EncryptionManager::seal(const std::string& plaintext) const {
    return encrypt(toBytes(plaintext)).serialize();
}

std::string EncryptionManager::open(const std::string& serialized) const {
    auto pt = decrypt(SealedField::parse(serialized));
    std::string out = toString(pt);
    OPENSSL_cleanse(pt.data(), pt.size());
    return out;
}
