// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <telemetry/roster_crypto.hpp>

namespace meshmetrics {

namespace {

constexpr size_t kKeySize = 32;
constexpr size_t kIvSize = 16;
constexpr size_t kBlockSize = 16;

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

std::string openssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    ERR_clear_error();
    return buffer;
}

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=';
}

struct DerivedKey {
    std::array<uint8_t, kKeySize> key;
    std::array<uint8_t, kIvSize> iv;
};

DerivedKey derive_key(std::string_view password, const uint8_t* salt, size_t salt_len) {
    std::array<uint8_t, kKeySize + kIvSize> key_iv{};
    if (PKCS5_PBKDF2_HMAC(
            password.data(),
            static_cast<int>(password.size()),
            salt,
            static_cast<int>(salt_len),
            kPbkdf2Iterations,
            EVP_sha256(),
            static_cast<int>(key_iv.size()),
            key_iv.data()) != 1) {
        throw RosterError("Key derivation failed: " + openssl_error_string());
    }

    DerivedKey derived{};
    std::copy(key_iv.begin(), key_iv.begin() + kKeySize, derived.key.begin());
    std::copy(key_iv.begin() + kKeySize, key_iv.end(), derived.iv.begin());
    return derived;
}

// Accepts everything except control characters other than tab, CR and LF, and malformed UTF-8 sequences.
bool is_valid_text(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            if (c < 0x20 && c != '\t' && c != '\n' && c != '\r') {
                return false;
            }
            if (c == 0x7f) {
                return false;
            }
            i++;
            continue;
        }

        size_t continuation = 0;
        if ((c & 0xe0) == 0xc0 && c >= 0xc2) {
            continuation = 1;
        } else if ((c & 0xf0) == 0xe0) {
            continuation = 2;
        } else if ((c & 0xf8) == 0xf0 && c <= 0xf4) {
            continuation = 3;
        } else {
            return false;
        }
        if (i + continuation >= text.size()) {
            return false;
        }
        for (size_t k = 1; k <= continuation; k++) {
            if ((static_cast<unsigned char>(text[i + k]) & 0xc0) != 0x80) {
                return false;
            }
        }
        i += continuation + 1;
    }
    return true;
}

}  // namespace

std::optional<std::string> base64_decode(std::string_view text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (!is_base64_char(c)) {
            return std::nullopt;
        }
        compact += c;
    }
    if (compact.empty() || compact.size() % 4 != 0) {
        return std::nullopt;
    }

    size_t padding = 0;
    if (compact.back() == '=') {
        padding++;
        if (compact[compact.size() - 2] == '=') {
            padding++;
        }
    }
    // '=' is only legal as trailing padding
    if (compact.find('=') < compact.size() - padding) {
        return std::nullopt;
    }

    std::string decoded(compact.size() / 4 * 3, '\0');
    int written = EVP_DecodeBlock(
        reinterpret_cast<unsigned char*>(decoded.data()),
        reinterpret_cast<const unsigned char*>(compact.data()),
        static_cast<int>(compact.size()));
    if (written < 0) {
        return std::nullopt;
    }
    decoded.resize(static_cast<size_t>(written) - padding);
    return decoded;
}

std::string base64_encode(std::string_view data, bool wrap_lines) {
    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(encoded.data()),
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<int>(data.size()));
    encoded.resize(static_cast<size_t>(written));

    if (!wrap_lines) {
        return encoded;
    }

    constexpr size_t line_width = 64;
    std::string wrapped;
    for (size_t pos = 0; pos < encoded.size(); pos += line_width) {
        wrapped += encoded.substr(pos, line_width);
        wrapped += '\n';
    }
    return wrapped;
}

std::string decrypt_roster(std::string_view payload, std::string_view password) {
    std::string raw;
    if (auto decoded = base64_decode(payload)) {
        raw = std::move(*decoded);
    } else {
        raw = std::string(payload);
    }

    std::string_view ciphertext = raw;
    std::string_view salt = kFallbackSalt;
    if (ciphertext.starts_with(kSaltMarker)) {
        if (ciphertext.size() < kSaltMarker.size() + 8) {
            throw RosterError("Encrypted roster is truncated: salt header incomplete");
        }
        salt = ciphertext.substr(kSaltMarker.size(), 8);
        ciphertext.remove_prefix(kSaltMarker.size() + 8);
    }

    if (ciphertext.empty() || ciphertext.size() % kBlockSize != 0) {
        throw RosterError(fmt::format(
            "Encrypted roster has invalid length {} (expected a non-zero multiple of {})",
            ciphertext.size(),
            kBlockSize));
    }

    DerivedKey derived = derive_key(password, reinterpret_cast<const uint8_t*>(salt.data()), salt.size());

    CipherContext ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, derived.key.data(), derived.iv.data()) != 1) {
        throw RosterError("Cipher initialisation failed: " + openssl_error_string());
    }

    std::string plaintext(ciphertext.size() + kBlockSize, '\0');
    int out_len = 0;
    if (EVP_DecryptUpdate(
            ctx.get(),
            reinterpret_cast<unsigned char*>(plaintext.data()),
            &out_len,
            reinterpret_cast<const unsigned char*>(ciphertext.data()),
            static_cast<int>(ciphertext.size())) != 1) {
        throw RosterError("Decryption failed: " + openssl_error_string());
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()) + out_len, &final_len) !=
        1) {
        ERR_clear_error();
        throw RosterError("Decryption failed: bad padding (wrong password?)");
    }
    plaintext.resize(static_cast<size_t>(out_len + final_len));

    if (!is_valid_text(plaintext)) {
        throw RosterError("Decrypted roster is not valid UTF-8 text (wrong password?)");
    }
    return plaintext;
}

std::string encrypt_roster(
    std::string_view plaintext, std::string_view password, const RosterEncryptionOptions& options) {
    Salt salt{};
    if (!options.with_marker) {
        std::copy(kFallbackSalt.begin(), kFallbackSalt.end(), salt.begin());
    } else if (options.salt) {
        salt = *options.salt;
    } else if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw RosterError("Cannot generate salt: " + openssl_error_string());
    }

    DerivedKey derived = derive_key(password, salt.data(), salt.size());

    CipherContext ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, derived.key.data(), derived.iv.data()) != 1) {
        throw RosterError("Cipher initialisation failed: " + openssl_error_string());
    }

    std::string ciphertext(plaintext.size() + kBlockSize, '\0');
    int out_len = 0;
    if (EVP_EncryptUpdate(
            ctx.get(),
            reinterpret_cast<unsigned char*>(ciphertext.data()),
            &out_len,
            reinterpret_cast<const unsigned char*>(plaintext.data()),
            static_cast<int>(plaintext.size())) != 1) {
        throw RosterError("Encryption failed: " + openssl_error_string());
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(ciphertext.data()) + out_len, &final_len) !=
        1) {
        throw RosterError("Encryption failed: " + openssl_error_string());
    }
    ciphertext.resize(static_cast<size_t>(out_len + final_len));

    std::string payload;
    if (options.with_marker) {
        payload += kSaltMarker;
        payload.append(reinterpret_cast<const char*>(salt.data()), salt.size());
    }
    payload += ciphertext;

    return options.base64 ? base64_encode(payload) : payload;
}

}  // namespace meshmetrics
