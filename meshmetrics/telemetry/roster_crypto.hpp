// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

/*
 * telemetry/roster_crypto.hpp
 *
 * At-rest encryption of the device roster. The format is the one written by
 *
 *   openssl enc -aes-256-cbc -pbkdf2 -iter 1000 -md sha256 -salt [-a]
 *
 * i.e. an optional base64 wrapper around "Salted__" + 8-byte salt + AES-256-CBC ciphertext, with key and IV taken
 * from a 48-byte PBKDF2-HMAC-SHA256 derivation (1000 rounds). Payloads without the marker use a fixed salt.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace meshmetrics {

class RosterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline constexpr std::string_view kSaltMarker = "Salted__";
inline constexpr std::string_view kFallbackSalt = "12345678";
inline constexpr int kPbkdf2Iterations = 1000;

using Salt = std::array<uint8_t, 8>;

// Decodes standard base64, ignoring ASCII whitespace. Returns nullopt if the text is not valid base64.
std::optional<std::string> base64_decode(std::string_view text);

// Standard base64 with '=' padding, optionally wrapped at 64 columns like `openssl enc -a`.
std::string base64_encode(std::string_view data, bool wrap_lines = true);

/**
 * Decrypts an encrypted roster and returns the plaintext CSV.
 * Throws RosterError on malformed input, bad padding (typically a wrong password), or plaintext that is not valid
 * UTF-8 text.
 */
std::string decrypt_roster(std::string_view payload, std::string_view password);

struct RosterEncryptionOptions {
    bool base64 = true;
    // Random when unset. Ignored when with_marker is false, in which case the fallback salt is used.
    std::optional<Salt> salt;
    bool with_marker = true;
};

std::string encrypt_roster(
    std::string_view plaintext, std::string_view password, const RosterEncryptionOptions& options = {});

}  // namespace meshmetrics
