// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pkce.h"

#include "hv/base64.h"
#include "spdlog/spdlog.h"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <random>
#include <vector>

// =============================================================================
// SHA-256 (FIPS 180-4)
// =============================================================================

namespace {

const uint32_t K256[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2};

const uint32_t H0[8] = {0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
                        0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19};

inline uint32_t rotr(uint32_t x, int n) {
    return (x >> n) | (x << (32 - n));
}

/**
 * @brief Streaming digest state
 *
 * Only whole-message hashing is needed here, but the update/finish split
 * keeps padding in one place.
 */
class Sha256 {
  public:
    Sha256() {
        std::memcpy(state_, H0, sizeof(state_));
    }

    void update(const unsigned char* data, size_t len) {
        size_t buffered = static_cast<size_t>(total_ % 64);
        total_ += len;

        if (buffered > 0) {
            size_t fill = 64 - buffered;
            if (len < fill) {
                std::memcpy(block_ + buffered, data, len);
                return;
            }
            std::memcpy(block_ + buffered, data, fill);
            compress(block_);
            data += fill;
            len -= fill;
        }

        for (; len >= 64; data += 64, len -= 64) {
            compress(data);
        }

        if (len > 0) {
            std::memcpy(block_, data, len);
        }
    }

    std::array<unsigned char, 32> finish() {
        uint64_t bit_len = total_ * 8;
        size_t buffered = static_cast<size_t>(total_ % 64);

        block_[buffered++] = 0x80;
        if (buffered > 56) {
            std::memset(block_ + buffered, 0, 64 - buffered);
            compress(block_);
            buffered = 0;
        }
        std::memset(block_ + buffered, 0, 56 - buffered);
        for (int i = 0; i < 8; ++i) {
            block_[56 + i] = static_cast<unsigned char>(bit_len >> (56 - i * 8));
        }
        compress(block_);

        std::array<unsigned char, 32> digest{};
        for (int i = 0; i < 8; ++i) {
            digest[i * 4] = static_cast<unsigned char>(state_[i] >> 24);
            digest[i * 4 + 1] = static_cast<unsigned char>(state_[i] >> 16);
            digest[i * 4 + 2] = static_cast<unsigned char>(state_[i] >> 8);
            digest[i * 4 + 3] = static_cast<unsigned char>(state_[i]);
        }
        return digest;
    }

  private:
    void compress(const unsigned char* block) {
        uint32_t w[64];
        for (int i = 0; i < 16; ++i) {
            w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
                   (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
                   (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
                   static_cast<uint32_t>(block[i * 4 + 3]);
        }
        for (int i = 16; i < 64; ++i) {
            uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
            uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
            w[i] = s1 + w[i - 7] + s0 + w[i - 16];
        }

        uint32_t v[8];
        std::memcpy(v, state_, sizeof(v));
        for (int i = 0; i < 64; ++i) {
            uint32_t e = v[4];
            uint32_t a = v[0];
            uint32_t t1 = v[7] + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25)) +
                          ((e & v[5]) ^ (~e & v[6])) + K256[i] + w[i];
            uint32_t t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22)) +
                          ((a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]));
            std::memmove(v + 1, v, 7 * sizeof(uint32_t));
            v[4] += t1;
            v[0] = t1 + t2;
        }
        for (int i = 0; i < 8; ++i) {
            state_[i] += v[i];
        }
    }

    uint32_t state_[8];
    uint64_t total_ = 0;
    unsigned char block_[64] = {};
};

std::vector<unsigned char> random_bytes(size_t n) {
    std::vector<unsigned char> bytes(n);

    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.good() && urandom.read(reinterpret_cast<char*>(bytes.data()),
                                       static_cast<std::streamsize>(n))) {
        return bytes;
    }

    spdlog::warn("[PKCE] /dev/urandom unavailable, using std::random_device");
    std::random_device rd;
    for (size_t i = 0; i < n; i += 4) {
        uint32_t val = rd();
        for (size_t b = 0; b < 4 && i + b < n; ++b) {
            bytes[i + b] = static_cast<unsigned char>((val >> (b * 8)) & 0xFF);
        }
    }
    return bytes;
}

} // namespace

namespace magpie::pkce {

std::array<unsigned char, 32> sha256(const std::string& input) {
    Sha256 ctx;
    ctx.update(reinterpret_cast<const unsigned char*>(input.data()), input.size());
    return ctx.finish();
}

std::string sha256_hex(const std::string& input) {
    auto digest = sha256(input);
    char hex[65];
    for (size_t i = 0; i < digest.size(); ++i) {
        std::snprintf(hex + i * 2, 3, "%02x", digest[i]);
    }
    return std::string(hex, 64);
}

std::string base64url_encode(const unsigned char* data, size_t len) {
    std::string out = hv::Base64Encode(data, static_cast<unsigned int>(len));
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (char& c : out) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    return out;
}

std::string random_token(size_t num_bytes) {
    auto bytes = random_bytes(num_bytes);
    return base64url_encode(bytes.data(), bytes.size());
}

std::string challenge_for(const std::string& verifier) {
    auto digest = sha256(verifier);
    return base64url_encode(digest.data(), digest.size());
}

PkceVerifier PkceVerifier::generate() {
    return PkceVerifier(random_token(32));
}

} // namespace magpie::pkce
