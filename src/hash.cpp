#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include "sandbox_probe/hash.hpp"

namespace sandbox_probe {

    namespace {
        constexpr std::size_t kBlockBytes = 64;
        constexpr std::size_t kReadChunk = 1 << 15;

        constexpr std::array<std::uint32_t, 64> kRoundConstants = {
            0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
            0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
            0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
            0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
            0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
            0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
            0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
            0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2};

        constexpr std::array<std::uint32_t, 8> kInitialState = {
            0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19};

        constexpr std::uint32_t rotr(std::uint32_t value, unsigned bits) {
            return (value >> bits) | (value << (32 - bits));
        }

        void compress(std::array<std::uint32_t, 8>& state, const std::uint8_t* block) {
            std::array<std::uint32_t, 64> w {};
            for (std::size_t i = 0; i < 16; ++i) {
                w[i] = (static_cast<std::uint32_t>(block[i * 4]) << 24) |
                       (static_cast<std::uint32_t>(block[i * 4 + 1]) << 16) |
                       (static_cast<std::uint32_t>(block[i * 4 + 2]) << 8) |
                       static_cast<std::uint32_t>(block[i * 4 + 3]);
            }
            for (std::size_t i = 16; i < 64; ++i) {
                const std::uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
                const std::uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
                w[i] = w[i - 16] + s0 + w[i - 7] + s1;
            }

            std::array<std::uint32_t, 8> v = state;
            for (std::size_t i = 0; i < 64; ++i) {
                const std::uint32_t sum1 = rotr(v[4], 6) ^ rotr(v[4], 11) ^ rotr(v[4], 25);
                const std::uint32_t choose = (v[4] & v[5]) ^ (~v[4] & v[6]);
                const std::uint32_t t1 = v[7] + sum1 + choose + kRoundConstants[i] + w[i];
                const std::uint32_t sum0 = rotr(v[0], 2) ^ rotr(v[0], 13) ^ rotr(v[0], 22);
                const std::uint32_t majority = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
                const std::uint32_t t2 = sum0 + majority;

                for (std::size_t j = 7; j > 0; --j) {
                    v[j] = v[j - 1];
                }
                v[4] += t1;
                v[0] = t1 + t2;
            }

            for (std::size_t i = 0; i < state.size(); ++i) {
                state[i] += v[i];
            }
        }

        class Digest {
        public:
            void feed(const std::uint8_t* data, std::size_t length) {
                total_bytes_ += length;
                while (length > 0) {
                    const std::size_t take = std::min(kBlockBytes - pending_, length);
                    std::memcpy(block_.data() + pending_, data, take);
                    pending_ += take;
                    data += take;
                    length -= take;
                    if (pending_ == kBlockBytes) {
                        compress(state_, block_.data());
                        pending_ = 0;
                    }
                }
            }

            std::string hex() {
                const std::uint64_t bit_length = total_bytes_ * 8;
                const std::uint8_t marker = 0x80;
                feed(&marker, 1);
                const std::uint8_t zero = 0;
                while (pending_ != kBlockBytes - 8) {
                    feed(&zero, 1);
                }
                std::array<std::uint8_t, 8> length_bytes {};
                for (std::size_t i = 0; i < 8; ++i) {
                    length_bytes[i] = static_cast<std::uint8_t>(bit_length >> (56 - 8 * i));
                }
                feed(length_bytes.data(), length_bytes.size());

                std::ostringstream oss;
                oss << std::hex << std::setfill('0');
                for (std::uint32_t word : state_) {
                    oss << std::setw(8) << word;
                }
                return oss.str();
            }

        private:
            std::array<std::uint32_t, 8> state_ = kInitialState;
            std::array<std::uint8_t, kBlockBytes> block_ {};
            std::size_t pending_ = 0;
            std::uint64_t total_bytes_ = 0;
        };
    }

    std::string sha256_hex(const std::string& data) {
        Digest digest;
        digest.feed(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
        return digest.hex();
    }

    std::optional<std::string> compute_sha256(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }

        Digest digest;
        std::array<char, kReadChunk> buffer {};
        while (file) {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const std::streamsize bytes_read = file.gcount();
            if (bytes_read > 0) {
                digest.feed(reinterpret_cast<const std::uint8_t*>(buffer.data()), static_cast<std::size_t>(bytes_read));
            }
        }

        if (!file.eof()) {
            return std::nullopt;
        }
        return digest.hex();
    }
}
