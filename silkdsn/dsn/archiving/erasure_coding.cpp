// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "erasure_coding.hpp"

#include <array>
#include <cstdint>

namespace silkdsn::dsn {

namespace {

// GF(2^8) with primitive polynomial x^8 + x^4 + x^3 + x^2 + 1
class GaloisField {
  public:
    GaloisField() {
        unsigned x{1};
        for (unsigned i{0}; i < 255; ++i) {
            exp_[i] = static_cast<uint8_t>(x);
            exp_[i + 255] = static_cast<uint8_t>(x);
            log_[x] = static_cast<uint8_t>(i);
            x <<= 1;
            if (x & 0x100) {
                x ^= 0x11d;
            }
        }
    }

    uint8_t mul(uint8_t a, uint8_t b) const {
        if (a == 0 || b == 0) return 0;
        return exp_[log_[a] + log_[b]];
    }

    //! \pre b != 0
    uint8_t div(uint8_t a, uint8_t b) const {
        if (a == 0) return 0;
        return exp_[log_[a] + 255 - log_[b]];
    }

  private:
    std::array<uint8_t, 510> exp_{};
    std::array<uint8_t, 256> log_{};
};

const GaloisField& field() {
    static const GaloisField kField;
    return kField;
}

struct KnownShard {
    uint8_t x{0};
    ByteView data;
};

//! Evaluates at every target point the polynomial through the known shards
std::vector<Bytes> interpolate(const std::vector<KnownShard>& known, const std::vector<uint8_t>& targets, size_t shard_size) {
    const GaloisField& gf{field()};

    // Lagrange denominators do not depend on the target
    std::vector<uint8_t> denominators(known.size(), 1);
    for (size_t j{0}; j < known.size(); ++j) {
        for (size_t m{0}; m < known.size(); ++m) {
            if (m != j) {
                denominators[j] = gf.mul(denominators[j], known[j].x ^ known[m].x);
            }
        }
    }

    std::vector<Bytes> results;
    results.reserve(targets.size());
    std::vector<uint8_t> coefficients(known.size());
    for (const uint8_t t : targets) {
        uint8_t total{1};
        for (const auto& shard : known) {
            total = gf.mul(total, t ^ shard.x);
        }
        for (size_t j{0}; j < known.size(); ++j) {
            coefficients[j] = gf.div(gf.div(total, t ^ known[j].x), denominators[j]);
        }

        Bytes out(shard_size, 0);
        for (size_t j{0}; j < known.size(); ++j) {
            const uint8_t c{coefficients[j]};
            if (c == 0) continue;
            const ByteView data{known[j].data};
            for (size_t b{0}; b < shard_size; ++b) {
                out[b] ^= gf.mul(c, data[b]);
            }
        }
        results.push_back(std::move(out));
    }
    return results;
}

}  // namespace

tl::expected<std::vector<Bytes>, ErasureCodingError> ErasureCoding::extend(std::span<const Bytes> source) {
    if (source.empty() || source.size() * 2 > 256) {
        return tl::unexpected{ErasureCodingError::kWrongShardCount};
    }
    const size_t shard_size{source.front().size()};
    std::vector<KnownShard> known;
    known.reserve(source.size());
    for (size_t i{0}; i < source.size(); ++i) {
        if (source[i].size() != shard_size) {
            return tl::unexpected{ErasureCodingError::kShardSizeMismatch};
        }
        known.push_back({static_cast<uint8_t>(i), source[i]});
    }

    std::vector<uint8_t> targets;
    targets.reserve(source.size());
    for (size_t j{0}; j < source.size(); ++j) {
        targets.push_back(static_cast<uint8_t>(source.size() + j));
    }
    return interpolate(known, targets, shard_size);
}

tl::expected<std::vector<Bytes>, ErasureCodingError> ErasureCoding::recover_source(std::span<const std::optional<Bytes>> shards) {
    if (shards.empty() || shards.size() % 2 != 0 || shards.size() > 256) {
        return tl::unexpected{ErasureCodingError::kWrongShardCount};
    }
    const size_t num_source{shards.size() / 2};

    // Source shards come first so that they are preferred over parity ones
    std::vector<KnownShard> known;
    known.reserve(num_source);
    std::optional<size_t> shard_size;
    for (size_t i{0}; i < shards.size() && known.size() < num_source; ++i) {
        if (!shards[i]) continue;
        if (shard_size && shards[i]->size() != *shard_size) {
            return tl::unexpected{ErasureCodingError::kShardSizeMismatch};
        }
        shard_size = shards[i]->size();
        known.push_back({static_cast<uint8_t>(i), *shards[i]});
    }
    if (known.size() < num_source) {
        return tl::unexpected{ErasureCodingError::kNotEnoughShards};
    }

    std::vector<uint8_t> missing;
    for (size_t i{0}; i < num_source; ++i) {
        if (!shards[i]) {
            missing.push_back(static_cast<uint8_t>(i));
        }
    }
    std::vector<Bytes> recovered;
    if (!missing.empty()) {
        recovered = interpolate(known, missing, *shard_size);
    }

    std::vector<Bytes> source;
    source.reserve(num_source);
    auto next_recovered{recovered.begin()};
    for (size_t i{0}; i < num_source; ++i) {
        source.push_back(shards[i] ? *shards[i] : std::move(*next_recovered++));
    }
    return source;
}

}  // namespace silkdsn::dsn
