// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
Facilities to deal with byte order/endianness
See https://en.wikipedia.org/wiki/Endianness
*/

#include <cstdint>

#include <boost/endian/conversion.hpp>

#include <silkdsn/core/common/bytes.hpp>

namespace silkdsn::endian {

inline uint32_t load_little_u32(const uint8_t* src) { return boost::endian::load_little_u32(src); }
inline uint64_t load_little_u64(const uint8_t* src) { return boost::endian::load_little_u64(src); }

inline void store_little_u32(uint8_t* dst, uint32_t value) { boost::endian::store_little_u32(dst, value); }
inline void store_little_u64(uint8_t* dst, uint64_t value) { boost::endian::store_little_u64(dst, value); }

//! \brief Appends the little endian form of value to out
void append_little_u32(Bytes& out, uint32_t value);

//! \brief Appends the little endian form of value to out
void append_little_u64(Bytes& out, uint64_t value);

}  // namespace silkdsn::endian
