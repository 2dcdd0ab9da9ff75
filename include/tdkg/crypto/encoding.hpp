#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "tdkg/common/bytes.hpp"
#include "tdkg/crypto/ec_point.hpp"
#include "tdkg/crypto/scalar.hpp"

namespace tdkg {

constexpr size_t kPointCompressedLen = 33;
constexpr size_t kScalarLen = 32;

void AppendU32Be(uint32_t value, Bytes* out);
uint32_t ReadU32Be(std::span<const uint8_t> input, size_t* offset);

void AppendSizedField(std::span<const uint8_t> field, Bytes* out);
Bytes ReadSizedField(std::span<const uint8_t> input,
                     size_t* offset,
                     size_t max_len,
                     const char* field_name);

Bytes EncodePoint(const ECPoint& point);
ECPoint DecodePoint(std::span<const uint8_t> encoded);

void AppendPoint(const ECPoint& point, Bytes* out);
ECPoint ReadPoint(std::span<const uint8_t> input, size_t* offset);

void AppendScalar(const Scalar& scalar, Bytes* out);
Scalar ReadScalar(std::span<const uint8_t> input, size_t* offset);

// u32 count followed by `count` compressed points.
void AppendPointVector(const std::vector<ECPoint>& points, Bytes* out);
std::vector<ECPoint> ReadPointVector(std::span<const uint8_t> input,
                                     size_t* offset,
                                     size_t max_count);

}  // namespace tdkg
