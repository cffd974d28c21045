#ifndef KGRAPH_VECTOR_QUANTIZATION_H_
#define KGRAPH_VECTOR_QUANTIZATION_H_

#include <cstdint>
#include <vector>

#include "kgraph/core/types.h"

namespace kgraph {
namespace vector {

/**
 * @brief 8-bit affine quantized vector: value ~= (q[i] - zero) * scale + offset
 *
 * offset is 0 unless the range excludes zero, in which case it holds the
 * minimum and zero is 0.
 */
struct QuantizedVector {
    std::vector<uint8_t> q;
    float scale = 1.0f;
    int32_t zero = 0;
    float offset = 0.0f;
};

/**
 * @brief Quantize to 8 bits over the vector's own [min, max] range
 *
 * scale = (max - min) / 255, or 1 when the range is zero or not finite.
 * When min <= 0 <= max, zero = round(-min / scale), which lies in [0, 255];
 * otherwise offset = min. Reconstruction error is at most half a step.
 */
QuantizedVector Quantize8(const core::Vector& values);

core::Vector Dequantize8(const QuantizedVector& quantized);

double Dot(const core::Vector& a, const core::Vector& b);
double Norm(const core::Vector& v);

/**
 * @brief Unit-length copy; zero or non-finite norms pass through unchanged
 */
core::Vector L2Normalize(const core::Vector& v);

/**
 * @brief Cosine similarity; 0 for mismatched lengths or zero vectors
 */
double Cosine(const core::Vector& a, const core::Vector& b);

} // namespace vector
} // namespace kgraph

#endif // KGRAPH_VECTOR_QUANTIZATION_H_
