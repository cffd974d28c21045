#include "kgraph/vector/quantization.h"

#include <algorithm>
#include <cmath>

namespace kgraph {
namespace vector {

QuantizedVector Quantize8(const core::Vector& values) {
    QuantizedVector out;
    if (values.empty()) {
        return out;
    }
    auto minmax = std::minmax_element(values.begin(), values.end());
    const double lo = *minmax.first;
    const double hi = *minmax.second;
    const double range = hi - lo;
    const double scale = (range > 0.0 && std::isfinite(range)) ? range / 255.0 : 1.0;
    out.scale = static_cast<float>(scale);
    out.q.resize(values.size());
    if (lo <= 0.0 && hi >= 0.0) {
        // Already in [0, 255] for finite input; the clamp covers infinities.
        const double zero = std::min(255.0, std::max(0.0, std::round(-lo / scale)));
        out.zero = static_cast<int32_t>(zero);
        for (size_t i = 0; i < values.size(); ++i) {
            double q = std::round(values[i] / scale + zero);
            out.q[i] = static_cast<uint8_t>(std::min(255.0, std::max(0.0, q)));
        }
        return out;
    }
    // A zero point this far outside [0, 255] would not fit the code range.
    out.offset = static_cast<float>(lo);
    for (size_t i = 0; i < values.size(); ++i) {
        double q = std::round((values[i] - lo) / scale);
        out.q[i] = static_cast<uint8_t>(std::min(255.0, std::max(0.0, q)));
    }
    return out;
}

core::Vector Dequantize8(const QuantizedVector& quantized) {
    core::Vector out(quantized.q.size());
    for (size_t i = 0; i < quantized.q.size(); ++i) {
        const double steps = static_cast<double>(quantized.q[i]) - static_cast<double>(quantized.zero);
        out[i] = static_cast<float>(steps * static_cast<double>(quantized.scale) +
                                    static_cast<double>(quantized.offset));
    }
    return out;
}

double Dot(const core::Vector& a, const core::Vector& b) {
    const size_t n = std::min(a.size(), b.size());
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum += static_cast<double>(a[i]) * b[i];
    }
    return sum;
}

double Norm(const core::Vector& v) {
    return std::sqrt(Dot(v, v));
}

core::Vector L2Normalize(const core::Vector& v) {
    const double n = Norm(v);
    if (n == 0.0 || !std::isfinite(n)) {
        return v;
    }
    core::Vector out(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        out[i] = static_cast<float>(v[i] / n);
    }
    return out;
}

double Cosine(const core::Vector& a, const core::Vector& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;
    const double na = Norm(a);
    const double nb = Norm(b);
    if (na == 0.0 || nb == 0.0) return 0.0;
    const double c = Dot(a, b) / (na * nb);
    return std::isfinite(c) ? c : 0.0;
}

} // namespace vector
} // namespace kgraph
