#include "kgraph/engine/context_basis.h"

#include <algorithm>
#include <cmath>

namespace kgraph {
namespace engine {

namespace {

constexpr double kResidualEpsilon = 1e-6;

double DotD(const core::Vector& a, const core::Vector& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return sum;
}

bool TryAddAxis(ContextBasis& basis, const core::Vector& v) {
    std::vector<double> residual(v.begin(), v.end());
    for (const auto& axis : basis.axes) {
        double proj = 0.0;
        for (size_t i = 0; i < residual.size(); ++i) proj += residual[i] * axis[i];
        for (size_t i = 0; i < residual.size(); ++i) residual[i] -= proj * axis[i];
    }
    double norm = 0.0;
    for (double x : residual) norm += x * x;
    norm = std::sqrt(norm);
    if (!std::isfinite(norm) || norm < kResidualEpsilon) {
        return false;
    }
    core::Vector axis(residual.size());
    for (size_t i = 0; i < residual.size(); ++i) {
        axis[i] = static_cast<float>(residual[i] / norm);
    }
    basis.axes.push_back(std::move(axis));
    return true;
}

} // namespace

ContextBasis BuildContextBasis(const core::Vector& anchor,
                               const std::vector<core::Vector>& members,
                               size_t max_axes) {
    ContextBasis basis;
    basis.dim = anchor.size();
    if (anchor.empty()) {
        return basis;
    }
    size_t limit = std::min(max_axes, basis.dim);
    if (limit == 0) {
        return basis;
    }
    TryAddAxis(basis, anchor);
    for (const auto& member : members) {
        if (basis.axes.size() >= limit) break;
        if (member.size() != basis.dim) continue;
        TryAddAxis(basis, member);
    }
    return basis;
}

Projection ProjectToBasis(const ContextBasis& basis, const core::Vector& v) {
    Projection out;
    if (basis.empty() || v.size() != basis.dim) {
        return out;
    }
    out.projected.assign(basis.dim, 0.0f);
    for (const auto& axis : basis.axes) {
        double c = DotD(axis, v);
        out.coords.push_back(c);
        out.probs.push_back(c * c);
        for (size_t i = 0; i < basis.dim; ++i) {
            out.projected[i] += static_cast<float>(c * axis[i]);
        }
    }
    return out;
}

double Peakiness(const Projection& projection) {
    double sum = 0.0;
    double peak = 0.0;
    for (double p : projection.probs) {
        sum += p;
        peak = std::max(peak, p);
    }
    if (!(sum > 0.0)) {
        return 0.0;
    }
    return peak / sum;
}

std::vector<NeighborhoodContext> BuildNeighborhoodContexts(const Graph& graph,
                                                           const std::vector<std::string>& anchors,
                                                           size_t max_axes) {
    std::vector<NeighborhoodContext> contexts;
    for (const auto& anchor_id : anchors) {
        const GraphNode* anchor = graph.find(anchor_id);
        if (!anchor || anchor->embedding.empty()) continue;

        NeighborhoodContext context;
        context.anchor = anchor_id;
        std::vector<core::Vector> member_vectors;
        for (const auto& neighbor_id : graph.neighbors(anchor_id)) {
            const GraphNode* neighbor = graph.find(neighbor_id);
            if (!neighbor || neighbor->embedding.size() != anchor->embedding.size()) continue;
            context.members.push_back(neighbor_id);
            member_vectors.push_back(neighbor->embedding);
        }
        context.basis = BuildContextBasis(anchor->embedding, member_vectors, max_axes);
        contexts.push_back(std::move(context));
    }
    return contexts;
}

} // namespace engine
} // namespace kgraph
