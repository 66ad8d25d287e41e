#include "fris/features/LinearProjection.hpp"
#include "fris/features/FeatureFrame.hpp"
#include "fris/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace fris {

namespace {

constexpr int MAX_SWEEPS = 100;

// Cyclic Jacobi on a symmetric matrix. On return a holds eigenvalues on its
// diagonal and v holds the matching eigenvectors as columns.
void jacobiEigen(std::vector<std::vector<double>>& a, std::vector<std::vector<double>>& v) {
    const size_t n = a.size();
    v.assign(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i) v[i][i] = 1.0;

    double total = 0.0;
    for (size_t i = 0; i < n; ++i)
        for (size_t j = 0; j < n; ++j) total += a[i][j] * a[i][j];
    if (total == 0.0) return;

    for (int sweep = 0; sweep < MAX_SWEEPS; ++sweep) {
        double off = 0.0;
        for (size_t p = 0; p < n; ++p)
            for (size_t q = p + 1; q < n; ++q) off += a[p][q] * a[p][q];
        if (off <= 1e-24 * total) break;

        for (size_t p = 0; p < n; ++p) {
            for (size_t q = p + 1; q < n; ++q) {
                if (a[p][q] == 0.0) continue;

                const double theta = (a[q][q] - a[p][p]) / (2.0 * a[p][q]);
                const double t = (theta >= 0.0 ? 1.0 : -1.0) /
                                 (std::fabs(theta) + std::sqrt(theta * theta + 1.0));
                const double c = 1.0 / std::sqrt(t * t + 1.0);
                const double s = t * c;

                for (size_t k = 0; k < n; ++k) {
                    const double akp = a[k][p];
                    const double akq = a[k][q];
                    a[k][p] = c * akp - s * akq;
                    a[k][q] = s * akp + c * akq;
                }
                for (size_t k = 0; k < n; ++k) {
                    const double apk = a[p][k];
                    const double aqk = a[q][k];
                    a[p][k] = c * apk - s * aqk;
                    a[q][k] = s * apk + c * aqk;
                }
                for (size_t k = 0; k < n; ++k) {
                    const double vkp = v[k][p];
                    const double vkq = v[k][q];
                    v[k][p] = c * vkp - s * vkq;
                    v[k][q] = s * vkp + c * vkq;
                }
            }
        }
    }
}

} // namespace

LinearProjection LinearProjection::fit(const FeatureFrame& frame,
                                       const std::vector<std::string>& columns,
                                       size_t n_components) {
    if (columns.empty()) {
        throw PipelineError("projection has no numeric input columns");
    }
    const size_t d = columns.size();
    const size_t n = frame.rows();
    if (n_components == 0 || n_components > d) {
        throw PipelineError("projection needs 1.." + std::to_string(d) + " components");
    }

    std::vector<const std::vector<double>*> cols;
    cols.reserve(d);
    for (const auto& name : columns) cols.push_back(&frame.numeric(name));

    LinearProjection proj;
    proj.input_columns = columns;
    proj.mean.assign(d, 0.0);
    for (size_t j = 0; j < d; ++j) {
        const auto& c = *cols[j];
        for (size_t i = 0; i < n; ++i) {
            if (!std::isfinite(c[i])) {
                throw PipelineError("projection input '" + columns[j] + "' is not finite");
            }
            proj.mean[j] += c[i];
        }
        proj.mean[j] /= static_cast<double>(n);
    }

    const double denom = n > 1 ? static_cast<double>(n - 1) : 1.0;
    std::vector<std::vector<double>> cov(d, std::vector<double>(d, 0.0));
    for (size_t a = 0; a < d; ++a) {
        for (size_t b = a; b < d; ++b) {
            double s = 0.0;
            for (size_t i = 0; i < n; ++i) {
                s += ((*cols[a])[i] - proj.mean[a]) * ((*cols[b])[i] - proj.mean[b]);
            }
            cov[a][b] = cov[b][a] = s / denom;
        }
    }

    std::vector<std::vector<double>> vecs;
    jacobiEigen(cov, vecs);

    std::vector<size_t> order(d);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t x, size_t y) {
        return cov[x][x] > cov[y][y];
    });

    for (size_t k = 0; k < n_components; ++k) {
        const size_t idx = order[k];
        std::vector<double> comp(d);
        size_t argmax = 0;
        for (size_t j = 0; j < d; ++j) {
            comp[j] = vecs[j][idx];
            if (std::fabs(comp[j]) > std::fabs(comp[argmax])) argmax = j;
        }
        if (comp[argmax] < 0.0) {
            for (auto& x : comp) x = -x;
        }
        proj.components.push_back(std::move(comp));
        proj.explained_variance.push_back(std::max(cov[idx][idx], 0.0));
    }
    return proj;
}

std::vector<double> LinearProjection::project(const std::vector<double>& x) const {
    if (x.size() != mean.size()) {
        throw ArtifactError("projection expects " + std::to_string(mean.size()) +
                            " inputs, got " + std::to_string(x.size()));
    }
    std::vector<double> out;
    out.reserve(components.size());
    for (const auto& comp : components) {
        double s = 0.0;
        for (size_t j = 0; j < x.size(); ++j) {
            s += (x[j] - mean[j]) * comp[j];
        }
        out.push_back(s);
    }
    return out;
}

} // namespace fris
