#include "fris/features/FeatureParityCheck.hpp"

#include <cmath>
#include <sstream>

namespace fris {

std::string ParityReport::summary() const {
    if (ok()) return "parity OK";

    std::ostringstream ss;
    ss << "parity FAILED:";
    for (const auto& c : only_left) ss << " -" << c;
    for (const auto& c : only_right) ss << " +" << c;
    for (const auto& m : mismatches) {
        ss << " " << m.column << "(" << m.left << " != " << m.right << ")";
    }
    return ss.str();
}

ParityReport FeatureParityCheck::compare(const EngineeredFeatureVector& a,
                                         const EngineeredFeatureVector& b,
                                         double rtol, double atol) {
    ParityReport report;

    for (const auto& e : a.entries()) {
        if (!b.has(e.first)) {
            report.only_left.insert(e.first);
            continue;
        }
        const FeatureValue& other = b.at(e.first);

        const auto* x = std::get_if<double>(&e.second);
        const auto* y = std::get_if<double>(&other);
        bool same;
        if (x && y) {
            same = (std::isnan(*x) && std::isnan(*y)) ||
                   std::fabs(*x - *y) <= atol + rtol * std::fabs(*y);
        } else {
            same = (e.second == other);
        }
        if (!same) {
            report.mismatches.push_back({e.first, canonicalText(e.second), canonicalText(other)});
        }
    }
    for (const auto& e : b.entries()) {
        if (!a.has(e.first)) report.only_right.insert(e.first);
    }
    return report;
}

} // namespace fris
