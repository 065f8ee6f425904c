#include "tempo_ngin/allocation/weight_utils.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace tempo_ngin {
namespace weights {

namespace {

constexpr int BISECTION_STEPS = 200;

Result<void> check_feasible(const WeightVector& values, const WeightVector& caps, double total) {
    if (values.size() != caps.size() || values.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Weights and caps must be non-empty and of equal size",
                                "WeightUtils");
    }
    double capacity = sum(caps);
    if (capacity < total - 1e-12) {
        return make_error<void>(ErrorCode::SOLVER_ERROR,
                                "Caps sum to " + std::to_string(capacity) +
                                    ", below the target " + std::to_string(total),
                                "WeightUtils");
    }
    return Result<void>();
}

// Put the rounding residual on assets that still have room
void absorb_residual(WeightVector& w, const WeightVector& caps, double total) {
    double residual = total - sum(w);
    for (size_t i = 0; i < w.size() && residual != 0.0; ++i) {
        double room = residual > 0.0 ? caps[i] - w[i] : w[i];
        double step = residual > 0.0 ? std::min(residual, room) : std::max(residual, -room);
        w[i] += step;
        residual -= step;
    }
}

}  // namespace

double sum(const WeightVector& weights) {
    double total = 0.0;
    for (double w : weights) {
        total += w;
    }
    return total;
}

double gross(const WeightVector& weights) {
    double total = 0.0;
    for (double w : weights) {
        total += std::abs(w);
    }
    return total;
}

Result<WeightVector> project_capped_simplex(const WeightVector& point, const WeightVector& caps,
                                            double total) {
    auto feasible = check_feasible(point, caps, total);
    if (feasible.is_error()) {
        return forward_error<WeightVector>(feasible.error());
    }

    auto evaluate = [&](double tau) {
        double s = 0.0;
        for (size_t i = 0; i < point.size(); ++i) {
            s += std::clamp(point[i] - tau, 0.0, caps[i]);
        }
        return s;
    };

    // sum is non-increasing in tau: total capacity at lo, zero at hi
    double lo = *std::min_element(point.begin(), point.end()) -
                *std::max_element(caps.begin(), caps.end()) - 1.0;
    double hi = *std::max_element(point.begin(), point.end());
    for (int step = 0; step < BISECTION_STEPS; ++step) {
        double mid = 0.5 * (lo + hi);
        if (evaluate(mid) > total) {
            lo = mid;
        } else {
            hi = mid;
        }
    }

    double tau = 0.5 * (lo + hi);
    WeightVector w(point.size());
    for (size_t i = 0; i < point.size(); ++i) {
        w[i] = std::clamp(point[i] - tau, 0.0, caps[i]);
    }
    absorb_residual(w, caps, total);
    return w;
}

Result<WeightVector> cap_and_renormalize(const WeightVector& raw, const WeightVector& caps,
                                         double total) {
    auto feasible = check_feasible(raw, caps, total);
    if (feasible.is_error()) {
        return forward_error<WeightVector>(feasible.error());
    }
    for (double r : raw) {
        if (!(r >= 0.0) || !std::isfinite(r)) {
            return make_error<WeightVector>(ErrorCode::INVALID_ARGUMENT,
                                            "Raw weights must be finite and non-negative",
                                            "WeightUtils");
        }
    }

    WeightVector w(raw.size(), 0.0);
    std::vector<bool> fixed(raw.size(), false);
    double remaining = total;

    for (size_t round = 0; round <= raw.size(); ++round) {
        double free_raw = 0.0;
        for (size_t i = 0; i < raw.size(); ++i) {
            if (!fixed[i]) {
                free_raw += raw[i];
            }
        }
        if (free_raw <= 0.0) {
            // Spread what is left evenly over assets with room
            size_t open = 0;
            for (size_t i = 0; i < raw.size(); ++i) {
                if (!fixed[i]) {
                    ++open;
                }
            }
            if (open == 0) {
                break;
            }
            for (size_t i = 0; i < raw.size(); ++i) {
                if (!fixed[i]) {
                    w[i] = remaining / static_cast<double>(open);
                }
            }
        } else {
            for (size_t i = 0; i < raw.size(); ++i) {
                if (!fixed[i]) {
                    w[i] = remaining * raw[i] / free_raw;
                }
            }
        }

        bool capped_any = false;
        for (size_t i = 0; i < raw.size(); ++i) {
            if (!fixed[i] && w[i] > caps[i]) {
                w[i] = caps[i];
                fixed[i] = true;
                remaining -= caps[i];
                capped_any = true;
            }
        }
        if (!capped_any) {
            break;
        }
    }

    absorb_residual(w, caps, total);
    if (std::abs(sum(w) - total) > 1e-9) {
        return make_error<WeightVector>(ErrorCode::SOLVER_ERROR,
                                        "Could not distribute the target under the caps",
                                        "WeightUtils");
    }
    return w;
}

}  // namespace weights
}  // namespace tempo_ngin
