#include "netwatch/health_policy.hpp"

#include "netwatch/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace netwatch {

namespace {

double clamp_percent(double value) {
    return std::min(100.0, std::max(0.0, value));
}

std::string format_ms(const char* label, double value, const char* unit) {
    std::ostringstream oss;
    oss << label << ": " << std::fixed << std::setprecision(1) << value << unit;
    return oss.str();
}

} // namespace

PiecewiseCurve::PiecewiseCurve(std::initializer_list<Breakpoint> points)
    : points_(points)
{
}

PiecewiseCurve::PiecewiseCurve(std::vector<Breakpoint> points)
    : points_(std::move(points))
{
}

double PiecewiseCurve::evaluate(double x) const {
    if (points_.empty()) {
        return 0.0;
    }
    if (x <= points_.front().x) {
        return points_.front().score;
    }
    for (size_t i = 1; i < points_.size(); ++i) {
        const Breakpoint& lo = points_[i - 1];
        const Breakpoint& hi = points_[i];
        if (x <= hi.x) {
            double t = (x - lo.x) / (hi.x - lo.x);
            return lo.score + t * (hi.score - lo.score);
        }
    }
    return points_.back().score;
}

void PiecewiseCurve::validate() const {
    if (points_.empty()) {
        throw ConfigurationError("score curve needs at least one breakpoint");
    }
    for (size_t i = 0; i < points_.size(); ++i) {
        if (points_[i].score < 0.0 || points_[i].score > 100.0) {
            throw ConfigurationError("curve scores must lie in [0, 100]");
        }
        if (i > 0 && points_[i].x <= points_[i - 1].x) {
            throw ConfigurationError("curve breakpoints must be strictly increasing");
        }
    }
}

void HealthPolicy::validate() const {
    latencyCurve.validate();
    jitterCurve.validate();

    double sum = weights.latency + weights.packetLoss + weights.jitter + weights.uptime;
    if (weights.latency < 0 || weights.packetLoss < 0 || weights.jitter < 0 || weights.uptime < 0 ||
        std::fabs(sum - 1.0) > 1e-6) {
        throw ConfigurationError("health weights must be non-negative and sum to 1.0");
    }
    if (batchSize == 0 || uptimeWindow == 0 || historyCapacity == 0) {
        throw ConfigurationError("batch size, uptime window and history capacity must be positive");
    }
}

ComponentScores scoreComponents(const HealthMetrics& metrics, const HealthPolicy& policy) {
    ComponentScores scores;
    scores.latency = metrics.latencyMs ? clamp_percent(policy.latencyCurve.evaluate(*metrics.latencyMs)) : 0.0;
    scores.packetLoss = clamp_percent(100.0 - metrics.packetLossPercent);
    scores.jitter = metrics.jitterMs ? clamp_percent(policy.jitterCurve.evaluate(*metrics.jitterMs)) : 0.0;
    scores.uptime = clamp_percent(metrics.uptimePercent);
    return scores;
}

int compositeScore(const ComponentScores& components, const HealthWeights& weights) {
    double total = components.latency * weights.latency +
                   components.packetLoss * weights.packetLoss +
                   components.jitter * weights.jitter +
                   components.uptime * weights.uptime;
    long rounded = std::lround(total);
    return static_cast<int>(std::min(100L, std::max(0L, rounded)));
}

HealthCategory categorize(int score) {
    if (score >= 80) return HealthCategory::Excellent;
    if (score >= 60) return HealthCategory::Good;
    if (score >= 40) return HealthCategory::Fair;
    return HealthCategory::Poor;
}

std::vector<std::string> collectAlerts(const HealthMetrics& metrics, const AlertThresholds& thresholds) {
    std::vector<std::string> alerts;

    if (!metrics.latencyMs) {
        alerts.push_back("No reply from the sampling target");
    } else if (*metrics.latencyMs >= thresholds.latencyCriticalMs) {
        alerts.push_back(format_ms("Critical latency", *metrics.latencyMs, " ms"));
    } else if (*metrics.latencyMs >= thresholds.latencyWarningMs) {
        alerts.push_back(format_ms("High latency", *metrics.latencyMs, " ms"));
    }

    if (metrics.packetLossPercent >= thresholds.lossCriticalPercent) {
        alerts.push_back(format_ms("Critical packet loss", metrics.packetLossPercent, "%"));
    } else if (metrics.packetLossPercent >= thresholds.lossWarningPercent) {
        alerts.push_back(format_ms("Packet loss", metrics.packetLossPercent, "%"));
    }

    if (metrics.jitterMs) {
        if (*metrics.jitterMs >= thresholds.jitterCriticalMs) {
            alerts.push_back(format_ms("Critical jitter", *metrics.jitterMs, " ms"));
        } else if (*metrics.jitterMs >= thresholds.jitterWarningMs) {
            alerts.push_back(format_ms("High jitter", *metrics.jitterMs, " ms"));
        }
    }

    if (metrics.uptimePercent < thresholds.uptimeWarningPercent) {
        alerts.push_back(format_ms("Low uptime", metrics.uptimePercent, "%"));
    }
    return alerts;
}

} // namespace netwatch
