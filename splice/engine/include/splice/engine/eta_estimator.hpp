/**
 * @file eta_estimator.hpp
 * @brief Remaining-time estimate from recent frame costs
 */

#pragma once

#include <splice/core/types.hpp>

#include <deque>

namespace spl::engine {

/**
 * @brief Moving average of the last N frame costs
 */
class EtaEstimator {
public:
    explicit EtaEstimator(size_t window = 30)
        : m_window(window > 0 ? window : 1) {}

    void addSample(Microseconds frameCost) {
        m_samples.push_back(frameCost);
        m_sum += frameCost;
        if (m_samples.size() > m_window) {
            m_sum -= m_samples.front();
            m_samples.pop_front();
        }
    }

    [[nodiscard]] Microseconds average() const {
        if (m_samples.empty()) return Microseconds(0);
        return m_sum / static_cast<int64_t>(m_samples.size());
    }

    [[nodiscard]] Microseconds estimate(int64_t remainingFrames) const {
        if (remainingFrames <= 0) return Microseconds(0);
        return average() * remainingFrames;
    }

    [[nodiscard]] size_t sampleCount() const { return m_samples.size(); }

    void reset() {
        m_samples.clear();
        m_sum = Microseconds(0);
    }

private:
    size_t m_window;
    std::deque<Microseconds> m_samples;
    Microseconds m_sum{0};
};

} // namespace spl::engine
