/**
 * @file Parameter.hpp
 * @brief Value Object describing one scalar measurement rule of a class.
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

#include "TaxonomyErrors.hpp"

namespace typolab::domain::taxonomy {

/**
 * @class Parameter
 * @brief Target value, hard acceptance range, tolerance and weight for one feature.
 *
 * Invariants: min <= target <= max, tolerance > 0, weight >= 0, all finite.
 * The unit is metadata and never affects scoring.
 */
class Parameter {
public:
    Parameter(std::string name,
              double targetValue,
              double minThreshold,
              double maxThreshold,
              double tolerance,
              double weight = 1.0,
              std::string unit = "mm")
        : m_name(std::move(name)),
          m_targetValue(targetValue),
          m_minThreshold(minThreshold),
          m_maxThreshold(maxThreshold),
          m_tolerance(tolerance),
          m_weight(weight),
          m_unit(std::move(unit)) {
        if (m_name.empty()) {
            throw InvalidParameter("name cannot be empty", m_name);
        }
        if (!std::isfinite(m_targetValue) || !std::isfinite(m_minThreshold) || !std::isfinite(m_maxThreshold) ||
            !std::isfinite(m_tolerance) || !std::isfinite(m_weight)) {
            throw InvalidParameter("values must be finite", m_name);
        }
        if (m_minThreshold > m_targetValue || m_targetValue > m_maxThreshold) {
            throw InvalidParameter("expected min_threshold <= target_value <= max_threshold", m_name);
        }
        if (m_tolerance <= 0.0) {
            throw InvalidParameter("tolerance must be positive", m_name);
        }
        if (m_weight < 0.0) {
            throw InvalidParameter("weight cannot be negative", m_name);
        }
    }

    const std::string& name() const { return m_name; }
    double targetValue() const { return m_targetValue; }
    double minThreshold() const { return m_minThreshold; }
    double maxThreshold() const { return m_maxThreshold; }
    double tolerance() const { return m_tolerance; }
    double weight() const { return m_weight; }
    const std::string& unit() const { return m_unit; }

    /** @brief True when the value lies inside the hard bounds. */
    bool withinBounds(double observed) const {
        return m_minThreshold <= observed && observed <= m_maxThreshold;
    }

    /**
     * @brief Per-parameter match score in [0,1].
     *
     * Missing observations and values outside the hard bounds score 0.
     * Inside the bounds the score falls linearly to 0 at `tolerance` from target.
     */
    double score(std::optional<double> observed) const {
        if (!observed || !std::isfinite(*observed)) return 0.0;
        if (!withinBounds(*observed)) return 0.0;
        double s = 1.0 - std::abs(*observed - m_targetValue) / m_tolerance;
        return std::clamp(s, 0.0, 1.0);
    }

private:
    std::string m_name;
    double m_targetValue;
    double m_minThreshold;
    double m_maxThreshold;
    double m_tolerance;
    double m_weight;
    std::string m_unit;
};

} // namespace typolab::domain::taxonomy
