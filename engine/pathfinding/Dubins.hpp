#pragma once

/**
 * @file Dubins.hpp
 * @brief Shortest paths for a forward-only vehicle with bounded curvature
 *
 * A path is three primitive segments, each a left arc, a straight line or a
 * right arc, chained in one of six words. Configurations are (x, y, heading)
 * with heading in radians, counter-clockwise from +x.
 */

#include <array>
#include <cstdint>
#include <functional>

namespace Lodestone {

// ============================================================================
// Error Codes
// ============================================================================

enum class DubinsError : uint8_t {
    None,               ///< Success
    Parametrization,    ///< Sample parameter outside [0, length]
    BadRho,             ///< Turning radius not positive
    NoPath              ///< No word connects the two configurations
};

inline const char* DubinsErrorToString(DubinsError error) {
    switch (error) {
        case DubinsError::None:            return "None";
        case DubinsError::Parametrization: return "Parametrization";
        case DubinsError::BadRho:          return "BadRho";
        case DubinsError::NoPath:          return "NoPath";
        default:                           return "Unknown";
    }
}

// ============================================================================
// Words and Segments
// ============================================================================

enum class DubinsSegmentType : uint8_t {
    Left,
    Straight,
    Right
};

/**
 * @brief The six candidate words, in the order they are evaluated
 */
enum class DubinsPathType : uint8_t {
    LSL,
    LSR,
    RSL,
    RSR,
    RLR,
    LRL
};

inline constexpr std::array<DubinsPathType, 6> kAllDubinsPathTypes = {
    DubinsPathType::LSL, DubinsPathType::LSR, DubinsPathType::RSL,
    DubinsPathType::RSR, DubinsPathType::RLR, DubinsPathType::LRL
};

inline const char* DubinsPathTypeToString(DubinsPathType type) {
    switch (type) {
        case DubinsPathType::LSL: return "LSL";
        case DubinsPathType::LSR: return "LSR";
        case DubinsPathType::RSL: return "RSL";
        case DubinsPathType::RSR: return "RSR";
        case DubinsPathType::RLR: return "RLR";
        case DubinsPathType::LRL: return "LRL";
        default:                  return "Unknown";
    }
}

/**
 * @brief Segment sequence for a word
 */
const std::array<DubinsSegmentType, 3>& GetDubinsSegments(DubinsPathType type);

/**
 * @brief Oriented point in the plane
 */
struct DubinsConfig {
    double x = 0.0;
    double y = 0.0;
    double heading = 0.0;
};

// ============================================================================
// Dubins Path
// ============================================================================

/**
 * @brief A solved path
 *
 * Segment lengths are stored normalized by the turning radius.
 */
class DubinsPath {
public:
    static constexpr double Epsilon = 10e-10;

    /**
     * @brief Return non-zero from a sampling callback to stop early
     */
    using SampleCallback = std::function<int(const DubinsConfig& q, double t)>;

    /**
     * @brief Solve for the shortest feasible word between two configurations
     * @param rho Minimum turning radius
     */
    static DubinsError ShortestPath(const DubinsConfig& q0, const DubinsConfig& q1,
                                    double rho, DubinsPath& outPath);

    /**
     * @brief Solve using one specific word
     */
    static DubinsError PathOfType(const DubinsConfig& q0, const DubinsConfig& q1,
                                  double rho, DubinsPathType type, DubinsPath& outPath);

    [[nodiscard]] double Length() const;

    /**
     * @brief Length of segment @p i in world units; DBL_MAX if out of range
     */
    [[nodiscard]] double SegmentLength(int i) const;

    /**
     * @brief Length of segment @p i divided by rho; DBL_MAX if out of range
     */
    [[nodiscard]] double SegmentLengthNormalized(int i) const;

    [[nodiscard]] DubinsPathType GetType() const { return m_type; }
    [[nodiscard]] const DubinsConfig& GetStart() const { return m_start; }
    [[nodiscard]] double GetRho() const { return m_rho; }

    /**
     * @brief Configuration at distance @p t along the path
     */
    DubinsError Sample(double t, DubinsConfig& outQ) const;

    /**
     * @brief Walk the path in steps of @p stepSize starting at 0
     * @return 0 when the walk completed, otherwise the callback's stop code
     */
    int SampleMany(double stepSize, const SampleCallback& callback) const;

    /**
     * @brief Configuration at the end of the path
     */
    DubinsError Endpoint(DubinsConfig& outQ) const;

    /**
     * @brief The first @p t units of this path
     */
    DubinsError ExtractSubpath(double t, DubinsPath& outPath) const;

private:
    DubinsConfig m_start;
    std::array<double, 3> m_segments{0.0, 0.0, 0.0};
    double m_rho = 1.0;
    DubinsPathType m_type = DubinsPathType::LSL;
};

} // namespace Lodestone
