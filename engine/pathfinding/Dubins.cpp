#include "pathfinding/Dubins.hpp"

#include <cfloat>
#include <cmath>
#include <algorithm>

namespace Lodestone {

namespace {

constexpr double kTwoPi = 2.0 * 3.14159265358979323846;

double FloorMod(double x, double y) {
    return x - y * std::floor(x / y);
}

double ModTwoPi(double theta) {
    return FloorMod(theta, kTwoPi);
}

/**
 * @brief Start and goal expressed in the frame where the start sits at the
 * origin and the goal lies on the +x axis, scaled by 1/rho
 */
struct Intermediate {
    double alpha = 0.0;
    double beta = 0.0;
    double d = 0.0;
    double sa = 0.0;
    double sb = 0.0;
    double ca = 0.0;
    double cb = 0.0;
    double cab = 0.0;
    double dsq = 0.0;
};

DubinsError ComputeIntermediate(const DubinsConfig& q0, const DubinsConfig& q1, double rho,
                                Intermediate& out) {
    if (rho <= 0.0) {
        return DubinsError::BadRho;
    }

    double dx = q1.x - q0.x;
    double dy = q1.y - q0.y;
    double d = std::sqrt(dx * dx + dy * dy) / rho;
    double theta = 0.0;

    // Colocated configurations keep theta at zero
    if (d > 0.0) {
        theta = ModTwoPi(std::atan2(dy, dx));
    }

    out.alpha = ModTwoPi(q0.heading - theta);
    out.beta = ModTwoPi(q1.heading - theta);
    out.d = d;
    out.sa = std::sin(out.alpha);
    out.sb = std::sin(out.beta);
    out.ca = std::cos(out.alpha);
    out.cb = std::cos(out.beta);
    out.cab = std::cos(out.alpha - out.beta);
    out.dsq = d * d;
    return DubinsError::None;
}

using Lengths = std::array<double, 3>;

DubinsError SolveLSL(const Intermediate& in, Lengths& out) {
    double tmp0 = in.d + in.sa - in.sb;
    double psq = 2.0 + in.dsq - (2.0 * in.cab) + (2.0 * in.d * (in.sa - in.sb));
    if (psq < 0.0) {
        return DubinsError::NoPath;
    }
    double tmp1 = std::atan2(in.cb - in.ca, tmp0);
    out[0] = ModTwoPi(tmp1 - in.alpha);
    out[1] = std::sqrt(psq);
    out[2] = ModTwoPi(in.beta - tmp1);
    return DubinsError::None;
}

DubinsError SolveRSR(const Intermediate& in, Lengths& out) {
    double tmp0 = in.d - in.sa + in.sb;
    double psq = 2.0 + in.dsq - (2.0 * in.cab) + (2.0 * in.d * (in.sb - in.sa));
    if (psq < 0.0) {
        return DubinsError::NoPath;
    }
    double tmp1 = std::atan2(in.ca - in.cb, tmp0);
    out[0] = ModTwoPi(in.alpha - tmp1);
    out[1] = std::sqrt(psq);
    out[2] = ModTwoPi(tmp1 - in.beta);
    return DubinsError::None;
}

DubinsError SolveLSR(const Intermediate& in, Lengths& out) {
    double psq = -2.0 + in.dsq + (2.0 * in.cab) + (2.0 * in.d * (in.sa + in.sb));
    if (psq < 0.0) {
        return DubinsError::NoPath;
    }
    double p = std::sqrt(psq);
    double tmp0 = std::atan2(-in.ca - in.cb, in.d + in.sa + in.sb) - std::atan2(-2.0, p);
    out[0] = ModTwoPi(tmp0 - in.alpha);
    out[1] = p;
    out[2] = ModTwoPi(tmp0 - ModTwoPi(in.beta));
    return DubinsError::None;
}

DubinsError SolveRSL(const Intermediate& in, Lengths& out) {
    double psq = -2.0 + in.dsq + (2.0 * in.cab) - (2.0 * in.d * (in.sa + in.sb));
    if (psq < 0.0) {
        return DubinsError::NoPath;
    }
    double p = std::sqrt(psq);
    double tmp0 = std::atan2(in.ca + in.cb, in.d - in.sa - in.sb) - std::atan2(2.0, p);
    out[0] = ModTwoPi(in.alpha - tmp0);
    out[1] = p;
    out[2] = ModTwoPi(in.beta - tmp0);
    return DubinsError::None;
}

DubinsError SolveRLR(const Intermediate& in, Lengths& out) {
    double tmp0 = (6.0 - in.dsq + 2.0 * in.cab + 2.0 * in.d * (in.sa - in.sb)) / 8.0;
    double phi = std::atan2(in.ca - in.cb, in.d - in.sa + in.sb);
    if (std::abs(tmp0) > 1.0) {
        return DubinsError::NoPath;
    }
    double p = ModTwoPi(kTwoPi - std::acos(tmp0));
    double t = ModTwoPi(in.alpha - phi + ModTwoPi(p / 2.0));
    out[0] = t;
    out[1] = p;
    out[2] = ModTwoPi(in.alpha - in.beta - t + ModTwoPi(p));
    return DubinsError::None;
}

DubinsError SolveLRL(const Intermediate& in, Lengths& out) {
    double tmp0 = (6.0 - in.dsq + 2.0 * in.cab + 2.0 * in.d * (in.sb - in.sa)) / 8.0;
    double phi = std::atan2(in.ca - in.cb, in.d + in.sa - in.sb);
    if (std::abs(tmp0) > 1.0) {
        return DubinsError::NoPath;
    }
    double p = ModTwoPi(kTwoPi - std::acos(tmp0));
    double t = ModTwoPi(-in.alpha - phi + p / 2.0);
    out[0] = t;
    out[1] = p;
    out[2] = ModTwoPi(ModTwoPi(in.beta) - in.alpha - t + ModTwoPi(p));
    return DubinsError::None;
}

DubinsError SolveWord(const Intermediate& in, DubinsPathType type, Lengths& out) {
    switch (type) {
        case DubinsPathType::LSL: return SolveLSL(in, out);
        case DubinsPathType::LSR: return SolveLSR(in, out);
        case DubinsPathType::RSL: return SolveRSL(in, out);
        case DubinsPathType::RSR: return SolveRSR(in, out);
        case DubinsPathType::RLR: return SolveRLR(in, out);
        case DubinsPathType::LRL: return SolveLRL(in, out);
        default:                  return DubinsError::NoPath;
    }
}

/**
 * @brief Advance a unit-radius configuration by @p t along one primitive
 */
DubinsConfig ApplySegment(double t, const DubinsConfig& qi, DubinsSegmentType type) {
    const double st = std::sin(qi.heading);
    const double ct = std::cos(qi.heading);
    DubinsConfig qt;

    switch (type) {
        case DubinsSegmentType::Left:
            qt.x = std::sin(qi.heading + t) - st;
            qt.y = -std::cos(qi.heading + t) + ct;
            qt.heading = t;
            break;
        case DubinsSegmentType::Right:
            qt.x = -std::sin(qi.heading - t) + st;
            qt.y = std::cos(qi.heading - t) - ct;
            qt.heading = -t;
            break;
        case DubinsSegmentType::Straight:
            qt.x = ct * t;
            qt.y = st * t;
            qt.heading = 0.0;
            break;
    }

    qt.x += qi.x;
    qt.y += qi.y;
    qt.heading += qi.heading;
    return qt;
}

} // anonymous namespace

const std::array<DubinsSegmentType, 3>& GetDubinsSegments(DubinsPathType type) {
    using S = DubinsSegmentType;
    static const std::array<std::array<DubinsSegmentType, 3>, 6> kSegments = {{
        {S::Left, S::Straight, S::Left},
        {S::Left, S::Straight, S::Right},
        {S::Right, S::Straight, S::Left},
        {S::Right, S::Straight, S::Right},
        {S::Right, S::Left, S::Right},
        {S::Left, S::Right, S::Left}
    }};
    return kSegments[static_cast<size_t>(type)];
}

DubinsError DubinsPath::ShortestPath(const DubinsConfig& q0, const DubinsConfig& q1,
                                     double rho, DubinsPath& outPath) {
    Intermediate in;
    DubinsError err = ComputeIntermediate(q0, q1, rho, in);
    if (err != DubinsError::None) {
        return err;
    }

    outPath.m_start = q0;
    outPath.m_rho = rho;

    bool found = false;
    double bestCost = DBL_MAX;
    for (DubinsPathType type : kAllDubinsPathTypes) {
        Lengths lengths{};
        if (SolveWord(in, type, lengths) != DubinsError::None) {
            continue;
        }
        double cost = lengths[0] + lengths[1] + lengths[2];
        if (cost < bestCost) {
            found = true;
            bestCost = cost;
            outPath.m_segments = lengths;
            outPath.m_type = type;
        }
    }

    return found ? DubinsError::None : DubinsError::NoPath;
}

DubinsError DubinsPath::PathOfType(const DubinsConfig& q0, const DubinsConfig& q1,
                                   double rho, DubinsPathType type, DubinsPath& outPath) {
    Intermediate in;
    DubinsError err = ComputeIntermediate(q0, q1, rho, in);
    if (err != DubinsError::None) {
        return err;
    }

    Lengths lengths{};
    err = SolveWord(in, type, lengths);
    if (err == DubinsError::None) {
        outPath.m_segments = lengths;
        outPath.m_start = q0;
        outPath.m_rho = rho;
        outPath.m_type = type;
    }
    return err;
}

double DubinsPath::Length() const {
    return (m_segments[0] + m_segments[1] + m_segments[2]) * m_rho;
}

double DubinsPath::SegmentLength(int i) const {
    if (i < 0 || i > 2) {
        return DBL_MAX;
    }
    return m_segments[static_cast<size_t>(i)] * m_rho;
}

double DubinsPath::SegmentLengthNormalized(int i) const {
    if (i < 0 || i > 2) {
        return DBL_MAX;
    }
    return m_segments[static_cast<size_t>(i)];
}

DubinsError DubinsPath::Sample(double t, DubinsConfig& outQ) const {
    if (t < 0.0 || t > Length()) {
        return DubinsError::Parametrization;
    }

    const auto& types = GetDubinsSegments(m_type);
    const double tPrime = t / m_rho;

    // Integrate at unit radius from the origin, then scale and translate
    DubinsConfig qi;
    qi.heading = m_start.heading;

    const double p1 = m_segments[0];
    const double p2 = m_segments[1];
    DubinsConfig q1 = ApplySegment(p1, qi, types[0]);
    DubinsConfig q2 = ApplySegment(p2, q1, types[1]);

    DubinsConfig q;
    if (tPrime < p1) {
        q = ApplySegment(tPrime, qi, types[0]);
    } else if (tPrime < p1 + p2) {
        q = ApplySegment(tPrime - p1, q1, types[1]);
    } else {
        q = ApplySegment(tPrime - p1 - p2, q2, types[2]);
    }

    outQ.x = q.x * m_rho + m_start.x;
    outQ.y = q.y * m_rho + m_start.y;
    outQ.heading = ModTwoPi(q.heading);
    return DubinsError::None;
}

int DubinsPath::SampleMany(double stepSize, const SampleCallback& callback) const {
    if (stepSize <= 0.0 || !callback) {
        return static_cast<int>(DubinsError::Parametrization);
    }

    const double length = Length();
    DubinsConfig q;
    for (double x = 0.0; x < length; x += stepSize) {
        if (Sample(x, q) != DubinsError::None) {
            break;
        }
        int code = callback(q, x);
        if (code != 0) {
            return code;
        }
    }
    return 0;
}

DubinsError DubinsPath::Endpoint(DubinsConfig& outQ) const {
    return Sample(std::max(0.0, Length() - Epsilon), outQ);
}

DubinsError DubinsPath::ExtractSubpath(double t, DubinsPath& outPath) const {
    if (t < 0.0 || t > Length()) {
        return DubinsError::Parametrization;
    }

    const double tPrime = t / m_rho;

    outPath.m_start = m_start;
    outPath.m_rho = m_rho;
    outPath.m_type = m_type;

    outPath.m_segments[0] = std::min(m_segments[0], tPrime);
    outPath.m_segments[1] = std::min(m_segments[1], tPrime - outPath.m_segments[0]);
    outPath.m_segments[2] = std::min(m_segments[2],
                                     tPrime - outPath.m_segments[0] - outPath.m_segments[1]);
    return DubinsError::None;
}

} // namespace Lodestone
