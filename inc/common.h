#ifndef _LT_COMMON_H
#define _LT_COMMON_H

#include <eigen3/Eigen/Dense>

#include <cmath>

#ifndef M_PI
#define M_PI 3.141592653589793238462643383279
#endif

using Eigen::Matrix2d;
using Eigen::Vector2d;

// Numeric tolerances shared by the tracer and the paraxial code
constexpr double kEpsilon = 1e-10;    // near-zero denominators
constexpr double kHitEpsilon = 1e-9;  // minimum forward distance to a surface (mm)
constexpr double kFlatRadius = 1e6;   // |R| above this is treated as flat (mm)

// Closed interval [min, max] of heights, angles or axial positions.
struct Interval
{
    double min;
    double max;

    bool contains(double v) const { return v >= min && v <= max; }
    double mid() const { return 0.5 * (min + max); }
};

// Wrap an angle into (-pi, pi].  Non-finite angles give NaN.
inline double wrap_angle(double a)
{
    a = std::remainder(a, 2.0 * M_PI);
    if (a <= -M_PI)
        a += 2.0 * M_PI;
    return a;
}

#endif
