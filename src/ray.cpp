#include "ray.h"

#include <cmath>

// ---------------------------------------------------------------------------
// Constructors
// ---------------------------------------------------------------------------
Ray::Ray()
{
    path.push_back(origin);
}

Ray::Ray(const Vector2d &start, double angle_rad, double wavelength, double n)
    : origin(start), angle(angle_rad), wavelength_nm(wavelength), medium_index(n)
{
    path.push_back(origin);
}

// ---------------------------------------------------------------------------
// Straight-line propagation
// ---------------------------------------------------------------------------
Ray &Ray::propagate(double distance)
{
    origin += distance * direction();
    path.push_back(origin);
    return *this;
}

// ---------------------------------------------------------------------------
// Refraction (Snell's law in angle form)
//
// The normal is turned to point along the propagation direction, so the
// incident angle theta_i = angle - phi lies in [-pi/2, pi/2] and the
// transmitted ray phi + asin((n1/n2) sin theta_i) stays on the same side
// of the normal line.  The same rule then holds for convex and concave
// surfaces, entering and exiting.
// ---------------------------------------------------------------------------
bool Ray::refract(double n1, double n2, double surface_normal_angle)
{
    if (n2 < kEpsilon)
    {
        blocked = true;
        return false;
    }

    double phi = surface_normal_angle;
    if (std::cos(angle - phi) < 0.0)
        phi += M_PI;

    const double incident = wrap_angle(angle - phi);
    const double sin_ratio = (n1 / n2) * std::sin(incident);

    if (std::abs(sin_ratio) > 1.0)
    {
        // Mirror about the surface: same angle to the reversed normal
        total_internal_reflection = true;
        angle = wrap_angle(2.0 * phi + M_PI - angle);
        return false;
    }

    angle = wrap_angle(phi + std::asin(sin_ratio));
    medium_index = n2;
    return true;
}
