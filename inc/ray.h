#ifndef _LT_RAY_H
#define _LT_RAY_H

#include "common.h"

#include <cmath>
#include <vector>

// ---------------------------------------------------------------------------
// Meridional ray: x is the axial coordinate, y the height above the axis.
// The angle is measured from +x, positive toward +y.
//
// A ray is mutated in place by the tracer.  Its path only ever grows, and
// once blocked or totally internally reflected it takes no further part in
// surface interactions.
// ---------------------------------------------------------------------------
struct Ray
{
    Vector2d origin = Vector2d(0, 0);
    double angle = 0.0;           // radians from the optical axis
    double wavelength_nm = 587.6; // d-line
    double intensity = 1.0;       // [0, 1]
    double medium_index = 1.0;    // index of the medium the ray travels in

    std::vector<Vector2d> path;

    bool blocked = false;
    bool total_internal_reflection = false;

    Ray();
    Ray(const Vector2d &start, double angle_rad, double wavelength = 587.6,
        double n = 1.0);

    Vector2d direction() const { return Vector2d(std::cos(angle), std::sin(angle)); }
    double height() const { return origin.y(); }

    // Still eligible for surface interactions / convergence analysis?
    bool alive() const { return !blocked && !total_internal_reflection; }

    // Advance the origin along the current direction and append the new
    // point to the path (a zero distance still appends).
    Ray &propagate(double distance);

    // Snell's law at an interface whose normal makes surface_normal_angle
    // with the axis.  Either orientation of the normal is accepted.
    // Returns false on total internal reflection; the ray is then flagged
    // and its direction mirrored about the surface.
    bool refract(double n1, double n2, double surface_normal_angle);
};

typedef std::vector<Ray> RayBundle;

#endif
