#ifndef _LT_SURFACE_H
#define _LT_SURFACE_H

#include "common.h"
#include "ray.h"

#include <limits>

// One refracting interface, spherical or flat.
struct Surface
{
    double radius = std::numeric_limits<double>::infinity(); // signed (mm), inf = flat
    double vertex = 0.0;                                      // axial position of the vertex (mm)
    double semi_aperture = 0.0;                               // clear semi-diameter (mm)

    bool is_flat() const { return !std::isfinite(radius) || std::abs(radius) > kFlatRadius; }

    // Center of curvature on the axis (meaningless for flat surfaces).
    double center() const { return vertex + radius; }
};

// Intersect a ray with a surface inside its clear aperture.
//
// Spherical: of the quadratic's roots, only forward hits on the vertex
// hemisphere (the physical cap) within the aperture count; the nearest one
// wins.  Flat: ray/plane intersection at x = vertex.  A ray whose origin
// already lies on the cap and heads into it hits at t = 0.
//
// On success sets the hit point, the unit normal (opposing the ray) and the
// distance t along the ray.  Returns false on a miss or aperture clip.
bool intersect_surface(const Ray &ray, const Surface &surf,
                       Vector2d &hit_pos, Vector2d &normal, double &t);

// Axial displacement of the surface from its vertex at height h.
// Positive toward +x.  Returns NaN when |h| exceeds a finite |radius|.
double surface_sag(const Surface &surf, double h);

// Angle of a normal vector measured from +x.
inline double normal_angle(const Vector2d &normal)
{
    return std::atan2(normal.y(), normal.x());
}

#endif
