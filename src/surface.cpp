#include "surface.h"

#include <cmath>
#include <limits>
#include <utility>

// ---------------------------------------------------------------------------
// Ray/surface intersection
//
// Flat surfaces: ray-plane intersection at x = surf.vertex.
// Curved surfaces: ray-circle intersection (meridional section of the
//   sphere).  Centre of curvature at C = (surf.vertex + surf.radius, 0).
//
// A sphere is cut by a forward ray twice.  Only the cap on the vertex side
// of C is glass, so a root counts when it lies ahead of the ray, inside the
// clear aperture, and on that hemisphere: (x - C) * R <= 0.
// ---------------------------------------------------------------------------

static bool accept_hit(const Ray &ray, const Surface &surf, double t,
                       Vector2d &hit_pos)
{
    if (!(t > kHitEpsilon))
        return false;

    Vector2d p = ray.origin + ray.direction() * t;
    if (std::abs(p.y()) > surf.semi_aperture)
        return false;

    if (!surf.is_flat() && (p.x() - surf.center()) * surf.radius > 0.0)
        return false; // far side of the sphere

    hit_pos = p;
    return true;
}

// Origin on the cap within kHitEpsilon (surfaces in contact at the origin).
static bool starts_on_cap(const Ray &ray, const Surface &surf)
{
    const Vector2d &p = ray.origin;
    if (std::abs(p.y()) > surf.semi_aperture)
        return false;
    double sag = surface_sag(surf, p.y());
    return std::isfinite(sag) && std::abs(p.x() - (surf.vertex + sag)) <= kHitEpsilon;
}

bool intersect_surface(const Ray &ray, const Surface &surf,
                       Vector2d &hit_pos, Vector2d &normal, double &t)
{
    const Vector2d dir = ray.direction();

    // A ray leaving a touching surface meets this one where it stands (t = 0)
    if (starts_on_cap(ray, surf))
    {
        if (surf.is_flat())
            normal = Vector2d(-1.0, 0.0);
        else
            normal = (ray.origin - Vector2d(surf.center(), 0.0)) / std::abs(surf.radius);
        if (normal.dot(dir) > 0)
            normal = -normal;
        if (normal.dot(dir) < -kEpsilon)
        {
            hit_pos = ray.origin;
            t = 0.0;
            return true;
        }
    }

    if (surf.is_flat())
    {
        // ---- Flat surface ----
        if (std::abs(dir.x()) < kEpsilon)
            return false; // parallel

        t = (surf.vertex - ray.origin.x()) / dir.x();
        if (!accept_hit(ray, surf, t, hit_pos))
            return false;

        // Normal opposing ray direction
        normal = Vector2d((dir.x() > 0) ? -1.0 : 1.0, 0.0);
        return true;
    }

    // ---- Spherical surface ----
    const double R = surf.radius;
    const Vector2d center(surf.center(), 0.0);
    const Vector2d oc = ray.origin - center;

    const double a = dir.dot(dir);
    const double b = 2.0 * oc.dot(dir);
    const double c = oc.dot(oc) - R * R;

    double roots[2];
    int num_roots = 0;

    if (std::abs(a) < kEpsilon)
    {
        // Degenerate quadratic: b t + c = 0
        if (std::abs(b) < kEpsilon)
            return false;
        roots[num_roots++] = -c / b;
    }
    else
    {
        double disc = b * b - 4.0 * a * c;
        if (disc < 0)
            return false;

        double sqrt_disc = std::sqrt(disc);
        double inv_2a = 0.5 / a;
        roots[num_roots++] = (-b - sqrt_disc) * inv_2a;
        roots[num_roots++] = (-b + sqrt_disc) * inv_2a;
        if (roots[0] > roots[1])
            std::swap(roots[0], roots[1]);
    }

    // Nearest admissible root
    bool found = false;
    for (int i = 0; i < num_roots && !found; ++i)
    {
        if (accept_hit(ray, surf, roots[i], hit_pos))
        {
            t = roots[i];
            found = true;
        }
    }
    if (!found)
        return false;

    // Normal: from sphere centre toward hit point, then ensure it opposes ray
    normal = (hit_pos - center) / std::abs(R);
    if (normal.dot(dir) > 0)
        normal = -normal;

    return true;
}

double surface_sag(const Surface &surf, double h)
{
    if (surf.is_flat())
        return 0.0;

    const double R = surf.radius;
    const double under = R * R - h * h;
    if (under < 0.0)
        return std::numeric_limits<double>::quiet_NaN();

    return (R > 0) ? R - std::sqrt(under) : R + std::sqrt(under);
}
