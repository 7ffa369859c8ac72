// ============================================================================
// trace.cpp — Sequential trace through a single lens element
// ============================================================================

#include "trace.h"
#include "surface.h"

#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

// ---------------------------------------------------------------------------
// Cross one surface: move to the hit point, then refract n1 -> n2.
// ---------------------------------------------------------------------------

bool cross_surface(Ray &ray, const Surface &surf, double n1, double n2,
                          bool &missed)
{
    Vector2d hit, norm;
    double t = 0;
    missed = false;

    if (!intersect_surface(ray, surf, hit, norm, t))
    {
        ray.blocked = true;
        missed = true;
        return false;
    }

    ray.propagate(t);
    ray.origin = hit;
    ray.path.back() = hit;

    return ray.refract(n1, n2, normal_angle(norm));
}

// ---------------------------------------------------------------------------
// Front surface (ambient -> glass), interior, back surface (glass -> ambient).
// ---------------------------------------------------------------------------

ElementPass pass_element(Ray &ray, const Element &element, double ambient_index)
{
    const double n = element.refractive_index();
    bool missed = false;

    if (!cross_surface(ray, element.front(), ambient_index, n, missed))
    {
        if (missed)
            return ElementPass::MissedFront;
        return ray.total_internal_reflection ? ElementPass::Reflected : ElementPass::MissedFront;
    }

    if (!cross_surface(ray, element.back(), n, ambient_index, missed))
    {
        if (missed)
            return ElementPass::MissedBack;
        return ray.total_internal_reflection ? ElementPass::Reflected : ElementPass::MissedBack;
    }

    return ElementPass::Exited;
}

Ray &trace_ray(Ray &ray, const Element &element, const TraceOptions &options)
{
    if (!ray.alive())
        return ray;

    switch (pass_element(ray, element, options.ambient_index))
    {
    case ElementPass::Exited:
    case ElementPass::MissedFront:
        // Unrefracted segment for a blocked ray, far-field run otherwise
        ray.propagate(options.exit_distance);
        break;
    case ElementPass::MissedBack:
    case ElementPass::Reflected:
        break;
    }
    return ray;
}

// ---------------------------------------------------------------------------
// Bundle generation
// ---------------------------------------------------------------------------

static double spread(const Interval &range, int i, int count)
{
    if (count == 1)
        return range.mid();
    return range.min + (range.max - range.min) * i / (count - 1);
}

RayBundle make_parallel_rays(double start_x, int num_rays, const Interval &heights,
                             double wavelength_nm, double n)
{
    RayBundle rays;
    for (int i = 0; i < num_rays; ++i)
        rays.emplace_back(Vector2d(start_x, spread(heights, i, num_rays)), 0.0, wavelength_nm, n);
    return rays;
}

RayBundle make_fan(const Vector2d &source, int num_rays, const Interval &angles,
                   double wavelength_nm, double n)
{
    RayBundle rays;
    for (int i = 0; i < num_rays; ++i)
        rays.emplace_back(source, spread(angles, i, num_rays), wavelength_nm, n);
    return rays;
}

// Each ray only reads the element, so the loop parallelises freely.
static void trace_bundle(RayBundle &rays, const Element &element, const TraceOptions &options)
{
    const int count = (int)rays.size();
#pragma omp parallel for schedule(static)
    for (int i = 0; i < count; ++i)
        trace_ray(rays[i], element, options);
}

RayBundle trace_parallel_rays(const Element &element, int num_rays,
                              std::optional<Interval> height_range,
                              const TraceOptions &options)
{
    if (!height_range)
    {
        double h = options.aperture_fill * element.semi_aperture();
        height_range = Interval{-h, h};
    }

    RayBundle rays = make_parallel_rays(element.axial_offset() - options.start_distance,
                                        num_rays, *height_range, options.wavelength_nm,
                                        options.ambient_index);
    trace_bundle(rays, element, options);
    return rays;
}

RayBundle trace_point_source(const Element &element, const Vector2d &source,
                             int num_rays, const Interval &angle_range,
                             const TraceOptions &options)
{
    RayBundle rays = make_fan(source, num_rays, angle_range, options.wavelength_nm,
                              options.ambient_index);
    trace_bundle(rays, element, options);
    return rays;
}
