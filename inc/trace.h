#ifndef _LT_TRACE_H
#define _LT_TRACE_H

#include "element.h"
#include "ray.h"

#include <optional>

// ---------------------------------------------------------------------------
// Settings shared by the element and system tracers.
// ---------------------------------------------------------------------------
struct TraceOptions
{
    double ambient_index = 1.0;   // medium outside the elements
    double exit_distance = 200.0; // straight run after the last surface (mm)
    double start_distance = 50.0; // launch distance before the first vertex (mm)
    double aperture_fill = 0.95;  // default beam height as a fraction of the semi-aperture
    double wavelength_nm = 587.6; // carried by generated rays
};

// Outcome of one pass through an element.
enum class ElementPass
{
    Exited,       // left through the back surface
    MissedFront,  // front surface missed or clipped: blocked
    MissedBack,   // back surface missed or clipped: blocked
    Reflected     // total internal reflection at either surface
};

// Move the ray to its hit on surf and refract n1 -> n2.  Returns false when
// the ray is blocked or totally internally reflected; missed is set when
// the surface was not hit inside its aperture.
bool cross_surface(Ray &ray, const Surface &surf, double n1, double n2, bool &missed);

// Front hit, refraction, back hit, refraction.  No exit propagation.
ElementPass pass_element(Ray &ray, const Element &element, double ambient_index);

// Trace a ray through one element and on for options.exit_distance.
// A ray that misses the front surface is blocked and carries on straight
// for its unrefracted segment.  Returns the same (mutated) ray.
Ray &trace_ray(Ray &ray, const Element &element,
               const TraceOptions &options = TraceOptions());

// Collimated beam along the axis: num_rays rays launched
// options.start_distance before the front vertex at evenly spaced heights.
// The default height range is +/- aperture_fill * semi-aperture.
RayBundle trace_parallel_rays(const Element &element, int num_rays,
                              std::optional<Interval> height_range = std::nullopt,
                              const TraceOptions &options = TraceOptions());

// Fan of num_rays rays from one point over angle_range (radians).
RayBundle trace_point_source(const Element &element, const Vector2d &source,
                             int num_rays, const Interval &angle_range,
                             const TraceOptions &options = TraceOptions());

// ---- Bundle generators (untraced rays) ----------------------------------

RayBundle make_parallel_rays(double start_x, int num_rays, const Interval &heights,
                             double wavelength_nm, double n = 1.0);
RayBundle make_fan(const Vector2d &source, int num_rays, const Interval &angles,
                   double wavelength_nm, double n = 1.0);

#endif
