// ============================================================================
// system.cpp — Multi-element assembly and chained trace
// ============================================================================

#include "system.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

// Heights sampled when checking neighbouring surfaces for overlap.
static constexpr int kOverlapSamples = 32;

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

OpticalSystem::OpticalSystem(std::string name, double origin)
    : m_name(std::move(name)), m_origin(origin)
{
}

// Does the front surface of next dip behind the back surface of prev
// anywhere inside the smaller of the two apertures?
static bool surfaces_overlap(const Element &prev, const Element &next, double &worst)
{
    const double h_max = std::min(prev.back().semi_aperture, next.front().semi_aperture);
    worst = next.front().vertex - prev.back().vertex;

    for (int k = 0; k <= kOverlapSamples; ++k)
    {
        double h = h_max * k / kOverlapSamples;
        double x_back = prev.back().vertex + surface_sag(prev.back(), h);
        double x_front = next.front().vertex + surface_sag(next.front(), h);
        worst = std::min(worst, x_front - x_back);
    }
    return worst < -1e-9;
}

bool OpticalSystem::add_element(const Element &element, double gap_before, std::string *error)
{
    if (!(element.back().vertex > element.front().vertex))
    {
        if (error)
            *error = "element must face +x (back vertex behind front vertex)";
        return false;
    }

    double position = m_origin;
    if (!m_elements.empty())
    {
        if (!std::isfinite(gap_before) || gap_before < 0.0)
        {
            if (error)
            {
                char buf[128];
                snprintf(buf, sizeof(buf), "air gap must be >= 0 (got %g mm)", gap_before);
                *error = buf;
            }
            return false;
        }
        position = m_elements.back().back().vertex + gap_before;
    }

    Element placed = element.translated(position);

    if (!m_elements.empty())
    {
        double worst = 0;
        if (surfaces_overlap(m_elements.back(), placed, worst))
        {
            if (error)
            {
                char buf[160];
                snprintf(buf, sizeof(buf),
                         "element %d overlaps the previous element by %.4g mm inside the aperture",
                         num_elements(), -worst);
                *error = buf;
            }
            return false;
        }
        m_gaps.push_back(gap_before);
    }

    m_elements.push_back(placed);
    return true;
}

bool OpticalSystem::add_lens(const LensRecord &record, double gap_before, std::string *error)
{
    std::optional<Element> e = Element::from_record(record, 0.0, error);
    if (!e)
        return false;
    return add_element(*e, gap_before, error);
}

double OpticalSystem::last_vertex() const
{
    if (m_elements.empty())
        return m_origin;
    return m_elements.back().back().vertex;
}

double OpticalSystem::total_length() const
{
    if (m_elements.empty())
        return 0.0;
    return last_vertex() - m_elements.front().front().vertex;
}

std::optional<OpticalSystem> OpticalSystem::at_wavelength(const IndexFunction &index_of,
                                                          double wavelength_nm,
                                                          double temperature_c,
                                                          std::string *error) const
{
    OpticalSystem out(m_name, m_origin);

    for (size_t i = 0; i < m_elements.size(); ++i)
    {
        const Element &src = m_elements[i];
        std::optional<Element> e = src;

        if (!src.record().material.empty())
        {
            std::string why;
            double n = index_of(src.record().material, wavelength_nm, temperature_c);
            e = src.with_index(n, &why);
            if (!e)
            {
                if (error)
                    *error = "element " + std::to_string(i) + " (" + src.record().material +
                             "): " + why;
                return std::nullopt;
            }
        }

        double gap = (i == 0) ? 0.0 : m_gaps[i - 1];
        if (!out.add_element(*e, gap, error))
            return std::nullopt;
    }
    return out;
}

void OpticalSystem::print_summary() const
{
    printf("System: %s\n", m_name.c_str());
    printf("  elements: %d\n", num_elements());
    printf("  length:   %.3f mm\n", total_length());
    printf("  %-4s  %10s  %10s  %8s  %8s  %8s  %8s  %s\n",
           "Idx", "R1", "R2", "Thick", "Diam", "Index", "Gap", "Material");

    for (int i = 0; i < num_elements(); ++i)
    {
        const Element &e = m_elements[i];
        char r1[32], r2[32];
        if (e.front().is_flat())
            snprintf(r1, sizeof(r1), "flat");
        else
            snprintf(r1, sizeof(r1), "%.3f", e.front().radius);
        if (e.back().is_flat())
            snprintf(r2, sizeof(r2), "flat");
        else
            snprintf(r2, sizeof(r2), "%.3f", e.back().radius);

        printf("  %-4d  %10s  %10s  %8.3f  %8.2f  %8.5f  %8.3f  %s\n",
               i, r1, r2, e.thickness(), 2.0 * e.semi_aperture(), e.refractive_index(),
               (i == 0) ? 0.0 : m_gaps[i - 1],
               e.record().material.empty() ? "-" : e.record().material.c_str());
    }
}

// ---------------------------------------------------------------------------
// Chained trace
// ---------------------------------------------------------------------------

// Element i + 1 is cemented to element i when the facing surfaces coincide.
// The ray then refracts once, glass to glass, at the shared interface.
static bool cemented_to_next(const std::vector<Element> &elements, size_t i)
{
    if (i + 1 >= elements.size())
        return false;
    const Surface &a = elements[i].back();
    const Surface &b = elements[i + 1].front();
    if (std::abs(a.vertex - b.vertex) > kHitEpsilon)
        return false;
    if (a.is_flat() || b.is_flat())
        return a.is_flat() && b.is_flat();
    return std::abs(a.radius - b.radius) <= kHitEpsilon;
}

Ray &trace_through_system(Ray &ray, const OpticalSystem &system, const TraceOptions &options)
{
    if (!ray.alive())
        return ray;

    const std::vector<Element> &elements = system.elements();
    const double ambient = options.ambient_index;
    bool missed = false;

    for (size_t i = 0; i < elements.size(); ++i)
    {
        const Element &e = elements[i];
        const double n = e.refractive_index();

        // The gap to this element is crossed by its front-surface hit
        if (i == 0 || !cemented_to_next(elements, i - 1))
        {
            if (!cross_surface(ray, e.front(), ambient, n, missed))
            {
                // Only a ray stopped by the first element runs on unrefracted
                if (i == 0 && !ray.total_internal_reflection)
                    ray.propagate(options.exit_distance);
                return ray;
            }
        }

        if (cemented_to_next(elements, i))
        {
            const Element &next = elements[i + 1];
            Surface joint = e.back();
            joint.semi_aperture = std::min(joint.semi_aperture, next.front().semi_aperture);
            if (!cross_surface(ray, joint, n, next.refractive_index(), missed))
                return ray;
        }
        else if (!cross_surface(ray, e.back(), n, ambient, missed))
        {
            return ray;
        }
    }

    if (!elements.empty())
        ray.propagate(options.exit_distance);
    return ray;
}

static void trace_system_bundle(RayBundle &rays, const OpticalSystem &system,
                                const TraceOptions &options)
{
    const int count = (int)rays.size();
#pragma omp parallel for schedule(static)
    for (int i = 0; i < count; ++i)
        trace_through_system(rays[i], system, options);
}

RayBundle trace_system_parallel_rays(const OpticalSystem &system, int num_rays,
                                     std::optional<Interval> height_range,
                                     const TraceOptions &options)
{
    if (system.empty())
        return RayBundle();

    const Element &first = system.elements().front();
    if (!height_range)
    {
        double h = options.aperture_fill * first.semi_aperture();
        height_range = Interval{-h, h};
    }

    RayBundle rays = make_parallel_rays(first.axial_offset() - options.start_distance,
                                        num_rays, *height_range, options.wavelength_nm,
                                        options.ambient_index);
    trace_system_bundle(rays, system, options);
    return rays;
}

RayBundle trace_system_point_source(const OpticalSystem &system, const Vector2d &source,
                                    int num_rays, const Interval &angle_range,
                                    const TraceOptions &options)
{
    RayBundle rays = make_fan(source, num_rays, angle_range, options.wavelength_nm,
                              options.ambient_index);
    trace_system_bundle(rays, system, options);
    return rays;
}
