#ifndef _LT_SYSTEM_H
#define _LT_SYSTEM_H

#include "element.h"
#include "material.h"
#include "trace.h"

#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Ordered chain of elements separated by air gaps.
//
// Element i + 1 starts gaps[i] after the back vertex of element i.  The
// first element's front vertex sits at origin.  add_element() keeps vertices
// strictly increasing and refuses elements that would overlap their
// predecessor inside the common clear aperture.
// ---------------------------------------------------------------------------
class OpticalSystem
{
public:
    explicit OpticalSystem(std::string name = "Optical System", double origin = 0.0);

    // Append an element gap_before mm behind the current last element (the
    // gap is ignored for the first element).  Returns false, leaving the
    // system unchanged, on a negative gap, overlapping surfaces or a
    // reversed element (back vertex not after the front vertex).
    bool add_element(const Element &element, double gap_before = 0.0,
                     std::string *error = nullptr);

    // Convenience: validate a lens record and append it.
    bool add_lens(const LensRecord &record, double gap_before = 0.0,
                  std::string *error = nullptr);

    const std::string &name() const { return m_name; }
    const std::vector<Element> &elements() const { return m_elements; }
    const std::vector<double> &gaps() const { return m_gaps; }
    bool empty() const { return m_elements.empty(); }
    int num_elements() const { return (int)m_elements.size(); }

    double origin() const { return m_origin; }

    // First front vertex to last back vertex.
    double total_length() const;
    double last_vertex() const;

    // Copy with every element that names a material re-indexed through
    // index_of at the given wavelength/temperature.  Elements without a
    // material keep their index.
    std::optional<OpticalSystem> at_wavelength(const IndexFunction &index_of,
                                               double wavelength_nm, double temperature_c,
                                               std::string *error = nullptr) const;

    void print_summary() const;

private:
    std::string m_name;
    double m_origin = 0.0;
    std::vector<Element> m_elements;
    std::vector<double> m_gaps;
};

// Trace a ray through every element in axial order.  Cemented neighbours
// (zero gap, coincident surfaces) share one glass-to-glass refraction.  The
// ray stops at its last hit when an element blocks or totally internally
// reflects it; a ray missing the first element runs on unrefracted for
// options.exit_distance, as does a ray leaving the last element.
Ray &trace_through_system(Ray &ray, const OpticalSystem &system,
                          const TraceOptions &options = TraceOptions());

// Bundles launched in front of the first element (see trace_parallel_rays).
RayBundle trace_system_parallel_rays(const OpticalSystem &system, int num_rays,
                                     std::optional<Interval> height_range = std::nullopt,
                                     const TraceOptions &options = TraceOptions());
RayBundle trace_system_point_source(const OpticalSystem &system, const Vector2d &source,
                                    int num_rays, const Interval &angle_range,
                                    const TraceOptions &options = TraceOptions());

#endif
