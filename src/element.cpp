#include "element.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// Validation helpers
// ---------------------------------------------------------------------------
static bool fail(std::string *error, const std::string &msg)
{
    if (error)
        *error = msg;
    return false;
}

static std::string fmt(const char *format, double value)
{
    char buf[160];
    snprintf(buf, sizeof(buf), format, value);
    return buf;
}

// A radius is usable when it is +/-inf (flat) or a finite non-zero number.
static bool check_radius(const char *which, double R, double semi_aperture,
                         std::string *error)
{
    if (std::isnan(R))
        return fail(error, std::string(which) + " is NaN");
    if (R == 0.0)
        return fail(error, std::string(which) + " is zero (use inf for a flat surface)");
    if (std::isfinite(R) && std::abs(R) <= kFlatRadius && semi_aperture > std::abs(R))
        return fail(error, std::string(which) +
                               fmt(" (%.4g mm) is smaller than the semi-aperture; the surface would self-intersect",
                                   R));
    return true;
}

static bool validate_record(const LensRecord &rec, std::string *error)
{
    if (!std::isfinite(rec.thickness) || rec.thickness <= 0.0)
        return fail(error, fmt("thickness must be positive (got %g mm)", rec.thickness));
    if (!std::isfinite(rec.diameter) || rec.diameter <= 0.0)
        return fail(error, fmt("diameter must be positive (got %g mm)", rec.diameter));
    if (!std::isfinite(rec.refractive_index) || !(rec.refractive_index > 1.0))
        return fail(error, fmt("refractive index must be greater than 1.0 (got %g)", rec.refractive_index));
    if (!std::isfinite(rec.wavelength_nm) || rec.wavelength_nm <= 0.0)
        return fail(error, fmt("wavelength must be positive (got %g nm)", rec.wavelength_nm));
    if (!std::isfinite(rec.temperature_c))
        return fail(error, "temperature is not finite");

    const double h = 0.5 * rec.diameter;
    if (!check_radius("radius_1", rec.radius_1, h, error))
        return false;
    if (!check_radius("radius_2", rec.radius_2, h, error))
        return false;
    return true;
}

// +1 for the usual front-to-back order along +x, -1 for a reversed element.
static double travel_sign(const Surface &front, const Surface &back)
{
    return (back.vertex >= front.vertex) ? 1.0 : -1.0;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
std::optional<Element> Element::from_record(const LensRecord &record,
                                            double axial_offset,
                                            std::string *error)
{
    if (!std::isfinite(axial_offset))
    {
        fail(error, "axial offset is not finite");
        return std::nullopt;
    }
    if (!validate_record(record, error))
        return std::nullopt;

    Element e;
    e.m_record = record;
    e.m_thickness = record.thickness;
    e.m_index = record.refractive_index;

    const double h = 0.5 * record.diameter;
    e.m_front.radius = record.radius_1;
    e.m_front.vertex = axial_offset;
    e.m_front.semi_aperture = h;
    e.m_back.radius = record.radius_2;
    e.m_back.vertex = axial_offset + record.thickness;
    e.m_back.semi_aperture = h;

    // Front and back must not cross inside the clear aperture
    double edge = e.edge_thickness();
    if (!(edge > 0.0))
    {
        fail(error, fmt("surfaces cross inside the clear aperture (edge thickness %.4g mm)", edge));
        return std::nullopt;
    }
    return e;
}

Element Element::translated(double offset) const
{
    Element e = *this;
    e.m_front.vertex = offset;
    e.m_back.vertex = offset + (m_back.vertex - m_front.vertex);
    return e;
}

std::optional<Element> Element::with_index(double n, std::string *error) const
{
    LensRecord rec = m_record;
    rec.refractive_index = n;

    const bool is_reversed = travel_sign(m_front, m_back) < 0;
    std::optional<Element> e = from_record(rec, std::min(m_front.vertex, m_back.vertex), error);
    if (e && is_reversed)
        return e->reversed();
    return e;
}

Element Element::reversed() const
{
    Element e = *this;
    std::swap(e.m_front, e.m_back);
    return e;
}

// ---------------------------------------------------------------------------
// Geometry and first-order optics
// ---------------------------------------------------------------------------
double Element::edge_thickness() const
{
    const double h = m_front.semi_aperture;
    const double rim = (m_back.vertex + surface_sag(m_back, h)) - (m_front.vertex + surface_sag(m_front, h));
    return travel_sign(m_front, m_back) * rim;
}

// Curvature seen by a ray travelling front to back.
double Element::curvature(const Surface &s) const
{
    return s.is_flat() ? 0.0 : travel_sign(m_front, m_back) / s.radius;
}

// 1/f = (n-1) [ c1 - c2 + (n-1) d c1 c2 / n ]
double Element::power() const
{
    const double n = m_index;
    const double c1 = curvature(m_front);
    const double c2 = curvature(m_back);
    return (n - 1.0) * (c1 - c2 + (n - 1.0) * m_thickness * c1 * c2 / n);
}

std::optional<double> Element::focal_length() const
{
    const double P = power();
    if (std::abs(P) < kEpsilon)
        return std::nullopt;
    return 1.0 / P;
}

// BFL = f (1 - d P1 / n), P1 = (n-1) c1
std::optional<double> Element::back_focal_length() const
{
    std::optional<double> f = focal_length();
    if (!f)
        return std::nullopt;
    const double P1 = (m_index - 1.0) * curvature(m_front);
    return *f * (1.0 - m_thickness * P1 / m_index);
}

// FFL = f (1 - d P2 / n), P2 = (1-n) c2
std::optional<double> Element::front_focal_length() const
{
    std::optional<double> f = focal_length();
    if (!f)
        return std::nullopt;
    const double P2 = (1.0 - m_index) * curvature(m_back);
    return *f * (1.0 - m_thickness * P2 / m_index);
}
