#ifndef _LT_ELEMENT_H
#define _LT_ELEMENT_H

#include "surface.h"

#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Lens record as supplied by the editor / persistence layer.  The first five
// fields are required; the rest default to a d-line, room-temperature lens
// with no catalogued material.
// ---------------------------------------------------------------------------
struct LensRecord
{
    double radius_1 = 100.0;           // front radius of curvature (mm), +/-inf = flat
    double radius_2 = -100.0;          // back radius of curvature (mm)
    double thickness = 5.0;            // centre thickness (mm)
    double diameter = 50.0;            // clear diameter (mm)
    double refractive_index = 1.5168;  // at wavelength_nm

    std::string name = "Untitled";
    std::string material;              // empty = fixed index only
    double wavelength_nm = 587.6;
    double temperature_c = 20.0;
};

// ---------------------------------------------------------------------------
// A validated lens element: two surfaces of one glass.
//
// Elements are only created through from_record(), which rejects geometry
// the tracer cannot handle, so every Element in circulation is sound.
// ---------------------------------------------------------------------------
class Element
{
public:
    // Build an element whose front vertex sits at axial_offset.
    // On failure returns nullopt and, if error is given, a description.
    static std::optional<Element> from_record(const LensRecord &record,
                                              double axial_offset = 0.0,
                                              std::string *error = nullptr);

    const Surface &front() const { return m_front; }
    const Surface &back() const { return m_back; }
    double thickness() const { return m_thickness; }
    double refractive_index() const { return m_index; }
    double axial_offset() const { return m_front.vertex; }
    double semi_aperture() const { return m_front.semi_aperture; }
    const LensRecord &record() const { return m_record; }

    // Copy moved so that the front vertex sits at offset.
    Element translated(double offset) const;

    // Copy with a different glass index (e.g. another wavelength).
    std::optional<Element> with_index(double n, std::string *error = nullptr) const;

    // The same glass with its surfaces visited in the opposite order,
    // for rays travelling toward -x.
    Element reversed() const;

    // Thickness at the rim of the clear aperture.
    double edge_thickness() const;

    // Thick-lens (lensmaker's) power in 1/mm; 0 for a flat plate.
    double power() const;

    // Effective focal length; nullopt when the power vanishes.
    std::optional<double> focal_length() const;

    // Distance from the back vertex to the rear focal point, and from the
    // front focal point to the front vertex.
    std::optional<double> back_focal_length() const;
    std::optional<double> front_focal_length() const;

private:
    Element() = default;

    double curvature(const Surface &s) const;

    Surface m_front;
    Surface m_back;
    double m_thickness = 0.0;
    double m_index = 1.0;
    LensRecord m_record;
};

#endif
