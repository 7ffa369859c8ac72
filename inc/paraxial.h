#ifndef _LT_PARAXIAL_H
#define _LT_PARAXIAL_H

#include "system.h"

#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Paraxial (first-order) properties from 2x2 ray transfer matrices acting on
// (height, angle).  Rays travel toward +x; distances are in mm.
// ---------------------------------------------------------------------------

Matrix2d translation_matrix(double distance);

// Refraction n1 -> n2 at a surface of signed radius R (flat for inf).
Matrix2d refraction_matrix(double n1, double n2, double radius);

// Front vertex to back vertex of one element in the ambient medium.
Matrix2d element_matrix(const Element &element, double ambient_index = 1.0);

// First front vertex to last back vertex, gaps included.  Identity when empty.
Matrix2d system_matrix(const OpticalSystem &system, double ambient_index = 1.0);

// Thick lensmaker's focal length; nullopt for zero power.
std::optional<double> element_focal_length(const Element &element);

// Effective focal length -1/C of the whole system.  nullopt for an empty
// system, when any element has no defined power, or when C vanishes.
std::optional<double> calculate_system_focal_length(const OpticalSystem &system,
                                                    double ambient_index = 1.0);

// Last back vertex to rear focal point.
std::optional<double> back_focal_length(const OpticalSystem &system, double ambient_index = 1.0);

// Front focal point to first front vertex.
std::optional<double> front_focal_length(const OpticalSystem &system, double ambient_index = 1.0);

// Image distance behind the last vertex for an object object_distance mm in
// front of the first vertex.  nullopt for an object in the front focal plane.
std::optional<double> image_distance(const OpticalSystem &system, double object_distance,
                                     double ambient_index = 1.0);

// Paraxial lateral magnification for the same conjugates.
std::optional<double> lateral_magnification(const OpticalSystem &system, double object_distance,
                                            double ambient_index = 1.0);

// n * h / |EFL| with h the first element's semi-aperture.
std::optional<double> numerical_aperture(const OpticalSystem &system, double ambient_index = 1.0);

// |EFL| / entrance diameter.
std::optional<double> f_number(const OpticalSystem &system, double ambient_index = 1.0);

// Longitudinal colour: focal lengths at the F, d and C lines.
struct ChromaticShift
{
    double f_F = 0.0;
    double f_d = 0.0;
    double f_C = 0.0;
    double longitudinal = 0.0; // |f_C - f_F|
    bool corrected = false;    // longitudinal below 0.1 % of |f_d|
};

// Re-indexes every element that names a material.  nullopt (with error set)
// when a lookup fails or a focal length is undefined.
std::optional<ChromaticShift> chromatic_focal_shift(const OpticalSystem &system,
                                                    const IndexFunction &index_of,
                                                    double temperature_c = 20.0,
                                                    double ambient_index = 1.0,
                                                    std::string *error = nullptr);

#endif
