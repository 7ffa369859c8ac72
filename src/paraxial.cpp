// ============================================================================
// paraxial.cpp — ABCD matrices and first-order system properties
// ============================================================================

#include "paraxial.h"

#include <cmath>
#include <cstdio>

Matrix2d translation_matrix(double distance)
{
    Matrix2d m;
    m << 1.0, distance,
         0.0, 1.0;
    return m;
}

Matrix2d refraction_matrix(double n1, double n2, double radius)
{
    double c = 0.0;
    if (std::isfinite(radius) && std::abs(radius) <= kFlatRadius)
        c = (n1 - n2) / (n2 * radius);

    Matrix2d m;
    m << 1.0, 0.0,
         c, n1 / n2;
    return m;
}

Matrix2d element_matrix(const Element &element, double ambient_index)
{
    const double n = element.refractive_index();
    return refraction_matrix(n, ambient_index, element.back().radius) *
           translation_matrix(element.thickness()) *
           refraction_matrix(ambient_index, n, element.front().radius);
}

Matrix2d system_matrix(const OpticalSystem &system, double ambient_index)
{
    Matrix2d m = Matrix2d::Identity();
    const std::vector<Element> &elements = system.elements();
    for (size_t i = 0; i < elements.size(); ++i)
    {
        if (i > 0)
            m = translation_matrix(system.gaps()[i - 1]) * m;
        m = element_matrix(elements[i], ambient_index) * m;
    }
    return m;
}

std::optional<double> element_focal_length(const Element &element)
{
    return element.focal_length();
}

// System matrix if every element has a defined power and C does not vanish.
static std::optional<Matrix2d> focusing_matrix(const OpticalSystem &system, double ambient_index)
{
    if (system.empty())
        return std::nullopt;
    for (const Element &e : system.elements())
        if (!e.focal_length())
            return std::nullopt;

    Matrix2d m = system_matrix(system, ambient_index);
    if (std::abs(m(1, 0)) < kEpsilon)
        return std::nullopt; // afocal
    return m;
}

std::optional<double> calculate_system_focal_length(const OpticalSystem &system,
                                                    double ambient_index)
{
    std::optional<Matrix2d> m = focusing_matrix(system, ambient_index);
    if (!m)
        return std::nullopt;
    return -1.0 / (*m)(1, 0);
}

std::optional<double> back_focal_length(const OpticalSystem &system, double ambient_index)
{
    std::optional<Matrix2d> m = focusing_matrix(system, ambient_index);
    if (!m)
        return std::nullopt;
    return -(*m)(0, 0) / (*m)(1, 0);
}

std::optional<double> front_focal_length(const OpticalSystem &system, double ambient_index)
{
    std::optional<Matrix2d> m = focusing_matrix(system, ambient_index);
    if (!m)
        return std::nullopt;
    return -(*m)(1, 1) / (*m)(1, 0);
}

std::optional<double> image_distance(const OpticalSystem &system, double object_distance,
                                     double ambient_index)
{
    if (system.empty())
        return std::nullopt;

    const Matrix2d m = system_matrix(system, ambient_index);
    double denom = m(1, 0) * object_distance + m(1, 1);
    if (std::abs(denom) < kEpsilon)
        return std::nullopt; // image at infinity

    return -(m(0, 0) * object_distance + m(0, 1)) / denom;
}

std::optional<double> lateral_magnification(const OpticalSystem &system, double object_distance,
                                            double ambient_index)
{
    std::optional<double> s_i = image_distance(system, object_distance, ambient_index);
    if (!s_i)
        return std::nullopt;

    const Matrix2d m = system_matrix(system, ambient_index);
    return m(0, 0) + *s_i * m(1, 0);
}

std::optional<double> numerical_aperture(const OpticalSystem &system, double ambient_index)
{
    std::optional<double> f = calculate_system_focal_length(system, ambient_index);
    if (!f)
        return std::nullopt;
    return ambient_index * system.elements().front().semi_aperture() / std::abs(*f);
}

std::optional<double> f_number(const OpticalSystem &system, double ambient_index)
{
    std::optional<double> f = calculate_system_focal_length(system, ambient_index);
    if (!f)
        return std::nullopt;
    return std::abs(*f) / (2.0 * system.elements().front().semi_aperture());
}

std::optional<ChromaticShift> chromatic_focal_shift(const OpticalSystem &system,
                                                    const IndexFunction &index_of,
                                                    double temperature_c, double ambient_index,
                                                    std::string *error)
{
    const double lines[3] = {kLineF, kLined, kLineC};
    double f[3];

    for (int i = 0; i < 3; ++i)
    {
        std::optional<OpticalSystem> s = system.at_wavelength(index_of, lines[i], temperature_c,
                                                              error);
        if (!s)
            return std::nullopt;

        std::optional<double> efl = calculate_system_focal_length(*s, ambient_index);
        if (!efl)
        {
            if (error)
            {
                char buf[96];
                snprintf(buf, sizeof(buf), "focal length undefined at %.2f nm", lines[i]);
                *error = buf;
            }
            return std::nullopt;
        }
        f[i] = *efl;
    }

    ChromaticShift cs;
    cs.f_F = f[0];
    cs.f_d = f[1];
    cs.f_C = f[2];
    cs.longitudinal = std::abs(cs.f_C - cs.f_F);
    cs.corrected = cs.longitudinal < 1e-3 * std::abs(cs.f_d);
    return cs;
}
