#ifndef _LT_MATERIAL_H
#define _LT_MATERIAL_H

#include <functional>
#include <optional>
#include <string>
#include <vector>

// Fraunhofer reference lines (nm)
constexpr double kLineF = 486.13;
constexpr double kLined = 587.56;
constexpr double kLineC = 656.27;

// Refractive index provider supplied by the caller (the material database).
// Arguments: material name, wavelength (nm), temperature (C).  The result is
// used as-is; a non-finite or <= 1.0 value makes the lookup fail downstream.
typedef std::function<double(const std::string &, double, double)> IndexFunction;

// Wavelength-dependent IOR from the d-line IOR and Abbe number (Cauchy).
double dispersion_ior(double n_d, double V_d, double lambda_nm);

// ---------------------------------------------------------------------------
// Read-only glass table.  Indices follow the Cauchy model through the Abbe
// number plus a linear temperature coefficient about 20 C.
// ---------------------------------------------------------------------------
struct Glass
{
    std::string name;
    double n_d;   // index at the d-line
    double V_d;   // Abbe number
    double dn_dT; // 1/K
};

class GlassCatalog
{
public:
    explicit GlassCatalog(std::vector<Glass> glasses);

    // BK7, SF11, F2, Fused Silica, N-SK16, LAK9
    static GlassCatalog standard();

    const Glass *find(const std::string &name) const;
    std::optional<double> index(const std::string &name, double wavelength_nm,
                                double temperature_c = 20.0) const;

    std::vector<std::string> names() const;

    // Adapter for the tracer; unknown glasses map to NaN.  The catalog must
    // outlive the returned function.
    IndexFunction index_function() const;

private:
    std::vector<Glass> m_glasses;
};

#endif
