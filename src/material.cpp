#include "material.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <utility>

// ---- Dispersion (Cauchy via Abbe number) --------------------------------

// n(lambda) = A + B / lambda^2 fitted so that n(d) = n_d and
// n_F - n_C = (n_d - 1) / V_d.
double dispersion_ior(double n_d, double V_d, double lambda_nm)
{
    if (V_d < 0.1 || n_d <= 1.0001)
        return n_d; // air or non-dispersive

    double dn = (n_d - 1.0) / V_d;

    double inv_lF2 = 1.0 / (kLineF * kLineF);
    double inv_lC2 = 1.0 / (kLineC * kLineC);
    double inv_ld2 = 1.0 / (kLined * kLined);

    double B = dn / (inv_lF2 - inv_lC2);
    double A = n_d - B * inv_ld2;

    return A + B / (lambda_nm * lambda_nm);
}

// ---- Glass catalog ------------------------------------------------------

static std::string lowercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

GlassCatalog::GlassCatalog(std::vector<Glass> glasses)
    : m_glasses(std::move(glasses))
{
}

GlassCatalog GlassCatalog::standard()
{
    std::vector<Glass> glasses = {
        //  name            n_d       V_d     dn/dT
        {"BK7", 1.5168, 64.17, 3.0e-6},
        {"SF11", 1.78472, 25.68, 1.1e-6},
        {"F2", 1.62004, 36.37, 4.4e-6},
        {"Fused Silica", 1.4585, 67.82, 1.0e-5},
        {"N-SK16", 1.62041, 60.32, 1.6e-6},
        {"LAK9", 1.6910, 54.71, 2.8e-6},
    };
    return GlassCatalog(std::move(glasses));
}

const Glass *GlassCatalog::find(const std::string &name) const
{
    const std::string key = lowercase(name);
    for (const Glass &g : m_glasses)
        if (lowercase(g.name) == key)
            return &g;
    return nullptr;
}

std::optional<double> GlassCatalog::index(const std::string &name, double wavelength_nm,
                                          double temperature_c) const
{
    const Glass *g = find(name);
    if (!g || !(wavelength_nm > 0.0))
        return std::nullopt;
    return dispersion_ior(g->n_d, g->V_d, wavelength_nm) + g->dn_dT * (temperature_c - 20.0);
}

std::vector<std::string> GlassCatalog::names() const
{
    std::vector<std::string> out;
    for (const Glass &g : m_glasses)
        out.push_back(g.name);
    return out;
}

IndexFunction GlassCatalog::index_function() const
{
    return [this](const std::string &name, double wavelength_nm, double temperature_c)
    {
        std::optional<double> n = index(name, wavelength_nm, temperature_c);
        return n ? *n : std::numeric_limits<double>::quiet_NaN();
    };
}
