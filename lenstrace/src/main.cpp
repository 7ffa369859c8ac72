// ============================================================================
// main.cpp — lenstrace entry point
//
// Sequential meridional ray tracer for thick spherical lens systems.
//
// Reads a lens prescription, reports its paraxial properties, traces a
// collimated bundle (and optionally a point-source fan) through it and
// reports where the rays converge.
//
// Usage:
//   lenstrace lenses/doublet.lens lenstrace.conf --rays 41 --fan-angle 4
//
// ============================================================================

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "config.h"
#include "focal.h"
#include "material.h"
#include "paraxial.h"
#include "prescription.h"
#include "system.h"

#ifdef _OPENMP
#include <omp.h>
#endif

// ---- CLI parameters -----------------------------------------------------

struct Params
{
    std::string lens_file;
    std::string config_file;
    TraceConfig cfg;
};

static void print_usage(const char *prog)
{
    printf("Usage: %s <lens_file> [config_file] [--key value ...]\n\n", prog);
    printf("Sequential ray tracer for thick spherical lens systems.\n\n");
    printf("The config file uses key = value format; # starts a comment.\n\n");
    printf("Config keys:\n");
    printf("  ambient_index        Index of the surrounding medium (default: 1.0)\n");
    printf("  rays                 Rays per bundle (default: 21)\n");
    printf("  start_distance       Launch distance before the first vertex, mm (default: 50)\n");
    printf("  exit_distance        Run after the last surface, mm (default: 200)\n");
    printf("  aperture_fill        Beam height as fraction of the semi-aperture (default: 0.95)\n");
    printf("  fan_angle            Point-source fan angle in degrees, 0 = off (default: 0)\n");
    printf("  source_x, source_y   Point-source position, mm (default: -100, 0)\n");
    printf("  object_distance      Paraxial object distance, mm (default: 1000)\n");
    printf("  focus_min, focus_max Axial focus search range, mm (default: 0, 1000)\n");
    printf("  focus_tolerance      Relative convergence tolerance (default: 0.1)\n");
    printf("  focus_tolerance_abs  Absolute convergence tolerance, mm (default: 0.001)\n");
    printf("  wavelength           Trace wavelength, nm (default: 587.6)\n");
    printf("  temperature          Glass temperature, C (default: 20)\n");
    printf("  chromatic            1 = report F/d/C focal shift (default: 0)\n");
    printf("  show_rays            1 = print every traced ray (default: 0)\n");
    printf("\nAll keys can also be passed as CLI overrides: --key value\n");
    printf("  e.g.: %s lenses/doublet.lens --rays 41 --fan-angle 4\n", prog);
    printf("\n  --help               Print this help\n");
}

static bool parse_args(int argc, char *argv[], Params &p)
{
    if (argc < 2)
        return false;

    std::vector<std::pair<std::string, std::string>> cli_kv;
    std::vector<std::string> positional;

    int i = 1;
    while (i < argc)
    {
        if (!strcmp(argv[i], "--help") || !strcmp(argv[i], "-h"))
            return false;

        // CLI key-value override: --key value
        if (argv[i][0] == '-' && argv[i][1] == '-' && i + 1 < argc)
        {
            // Strip leading "--" and convert hyphens to underscores
            std::string key(argv[i] + 2);
            for (auto &c : key)
                if (c == '-')
                    c = '_';
            cli_kv.emplace_back(key, argv[i + 1]);
            i += 2;
        }
        else if (argv[i][0] != '-' && positional.size() < 2)
        {
            positional.push_back(argv[i]);
            ++i;
        }
        else
        {
            fprintf(stderr, "ERROR: unexpected argument: %s\n", argv[i]);
            return false;
        }
    }

    if (positional.empty())
    {
        fprintf(stderr, "ERROR: no lens file specified\n");
        return false;
    }
    p.lens_file = positional[0];

    if (positional.size() > 1)
    {
        p.config_file = positional[1];
        if (!load_trace_config(p.config_file.c_str(), p.cfg))
        {
            fprintf(stderr, "ERROR: cannot open config file: %s\n", p.config_file.c_str());
            return false;
        }
    }

    // CLI overrides on top of the file
    for (auto &kv : cli_kv)
        apply_trace_setting(p.cfg, kv.first, kv.second);

    if (p.cfg.focus_min > p.cfg.focus_max)
        std::swap(p.cfg.focus_min, p.cfg.focus_max);

    return true;
}

// ---- Reports --------------------------------------------------------------

static void print_optional(const char *label, const std::optional<double> &v, const char *unit)
{
    if (v)
        printf("  %-22s %10.4f %s\n", label, *v, unit);
    else
        printf("  %-22s %10s\n", label, "undefined");
}

static void print_paraxial(const OpticalSystem &system, const TraceConfig &cfg)
{
    printf("\nElement focal lengths:\n");
    for (int i = 0; i < system.num_elements(); ++i)
    {
        const Element &e = system.elements()[i];
        std::optional<double> f = element_focal_length(e);
        std::optional<double> bfl = e.back_focal_length();
        if (f)
            printf("  [%d] f = %9.4f mm  BFL = %9.4f mm  edge = %.3f mm\n",
                   i, *f, bfl ? *bfl : 0.0, e.edge_thickness());
        else
            printf("  [%d] afocal (zero power)  edge = %.3f mm\n", i, e.edge_thickness());
    }

    const double n = cfg.ambient_index;
    printf("\nParaxial properties:\n");
    print_optional("EFL", calculate_system_focal_length(system, n), "mm");
    print_optional("BFL", back_focal_length(system, n), "mm");
    print_optional("FFL", front_focal_length(system, n), "mm");
    print_optional("f-number", f_number(system, n), "");
    print_optional("NA", numerical_aperture(system, n), "");

    char label[64];
    snprintf(label, sizeof(label), "image @ s_o=%.0f", cfg.object_distance);
    print_optional(label, image_distance(system, cfg.object_distance, n), "mm");
    print_optional("magnification", lateral_magnification(system, cfg.object_distance, n), "");
}

static void print_bundle_stats(const char *label, const RayBundle &rays, bool show_rays)
{
    int blocked = 0, tir = 0;
    for (const Ray &r : rays)
    {
        if (r.blocked)
            blocked++;
        if (r.total_internal_reflection)
            tir++;
    }
    printf("  %s: %d rays, %d passed, %d blocked, %d TIR\n",
           label, (int)rays.size(), (int)rays.size() - blocked - tir, blocked, tir);

    if (!show_rays)
        return;
    for (size_t i = 0; i < rays.size(); ++i)
    {
        const Ray &r = rays[i];
        printf("    [%3zu] start y=%8.3f  end (%9.3f, %8.3f)  angle=%8.4f deg  pts=%zu%s%s\n",
               i, r.path.front().y(), r.origin.x(), r.origin.y(), r.angle * 180.0 / M_PI,
               r.path.size(), r.blocked ? "  BLOCKED" : "",
               r.total_internal_reflection ? "  TIR" : "");
    }
}

static void print_focus(const char *label, const std::optional<FocalResult> &res)
{
    if (!res)
    {
        printf("  %-14s no convergence\n", label);
        return;
    }
    printf("  %-14s (%9.4f, %8.4f) mm  spot=%.4f mm  rms=%.4f mm  rays=%d\n",
           label, res->point.x(), res->point.y(), res->spot_size, res->rms_spread, res->num_rays);
}

static bool has_materials(const OpticalSystem &system)
{
    for (const Element &e : system.elements())
        if (!e.record().material.empty())
            return true;
    return false;
}

// ---- Main -----------------------------------------------------------------

int main(int argc, char *argv[])
{
    Params params;
    if (!parse_args(argc, argv, params))
    {
        print_usage(argv[0]);
        return 1;
    }
    const TraceConfig &cfg = params.cfg;

    printf("lenstrace\n");
#ifdef _OPENMP
    printf("  threads: %d\n", omp_get_max_threads());
#endif

    OpticalSystem system;
    if (!load_prescription(params.lens_file.c_str(), system))
        return 1;

    print_trace_config(cfg);
    system.print_summary();

    GlassCatalog catalog = GlassCatalog::standard();

    // Re-index catalogued glasses for the requested wavelength and temperature
    if (has_materials(system) &&
        (std::abs(cfg.wavelength - 587.6) > 1e-6 || std::abs(cfg.temperature - 20.0) > 1e-6))
    {
        std::string error;
        std::optional<OpticalSystem> shifted =
            system.at_wavelength(catalog.index_function(), cfg.wavelength, cfg.temperature, &error);
        if (shifted)
        {
            system = *shifted;
            printf("\nRe-indexed for %.2f nm at %.1f C\n", cfg.wavelength, cfg.temperature);
        }
        else
            fprintf(stderr, "WARNING: keeping prescription indices: %s\n", error.c_str());
    }

    print_paraxial(system, cfg);

    const TraceOptions options = trace_options(cfg);
    const FocusTolerance tol = focus_tolerance(cfg);
    const Interval range = focus_range(cfg);

    // ---- Collimated bundle ----
    printf("\nTracing...\n");
    auto t0 = std::chrono::steady_clock::now();
    RayBundle parallel = trace_system_parallel_rays(system, cfg.rays, std::nullopt, options);
    auto t1 = std::chrono::steady_clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    printf("  collimated bundle traced in %.2f ms\n", ms);

    print_bundle_stats("collimated", parallel, cfg.show_rays);
    print_focus("focal point", find_focal_point(parallel, range, tol));
    print_focus("best focus", find_best_focus(parallel, range));

    // ---- Point-source fan ----
    if (cfg.fan_angle > 0)
    {
        double half = 0.5 * cfg.fan_angle * M_PI / 180.0;
        Vector2d source(cfg.source_x, cfg.source_y);

        t0 = std::chrono::steady_clock::now();
        RayBundle fan = trace_system_point_source(system, source, cfg.rays, Interval{-half, half},
                                                  options);
        t1 = std::chrono::steady_clock::now();
        ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
        printf("  point-source fan traced in %.2f ms\n", ms);

        print_bundle_stats("fan", fan, cfg.show_rays);
        print_focus("focal point", find_focal_point(fan, range, tol));
        print_focus("image point", find_image_point(fan, range, tol));
    }

    // ---- Longitudinal colour ----
    if (cfg.chromatic)
    {
        printf("\nChromatic focal shift:\n");
        std::string error;
        std::optional<ChromaticShift> cs =
            chromatic_focal_shift(system, catalog.index_function(), cfg.temperature,
                                  cfg.ambient_index, &error);
        if (cs)
        {
            printf("  f_F = %.4f mm  f_d = %.4f mm  f_C = %.4f mm\n", cs->f_F, cs->f_d, cs->f_C);
            printf("  longitudinal = %.4f mm  (%s)\n", cs->longitudinal,
                   cs->corrected ? "corrected" : "uncorrected");
        }
        else
        {
            fprintf(stderr, "ERROR: chromatic analysis failed: %s\n", error.c_str());
            return 1;
        }
    }

    printf("\nDone.\n");
    return 0;
}
