#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Trim leading/trailing whitespace
// ---------------------------------------------------------------------------
static std::string trim(const std::string &s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static bool parse_bool(const std::string &value, bool &out)
{
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        out = true;
    else if (v == "0" || v == "false" || v == "no" || v == "off")
        out = false;
    else
        return false;
    return true;
}

// ---------------------------------------------------------------------------
// Set a single key
// ---------------------------------------------------------------------------
bool apply_trace_setting(TraceConfig &cfg, const std::string &key, const std::string &value)
{
    TraceConfig next = cfg;
    bool known = true;

    try
    {
        size_t used = 0;
        auto get_int = [&](int &out)
        {
            out = std::stoi(value, &used);
        };
        auto get_double = [&](double &out)
        {
            out = std::stod(value, &used);
        };

        used = value.size();

        if (key == "ambient_index")
            get_double(next.ambient_index);
        else if (key == "rays")
            get_int(next.rays);
        else if (key == "start_distance")
            get_double(next.start_distance);
        else if (key == "exit_distance")
            get_double(next.exit_distance);
        else if (key == "aperture_fill")
            get_double(next.aperture_fill);
        else if (key == "fan_angle")
            get_double(next.fan_angle);
        else if (key == "source_x")
            get_double(next.source_x);
        else if (key == "source_y")
            get_double(next.source_y);
        else if (key == "object_distance")
            get_double(next.object_distance);
        else if (key == "focus_min")
            get_double(next.focus_min);
        else if (key == "focus_max")
            get_double(next.focus_max);
        else if (key == "focus_tolerance")
            get_double(next.focus_tolerance);
        else if (key == "focus_tolerance_abs")
            get_double(next.focus_tolerance_abs);
        else if (key == "wavelength")
            get_double(next.wavelength);
        else if (key == "temperature")
            get_double(next.temperature);
        else if (key == "chromatic")
        {
            if (!parse_bool(value, next.chromatic))
                used = 0;
        }
        else if (key == "show_rays")
        {
            if (!parse_bool(value, next.show_rays))
                used = 0;
        }
        else
            known = false;

        if (known && used != value.size())
        {
            fprintf(stderr, "WARNING: Bad value for '%s': '%s'\n", key.c_str(), value.c_str());
            return false;
        }
    }
    catch (const std::invalid_argument &)
    {
        fprintf(stderr, "WARNING: Bad value for '%s': '%s'\n", key.c_str(), value.c_str());
        return false;
    }
    catch (const std::out_of_range &)
    {
        fprintf(stderr, "WARNING: Value out of range for '%s': '%s'\n", key.c_str(), value.c_str());
        return false;
    }

    if (!known)
    {
        fprintf(stderr, "WARNING: Unknown config key '%s'\n", key.c_str());
        return false;
    }

    if (next.rays < 1)
        next.rays = 1;

    cfg = next;
    return true;
}

// ---------------------------------------------------------------------------
// Load config from a key = value text file
// ---------------------------------------------------------------------------
bool load_trace_config(const char *path, TraceConfig &cfg)
{
    std::ifstream file(path);
    if (!file.is_open())
        return false;

    std::string line;
    int line_num = 0;
    while (std::getline(file, line))
    {
        line_num++;

        // Strip comments
        size_t hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);

        line = trim(line);
        if (line.empty())
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos)
        {
            fprintf(stderr, "WARNING: %s:%d: expected key = value\n", path, line_num);
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (!key.empty() && !val.empty())
            apply_trace_setting(cfg, key, val);
    }

    return true;
}

// ---------------------------------------------------------------------------
// Pretty-print the config
// ---------------------------------------------------------------------------
void print_trace_config(const TraceConfig &cfg)
{
    printf("=== Trace Configuration ===\n");
    printf("  Medium:    n = %.5f\n", cfg.ambient_index);
    printf("  Bundle:    %d rays  fill=%.2f  start=%.1f mm  exit=%.1f mm\n",
           cfg.rays, cfg.aperture_fill, cfg.start_distance, cfg.exit_distance);
    if (cfg.fan_angle > 0)
        printf("  Fan:       %.2f deg from (%.2f, %.2f)\n", cfg.fan_angle, cfg.source_x, cfg.source_y);
    else
        printf("  Fan:       off\n");
    printf("  Object:    %.2f mm\n", cfg.object_distance);
    printf("  Focus:     [%.1f, %.1f] mm  tol=%.3g rel + %.3g mm\n",
           cfg.focus_min, cfg.focus_max, cfg.focus_tolerance, cfg.focus_tolerance_abs);
    printf("  Spectrum:  %.2f nm  %.1f C  chromatic=%s\n",
           cfg.wavelength, cfg.temperature, cfg.chromatic ? "yes" : "no");
    printf("===========================\n");
}

TraceOptions trace_options(const TraceConfig &cfg)
{
    TraceOptions opt;
    opt.ambient_index = cfg.ambient_index;
    opt.exit_distance = cfg.exit_distance;
    opt.start_distance = cfg.start_distance;
    opt.aperture_fill = cfg.aperture_fill;
    opt.wavelength_nm = cfg.wavelength;
    return opt;
}

FocusTolerance focus_tolerance(const TraceConfig &cfg)
{
    FocusTolerance tol;
    tol.relative = cfg.focus_tolerance;
    tol.absolute = cfg.focus_tolerance_abs;
    return tol;
}

Interval focus_range(const TraceConfig &cfg)
{
    return Interval{cfg.focus_min, cfg.focus_max};
}
