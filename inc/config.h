#ifndef _LT_CONFIG_H
#define _LT_CONFIG_H

#include "focal.h"
#include "trace.h"

#include <string>

// ---------------------------------------------------------------------------
// Trace configuration — every tweakable run parameter in one place
// ---------------------------------------------------------------------------
struct TraceConfig
{
    // Media and bundle
    double ambient_index = 1.0;
    int rays = 21;
    double start_distance = 50.0;  // launch distance before the first vertex (mm)
    double exit_distance = 200.0;  // run after the last surface (mm)
    double aperture_fill = 0.95;   // collimated beam height / semi-aperture

    // Point source fan (disabled when fan_angle <= 0)
    double fan_angle = 0.0;        // full fan angle (degrees)
    double source_x = -100.0;      // source position (mm)
    double source_y = 0.0;

    // Paraxial conjugates
    double object_distance = 1000.0; // object in front of the first vertex (mm)

    // Focal search
    double focus_min = 0.0;
    double focus_max = 1000.0;
    double focus_tolerance = 0.1;      // relative
    double focus_tolerance_abs = 1e-3; // mm

    // Spectrum
    double wavelength = 587.6; // nm
    double temperature = 20.0; // C
    bool chromatic = false;    // report F/d/C focal shift

    // Output
    bool show_rays = false; // dump final ray states
};

// Set one key from its textual value.  Returns false (with a warning on
// stderr) for an unknown key or an unparsable value; cfg is then unchanged.
bool apply_trace_setting(TraceConfig &cfg, const std::string &key, const std::string &value);

// Load a configuration from a key = value text file.
// Missing keys keep their default values.  Returns false on file-open error.
bool load_trace_config(const char *path, TraceConfig &cfg);

// Print all config values to stdout.
void print_trace_config(const TraceConfig &cfg);

TraceOptions trace_options(const TraceConfig &cfg);
FocusTolerance focus_tolerance(const TraceConfig &cfg);
Interval focus_range(const TraceConfig &cfg);

#endif
