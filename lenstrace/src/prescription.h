// ============================================================================
// prescription.h — .lens prescription files
// ============================================================================
#pragma once

#include "system.h"

// Load an optical system from a .lens file:
//
//   name: Achromatic doublet
//   elements:
//   # r1    r2      thickness  diameter  n       gap_before  [material]
//     61.9  -44.2   6.0        25.0      1.5168  0           BK7
//
// Malformed element lines are skipped with a warning; elements that fail
// validation abort the load.  Returns false (after printing an ERROR line)
// if the file cannot be read, holds no elements or any element is invalid.
bool load_prescription(const char *filename, OpticalSystem &system);

// Parse a radius token: a number, or "inf" / "flat" for a flat surface.
bool parse_radius(const std::string &token, double &radius);
