#ifndef _LT_FOCAL_H
#define _LT_FOCAL_H

#include "ray.h"

#include <optional>

// Where a traced bundle comes together.
struct FocalResult
{
    Vector2d point = Vector2d(0, 0); // focus (on axis for the crossing analysis)
    double spot_size = 0.0;          // max deviation of the contributing rays (mm)
    double rms_spread = 0.0;         // RMS deviation (mm)
    int num_rays = 0;                // rays that contributed
};

// Convergence test: spot_size <= relative * distance + absolute, where
// distance runs from the mean start of the final segments to the focus.
struct FocusTolerance
{
    double relative = 0.1;
    double absolute = 1e-3;
};

// Axis crossings of the final path segments of every live ray.  Only real
// crossings (ahead of the segment start) inside search_range count.
// nullopt with fewer than two crossings or when they do not converge.
std::optional<FocalResult> find_focal_point(const RayBundle &rays, const Interval &search_range,
                                            const FocusTolerance &tolerance = FocusTolerance());

// Axial plane of least RMS ray height (circle of least confusion for a
// collimated beam).  nullopt outside search_range or for parallel rays.
std::optional<FocalResult> find_best_focus(const RayBundle &rays, const Interval &search_range);

// Least-squares intersection of the final segments as full 2D lines, for
// off-axis fans.  The point must lie ahead of every contributing ray and
// inside search_range (axially).
std::optional<FocalResult> find_image_point(const RayBundle &rays, const Interval &search_range,
                                            const FocusTolerance &tolerance = FocusTolerance());

#endif
