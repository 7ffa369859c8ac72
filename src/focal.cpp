// ============================================================================
// focal.cpp — Convergence analysis of traced bundles
// ============================================================================

#include "focal.h"

#include <algorithm>
#include <cmath>
#include <vector>

// Final straight segment of a ray's path.
struct Segment
{
    Vector2d start;
    Vector2d delta;
};

static std::vector<Segment> final_segments(const RayBundle &rays)
{
    std::vector<Segment> out;
    for (const Ray &r : rays)
    {
        if (!r.alive() || r.path.size() < 2)
            continue;

        const Vector2d &a = r.path[r.path.size() - 2];
        const Vector2d &b = r.path.back();
        Vector2d d = b - a;
        if (d.norm() < kEpsilon)
            continue;
        out.push_back({a, d});
    }
    return out;
}

std::optional<FocalResult> find_focal_point(const RayBundle &rays, const Interval &search_range,
                                            const FocusTolerance &tolerance)
{
    std::vector<double> crossings;
    double start_sum = 0.0;

    for (const Segment &s : final_segments(rays))
    {
        if (std::abs(s.delta.y()) < kEpsilon)
            continue; // parallel to the axis

        // Parameter along the segment where y = 0
        double u = -s.start.y() / s.delta.y();
        if (u < 0.0)
            continue; // virtual crossing behind the segment

        double x = s.start.x() + u * s.delta.x();
        if (!search_range.contains(x))
            continue;

        crossings.push_back(x);
        start_sum += s.start.x();
    }

    const int n = (int)crossings.size();
    if (n < 2)
        return std::nullopt;

    double centroid = 0.0;
    for (double x : crossings)
        centroid += x;
    centroid /= n;

    double spot = 0.0, sq = 0.0;
    for (double x : crossings)
    {
        double dev = std::abs(x - centroid);
        spot = std::max(spot, dev);
        sq += dev * dev;
    }

    double distance = std::abs(centroid - start_sum / n);
    if (spot > tolerance.relative * distance + tolerance.absolute)
        return std::nullopt;

    FocalResult res;
    res.point = Vector2d(centroid, 0.0);
    res.spot_size = spot;
    res.rms_spread = std::sqrt(sq / n);
    res.num_rays = n;
    return res;
}

std::optional<FocalResult> find_best_focus(const RayBundle &rays, const Interval &search_range)
{
    // Each segment as y(x) = a + m x; minimise sum (a + m x)^2
    std::vector<double> a, m;
    for (const Segment &s : final_segments(rays))
    {
        if (s.delta.x() <= kEpsilon)
            continue;
        double slope = s.delta.y() / s.delta.x();
        m.push_back(slope);
        a.push_back(s.start.y() - slope * s.start.x());
    }

    const int n = (int)m.size();
    if (n < 2)
        return std::nullopt;

    double am = 0.0, mm = 0.0;
    for (int i = 0; i < n; ++i)
    {
        am += a[i] * m[i];
        mm += m[i] * m[i];
    }
    if (mm < kEpsilon)
        return std::nullopt;

    double x = -am / mm;
    if (!search_range.contains(x))
        return std::nullopt;

    double spot = 0.0, sq = 0.0;
    for (int i = 0; i < n; ++i)
    {
        double y = a[i] + m[i] * x;
        spot = std::max(spot, std::abs(y));
        sq += y * y;
    }

    FocalResult res;
    res.point = Vector2d(x, 0.0);
    res.spot_size = spot;
    res.rms_spread = std::sqrt(sq / n);
    res.num_rays = n;
    return res;
}

std::optional<FocalResult> find_image_point(const RayBundle &rays, const Interval &search_range,
                                            const FocusTolerance &tolerance)
{
    std::vector<Segment> segs = final_segments(rays);
    const int n = (int)segs.size();
    if (n < 2)
        return std::nullopt;

    // Normal equations: sum (I - u u^T) p = sum (I - u u^T) a
    Matrix2d A = Matrix2d::Zero();
    Vector2d b = Vector2d::Zero();
    Vector2d start_mean = Vector2d::Zero();
    for (const Segment &s : segs)
    {
        Vector2d u = s.delta.normalized();
        Matrix2d P = Matrix2d::Identity() - u * u.transpose();
        A += P;
        b += P * s.start;
        start_mean += s.start;
    }
    start_mean /= n;

    if (std::abs(A.determinant()) < kEpsilon)
        return std::nullopt; // all lines parallel

    Vector2d p = A.partialPivLu().solve(b);
    if (!search_range.contains(p.x()))
        return std::nullopt;

    double spot = 0.0, sq = 0.0;
    for (const Segment &s : segs)
    {
        Vector2d u = s.delta.normalized();
        Vector2d rel = p - s.start;
        if (rel.dot(u) < 0.0)
            return std::nullopt; // virtual for this ray

        double dist = std::abs(u.x() * rel.y() - u.y() * rel.x());
        spot = std::max(spot, dist);
        sq += dist * dist;
    }

    if (spot > tolerance.relative * (p - start_mean).norm() + tolerance.absolute)
        return std::nullopt;

    FocalResult res;
    res.point = p;
    res.spot_size = spot;
    res.rms_spread = std::sqrt(sq / n);
    res.num_rays = n;
    return res;
}
