#include "geometry.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace loop::geometry {

Rect intersection(Rect const& a, Rect const& b)
{
    double x0 = std::max(a.min_x(), b.min_x());
    double y0 = std::max(a.min_y(), b.min_y());
    double x1 = std::min(a.max_x(), b.max_x());
    double y1 = std::min(a.max_y(), b.max_y());
    if (x1 <= x0 || y1 <= y0)
        return {};
    return { x0, y0, x1 - x0, y1 - y0 };
}

bool intersects(Rect const& a, Rect const& b)
{
    return a.min_x() < b.max_x() && b.min_x() < a.max_x() && a.min_y() < b.max_y() && b.min_y() < a.max_y();
}

bool contains(Rect const& outer, Rect const& inner)
{
    return inner.min_x() >= outer.min_x() && inner.max_x() <= outer.max_x() && inner.min_y() >= outer.min_y()
        && inner.max_y() <= outer.max_y();
}

bool contains(Rect const& rect, Point const& point)
{
    return point.x >= rect.min_x() && point.x < rect.max_x() && point.y >= rect.min_y() && point.y < rect.max_y();
}

Rect push_inside(Rect const& rect, Rect const& bounds)
{
    Rect result = rect;
    if (result.max_x() > bounds.max_x())
        result.x = bounds.max_x() - result.width;
    if (result.min_x() < bounds.min_x())
        result.x = bounds.min_x();
    if (result.max_y() > bounds.max_y())
        result.y = bounds.max_y() - result.height;
    if (result.min_y() < bounds.min_y())
        result.y = bounds.min_y();
    return result;
}

Rect centered_in(Size const& size, Rect const& rect)
{
    return { rect.mid_x() - size.width / 2, rect.mid_y() - size.height / 2, size.width, size.height };
}

Rect inset_edges(Rect const& rect, EdgeSet edges, double amount)
{
    Rect result = rect;
    if (edges & edge::Top)
    {
        result.y += amount;
        result.height -= amount;
    }
    if (edges & edge::Bottom)
        result.height -= amount;
    if (edges & edge::Left)
    {
        result.x += amount;
        result.width -= amount;
    }
    if (edges & edge::Right)
        result.width -= amount;
    return result;
}

Rect inset_all(Rect const& rect, double amount, Size const& min_size)
{
    double width = std::max(rect.width - 2 * amount, min_size.width);
    double height = std::max(rect.height - 2 * amount, min_size.height);
    return centered_in({ width, height }, rect);
}

Rect inset_by(Rect const& rect, double dx, double dy)
{
    return { rect.x + dx, rect.y + dy, rect.width - 2 * dx, rect.height - 2 * dy };
}

EdgeSet edges_touching(Rect const& rect, Rect const& bounds)
{
    EdgeSet edges = edge::Empty;
    if (std::abs(rect.min_y() - bounds.min_y()) <= 1)
        edges |= edge::Top;
    if (std::abs(rect.max_y() - bounds.max_y()) <= 1)
        edges |= edge::Bottom;
    if (std::abs(rect.min_x() - bounds.min_x()) <= 1)
        edges |= edge::Left;
    if (std::abs(rect.max_x() - bounds.max_x()) <= 1)
        edges |= edge::Right;
    return edges;
}

Rect integral(Rect const& rect)
{
    return { std::round(rect.x), std::round(rect.y), std::round(rect.width), std::round(rect.height) };
}

bool approx_equal(double a, double b, double tolerance) { return std::abs(a - b) <= tolerance; }

bool approx_equal(Point const& a, Point const& b, double tolerance)
{
    return approx_equal(a.x, b.x, tolerance) && approx_equal(a.y, b.y, tolerance);
}

bool approx_equal(Size const& a, Size const& b, double tolerance)
{
    return approx_equal(a.width, b.width, tolerance) && approx_equal(a.height, b.height, tolerance);
}

bool approx_equal(Rect const& a, Rect const& b, double tolerance)
{
    return approx_equal(a.origin(), b.origin(), tolerance) && approx_equal(a.size(), b.size(), tolerance);
}

double distance(Point const& from, Point const& to) { return std::hypot(to.x - from.x, to.y - from.y); }

double angle_degrees(Point const& from, Point const& to)
{
    double degrees = std::atan2(to.y - from.y, to.x - from.x) * 180.0 / std::numbers::pi;
    degrees = std::fmod(degrees, 360.0);
    if (degrees < 0)
        degrees += 360.0;
    return degrees;
}

double area(Rect const& rect) { return std::max(0.0, rect.width) * std::max(0.0, rect.height); }

} // namespace loop::geometry
