#pragma once

#include "loop/core/types.hpp"

namespace loop::geometry {

/// Overlap of two rects, zero rect when they do not intersect.
Rect intersection(Rect const& a, Rect const& b);

/// True when the two rects share a non-empty area.
bool intersects(Rect const& a, Rect const& b);

/// Inclusive containment of a whole rect.
bool contains(Rect const& outer, Rect const& inner);

/// Half-open containment of a point: [min, max).
bool contains(Rect const& rect, Point const& point);

/// Moves the rect so it lies inside bounds; larger rects are aligned to the minimum edge.
Rect push_inside(Rect const& rect, Rect const& bounds);

/// A rect of the given size centred on the rect's centre.
Rect centered_in(Size const& size, Rect const& rect);

/// Insets the chosen edges by amount (negative grows).
Rect inset_edges(Rect const& rect, EdgeSet edges, double amount);

/// Uniform inset on all four edges, clamped so the result keeps min_size around the original centre.
Rect inset_all(Rect const& rect, double amount, Size const& min_size);

/// Symmetric inset (negative grows), no clamping.
Rect inset_by(Rect const& rect, double dx, double dy);

/// Edges of rect lying within 1 unit of the matching edge of bounds.
EdgeSet edges_touching(Rect const& rect, Rect const& bounds);

/// Rounds every component to the nearest integer.
Rect integral(Rect const& rect);

bool approx_equal(double a, double b, double tolerance);
bool approx_equal(Point const& a, Point const& b, double tolerance);
bool approx_equal(Size const& a, Size const& b, double tolerance);
bool approx_equal(Rect const& a, Rect const& b, double tolerance);

double distance(Point const& from, Point const& to);

/// Angle of the vector from -> to in degrees, normalised to [0, 360). 0 points right, 90 down.
double angle_degrees(Point const& from, Point const& to);

/// Area, zero for degenerate rects.
double area(Rect const& rect);

} // namespace loop::geometry
