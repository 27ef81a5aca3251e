#pragma once

#include <vector>

namespace floodmap::geometry {

struct Point {
    double x = 0.0;
    double y = 0.0;
};

// Axis-aligned box, min <= max on both axes.
struct Box {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    double area() const { return width() * height(); }
    bool empty() const { return !(max_x > min_x) || !(max_y > min_y); }
};

// Closed ring without the repeated closing vertex. Also used for line strings.
using Ring = std::vector<Point>;

struct Polygon {
    Ring outer;
    std::vector<Ring> holes;
};

using LineString = std::vector<Point>;

Ring box_to_ring(const Box& box);
Box bounds(const Ring& ring);
Box bounds(const Polygon& poly);

double ring_area(const Ring& ring);
double polygon_area(const Polygon& poly);

// Boundary points count as inside.
bool point_in_ring(const Point& p, const Ring& ring);
bool point_in_polygon(const Point& p, const Polygon& poly);

bool segments_intersect(const Point& p1, const Point& p2, const Point& q1, const Point& q2);
bool segment_intersects_box(const Point& p1, const Point& p2, const Box& box);

bool line_intersects_polygon(const LineString& line, const Polygon& poly);

// True when every point of `ring` lies inside `poly` (boundary inclusive).
bool polygon_contains_ring(const Polygon& poly, const Ring& ring);

// Sutherland-Hodgman clip of a ring against an axis-aligned box.
Ring clip_ring_to_box(const Ring& ring, const Box& box);

double intersection_area(const Polygon& poly, const Box& box);

} // namespace floodmap::geometry
