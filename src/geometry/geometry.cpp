#include "floodmap/geometry/geometry.hpp"
#include "floodmap/geometry/affine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace floodmap::geometry {

namespace {

constexpr double kEps = 1.0e-12;

double cross(const Point& o, const Point& a, const Point& b) {
    return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

int orientation(const Point& o, const Point& a, const Point& b) {
    const double v = cross(o, a, b);
    const double scale = std::max({std::fabs(a.x - o.x), std::fabs(a.y - o.y),
                                   std::fabs(b.x - o.x), std::fabs(b.y - o.y), 1.0});
    if (std::fabs(v) <= kEps * scale * scale) return 0;
    return v > 0.0 ? 1 : -1;
}

bool on_segment(const Point& p, const Point& a, const Point& b) {
    return p.x >= std::min(a.x, b.x) - kEps && p.x <= std::max(a.x, b.x) + kEps &&
           p.y >= std::min(a.y, b.y) - kEps && p.y <= std::max(a.y, b.y) + kEps;
}

bool point_on_ring_boundary(const Point& p, const Ring& ring) {
    const size_t n = ring.size();
    for (size_t i = 0; i < n; ++i) {
        const Point& a = ring[i];
        const Point& b = ring[(i + 1) % n];
        if (orientation(a, b, p) == 0 && on_segment(p, a, b)) return true;
    }
    return false;
}

// Crossing-number test, boundary excluded.
bool point_in_ring_interior(const Point& p, const Ring& ring) {
    bool inside = false;
    const size_t n = ring.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point& a = ring[i];
        const Point& b = ring[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            const double x_at = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
            if (p.x < x_at) inside = !inside;
        }
    }
    return inside;
}

bool point_strictly_in_ring(const Point& p, const Ring& ring) {
    return !point_on_ring_boundary(p, ring) && point_in_ring_interior(p, ring);
}

// Both segments cross at a single point interior to each.
bool segments_cross_properly(const Point& p1, const Point& p2, const Point& q1, const Point& q2) {
    const int o1 = orientation(p1, p2, q1);
    const int o2 = orientation(p1, p2, q2);
    const int o3 = orientation(q1, q2, p1);
    const int o4 = orientation(q1, q2, p2);
    return o1 != 0 && o2 != 0 && o3 != 0 && o4 != 0 && o1 != o2 && o3 != o4;
}

bool ring_edges_cross(const Ring& a, const Ring& b) {
    for (size_t i = 0; i < a.size(); ++i) {
        const Point& a1 = a[i];
        const Point& a2 = a[(i + 1) % a.size()];
        for (size_t j = 0; j < b.size(); ++j) {
            if (segments_cross_properly(a1, a2, b[j], b[(j + 1) % b.size()])) return true;
        }
    }
    return false;
}

} // namespace

Ring box_to_ring(const Box& box) {
    return {{box.min_x, box.min_y},
            {box.max_x, box.min_y},
            {box.max_x, box.max_y},
            {box.min_x, box.max_y}};
}

Box bounds(const Ring& ring) {
    Box b;
    if (ring.empty()) return b;
    b.min_x = b.max_x = ring.front().x;
    b.min_y = b.max_y = ring.front().y;
    for (const auto& p : ring) {
        b.min_x = std::min(b.min_x, p.x);
        b.max_x = std::max(b.max_x, p.x);
        b.min_y = std::min(b.min_y, p.y);
        b.max_y = std::max(b.max_y, p.y);
    }
    return b;
}

Box bounds(const Polygon& poly) {
    return bounds(poly.outer);
}

double ring_area(const Ring& ring) {
    const size_t n = ring.size();
    if (n < 3) return 0.0;
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const Point& a = ring[i];
        const Point& b = ring[(i + 1) % n];
        acc += a.x * b.y - b.x * a.y;
    }
    return std::fabs(acc) * 0.5;
}

double polygon_area(const Polygon& poly) {
    double area = ring_area(poly.outer);
    for (const auto& h : poly.holes) {
        area -= ring_area(h);
    }
    return std::max(0.0, area);
}

bool point_in_ring(const Point& p, const Ring& ring) {
    if (ring.size() < 3) return false;
    return point_on_ring_boundary(p, ring) || point_in_ring_interior(p, ring);
}

bool point_in_polygon(const Point& p, const Polygon& poly) {
    if (!point_in_ring(p, poly.outer)) return false;
    for (const auto& h : poly.holes) {
        if (point_strictly_in_ring(p, h)) return false;
    }
    return true;
}

bool segments_intersect(const Point& p1, const Point& p2, const Point& q1, const Point& q2) {
    const int o1 = orientation(p1, p2, q1);
    const int o2 = orientation(p1, p2, q2);
    const int o3 = orientation(q1, q2, p1);
    const int o4 = orientation(q1, q2, p2);

    if (o1 != o2 && o3 != o4) return true;

    if (o1 == 0 && on_segment(q1, p1, p2)) return true;
    if (o2 == 0 && on_segment(q2, p1, p2)) return true;
    if (o3 == 0 && on_segment(p1, q1, q2)) return true;
    if (o4 == 0 && on_segment(p2, q1, q2)) return true;
    return false;
}

bool segment_intersects_box(const Point& p1, const Point& p2, const Box& box) {
    auto outcode = [&](const Point& p) {
        int code = 0;
        if (p.x < box.min_x) code |= 1;
        if (p.x > box.max_x) code |= 2;
        if (p.y < box.min_y) code |= 4;
        if (p.y > box.max_y) code |= 8;
        return code;
    };

    const int code1 = outcode(p1);
    const int code2 = outcode(p2);

    if (code1 == 0 || code2 == 0) return true;
    if (code1 & code2) return false;

    const Ring edges = box_to_ring(box);
    for (size_t i = 0; i < edges.size(); ++i) {
        if (segments_intersect(p1, p2, edges[i], edges[(i + 1) % edges.size()])) return true;
    }
    return false;
}

bool line_intersects_polygon(const LineString& line, const Polygon& poly) {
    if (line.empty() || poly.outer.size() < 3) return false;
    for (const auto& p : line) {
        if (point_in_polygon(p, poly)) return true;
    }
    auto crosses_ring = [&](const Ring& ring) {
        for (size_t i = 0; i + 1 < line.size(); ++i) {
            for (size_t j = 0; j < ring.size(); ++j) {
                if (segments_intersect(line[i], line[i + 1], ring[j], ring[(j + 1) % ring.size()])) {
                    return true;
                }
            }
        }
        return false;
    };
    if (crosses_ring(poly.outer)) return true;
    for (const auto& h : poly.holes) {
        if (crosses_ring(h)) return true;
    }
    return false;
}

bool polygon_contains_ring(const Polygon& poly, const Ring& ring) {
    if (ring.empty() || poly.outer.size() < 3) return false;
    for (const auto& p : ring) {
        if (!point_in_polygon(p, poly)) return false;
    }
    if (ring_edges_cross(poly.outer, ring)) return false;
    for (const auto& p : poly.outer) {
        if (point_strictly_in_ring(p, ring)) return false;
    }
    for (const auto& h : poly.holes) {
        if (ring_edges_cross(h, ring)) return false;
        for (const auto& p : h) {
            if (point_strictly_in_ring(p, ring)) return false;
        }
    }
    return true;
}

Ring clip_ring_to_box(const Ring& ring, const Box& box) {
    if (ring.size() < 3) return {};

    const Box rb = bounds(ring);
    if (rb.max_x < box.min_x || rb.min_x > box.max_x ||
        rb.max_y < box.min_y || rb.min_y > box.max_y) {
        return {};
    }
    if (rb.min_x >= box.min_x && rb.max_x <= box.max_x &&
        rb.min_y >= box.min_y && rb.max_y <= box.max_y) {
        return ring;
    }

    enum class Edge { LEFT, RIGHT, BOTTOM, TOP };

    auto inside = [&](const Point& p, Edge edge) {
        switch (edge) {
            case Edge::LEFT: return p.x >= box.min_x;
            case Edge::RIGHT: return p.x <= box.max_x;
            case Edge::BOTTOM: return p.y >= box.min_y;
            case Edge::TOP: return p.y <= box.max_y;
        }
        return false;
    };

    auto intersect = [&](const Point& a, const Point& b, Edge edge) {
        Point out;
        if (edge == Edge::LEFT || edge == Edge::RIGHT) {
            const double xv = edge == Edge::LEFT ? box.min_x : box.max_x;
            const double dx = b.x - a.x;
            const double t = std::fabs(dx) > kEps ? (xv - a.x) / dx : 0.0;
            out.x = xv;
            out.y = a.y + t * (b.y - a.y);
        } else {
            const double yv = edge == Edge::BOTTOM ? box.min_y : box.max_y;
            const double dy = b.y - a.y;
            const double t = std::fabs(dy) > kEps ? (yv - a.y) / dy : 0.0;
            out.x = a.x + t * (b.x - a.x);
            out.y = yv;
        }
        return out;
    };

    Ring current = ring;
    Ring next;
    for (Edge edge : {Edge::LEFT, Edge::RIGHT, Edge::BOTTOM, Edge::TOP}) {
        next.clear();
        if (current.empty()) break;
        Point prev = current.back();
        for (const auto& curr : current) {
            const bool curr_in = inside(curr, edge);
            const bool prev_in = inside(prev, edge);
            if (curr_in) {
                if (!prev_in) next.push_back(intersect(prev, curr, edge));
                next.push_back(curr);
            } else if (prev_in) {
                next.push_back(intersect(prev, curr, edge));
            }
            prev = curr;
        }
        current.swap(next);
    }
    return current;
}

double intersection_area(const Polygon& poly, const Box& box) {
    double area = ring_area(clip_ring_to_box(poly.outer, box));
    for (const auto& h : poly.holes) {
        area -= ring_area(clip_ring_to_box(h, box));
    }
    return std::max(0.0, area);
}

Ring transform_ring(const Ring& ring, const AffineTransform& t) {
    Ring out;
    out.reserve(ring.size());
    for (const auto& p : ring) {
        out.push_back(t.apply(p));
    }
    return out;
}

Polygon transform_polygon(const Polygon& poly, const AffineTransform& t) {
    Polygon out;
    out.outer = transform_ring(poly.outer, t);
    out.holes.reserve(poly.holes.size());
    for (const auto& h : poly.holes) {
        out.holes.push_back(transform_ring(h, t));
    }
    return out;
}

LineString transform_line(const LineString& line, const AffineTransform& t) {
    return transform_ring(line, t);
}

} // namespace floodmap::geometry
