#pragma once

#include "floodmap/geometry/geometry.hpp"

#include <cmath>

namespace floodmap::geometry {

// Pixel -> world affine transform, rasterio/affine coefficient order:
//   x = a * col + b * row + c
//   y = d * col + e * row + f
// Pixel coordinates address pixel corners, so (0, 0) is the top-left corner of
// the first pixel.
struct AffineTransform {
    double a = 1.0;
    double b = 0.0;
    double c = 0.0;
    double d = 0.0;
    double e = 1.0;
    double f = 0.0;

    Point apply(double col, double row) const {
        return {a * col + b * row + c, d * col + e * row + f};
    }

    Point apply(const Point& px) const { return apply(px.x, px.y); }

    double determinant() const { return a * e - b * d; }

    bool is_invertible() const { return std::fabs(determinant()) > 0.0; }

    AffineTransform inverse() const {
        const double det = determinant();
        AffineTransform inv;
        inv.a = e / det;
        inv.b = -b / det;
        inv.d = -d / det;
        inv.e = a / det;
        inv.c = -(inv.a * c + inv.b * f);
        inv.f = -(inv.d * c + inv.e * f);
        return inv;
    }

    // Same pixel size, origin moved to pixel (col, row) of this transform.
    AffineTransform shifted(double col, double row) const {
        AffineTransform t = *this;
        const Point origin = apply(col, row);
        t.c = origin.x;
        t.f = origin.y;
        return t;
    }

    double pixel_width() const { return std::sqrt(a * a + d * d); }
    double pixel_height() const { return std::sqrt(b * b + e * e); }
};

Ring transform_ring(const Ring& ring, const AffineTransform& t);
Polygon transform_polygon(const Polygon& poly, const AffineTransform& t);
LineString transform_line(const LineString& line, const AffineTransform& t);

} // namespace floodmap::geometry
