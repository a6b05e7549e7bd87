#pragma once

#include <cmath>

namespace rmp {

// Width/height pair in pixels (display space)
struct Size2D {
    double width;
    double height;

    bool operator==(const Size2D& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size2D& other) const { return !(*this == other); }
};

// 2x2 linear part of an orientation transform.
// Applied as (x, y) -> (a*x + c*y, b*x + d*y)
struct Transform2D {
    double a;
    double b;
    double c;
    double d;

    static Transform2D identity() { return {1.0, 0.0, 0.0, 1.0}; }

    Size2D apply(const Size2D& s) const {
        return Size2D{a * s.width + c * s.height, b * s.width + d * s.height};
    }
};

// NaN and +/-inf collapse to 0
inline double finite_or_zero(double x) {
    return std::isfinite(x) ? x : 0.0;
}

inline double safe_div(double n, double d, double fallback = 0.0) {
    if (!std::isfinite(d) || d == 0.0 || !std::isfinite(n)) {
        return fallback;
    }
    double value = n / d;
    return std::isfinite(value) ? value : fallback;
}

// Returns (w, h) when both are finite and positive, otherwise fallback
inline Size2D safe_size(double w, double h, Size2D fallback = Size2D{0.0, 0.0}) {
    double width = finite_or_zero(w);
    double height = finite_or_zero(h);
    return (width > 0.0 && height > 0.0) ? Size2D{width, height} : fallback;
}

inline double clamp_positive(double x, double min = 0.001) {
    double value = finite_or_zero(x);
    return value > min ? value : min;
}

} // namespace rmp
