#ifndef SPINLOGO_MATH_VEC2_HPP
#define SPINLOGO_MATH_VEC2_HPP

#include <cmath>
#include <cstddef>

namespace spinlogo {

struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    // Arithmetic operators
    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr Vec2 operator/(double scalar) const {
        return {x / scalar, y / scalar};
    }

    constexpr Vec2 operator-() const {
        return {-x, -y};
    }

    // Compound assignment
    constexpr Vec2& operator+=(const Vec2& other) {
        x += other.x; y += other.y;
        return *this;
    }

    constexpr Vec2& operator-=(const Vec2& other) {
        x -= other.x; y -= other.y;
        return *this;
    }

    constexpr Vec2& operator*=(double scalar) {
        x *= scalar; y *= scalar;
        return *this;
    }

    // Dot product
    constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    // Z component of the 3D cross product
    constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    constexpr double length_squared() const {
        return x * x + y * y;
    }

    double length() const {
        return std::hypot(x, y);
    }

    Vec2 normalized() const {
        double len = length();
        if (len > 0.0) {
            return *this / len;
        }
        return {0.0, 0.0};
    }

    double distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    // Polar angle in radians, (-pi, pi]
    double angle() const {
        return std::atan2(y, x);
    }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y);
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }

    constexpr double operator[](size_t i) const {
        return i == 0 ? x : y;
    }
};

// Scalar * Vec2
constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

constexpr Vec2 lerp(const Vec2& a, const Vec2& b, double t) {
    return a * (1.0 - t) + b * t;
}

namespace vec2 {
    constexpr Vec2 zero() { return {0.0, 0.0}; }
    constexpr Vec2 unit_x() { return {1.0, 0.0}; }
    constexpr Vec2 unit_y() { return {0.0, 1.0}; }

    // Unit vector at the given angle (radians)
    inline Vec2 from_angle(double radians) {
        return {std::cos(radians), std::sin(radians)};
    }
}

}  // namespace spinlogo

#endif // SPINLOGO_MATH_VEC2_HPP
