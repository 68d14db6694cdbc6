#pragma once

#include <cmath>
#include <random>

// Plain 2D value type used for positions, velocities and forces.
// All operations return new values; nothing here mutates its inputs.
struct Vector2 {
    double x;
    double y;

    Vector2() : x(0.0), y(0.0) {}
    Vector2(double xVal, double yVal) : x(xVal), y(yVal) {}

    static Vector2 zero() { return Vector2(0.0, 0.0); }

    // (r cos theta, r sin theta)
    static Vector2 fromPolar(double r, double theta) {
        return Vector2(r * std::cos(theta), r * std::sin(theta));
    }

    // Uniform in [0,1) x [0,1)
    template <typename Rng>
    static Vector2 random(Rng& rng) {
        std::uniform_real_distribution<double> unit(0.0, 1.0);
        double u = unit(rng);
        double v = unit(rng);
        return Vector2(u, v);
    }

    double magnitude() const { return std::sqrt(x * x + y * y); }
};

inline Vector2 add(const Vector2& a, const Vector2& b) {
    return Vector2(a.x + b.x, a.y + b.y);
}

inline Vector2 subtract(const Vector2& a, const Vector2& b) {
    return Vector2(a.x - b.x, a.y - b.y);
}

inline Vector2 scale(const Vector2& v, double k) {
    return Vector2(v.x * k, v.y * k);
}

// Componentwise product
inline Vector2 scale(const Vector2& v, const Vector2& k) {
    return Vector2(v.x * k.x, v.y * k.y);
}

inline double magnitude(const Vector2& v) { return v.magnitude(); }

inline Vector2 operator+(const Vector2& a, const Vector2& b) { return add(a, b); }
inline Vector2 operator-(const Vector2& a, const Vector2& b) { return subtract(a, b); }
inline Vector2 operator-(const Vector2& v) { return Vector2(-v.x, -v.y); }
inline Vector2 operator*(const Vector2& v, double k) { return scale(v, k); }
inline Vector2 operator*(double k, const Vector2& v) { return scale(v, k); }
inline Vector2 operator*(const Vector2& a, const Vector2& b) { return scale(a, b); }
inline Vector2 operator/(const Vector2& v, double k) { return Vector2(v.x / k, v.y / k); }

inline Vector2& operator+=(Vector2& a, const Vector2& b) {
    a.x += b.x;
    a.y += b.y;
    return a;
}

inline bool operator==(const Vector2& a, const Vector2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Vector2& a, const Vector2& b) { return !(a == b); }
