/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/exception.hh>
#include <locus/vector.hh>

#include <cmath>
#include <ostream>

using namespace locus;

using std::atan2;
using std::cos;
using std::fabs;
using std::hypot;
using std::ostream;
using std::sin;

auto Vector::from_angle(double radians) -> Vector
{
    return Vector{cos(radians), sin(radians)};
}

auto Vector::magnitude() const -> double
{
    return hypot(x, y);
}

auto Vector::distance_to(const Vector & other) const -> double
{
    return (other - *this).magnitude();
}

auto Vector::dot(const Vector & other) const -> double
{
    return x * other.x + y * other.y;
}

auto Vector::cross(const Vector & other) const -> double
{
    return x * other.y - y * other.x;
}

auto Vector::unit() const -> Vector
{
    auto m = magnitude();
    if (m == 0.0)
        throw UnexpectedException{"tried to normalise a zero vector"};
    return *this / m;
}

auto Vector::perpendicular() const -> Vector
{
    return Vector{-y, x};
}

auto Vector::rotated(double radians) const -> Vector
{
    auto c = cos(radians), s = sin(radians);
    return Vector{x * c - y * s, x * s + y * c};
}

auto Vector::angle() const -> double
{
    return atan2(y, x);
}

auto locus::operator+(const Vector & a, const Vector & b) -> Vector
{
    return Vector{a.x + b.x, a.y + b.y};
}

auto locus::operator-(const Vector & a, const Vector & b) -> Vector
{
    return Vector{a.x - b.x, a.y - b.y};
}

auto locus::operator-(const Vector & a) -> Vector
{
    return Vector{-a.x, -a.y};
}

auto locus::operator*(const Vector & a, double s) -> Vector
{
    return Vector{a.x * s, a.y * s};
}

auto locus::operator*(double s, const Vector & a) -> Vector
{
    return a * s;
}

auto locus::operator/(const Vector & a, double s) -> Vector
{
    return Vector{a.x / s, a.y / s};
}

auto locus::about_zero(double v, double tolerance) -> bool
{
    return fabs(v) <= tolerance;
}

auto locus::about_equal(double a, double b, double tolerance) -> bool
{
    return fabs(a - b) <= tolerance;
}

auto locus::about_equal(const Vector & a, const Vector & b, double tolerance) -> bool
{
    return a.distance_to(b) <= tolerance;
}

auto locus::parallel(const Vector & a, const Vector & b, double tolerance) -> bool
{
    return about_zero(a.unit().cross(b.unit()), tolerance);
}

auto locus::operator<<(ostream & s, const Vector & v) -> ostream &
{
    return s << "(" << v.x << ", " << v.y << ")";
}
