/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_VECTOR_HH
#define LOCUS_GUARD_LOCUS_VECTOR_HH

#include <iosfwd>
#include <string>

#include <fmt/ostream.h>

namespace locus
{
    /**
     * \brief Absolute tolerance used when comparing lengths, angles and
     * discriminants.
     *
     * \ingroup Core
     */
    constexpr double epsilon = 1e-9;

    /**
     * \brief A position or displacement in the plane.
     *
     * \ingroup Core
     */
    struct Vector final
    {
        double x = 0.0;
        double y = 0.0;

        [[nodiscard]] static auto from_angle(double radians) -> Vector;

        [[nodiscard]] auto magnitude() const -> double;
        [[nodiscard]] auto distance_to(const Vector &) const -> double;
        [[nodiscard]] auto dot(const Vector &) const -> double;
        [[nodiscard]] auto cross(const Vector &) const -> double;

        /**
         * Unit vector in the same direction. Throws UnexpectedException for
         * a zero vector, which has no direction.
         */
        [[nodiscard]] auto unit() const -> Vector;

        /**
         * Rotated by a quarter turn in the positive direction.
         */
        [[nodiscard]] auto perpendicular() const -> Vector;

        [[nodiscard]] auto rotated(double radians) const -> Vector;

        [[nodiscard]] auto angle() const -> double;

        [[nodiscard]] constexpr auto operator==(const Vector &) const -> bool = default;
    };

    [[nodiscard]] auto operator+(const Vector &, const Vector &) -> Vector;
    [[nodiscard]] auto operator-(const Vector &, const Vector &) -> Vector;
    [[nodiscard]] auto operator-(const Vector &) -> Vector;
    [[nodiscard]] auto operator*(const Vector &, double) -> Vector;
    [[nodiscard]] auto operator*(double, const Vector &) -> Vector;
    [[nodiscard]] auto operator/(const Vector &, double) -> Vector;

    [[nodiscard]] auto about_zero(double v, double tolerance = epsilon) -> bool;
    [[nodiscard]] auto about_equal(double a, double b, double tolerance = epsilon) -> bool;
    [[nodiscard]] auto about_equal(const Vector & a, const Vector & b, double tolerance = epsilon) -> bool;

    /**
     * Are these two directions parallel, either way round?
     */
    [[nodiscard]] auto parallel(const Vector & a, const Vector & b, double tolerance = epsilon) -> bool;

    auto operator<<(std::ostream &, const Vector &) -> std::ostream &;
}

template <>
struct fmt::formatter<locus::Vector> : ostream_formatter
{
};

#endif
