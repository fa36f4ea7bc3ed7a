#include <catch2/catch_all.hpp>

#include "fieldvector.h"

#include <cmath>

namespace
{
	const double PI = 3.14159265358979323846;
}

TEST_CASE("Cartesian construction fills all coordinates", "[FieldVector]")
{
	FieldVector vec(1.0, 0.0, 0.0);

	CHECK(vec.r() == Catch::Approx(1.0));
	CHECK(vec.theta() == Catch::Approx(PI / 2));
	CHECK(vec.phi() == Catch::Approx(0.0));
	CHECK(vec.rho() == Catch::Approx(1.0));
}

TEST_CASE("Spherical and cylindrical factories", "[FieldVector]")
{
	FieldVector s = FieldVector::fromSpherical(2.0, PI / 2, PI / 2);
	CHECK(s.x() == Catch::Approx(0.0).margin(1e-12));
	CHECK(s.y() == Catch::Approx(2.0));
	CHECK(s.z() == Catch::Approx(0.0).margin(1e-12));

	FieldVector c = FieldVector::fromCylindrical(1.0, PI, 3.0);
	CHECK(c.x() == Catch::Approx(-1.0));
	CHECK(c.y() == Catch::Approx(0.0).margin(1e-12));
	CHECK(c.z() == Catch::Approx(3.0));
	CHECK(c.r() == Catch::Approx(std::sqrt(10.0)));
}

TEST_CASE("Changing a Cartesian component keeps the others", "[FieldVector]")
{
	FieldVector vec(0.1, 0.2, 0.3);
	vec.setComponent(FieldVector::Y, -0.4);

	CHECK(vec.x() == Catch::Approx(0.1));
	CHECK(vec.y() == Catch::Approx(-0.4));
	CHECK(vec.z() == Catch::Approx(0.3));
	CHECK(vec.r() == Catch::Approx(std::sqrt(0.01 + 0.16 + 0.09)));
}

TEST_CASE("Changing the magnitude keeps the direction", "[FieldVector]")
{
	FieldVector vec(1.0, 1.0, 1.0);
	double theta = vec.theta();
	double phi = vec.phi();

	vec.setComponent(FieldVector::R, 2.0 * std::sqrt(3.0));

	CHECK(vec.x() == Catch::Approx(2.0));
	CHECK(vec.y() == Catch::Approx(2.0));
	CHECK(vec.z() == Catch::Approx(2.0));
	CHECK(vec.theta() == Catch::Approx(theta));
	CHECK(vec.phi() == Catch::Approx(phi));
}

TEST_CASE("Changing rho keeps phi and z", "[FieldVector]")
{
	FieldVector vec(1.0, 1.0, 1.0);
	vec.setComponent(FieldVector::RHO, 2.0);

	CHECK(vec.x() == Catch::Approx(std::sqrt(2.0)));
	CHECK(vec.y() == Catch::Approx(std::sqrt(2.0)));
	CHECK(vec.z() == Catch::Approx(1.0));
	CHECK(vec.phi() == Catch::Approx(PI / 4));
	CHECK(vec.r() == Catch::Approx(std::sqrt(5.0)));
}

TEST_CASE("Angles survive a pass through the origin", "[FieldVector]")
{
	FieldVector vec = FieldVector::fromSpherical(1.0, 1.0, 0.5);

	vec.setComponent(FieldVector::R, 0.0);
	CHECK(vec.isClose(FieldVector()));
	CHECK(vec.theta() == Catch::Approx(1.0));
	CHECK(vec.phi() == Catch::Approx(0.5));

	vec.setComponent(FieldVector::R, 2.0);
	CHECK(vec.isClose(FieldVector::fromSpherical(2.0, 1.0, 0.5)));
}

TEST_CASE("Tilting a vector on the z axis", "[FieldVector]")
{
	FieldVector vec(0.0, 0.0, 1.0);
	vec.setComponent(FieldVector::THETA, PI / 2);

	CHECK(vec.x() == Catch::Approx(1.0));
	CHECK(vec.y() == Catch::Approx(0.0).margin(1e-12));
	CHECK(vec.z() == Catch::Approx(0.0).margin(1e-12));
}

TEST_CASE("withComponent leaves the original unchanged", "[FieldVector]")
{
	FieldVector vec(0.5, 0.0, 0.0);
	FieldVector other = vec.withComponent(FieldVector::Z, 1.0);

	CHECK(vec.z() == 0.0);
	CHECK(other.z() == 1.0);
	CHECK(other.x() == 0.5);
	CHECK(vec.distance(other) == Catch::Approx(1.0));
	CHECK_FALSE(vec.isClose(other));
}

TEST_CASE("Coordinate names", "[FieldVector]")
{
	FieldVector::Coordinate coordinate = FieldVector::X;

	CHECK(FieldVector::coordinateName(FieldVector::THETA) == "theta");
	CHECK(FieldVector::coordinateFromName("RHO", &coordinate));
	CHECK(coordinate == FieldVector::RHO);
	CHECK(FieldVector::coordinateFromName("phi", &coordinate));
	CHECK(coordinate == FieldVector::PHI);
	CHECK_FALSE(FieldVector::coordinateFromName("w", &coordinate));
	CHECK(coordinate == FieldVector::PHI);
}

TEST_CASE("Negative theta is folded into range", "[FieldVector]")
{
	FieldVector vec(1.0, 0.0, 0.0);
	vec.setComponent(FieldVector::THETA, -0.5);

	CHECK(vec.x() == Catch::Approx(-std::sin(0.5)));
	CHECK(vec.z() == Catch::Approx(std::cos(0.5)));
	CHECK(vec.rho() == Catch::Approx(std::sin(0.5)));
	CHECK(vec.rho() == Catch::Approx(std::sqrt(vec.x() * vec.x() + vec.y() * vec.y())));
	CHECK(vec.theta() == Catch::Approx(0.5));
	CHECK(std::cos(vec.phi()) == Catch::Approx(-1.0));
}

TEST_CASE("Negative magnitude points the other way", "[FieldVector]")
{
	FieldVector vec(1.0, 0.0, 0.0);
	vec.setComponent(FieldVector::R, -2.0);

	CHECK(vec.x() == Catch::Approx(-2.0));
	CHECK(vec.r() == Catch::Approx(2.0));
	CHECK(vec.rho() == Catch::Approx(2.0));
	CHECK(std::cos(vec.phi()) == Catch::Approx(-1.0));
	CHECK(vec.theta() == Catch::Approx(PI / 2));
}

TEST_CASE("Negative rho points the other way", "[FieldVector]")
{
	FieldVector vec(1.0, 0.0, 1.0);
	vec.setComponent(FieldVector::RHO, -1.0);

	CHECK(vec.x() == Catch::Approx(-1.0));
	CHECK(vec.z() == Catch::Approx(1.0));
	CHECK(vec.rho() == Catch::Approx(1.0));
	CHECK(vec.r() == Catch::Approx(std::sqrt(2.0)));
	CHECK(std::cos(vec.phi()) == Catch::Approx(-1.0));
}
