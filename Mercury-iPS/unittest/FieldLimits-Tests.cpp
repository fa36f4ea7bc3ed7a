#include <catch2/catch_all.hpp>

#include "fieldlimits.h"

#include <QSettings>
#include <QTemporaryDir>

TEST_CASE("Default limits admit everything", "[FieldLimits]")
{
	FieldLimits limits;

	CHECK(limits.isValid());
	CHECK(limits.description() == "none");
	CHECK(limits.admits(100.0, -100.0, 1e6));
}

TEST_CASE("Sphere", "[FieldLimits]")
{
	FieldLimits limits = FieldLimits::sphere(1.0);

	CHECK(limits.admits(0.5, 0.5, 0.5));
	CHECK(limits.admits(0.0, 0.0, -1.0));
	CHECK_FALSE(limits.admits(1.0, 1.0, 0.0));
}

TEST_CASE("Cylinder", "[FieldLimits]")
{
	FieldLimits limits = FieldLimits::cylinder(1.0, 2.0);

	CHECK(limits.admits(0.6, 0.6, 1.9));
	CHECK_FALSE(limits.admits(0.8, 0.8, 0.0));
	CHECK_FALSE(limits.admits(0.0, 0.0, -2.1));
}

TEST_CASE("Box", "[FieldLimits]")
{
	FieldLimits limits = FieldLimits::box(1.0, 2.0, 3.0);

	CHECK(limits.admits(-1.0, 2.0, -3.0));
	CHECK_FALSE(limits.admits(0.0, 2.5, 0.0));
}

TEST_CASE("Custom predicate", "[FieldLimits]")
{
	FieldLimits limits([](double x, double, double) { return x >= 0.0; });

	CHECK(limits.description() == "custom");
	CHECK(limits.admits(1.0, -5.0, -5.0));
	CHECK_FALSE(limits.admits(-0.1, 0.0, 0.0));
}

TEST_CASE("Empty predicate is not valid", "[FieldLimits]")
{
	FieldLimits limits = FieldLimits(FieldLimits::Predicate());

	CHECK_FALSE(limits.isValid());
	CHECK_FALSE(limits.admits(0.0, 0.0, 0.0));
}

TEST_CASE("Limits from settings", "[FieldLimits]")
{
	QTemporaryDir dir;
	REQUIRE(dir.isValid());
	QSettings settings(dir.filePath("limits.ini"), QSettings::IniFormat);
	bool ok = false;

	SECTION("no region")
	{
		FieldLimits limits = FieldLimits::fromSettings(&settings, &ok);
		CHECK(ok);
		CHECK(limits.description() == "none");
	}

	SECTION("sphere")
	{
		settings.setValue("FieldLimits/Region", "Sphere");
		settings.setValue("FieldLimits/RMax", 0.5);

		FieldLimits limits = FieldLimits::fromSettings(&settings, &ok);
		CHECK(ok);
		CHECK(limits.admits(0.0, 0.0, 0.5));
		CHECK_FALSE(limits.admits(0.0, 0.0, 0.6));
	}

	SECTION("box")
	{
		settings.setValue("FieldLimits/Region", "box");
		settings.setValue("FieldLimits/XMax", 1.0);
		settings.setValue("FieldLimits/YMax", 1.0);
		settings.setValue("FieldLimits/ZMax", 6.0);

		FieldLimits limits = FieldLimits::fromSettings(&settings, &ok);
		CHECK(ok);
		CHECK(limits.admits(1.0, -1.0, 6.0));
		CHECK_FALSE(limits.admits(1.1, 0.0, 0.0));
	}

	SECTION("missing bound")
	{
		settings.setValue("FieldLimits/Region", "cylinder");
		settings.setValue("FieldLimits/RhoMax", 1.0);

		FieldLimits limits = FieldLimits::fromSettings(&settings, &ok);
		CHECK_FALSE(ok);
		CHECK_FALSE(limits.isValid());
	}

	SECTION("unknown region")
	{
		settings.setValue("FieldLimits/Region", "ellipsoid");

		FieldLimits limits = FieldLimits::fromSettings(&settings, &ok);
		CHECK_FALSE(ok);
		CHECK_FALSE(limits.isValid());
	}
}
