#include <catch2/catch_all.hpp>

#include "parser.h"
#include "simulatedmercury.h"

TEST_CASE("Line interface", "[Parser]")
{
	SimulatedMercury sim;
	MercuryiPS mercury("mercury", &sim, FieldLimits::sphere(1.0));
	REQUIRE(mercury.connectToInstrument() == MercuryError::NO_MERCURY_ERROR);

	Parser parser;
	parser.setDataSource(&mercury);

	SECTION("identification")
	{
		CHECK(parser.parseLine("*IDN?") == "OXFORD INSTRUMENTS,MERCURY IPS,SIMULATED,2.6.04.000");
	}

	SECTION("blank lines are ignored")
	{
		CHECK(parser.parseLine("").isEmpty());
		CHECK(parser.parseLine("   ").isEmpty());
		CHECK(mercury.errorCount() == 0);
	}

	SECTION("axis readings")
	{
		sim.setField("GRPY", 0.25);

		CHECK(parser.parseLine("y:field?") == "0.25");
		CHECK(parser.parseLine("Y:FIELD:PERS?") == "0.25");
		CHECK(parser.parseLine("Y:CURR?") == "15");
		CHECK(parser.parseLine("Y:ATOB?") == "60");
		CHECK(parser.parseLine("Y:VOLT?") == "0");
		CHECK(parser.parseLine("Y:STATE?") == "HOLD");
		CHECK(parser.parseLine("Y:RATE:FIELD?").toDouble() == Catch::Approx(0.2 / 60.0));
		CHECK(parser.parseLine("Y:RATE:CURR?").toDouble() == Catch::Approx(0.2));
	}

	SECTION("axis configuration")
	{
		CHECK(parser.parseLine("CONF:X:FIELD:TARG 0.125").isEmpty());
		CHECK(parser.parseLine("X:FIELD:TARG?") == "0.125");
		CHECK(parser.parseLine("X:CURR:TARG?") == "7.5");

		CHECK(parser.parseLine("CONF:X:CURR:TARG 3").isEmpty());
		CHECK(parser.parseLine("X:FIELD:TARG?") == "0.05");

		CHECK(parser.parseLine("CONF:X:ATOB 50").isEmpty());
		CHECK(parser.parseLine("X:ATOB?") == "50");

		CHECK(parser.parseLine("CONF:X:RATE:FIELD 0.01").isEmpty());
		CHECK(parser.parseLine("X:RATE:FIELD?").toDouble() == Catch::Approx(0.01));
		CHECK(mercury.errorCount() == 0);
	}

	SECTION("target vector and ramp")
	{
		CHECK(parser.parseLine("CONF:TARG:X 0.5").isEmpty());
		CHECK(parser.parseLine("TARG:X?") == "0.5");
		CHECK(parser.parseLine("TARG:R?") == "0.5");
		CHECK(parser.parseLine("RAMPING?") == "0");

		CHECK(parser.parseLine("RAMP").isEmpty());
		CHECK(parser.parseLine("X:FIELD?") == "0.5");
		CHECK(parser.parseLine("X:STATE?") == "TO SET");
		CHECK(parser.parseLine("RAMPING?") == "1");

		CHECK(parser.parseLine("CONF:TARG:Z -0.25").isEmpty());
		CHECK(parser.parseLine("RAMP SAFE").isEmpty());
		CHECK(parser.parseLine("Z:FIELD?") == "-0.25");
	}

	SECTION("field limit violation")
	{
		CHECK(parser.parseLine("CONF:TARG:Z 1.5").isEmpty());
		CHECK(parser.parseLine("TARG:Z?") == "0");
		CHECK(parser.parseLine("SYST:ERR?") == "202,\"Target violates field limits\"");
	}

	SECTION("clamped axis")
	{
		CHECK(parser.parseLine("CONF:X:STATE CLAMP").isEmpty());
		CHECK(parser.parseLine("X:STATE?") == "CLAMP");
		CHECK(parser.parseLine("CONF:X:STATE TOSET").isEmpty());
		CHECK(parser.parseLine("SYSTEM:ERROR?") == "201,\"Power supply is clamped\"");
		CHECK(parser.parseLine("CONF:X:STATE HOLD").isEmpty());
		CHECK(parser.parseLine("X:STATE?") == "HOLD");
	}

	SECTION("input errors")
	{
		parser.parseLine("FOO");
		CHECK(parser.parseLine("SYST:ERR?") == "401,\"Unrecognized command\"");

		parser.parseLine("X:FOO?");
		CHECK(parser.parseLine("SYST:ERR?") == "402,\"Unrecognized query\"");

		parser.parseLine("CONF:X:ATOB");
		CHECK(parser.parseLine("SYST:ERR?") == "403,\"Missing parameter\"");

		parser.parseLine("CONF:X:ATOB fast");
		CHECK(parser.parseLine("SYST:ERR?") == "404,\"Non-numerical entry\"");

		parser.parseLine("CONF:X:STATE PAUSE");
		CHECK(parser.parseLine("SYST:ERR?") == "405,\"Invalid argument\"");

		parser.parseLine("RAMP SLOW");
		CHECK(parser.parseLine("SYST:ERR?") == "405,\"Invalid argument\"");

		CHECK(parser.parseLine("SYST:ERR?") == "0,\"No error\"");
	}

	SECTION("numbers and whitespace")
	{
		CHECK(parser.parseLine("  conf:x:atob\t5e1  ").isEmpty());
		CHECK(parser.parseLine("\tX:ATOB? ") == "50");
		CHECK(mercury.errorCount() == 0);

		parser.parseLine("CONF:X:ATOB 1.2.3");
		CHECK(parser.parseLine("SYST:ERR?") == "404,\"Non-numerical entry\"");

		parser.parseLine("CONF:X:ATOB INF");
		CHECK(parser.parseLine("SYST:ERR?") == "404,\"Non-numerical entry\"");
		CHECK(parser.parseLine("X:ATOB?") == "50");
	}

	SECTION("clear errors")
	{
		parser.parseLine("FOO");
		parser.parseLine("BAR");
		CHECK(mercury.errorCount() == 2);

		CHECK(parser.parseLine("*CLS").isEmpty());
		CHECK(parser.parseLine("SYST:ERR?") == "0,\"No error\"");
	}

	SECTION("exit")
	{
		bool exited = false;
		QObject::connect(&parser, &Parser::exit_app, [&]() { exited = true; });

		CHECK(parser.parseLine("exit").isEmpty());
		CHECK(exited);
	}
}
