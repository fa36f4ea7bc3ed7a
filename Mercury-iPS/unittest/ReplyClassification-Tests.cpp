#include <catch2/catch_all.hpp>

#include "mercuryips.h"
#include "MockTransport.h"

TEST_CASE("SET acknowledgement yields the value", "[ask]")
{
	MockTransport mock;
	MercuryiPS mercury("mercury", &mock);
	mock.addSet("SET:DEV:GRPX:PSU:SIG:FSET:1.5");

	bool ok = false;
	CHECK(mercury.ask("SET:DEV:GRPX:PSU:SIG:FSET:1.5", &ok) == "1.5");
	CHECK(ok);
	CHECK(mercury.errorCount() == 0);
}

TEST_CASE("READ reply has the echo removed", "[ask]")
{
	MockTransport mock;
	MercuryiPS mercury("mercury", &mock);
	mock.addRead("READ:DEV:GRPX:PSU:SIG:FLD", "0.0123T");

	CHECK(mercury.ask("READ:DEV:GRPX:PSU:SIG:FLD") == ":0.0123T");
}

TEST_CASE("Reply without echo is returned whole", "[ask]")
{
	MockTransport mock;
	MercuryiPS mercury("mercury", &mock);
	mock.replies.insert("*IDN?", "IDN:OXFORD INSTRUMENTS:MERCURY IPS:123:2.5");

	CHECK(mercury.ask("*IDN?") == "IDN:OXFORD INSTRUMENTS:MERCURY IPS:123:2.5");
}

TEST_CASE("Rejected command is logged but not raised", "[ask]")
{
	MockTransport mock;
	MercuryiPS mercury("mercury", &mock);
	QString message;
	QString command;

	QObject::connect(&mercury, &MercuryiPS::systemErrorMessage, [&](QString errMsg, QString lastStrSent)
	{
		message = errMsg;
		command = lastStrSent;
	});

	bool ok = false;
	QString reply = mercury.ask("SET:DEV:GRPX:PSU:SIG:FOO:1", &ok);

	CHECK(ok);
	CHECK(reply == "STAT:SET:DEV:GRPX:PSU:SIG:FOO:1:INVALID");
	CHECK(mercury.lastError() == MercuryError::NO_MERCURY_ERROR);
	CHECK(mercury.errorCount() == 1);
	CHECK(mercury.takeError() == "305,\"Invalid command\"");
	CHECK(message.startsWith("Invalid command"));
	CHECK(command == "SET:DEV:GRPX:PSU:SIG:FOO:1");
}

TEST_CASE("Transport failure is raised", "[ask]")
{
	MockTransport mock;
	MercuryiPS mercury("mercury", &mock);
	mock.failure = MercuryError::REPLY_TIMEOUT;

	bool ok = true;
	CHECK(mercury.ask("READ:DEV:GRPX:PSU:SIG:FLD", &ok).isEmpty());
	CHECK_FALSE(ok);
	CHECK(mercury.lastError() == MercuryError::REPLY_TIMEOUT);
	CHECK(mercury.takeError() == "303,\"Reply timeout\"");
}
