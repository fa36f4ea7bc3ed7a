#include <catch2/catch_all.hpp>

#include "mercuryerror.h"

TEST_CASE("Error kind follows the code range", "[MercuryError]")
{
	CHECK(mercuryErrorKind(MercuryError::NO_MERCURY_ERROR) == MercuryErrorKind::NONE);
	CHECK(mercuryErrorKind(MercuryError::INVALID_UID) == MercuryErrorKind::CONSTRUCTION);
	CHECK(mercuryErrorKind(MercuryError::INVALID_FIELD_LIMITS) == MercuryErrorKind::CONSTRUCTION);
	CHECK(mercuryErrorKind(MercuryError::CLAMPED_RAMP) == MercuryErrorKind::VALIDATION);
	CHECK(mercuryErrorKind(MercuryError::FIELD_LIMIT_VIOLATION) == MercuryErrorKind::VALIDATION);
	CHECK(mercuryErrorKind(MercuryError::REPLY_TIMEOUT) == MercuryErrorKind::PROTOCOL);
	CHECK(mercuryErrorKind(MercuryError::MISSING_PARAMETER) == MercuryErrorKind::COMMAND);
}

TEST_CASE("Error history entry format", "[MercuryError]")
{
	CHECK(mercuryErrorEntry(MercuryError::NO_MERCURY_ERROR) == "0,\"No error\"");
	CHECK(mercuryErrorEntry(MercuryError::INVALID_UID) == "101,\"Invalid UID\"");
	CHECK(mercuryErrorEntry(MercuryError::CLAMPED_RAMP) == "201,\"Power supply is clamped\"");
	CHECK(mercuryErrorEntry(MercuryError::INSTRUMENT_REJECTED) == "305,\"Invalid command\"");
	CHECK(mercuryErrorEntry(MercuryError::RAMP_TIMEOUT) == "306,\"Ramp timeout\"");
}
