#ifndef MERCURYERROR_H
#define MERCURYERROR_H

#include <QString>

//---------------------------------------------------------------------------
// Error codes reported by the driver. The hundreds digit gives the kind.
//---------------------------------------------------------------------------
enum class MercuryError
{
	NO_MERCURY_ERROR = 0,

	// construction errors
	INVALID_UID = 101,
	INVALID_ADDRESS,
	INVALID_FIELD_LIMITS,

	// validation errors
	CLAMPED_RAMP = 201,
	FIELD_LIMIT_VIOLATION,

	// protocol and transport errors
	NON_NUMERICAL_REPLY = 301,
	UNRECOGNIZED_REPLY,
	REPLY_TIMEOUT,
	NOT_CONNECTED,
	INSTRUMENT_REJECTED,	// logged only, never returned
	RAMP_TIMEOUT,

	// command interface errors
	UNRECOGNIZED_COMMAND = 401,
	UNRECOGNIZED_QUERY,
	MISSING_PARAMETER,
	NON_NUMERICAL_ENTRY,
	INVALID_ARGUMENT
};

enum class MercuryErrorKind
{
	NONE = 0,
	CONSTRUCTION,
	VALIDATION,
	PROTOCOL,
	COMMAND
};

MercuryErrorKind mercuryErrorKind(MercuryError error);
QString mercuryErrorString(MercuryError error);

// "<code>,\"<text>\"" as pushed onto the error history
QString mercuryErrorEntry(MercuryError error);

#endif // MERCURYERROR_H
