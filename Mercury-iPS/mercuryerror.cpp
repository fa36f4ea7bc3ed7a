#include "stdafx.h"
#include "mercuryerror.h"

//---------------------------------------------------------------------------
MercuryErrorKind mercuryErrorKind(MercuryError error)
{
	switch ((int)error / 100)
	{
	case 1:
		return MercuryErrorKind::CONSTRUCTION;

	case 2:
		return MercuryErrorKind::VALIDATION;

	case 3:
		return MercuryErrorKind::PROTOCOL;

	case 4:
		return MercuryErrorKind::COMMAND;

	default:
		return MercuryErrorKind::NONE;
	}
}

//---------------------------------------------------------------------------
QString mercuryErrorString(MercuryError error)
{
	switch (error)
	{
	case MercuryError::NO_MERCURY_ERROR:
		return "No error";

	case MercuryError::INVALID_UID:
		return "Invalid UID";

	case MercuryError::INVALID_ADDRESS:
		return "Invalid socket address";

	case MercuryError::INVALID_FIELD_LIMITS:
		return "Invalid field limits";

	case MercuryError::CLAMPED_RAMP:
		return "Power supply is clamped";

	case MercuryError::FIELD_LIMIT_VIOLATION:
		return "Target violates field limits";

	case MercuryError::NON_NUMERICAL_REPLY:
		return "Non-numerical reply";

	case MercuryError::UNRECOGNIZED_REPLY:
		return "Unrecognized reply";

	case MercuryError::REPLY_TIMEOUT:
		return "Reply timeout";

	case MercuryError::NOT_CONNECTED:
		return "Not connected";

	case MercuryError::INSTRUMENT_REJECTED:
		return "Invalid command";

	case MercuryError::RAMP_TIMEOUT:
		return "Ramp timeout";

	case MercuryError::UNRECOGNIZED_COMMAND:
		return "Unrecognized command";

	case MercuryError::UNRECOGNIZED_QUERY:
		return "Unrecognized query";

	case MercuryError::MISSING_PARAMETER:
		return "Missing parameter";

	case MercuryError::NON_NUMERICAL_ENTRY:
		return "Non-numerical entry";

	case MercuryError::INVALID_ARGUMENT:
		return "Invalid argument";
	}

	return "Error";
}

//---------------------------------------------------------------------------
QString mercuryErrorEntry(MercuryError error)
{
	return QString::number((int)error) + ",\"" + mercuryErrorString(error) + "\"";
}
