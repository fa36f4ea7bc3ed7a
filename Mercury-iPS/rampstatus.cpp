#include "stdafx.h"
#include "rampstatus.h"

//---------------------------------------------------------------------------
// Local constants
//---------------------------------------------------------------------------
namespace
{
	struct RampStatusEntry
	{
		RampStatus status;
		const char *name;
		const char *token;
	};

	const RampStatusEntry rampStatusTable[] =
	{
		{ RampStatus::HOLD,		"HOLD",		"HOLD" },
		{ RampStatus::TO_SET,	"TO SET",	"RTOS" },
		{ RampStatus::CLAMP,	"CLAMP",	"CLMP" },
		{ RampStatus::TO_ZERO,	"TO ZERO",	"RTOZ" }
	};
}

//---------------------------------------------------------------------------
QString rampStatusToken(RampStatus status)
{
	for (const RampStatusEntry &entry : rampStatusTable)
	{
		if (entry.status == status)
			return entry.token;
	}

	return QString();
}

//---------------------------------------------------------------------------
bool rampStatusFromToken(const QString &token, RampStatus *status)
{
	for (const RampStatusEntry &entry : rampStatusTable)
	{
		if (token == entry.token)
		{
			*status = entry.status;
			return true;
		}
	}

	return false;
}

//---------------------------------------------------------------------------
QString rampStatusName(RampStatus status)
{
	for (const RampStatusEntry &entry : rampStatusTable)
	{
		if (entry.status == status)
			return entry.name;
	}

	return QString();
}

//---------------------------------------------------------------------------
bool rampStatusFromName(const QString &name, RampStatus *status)
{
	for (const RampStatusEntry &entry : rampStatusTable)
	{
		if (name == entry.name)
		{
			*status = entry.status;
			return true;
		}
	}

	return false;
}
