#include "stdafx.h"
#include "mercuryslaveps.h"
#include "mercuryips.h"
#include "signalparser.h"

//---------------------------------------------------------------------------
// Command tokens
//---------------------------------------------------------------------------
const char _SIG_VOLT[] = "SIG:VOLT";
const char _SIG_CURR[] = "SIG:CURR";
const char _SIG_PCUR[] = "SIG:PCUR";
const char _SIG_CSET[] = "SIG:CSET";
const char _SIG_FSET[] = "SIG:FSET";
const char _SIG_RCST[] = "SIG:RCST";
const char _SIG_RFST[] = "SIG:RFST";
const char _SIG_FLD[] = "SIG:FLD";
const char _SIG_PFLD[] = "SIG:PFLD";
const char _ATOB[] = "ATOB";
const char _ACTN[] = "ACTN";

// ramp rates are reported and set per minute
const double PER_MINUTE = 60.0;


//---------------------------------------------------------------------------
MercurySlavePS::MercurySlavePS(MercuryiPS *parent, const QString &name, const QString &UID)
	: QObject(parent)
{
	mercury = parent;
	psuName = name;
	psuUid = UID;
	constructionError = MercuryError::NO_MERCURY_ERROR;

	if (!isValidUid(UID))
	{
		constructionError = MercuryError::INVALID_UID;
		qWarning() << "Invalid UID" << UID << "for" << name << ". Must be axis group name or device name, e.g. \"GRPX\" or \"PSU.M1\"";
	}
}

//---------------------------------------------------------------------------
MercurySlavePS::~MercurySlavePS()
{

}

//---------------------------------------------------------------------------
bool MercurySlavePS::isValidUid(const QString &UID)
{
	return !UID.isEmpty() && !UID.contains(':');
}

//---------------------------------------------------------------------------
QString MercurySlavePS::readCommand(const QString &getCmd) const
{
	return "READ:DEV:" + psuUid + ":PSU:" + getCmd;
}

//---------------------------------------------------------------------------
QString MercurySlavePS::setCommand(const QString &setCmd, const QString &value) const
{
	return "SET:DEV:" + psuUid + ":PSU:" + setCmd + ":" + value;
}

//---------------------------------------------------------------------------
double MercurySlavePS::voltage(bool *ok)
{
	return getSignal(_SIG_VOLT, 1.0, ok);
}

//---------------------------------------------------------------------------
double MercurySlavePS::current(bool *ok)
{
	return getSignal(_SIG_CURR, 1.0, ok);
}

//---------------------------------------------------------------------------
double MercurySlavePS::currentPersistent(bool *ok)
{
	return getSignal(_SIG_PCUR, 1.0, ok);
}

//---------------------------------------------------------------------------
double MercurySlavePS::currentTarget(bool *ok)
{
	return getSignal(_SIG_CSET, 1.0, ok);
}

//---------------------------------------------------------------------------
double MercurySlavePS::fieldTarget(bool *ok)
{
	return getSignal(_SIG_FSET, 1.0, ok);
}

//---------------------------------------------------------------------------
// The current ramp rate follows the field ramp rate (converted via ATOB)
//---------------------------------------------------------------------------
double MercurySlavePS::currentRampRate(bool *ok)
{
	return getSignal(_SIG_RCST, 1.0 / PER_MINUTE, ok);
}

//---------------------------------------------------------------------------
double MercurySlavePS::fieldRampRate(bool *ok)
{
	return getSignal(_SIG_RFST, 1.0 / PER_MINUTE, ok);
}

//---------------------------------------------------------------------------
double MercurySlavePS::field(bool *ok)
{
	return getSignal(_SIG_FLD, 1.0, ok);
}

//---------------------------------------------------------------------------
double MercurySlavePS::fieldPersistent(bool *ok)
{
	return getSignal(_SIG_PFLD, 1.0, ok);
}

//---------------------------------------------------------------------------
double MercurySlavePS::atob(bool *ok)
{
	return getSignal(_ATOB, 1.0, ok);
}

//---------------------------------------------------------------------------
RampStatus MercurySlavePS::rampStatus(bool *ok)
{
	bool replyOk;
	RampStatus status = RampStatus::HOLD;
	QString reply = paramGetter(_ACTN, &replyOk);

	if (replyOk && !rampStatusFromToken(preparseResponse(reply), &status))
	{
		mercury->reportError(MercuryError::UNRECOGNIZED_REPLY,
			"Unknown ramp status '" + reply + "' from " + psuUid);
		replyOk = false;
	}

	if (ok)
		*ok = replyOk;

	return status;
}

//---------------------------------------------------------------------------
MercuryError MercurySlavePS::setCurrentTarget(double value)
{
	return paramSetter(_SIG_CSET, QString::number(value, 'g', 10));
}

//---------------------------------------------------------------------------
MercuryError MercurySlavePS::setFieldTarget(double value)
{
	return paramSetter(_SIG_FSET, QString::number(value, 'g', 10));
}

//---------------------------------------------------------------------------
MercuryError MercurySlavePS::setFieldRampRate(double value)
{
	return paramSetter(_SIG_RFST, QString::number(value * PER_MINUTE, 'g', 10));
}

//---------------------------------------------------------------------------
MercuryError MercurySlavePS::setAtob(double value)
{
	return paramSetter(_ATOB, QString::number(value, 'g', 10));
}

//---------------------------------------------------------------------------
// A clamped supply accepts RTOS but is then left in an unsafe state, so the
// transition CLAMP -> TO SET is refused here.
//---------------------------------------------------------------------------
MercuryError MercurySlavePS::setRampStatus(RampStatus status)
{
	bool ok;
	RampStatus statusNow = rampStatus(&ok);

	if (!ok)
		return mercury->lastError();

	if (statusNow == RampStatus::CLAMP && status == RampStatus::TO_SET)
	{
		mercury->reportError(MercuryError::CLAMPED_RAMP,
			"Error in ramping unit " + psuUid + ": Can not ramp to target value; power supply is "
			"clamped. Unclamp first by setting ramp status to HOLD.");
		return MercuryError::CLAMPED_RAMP;
	}

	return paramSetter(_ACTN, rampStatusToken(status));
}

//---------------------------------------------------------------------------
double MercurySlavePS::getSignal(const QString &getCmd, double ourScaling, bool *ok)
{
	bool replyOk;
	double value = NAN;
	QString reply = paramGetter(getCmd, &replyOk);

	if (replyOk)
	{
		value = parseSignal(reply, ourScaling, &replyOk);

		if (!replyOk)
			mercury->reportError(MercuryError::NON_NUMERICAL_REPLY,
				"Cannot parse reply '" + reply + "' to " + readCommand(getCmd));
	}

	if (ok)
		*ok = replyOk;

	return value;
}

//---------------------------------------------------------------------------
QString MercurySlavePS::paramGetter(const QString &getCmd, bool *ok)
{
	if (!isValid())
	{
		mercury->reportError(constructionError, "Unusable power supply " + psuName);
		*ok = false;
		return QString();
	}

	return mercury->ask(readCommand(getCmd), ok);
}

//---------------------------------------------------------------------------
// The instrument always very verbosely responds; an INVALID reply has
// already been logged by MercuryiPS::ask().
//---------------------------------------------------------------------------
MercuryError MercurySlavePS::paramSetter(const QString &setCmd, const QString &value)
{
	if (!isValid())
	{
		mercury->reportError(constructionError, "Unusable power supply " + psuName);
		return constructionError;
	}

	bool ok;
	mercury->ask(setCommand(setCmd, value), &ok);

	if (!ok)
		return mercury->lastError();

	return MercuryError::NO_MERCURY_ERROR;
}
