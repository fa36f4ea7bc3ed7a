#include "stdafx.h"
#include "simulatedmercury.h"

//---------------------------------------------------------------------------
// Command and reply tokens
//---------------------------------------------------------------------------
const char _READ[] = "READ";
const char _SET[] = "SET";
const char _DEV[] = "DEV";
const char _PSU[] = "PSU";
const char _STAT[] = "STAT";
const char _IDN[] = "*IDN?";
const char _VALID[] = "VALID";
const char _INVALID[] = "INVALID";

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

const char SIMULATED_IDN[] = "IDN:OXFORD INSTRUMENTS:MERCURY IPS:SIMULATED:2.6.04.000";

//---------------------------------------------------------------------------
// Format a value the way the instrument does, with a milli prefix for
// small currents and voltages.
//---------------------------------------------------------------------------
static QString formatSignal(double value, const QString &unit)
{
	if ((unit == "A" || unit == "V") && value != 0.0 && fabs(value) < 1.0)
		return QString::number(value * 1e3, 'f', 4) + "m" + unit;

	return QString::number(value, 'f', 4) + unit;
}

//---------------------------------------------------------------------------
SimulatedMercury::SimulatedMercury(const QStringList &uids)
{
	connectedState = false;

	for (const QString &uid : uids)
	{
		PsuRegisters psu;

		psu.voltage = 0.0;
		psu.current = 0.0;
		psu.persistentCurrent = 0.0;
		psu.currentTarget = 0.0;
		psu.fieldTarget = 0.0;
		psu.field = 0.0;
		psu.persistentField = 0.0;
		psu.fieldRampRate = 0.2;
		psu.atob = 60.0;
		psu.action = "HOLD";

		registers.insert(uid, psu);
	}
}

//---------------------------------------------------------------------------
SimulatedMercury::~SimulatedMercury()
{

}

//---------------------------------------------------------------------------
bool SimulatedMercury::open(void)
{
	connectedState = true;
	return true;
}

//---------------------------------------------------------------------------
void SimulatedMercury::close(void)
{
	connectedState = false;
}

//---------------------------------------------------------------------------
void SimulatedMercury::setField(const QString &uid, double field)
{
	if (registers.contains(uid))
	{
		PsuRegisters &psu = registers[uid];

		psu.field = psu.persistentField = field;
		psu.current = psu.persistentCurrent = field * psu.atob;
	}
}

//---------------------------------------------------------------------------
void SimulatedMercury::setAtob(const QString &uid, double atob)
{
	if (registers.contains(uid))
		setSignal(registers[uid], _ATOB, QString::number(atob));
}

//---------------------------------------------------------------------------
void SimulatedMercury::setAction(const QString &uid, const QString &token)
{
	if (registers.contains(uid))
		registers[uid].action = token;
}

//---------------------------------------------------------------------------
QString SimulatedMercury::action(const QString &uid) const
{
	return registers.value(uid).action;
}

//---------------------------------------------------------------------------
double SimulatedMercury::fieldTarget(const QString &uid) const
{
	if (!registers.contains(uid))
		return NAN;

	return registers.value(uid).fieldTarget;
}

//---------------------------------------------------------------------------
QString SimulatedMercury::ask(const QString &command, MercuryError *error)
{
	*error = MercuryError::NO_MERCURY_ERROR;

	if (!connectedState)
	{
		*error = MercuryError::NOT_CONNECTED;
		return QString();
	}

	log.append(command);

	if (command == _IDN)
		return SIMULATED_IDN;

	QStringList tokens = command.split(':');
	QString invalid = QString(_STAT) + ":" + command + ":" + _INVALID;

	// every device command is ACTION:DEV:<UID>:PSU:<signal>[:<value>]
	if (tokens.size() < 5 || tokens.at(1) != _DEV || tokens.at(3) != _PSU || !registers.contains(tokens.at(2)))
		return invalid;

	PsuRegisters &psu = registers[tokens.at(2)];

	if (tokens.at(0) == _READ)
	{
		bool ok;
		QString signal = QStringList(tokens.mid(4)).join(':');
		QString value = readSignal(psu, signal, &ok);

		if (!ok)
			return invalid;

		QString echo = command;
		echo.remove(0, strlen(_READ) + 1);

		return QString(_STAT) + ":" + echo + ":" + value;
	}
	else if (tokens.at(0) == _SET && tokens.size() >= 6)
	{
		QString signal = QStringList(tokens.mid(4, tokens.size() - 5)).join(':');

		if (!setSignal(psu, signal, tokens.last()))
			return invalid;

		return QString(_STAT) + ":" + command + ":" + _VALID;
	}

	return invalid;
}

//---------------------------------------------------------------------------
QString SimulatedMercury::readSignal(const PsuRegisters &psu, const QString &signal, bool *ok) const
{
	*ok = true;

	if (signal == _SIG_VOLT)
		return formatSignal(psu.voltage, "V");
	else if (signal == _SIG_CURR)
		return formatSignal(psu.current, "A");
	else if (signal == _SIG_PCUR)
		return formatSignal(psu.persistentCurrent, "A");
	else if (signal == _SIG_CSET)
		return formatSignal(psu.currentTarget, "A");
	else if (signal == _SIG_FSET)
		return formatSignal(psu.fieldTarget, "T");
	else if (signal == _SIG_RCST)
		return formatSignal(psu.fieldRampRate * psu.atob, "A/m");
	else if (signal == _SIG_RFST)
		return formatSignal(psu.fieldRampRate, "T/m");
	else if (signal == _SIG_FLD)
		return formatSignal(psu.field, "T");
	else if (signal == _SIG_PFLD)
		return formatSignal(psu.persistentField, "T");
	else if (signal == _ATOB)
		return formatSignal(psu.atob, "A/T");
	else if (signal == _ACTN)
		return psu.action;

	*ok = false;
	return QString();
}

//---------------------------------------------------------------------------
bool SimulatedMercury::setSignal(PsuRegisters &psu, const QString &signal, const QString &value)
{
	if (signal == _ACTN)
	{
		if (value != "HOLD" && value != "RTOS" && value != "CLMP" && value != "RTOZ")
			return false;

		psu.action = value;
		applyAction(psu);
		return true;
	}

	bool ok;
	double temp = value.toDouble(&ok);

	if (!ok)
		return false;

	if (signal == _SIG_FSET)
	{
		psu.fieldTarget = temp;
		psu.currentTarget = temp * psu.atob;
	}
	else if (signal == _SIG_CSET)
	{
		psu.currentTarget = temp;
		psu.fieldTarget = (psu.atob != 0.0) ? temp / psu.atob : 0.0;
	}
	else if (signal == _SIG_RFST)
	{
		psu.fieldRampRate = temp;
	}
	else if (signal == _ATOB)
	{
		if (temp <= 0.0)
			return false;

		psu.atob = temp;
		psu.currentTarget = psu.fieldTarget * psu.atob;
	}
	else
	{
		return false;	// read-only or unknown signal
	}

	return true;
}

//---------------------------------------------------------------------------
void SimulatedMercury::applyAction(PsuRegisters &psu)
{
	if (psu.action == "RTOS")
	{
		psu.field = psu.persistentField = psu.fieldTarget;
		psu.current = psu.persistentCurrent = psu.fieldTarget * psu.atob;
	}
	else if (psu.action == "RTOZ")
	{
		psu.field = psu.persistentField = 0.0;
		psu.current = psu.persistentCurrent = 0.0;
	}
}
