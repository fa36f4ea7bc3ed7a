#include "stdafx.h"
#include "mercuryips.h"
#include "socket.h"
#include "simulatedmercury.h"

//---------------------------------------------------------------------------
// Local constants
//---------------------------------------------------------------------------
static const char *axisNames[NUM_AXES] = { "X", "Y", "Z" };

// SAFE ramp: polling interval and the field deviation taken as "at target"
const int RAMP_POLL_INTERVAL = 100;	// ms
const double FIELD_TOLERANCE = 1e-4;	// T

// SAFE ramp: allowed time is the nominal ramp time scaled, plus a margin
const double RAMP_TIME_FACTOR = 2.0;
const qint64 RAMP_TIME_MARGIN = 1000;	// ms


//---------------------------------------------------------------------------
MercuryiPS::MercuryiPS(const QString &name, const QString &address, bool simulated,
	const FieldLimits &fieldLimits, const QStringList &axisUids, QObject *parent)
	: QObject(parent)
{
	instrumentName = name;
	this->simulated = simulated;
	ownsTransport = true;
	socket = NULL;
	constructionError = MercuryError::NO_MERCURY_ERROR;
	lastErrorCode = MercuryError::NO_MERCURY_ERROR;

	if (simulated)
	{
		transport = new SimulatedMercury(axisUids);
	}
	else
	{
		socket = new Socket();
		transport = socket;

		// ensure that a socket is used unless we are in simulation mode
		if (!socket->setResource(address))
		{
			constructionError = MercuryError::INVALID_ADDRESS;
			reportError(constructionError, "Incorrect resource name '" + address +
				"'. Must be of type TCPIP0::XXX.XXX.XXX.XXX::7020::SOCKET.");
		}

		// connect error signals
		connect(socket, SIGNAL(mercuryDisconnected()), this, SLOT(socketDisconnected()));
		connect(socket, SIGNAL(systemErrorMessage(QString, QString)), this, SIGNAL(systemErrorMessage(QString, QString)));
	}

	init(fieldLimits, axisUids);
}

//---------------------------------------------------------------------------
MercuryiPS::MercuryiPS(const QString &name, Transport *aTransport, const FieldLimits &fieldLimits,
	const QStringList &axisUids, QObject *parent)
	: QObject(parent)
{
	instrumentName = name;
	simulated = false;
	ownsTransport = false;
	transport = aTransport;
	socket = NULL;
	constructionError = MercuryError::NO_MERCURY_ERROR;
	lastErrorCode = MercuryError::NO_MERCURY_ERROR;

	init(fieldLimits, axisUids);
}

//---------------------------------------------------------------------------
MercuryiPS::~MercuryiPS()
{
	if (ownsTransport)
	{
		if (transport->isConnected())
			transport->close();

		delete transport;
	}
}

//---------------------------------------------------------------------------
void MercuryiPS::init(const FieldLimits &fieldLimits, const QStringList &axisUids)
{
	if (!fieldLimits.isValid() && constructionError == MercuryError::NO_MERCURY_ERROR)
	{
		constructionError = MercuryError::INVALID_FIELD_LIMITS;
		reportError(constructionError, "Got wrong type of field limits (" + fieldLimits.description() +
			"). Must be a function from (x, y, z) -> bool.");
	}

	limits = fieldLimits;

	// TODO: Query instrument to ensure which PSUs are actually present
	for (int i = 0; i < NUM_AXES; i++)
	{
		QString uid = (i < axisUids.size()) ? axisUids.at(i) : QString();

		axes[i] = new MercurySlavePS(this, axisNames[i], uid);

		if (!axes[i]->isValid() && constructionError == MercuryError::NO_MERCURY_ERROR)
		{
			constructionError = axes[i]->error();
			reportError(constructionError, "Invalid UID '" + uid + "' for " + axisNames[i] + " axis");
		}
	}
}

//---------------------------------------------------------------------------
QStringList MercuryiPS::defaultAxisUids(void)
{
	return QStringList() << "GRPX" << "GRPY" << "GRPZ";
}

//---------------------------------------------------------------------------
void MercuryiPS::setTimeout(int msec)
{
	if (socket)
		socket->setTimeout(msec);
}

//---------------------------------------------------------------------------
MercuryError MercuryiPS::connectToInstrument(void)
{
	if (!isValid())
	{
		reportError(constructionError, "Cannot connect " + instrumentName + ", invalid configuration");
		return constructionError;
	}

	QElapsedTimer timer;
	timer.start();

	if (!transport->isConnected() && !transport->open())
	{
		reportError(MercuryError::NOT_CONNECTED, "Cannot connect " + instrumentName);
		return MercuryError::NOT_CONNECTED;
	}

	// the target vector starts out at the present field
	bool ok[NUM_AXES];
	double field[NUM_AXES];

	for (int i = 0; i < NUM_AXES; i++)
	{
		field[i] = axes[i]->field(&ok[i]);

		if (!ok[i])
			return lastErrorCode;
	}

	targetVec = FieldVector(field[X_AXIS], field[Y_AXIS], field[Z_AXIS]);

	connectMessage(timer.elapsed());

	return MercuryError::NO_MERCURY_ERROR;
}

//---------------------------------------------------------------------------
void MercuryiPS::disconnectFromInstrument(void)
{
	if (transport->isConnected())
		transport->close();
}

//---------------------------------------------------------------------------
bool MercuryiPS::isConnected(void) const
{
	return transport->isConnected();
}

//---------------------------------------------------------------------------
void MercuryiPS::socketDisconnected(void)
{
	qWarning().noquote() << "Lost connection to" << instrumentName;
	emit instrumentDisconnected();
}

//---------------------------------------------------------------------------
void MercuryiPS::connectMessage(qint64 elapsed)
{
	bool ok;
	MercuryIdn idn = identity(&ok);

	if (ok)
	{
		qDebug().noquote() << "Connected to:" << idn.vendor << idn.model << "(serial:" + idn.serial +
			", firmware:" + idn.firmware + ") in" << QString::number(elapsed / 1000.0, 'f', 2) + "s";
	}
}

//---------------------------------------------------------------------------
MercurySlavePS *MercuryiPS::axis(const QString &axisName)
{
	for (int i = 0; i < NUM_AXES; i++)
	{
		if (axisName.compare(axisNames[i], Qt::CaseInsensitive) == 0 || axisName == axes[i]->uid())
			return axes[i];
	}

	return NULL;
}

//---------------------------------------------------------------------------
// Oxford Instruments implement their own version of a SCPI-like language.
// A valid READ reply echoes the command after "STAT:", a SET reply ends
// in VALID, a rejected command contains INVALID.
//---------------------------------------------------------------------------
QString MercuryiPS::ask(const QString &cmd, bool *ok)
{
	MercuryError error;
	QString baseResp;

	lastCommand = cmd;
	QString resp = transport->ask(cmd, &error);

	if (error != MercuryError::NO_MERCURY_ERROR)
	{
		reportError(error, mercuryErrorString(error) + " on " + cmd);

		if (ok)
			*ok = false;

		return QString();
	}

	if (ok)
		*ok = true;

	if (resp.contains("INVALID"))
	{
		qCritical() << "Invalid command. Got response:" << resp;
		errorStack.push(mercuryErrorEntry(MercuryError::INSTRUMENT_REJECTED));
		emit systemErrorMessage("Invalid command. Got response: " + resp, cmd);
		baseResp = resp;
	}

	// SET:
	else if (resp.endsWith("VALID"))
	{
		QStringList fields = resp.split(':');

		if (fields.size() >= 2)
			baseResp = fields.at(fields.size() - 2);
	}

	// READ:
	else
	{
		// for "normal" commands only (e.g. *IDN? is excepted), the reply
		// echoes the command, which is removed here
		QString baseCmd = cmd;
		baseCmd.remove("READ:");

		baseResp = resp;
		baseResp.remove("STAT:" + baseCmd);
	}

	return baseResp;
}

//---------------------------------------------------------------------------
// Parse the raw non-SCPI compliant IDN string
// <preamble>:<vendor>:<model>:<serial>:<firmware>
//---------------------------------------------------------------------------
MercuryIdn MercuryiPS::identity(bool *ok)
{
	MercuryIdn idn;
	bool replyOk;
	QString rawIdnString = ask("*IDN?", &replyOk);

	if (replyOk)
	{
		QStringList resps = rawIdnString.split(':');

		if (resps.size() < 5)
		{
			reportError(MercuryError::UNRECOGNIZED_REPLY, "Unrecognized *IDN? reply: " + rawIdnString);
			replyOk = false;
		}
		else
		{
			idn.vendor = resps.at(1);
			idn.model = resps.at(2);
			idn.serial = resps.at(3);
			idn.firmware = resps.at(4);
		}
	}

	if (ok)
		*ok = replyOk;

	return idn;
}

//---------------------------------------------------------------------------
// The candidate vector is validated against the field limits before it
// replaces the live target vector.
//---------------------------------------------------------------------------
MercuryError MercuryiPS::setTarget(FieldVector::Coordinate coordinate, double target)
{
	double x, y, z;
	FieldVector validVec = targetVec.withComponent(coordinate, target);

	validVec.getComponents(&x, &y, &z);

	if (!limits.admits(x, y, z))
	{
		reportError(MercuryError::FIELD_LIMIT_VIOLATION, "Cannot set " + FieldVector::coordinateName(coordinate) +
			" target to " + QString::number(target, 'g', 10) + ", that would violate the field limits.");
		return MercuryError::FIELD_LIMIT_VIOLATION;
	}

	targetVec = validVec;

	return MercuryError::NO_MERCURY_ERROR;
}

//---------------------------------------------------------------------------
MercuryError MercuryiPS::rampToTarget(RampMode mode)
{
	double targets[NUM_AXES];
	MercuryError error;

	targetVec.getComponents(&targets[X_AXIS], &targets[Y_AXIS], &targets[Z_AXIS]);

	// no axis may move unless all of them can
	if ((error = checkRampable()) != MercuryError::NO_MERCURY_ERROR)
		return error;

	for (int i = 0; i < NUM_AXES; i++)
	{
		if ((error = axes[i]->setFieldTarget(targets[i])) != MercuryError::NO_MERCURY_ERROR)
			return error;
	}

	if (mode == RampMode::SIMULTANEOUS)
	{
		for (int i = 0; i < NUM_AXES; i++)
		{
			if ((error = axes[i]->setRampStatus(RampStatus::TO_SET)) != MercuryError::NO_MERCURY_ERROR)
				return error;
		}
	}
	else
	{
		// axes moving towards zero go first
		QList<int> order;
		QList<int> rising;

		for (int i = 0; i < NUM_AXES; i++)
		{
			bool ok;
			double present = axes[i]->field(&ok);

			if (!ok)
				return lastErrorCode;

			if (fabs(targets[i]) < fabs(present))
				order.append(i);
			else
				rising.append(i);
		}

		order.append(rising);

		for (int i : order)
		{
			if ((error = axes[i]->setRampStatus(RampStatus::TO_SET)) != MercuryError::NO_MERCURY_ERROR)
				return error;

			if ((error = waitForAxis(axes[i], targets[i])) != MercuryError::NO_MERCURY_ERROR)
				return error;
		}
	}

	return MercuryError::NO_MERCURY_ERROR;
}

//---------------------------------------------------------------------------
MercuryError MercuryiPS::checkRampable(void)
{
	for (int i = 0; i < NUM_AXES; i++)
	{
		bool ok;
		RampStatus status = axes[i]->rampStatus(&ok);

		if (!ok)
			return lastErrorCode;

		if (status == RampStatus::CLAMP)
		{
			reportError(MercuryError::CLAMPED_RAMP, "Error in ramping unit " + axes[i]->uid() +
				": Can not ramp to target value; power supply is clamped. Unclamp first by setting "
				"ramp status to HOLD.");
			return MercuryError::CLAMPED_RAMP;
		}
	}

	return MercuryError::NO_MERCURY_ERROR;
}

//---------------------------------------------------------------------------
// Waits until the axis leaves TO SET or reaches the target, at most twice
// the nominal ramp time plus a margin.
//---------------------------------------------------------------------------
MercuryError MercuryiPS::waitForAxis(MercurySlavePS *psu, double target)
{
	bool ok;
	double start = psu->field(&ok);

	if (!ok)
		return lastErrorCode;

	double rate = psu->fieldRampRate(&ok);	// T/s

	if (!ok)
		return lastErrorCode;

	qint64 allowed = RAMP_TIME_MARGIN;

	if (rate > 0.0)
		allowed += (qint64)(RAMP_TIME_FACTOR * 1000.0 * fabs(target - start) / rate);

	QElapsedTimer timer;
	timer.start();

	forever
	{
		RampStatus status = psu->rampStatus(&ok);

		if (!ok)
			return lastErrorCode;

		if (status != RampStatus::TO_SET)
			break;

		double present = psu->field(&ok);

		if (!ok)
			return lastErrorCode;

		if (fabs(present - target) <= FIELD_TOLERANCE)
			break;

		if (timer.elapsed() > allowed)
		{
			reportError(MercuryError::RAMP_TIMEOUT, psu->name() + " axis did not reach " +
				QString::number(target, 'g', 10) + " T within " + QString::number(allowed / 1000.0, 'f', 1) + " s");
			return MercuryError::RAMP_TIMEOUT;
		}

		QThread::msleep(RAMP_POLL_INTERVAL);
	}

	return MercuryError::NO_MERCURY_ERROR;
}

//---------------------------------------------------------------------------
bool MercuryiPS::isRamping(bool *ok)
{
	bool ramping = false;

	for (int i = 0; i < NUM_AXES; i++)
	{
		bool statusOk;
		RampStatus status = axes[i]->rampStatus(&statusOk);

		if (!statusOk)
		{
			if (ok)
				*ok = false;

			return false;
		}

		if (status == RampStatus::TO_SET)
			ramping = true;
	}

	if (ok)
		*ok = true;

	return ramping;
}

//---------------------------------------------------------------------------
void MercuryiPS::reportError(MercuryError error, const QString &errMsg)
{
	lastErrorCode = error;
	errorStack.push(mercuryErrorEntry(error));
	qWarning().noquote() << errMsg;
	emit systemErrorMessage(errMsg, lastCommand);
}

//---------------------------------------------------------------------------
QString MercuryiPS::takeError(void)
{
	if (errorStack.isEmpty())
		return mercuryErrorEntry(MercuryError::NO_MERCURY_ERROR);

	return errorStack.pop();
}

//---------------------------------------------------------------------------
void MercuryiPS::clearErrorHistory(void)
{
	errorStack.clear();
}
