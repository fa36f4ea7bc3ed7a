#ifndef MERCURYIPS_H
#define MERCURYIPS_H

#include <QObject>
#include <QStack>
#include <QStringList>
#include "mercuryerror.h"
#include "mercuryslaveps.h"
#include "fieldvector.h"
#include "fieldlimits.h"
#include "transport.h"

class Socket;

// identification record repackaged from the non-SCPI *IDN? reply
struct MercuryIdn
{
	QString vendor;
	QString model;
	QString serial;
	QString firmware;
};

enum Axis
{
	X_AXIS = 0,
	Y_AXIS,
	Z_AXIS,
	NUM_AXES
};

enum class RampMode
{
	SIMULTANEOUS = 0,	// ramp all axes at once
	SAFE				// ramp decreasing axes first, one axis at a time
};

//---------------------------------------------------------------------------
// Driver for the Oxford Instruments MercuryiPS magnet power supply with
// three slave supplies (X, Y, Z) and a target field vector.
//---------------------------------------------------------------------------
class MercuryiPS : public QObject
{
	Q_OBJECT

public:
	// address is a socket resource, e.g. TCPIP0::192.168.0.10::7020::SOCKET;
	// any address is accepted in simulation mode
	MercuryiPS(const QString &name, const QString &address, bool simulated = false,
		const FieldLimits &fieldLimits = FieldLimits(), const QStringList &axisUids = defaultAxisUids(),
		QObject *parent = Q_NULLPTR);

	// uses a caller owned transport, no address check
	// and not in simulation mode
	MercuryiPS(const QString &name, Transport *aTransport, const FieldLimits &fieldLimits = FieldLimits(),
		const QStringList &axisUids = defaultAxisUids(), QObject *parent = Q_NULLPTR);

	~MercuryiPS();

	static QStringList defaultAxisUids(void);

	bool isValid(void) const { return constructionError == MercuryError::NO_MERCURY_ERROR; }
	MercuryError error(void) const { return constructionError; }
	QString name(void) const { return instrumentName; }
	bool isSimulated(void) const { return simulated; }
	Transport *getTransport(void) { return transport; }
	void setTimeout(int msec);

	MercuryError connectToInstrument(void);
	void disconnectFromInstrument(void);
	bool isConnected(void) const;

	MercurySlavePS *axis(Axis anAxis) { return axes[anAxis]; }
	MercurySlavePS *axis(const QString &axisName);

	// send a command and return the reply payload
	QString ask(const QString &cmd, bool *ok = nullptr);
	MercuryIdn identity(bool *ok = nullptr);

	// target field vector
	FieldVector targetVector(void) const { return targetVec; }
	double target(FieldVector::Coordinate coordinate) const { return targetVec.component(coordinate); }
	MercuryError setTarget(FieldVector::Coordinate coordinate, double target);
	FieldLimits fieldLimits(void) const { return limits; }

	MercuryError rampToTarget(RampMode mode = RampMode::SIMULTANEOUS);
	bool isRamping(bool *ok = nullptr);

	// error reporting and history, newest entry on top
	MercuryError lastError(void) const { return lastErrorCode; }
	void reportError(MercuryError error, const QString &errMsg);
	int errorCount(void) const { return errorStack.size(); }
	QString takeError(void);
	void clearErrorHistory(void);

signals:
	void systemErrorMessage(QString errMsg, QString lastStrSent);
	void instrumentDisconnected(void);

private slots:
	void socketDisconnected(void);

private:
	void init(const FieldLimits &fieldLimits, const QStringList &axisUids);
	MercuryError checkRampable(void);
	MercuryError waitForAxis(MercurySlavePS *psu, double target);
	void connectMessage(qint64 elapsed);

	QString instrumentName;
	bool simulated;
	bool ownsTransport;
	Transport *transport;
	Socket *socket;	// same object as transport when using TCP
	MercurySlavePS *axes[NUM_AXES];
	FieldLimits limits;
	FieldVector targetVec;
	MercuryError constructionError;
	MercuryError lastErrorCode;
	QString lastCommand;
	QStack<QString> errorStack;
};

#endif // MERCURYIPS_H
