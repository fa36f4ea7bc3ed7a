#ifndef MERCURYSLAVEPS_H
#define MERCURYSLAVEPS_H

#include <QObject>
#include "mercuryerror.h"
#include "rampstatus.h"

// forward declaration to prevent circular reference
class MercuryiPS;

//---------------------------------------------------------------------------
// One slave power supply (axis group) of the MercuryiPS. Nothing is cached:
// every getter is a READ and every setter a SET on the instrument.
//---------------------------------------------------------------------------
class MercurySlavePS : public QObject
{
	Q_OBJECT

public:
	// UID as used internally by the MercuryiPS, e.g. "GRPX" or "PSU.M1"
	MercurySlavePS(MercuryiPS *parent, const QString &name, const QString &UID);
	~MercurySlavePS();

	static bool isValidUid(const QString &UID);

	bool isValid(void) const { return constructionError == MercuryError::NO_MERCURY_ERROR; }
	MercuryError error(void) const { return constructionError; }
	QString name(void) const { return psuName; }
	QString uid(void) const { return psuUid; }

	double voltage(bool *ok = nullptr);				// V
	double current(bool *ok = nullptr);				// A
	double currentPersistent(bool *ok = nullptr);	// A
	double currentTarget(bool *ok = nullptr);		// A
	double fieldTarget(bool *ok = nullptr);			// T
	double currentRampRate(bool *ok = nullptr);		// A/s
	double fieldRampRate(bool *ok = nullptr);		// T/s
	double field(bool *ok = nullptr);				// T
	double fieldPersistent(bool *ok = nullptr);		// T
	double atob(bool *ok = nullptr);				// A/T
	RampStatus rampStatus(bool *ok = nullptr);

	MercuryError setCurrentTarget(double value);
	MercuryError setFieldTarget(double value);
	MercuryError setFieldRampRate(double value);
	MercuryError setAtob(double value);
	MercuryError setRampStatus(RampStatus status);

	// dressed command strings
	QString readCommand(const QString &getCmd) const;
	QString setCommand(const QString &setCmd, const QString &value) const;

private:
	double getSignal(const QString &getCmd, double ourScaling, bool *ok);
	QString paramGetter(const QString &getCmd, bool *ok);
	MercuryError paramSetter(const QString &setCmd, const QString &value);

	MercuryiPS *mercury;
	QString psuName;
	QString psuUid;
	MercuryError constructionError;
};

#endif // MERCURYSLAVEPS_H
