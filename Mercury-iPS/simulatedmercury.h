#ifndef SIMULATEDMERCURY_H
#define SIMULATEDMERCURY_H

#include <QMap>
#include <QStringList>
#include "transport.h"

//---------------------------------------------------------------------------
// In-memory MercuryiPS answering the READ/SET grammar, used in simulation
// mode and by the unit tests. Ramps complete instantly.
//---------------------------------------------------------------------------
class SimulatedMercury : public Transport
{
public:
	SimulatedMercury(const QStringList &uids = QStringList() << "GRPX" << "GRPY" << "GRPZ");
	~SimulatedMercury();

	bool open(void) override;
	void close(void) override;
	bool isConnected(void) const override { return connectedState; }
	QString ask(const QString &command, MercuryError *error) override;

	// direct register access
	bool hasUid(const QString &uid) const { return registers.contains(uid); }
	void setField(const QString &uid, double field);
	void setAtob(const QString &uid, double atob);
	void setAction(const QString &uid, const QString &token);
	QString action(const QString &uid) const;
	double fieldTarget(const QString &uid) const;

	// commands received since construction
	QStringList commandLog(void) const { return log; }
	void clearCommandLog(void) { log.clear(); }

private:
	struct PsuRegisters
	{
		double voltage;
		double current;
		double persistentCurrent;
		double currentTarget;
		double fieldTarget;
		double field;
		double persistentField;
		double fieldRampRate;	// T/min
		double atob;			// A/T
		QString action;
	};

	QString readSignal(const PsuRegisters &psu, const QString &signal, bool *ok) const;
	bool setSignal(PsuRegisters &psu, const QString &signal, const QString &value);
	void applyAction(PsuRegisters &psu);

	QMap<QString, PsuRegisters> registers;
	QStringList log;
	bool connectedState;
};

#endif // SIMULATEDMERCURY_H
