#ifndef MOCKTRANSPORT_H
#define MOCKTRANSPORT_H

#include <QMap>
#include <QStringList>
#include "transport.h"

// Scripted transport: answers from a command -> reply table and records
// every command sent. Unknown commands get an INVALID reply.
class MockTransport : public Transport
{
public:
	MockTransport()
		: connectedState(true), failure(MercuryError::NO_MERCURY_ERROR)
	{
	}

	bool open(void) override { connectedState = true; return true; }
	void close(void) override { connectedState = false; }
	bool isConnected(void) const override { return connectedState; }

	QString ask(const QString &command, MercuryError *error) override
	{
		sent.append(command);
		*error = failure;

		if (failure != MercuryError::NO_MERCURY_ERROR)
			return QString();

		return replies.value(command, "STAT:" + command + ":INVALID");
	}

	// reply to a READ the way the instrument echoes it
	void addRead(const QString &command, const QString &value)
	{
		QString echo = command;
		echo.remove("READ:");
		replies.insert(command, "STAT:" + echo + ":" + value);
	}

	void addSet(const QString &command)
	{
		replies.insert(command, "STAT:" + command + ":VALID");
	}

	bool connectedState;
	MercuryError failure;
	QMap<QString, QString> replies;
	QStringList sent;
};

#endif // MOCKTRANSPORT_H
