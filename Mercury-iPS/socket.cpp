#include "stdafx.h"
#include "socket.h"

#undef DEBUG
//#define DEBUG

// timeout constants
const int TIMEOUT = 1000;
const int CONNECT_TIMEOUT = 5000;

// line terminator used by the MercuryiPS
const char TERMINATOR[] = "\n";


//---------------------------------------------------------------------------
Socket::Socket(QObject *parent)
	: QObject(parent)
{
	socket = NULL;
	ipPort = 7020;
	unitConnected = false;
	replyTimeout = TIMEOUT;
}

//---------------------------------------------------------------------------
Socket::~Socket()
{
	if (socket)
	{
		if (unitConnected)
			socket->close();

		delete socket;
	}
}

//---------------------------------------------------------------------------
bool Socket::parseResource(const QString &resource, QString *host, quint16 *port)
{
	static const QRegularExpression resourceExp("^TCPIP\\d*::([^:]+)::(\\d+)::SOCKET$",
		QRegularExpression::CaseInsensitiveOption);

	QRegularExpressionMatch match = resourceExp.match(resource.trimmed());

	if (!match.hasMatch())
		return false;

	bool ok;
	uint temp = match.captured(2).toUInt(&ok);

	if (!ok || temp == 0 || temp > 65535)
		return false;

	*host = match.captured(1);
	*port = (quint16)temp;

	return true;
}

//---------------------------------------------------------------------------
bool Socket::setResource(const QString &resource)
{
	return parseResource(resource, &ipAddress, &ipPort);
}

//---------------------------------------------------------------------------
bool Socket::open(void)
{
	if (socket == NULL)
	{
		socket = new QTcpSocket(this);

		connect(socket, SIGNAL(connected()), this, SLOT(connected()));
		connect(socket, SIGNAL(disconnected()), this, SLOT(disconnected()));
	}

	socket->connectToHost(ipAddress, ipPort);

	if (!socket->waitForConnected(CONNECT_TIMEOUT))
	{
		qDebug() << "Error: " << socket->errorString();
		unitConnected = false;
	}
	else
	{
		unitConnected = true;
	}

	return unitConnected;
}

//---------------------------------------------------------------------------
void Socket::close(void)
{
	if (socket && unitConnected)
	{
		socket->disconnectFromHost();

		if (socket->state() != QAbstractSocket::UnconnectedState)
			socket->waitForDisconnected(TIMEOUT);
	}

	unitConnected = false;
}

//---------------------------------------------------------------------------
void Socket::connected()
{
	qDebug() << "Connected to MercuryiPS @" + ipAddress + ":" + QString::number(ipPort);
	unitConnected = true;
}

//---------------------------------------------------------------------------
void Socket::disconnected()
{
	unitConnected = false;
	qDebug() << "Disconnected from MercuryiPS @" + ipAddress + ":" + QString::number(ipPort);
	emit mercuryDisconnected();
}

//---------------------------------------------------------------------------
// Writes the command and waits for a complete reply line. Anything left
// over from an earlier timed out query is discarded first.
//---------------------------------------------------------------------------
QString Socket::ask(const QString &command, MercuryError *error)
{
	*error = MercuryError::NO_MERCURY_ERROR;

	if (!unitConnected)
	{
		*error = MercuryError::NOT_CONNECTED;
		emit systemErrorMessage("Not connected", command);
		return QString();
	}

	replyBuffer.clear();
	socket->readAll();

	QString cmd = command + TERMINATOR;
	socket->write(cmd.toLocal8Bit());

	#ifdef DEBUG
	qDebug() << "CMD: " << command;
	#endif

	QElapsedTimer timeout;
	timeout.restart();

	while (!replyBuffer.contains(TERMINATOR))
	{
		qint64 remaining = replyTimeout - timeout.elapsed();

		if (remaining <= 0)
		{
			*error = MercuryError::REPLY_TIMEOUT;
			emit systemErrorMessage("Query reply timeout", command);
			return QString();
		}

		if (socket->waitForReadyRead((int)remaining))
		{
			replyBuffer += QString::fromLatin1(socket->readAll());
		}
		else if (socket->state() != QAbstractSocket::ConnectedState)
		{
			unitConnected = false;
			*error = MercuryError::NOT_CONNECTED;
			emit systemErrorMessage("Connection lost", command);
			return QString();
		}
	}

	int end = replyBuffer.indexOf(TERMINATOR);
	QString reply = replyBuffer.left(end);
	replyBuffer.clear();

	// remove any carriage return
	while (reply.endsWith('\r'))
		reply.chop(1);

	#ifdef DEBUG
	qDebug() << "Reply: " << reply;
	#endif

	return reply;
}
