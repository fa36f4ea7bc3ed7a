#ifndef SOCKET_H
#define SOCKET_H

#include <QObject>
#include <QtNetwork>
#include <QDebug>
#include "transport.h"

//---------------------------------------------------------------------------
// TCP connection to the MercuryiPS ethernet interface (port 7020)
//---------------------------------------------------------------------------
class Socket : public QObject, public Transport
{
	Q_OBJECT

public:
	Socket(QObject *parent = Q_NULLPTR);
	~Socket();

	// accepts TCPIP[board]::<host>::<port>::SOCKET
	static bool parseResource(const QString &resource, QString *host, quint16 *port);

	bool setResource(const QString &resource);
	void setTimeout(int msec) { replyTimeout = msec; }
	int timeout(void) const { return replyTimeout; }
	QString host(void) const { return ipAddress; }
	quint16 port(void) const { return ipPort; }

	bool open(void) override;
	void close(void) override;
	bool isConnected(void) const override { return unitConnected; }
	QString ask(const QString &command, MercuryError *error) override;

signals:
	void systemErrorMessage(QString errMsg, QString lastStrSent);
	void mercuryDisconnected(void);

private slots:
	void connected();
	void disconnected();

private:
	QTcpSocket *socket;
	QString ipAddress;
	quint16 ipPort;
	bool unitConnected;
	int replyTimeout;
	QString replyBuffer;
};

#endif // SOCKET_H
