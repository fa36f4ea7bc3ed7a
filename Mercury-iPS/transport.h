#ifndef TRANSPORT_H
#define TRANSPORT_H

#include <QString>
#include "mercuryerror.h"

//---------------------------------------------------------------------------
// Line oriented request/response connection to a MercuryiPS. One call to
// ask() writes one command line and blocks for one reply line.
//---------------------------------------------------------------------------
class Transport
{
public:
	virtual ~Transport() {}

	virtual bool open(void) = 0;
	virtual void close(void) = 0;
	virtual bool isConnected(void) const = 0;

	// reply without line terminator, *error set on transport failure
	virtual QString ask(const QString &command, MercuryError *error) = 0;
};

#endif // TRANSPORT_H
