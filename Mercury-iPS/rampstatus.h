#ifndef RAMPSTATUS_H
#define RAMPSTATUS_H

#include <QString>

enum class RampStatus
{
	HOLD = 0,
	TO_SET,
	CLAMP,
	TO_ZERO
};

// device tokens: HOLD, RTOS, CLMP, RTOZ
QString rampStatusToken(RampStatus status);
bool rampStatusFromToken(const QString &token, RampStatus *status);

// user facing names: "HOLD", "TO SET", "CLAMP", "TO ZERO"
QString rampStatusName(RampStatus status);
bool rampStatusFromName(const QString &name, RampStatus *status);

#endif // RAMPSTATUS_H
