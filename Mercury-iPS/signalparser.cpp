#include "stdafx.h"
#include "signalparser.h"

//---------------------------------------------------------------------------
QString preparseResponse(const QString &response)
{
	QString str(response);

	return str.remove(':');
}

//---------------------------------------------------------------------------
double scaleFactor(const QString &scaleAndUnit)
{
	if (scaleAndUnit.isEmpty())
		return 1.0;

	// only a leading SI prefix is significant, the unit itself is ignored
	switch (scaleAndUnit.at(0).toLatin1())
	{
	case 'n':
		return 1e-9;

	case 'u':
		return 1e-6;

	case 'm':
		return 1e-3;

	case 'k':
		return 1e3;

	case 'M':
		return 1e6;

	default:
		return 1.0;
	}
}

//---------------------------------------------------------------------------
double parseSignal(const QString &response, double ourScaling, bool *ok)
{
	QString str = preparseResponse(response);
	int i;

	// parse only the number
	for (i = 0; i < str.length(); i++)
	{
		if (str[i].isDigit() || str[i] == '.' || str[i] == '-')
			continue;
		else
			break;
	}

	QString digits = str.left(i);
	QString scaleAndUnit = str.mid(i);

	// convert to double
	bool converted = false;
	double value = digits.isEmpty() ? 0.0 : digits.toDouble(&converted);

	if (ok)
		*ok = converted;

	if (!converted)
		return NAN;

	return value * scaleFactor(scaleAndUnit) * ourScaling;
}
