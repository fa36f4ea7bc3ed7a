#include "stdafx.h"
#include "fieldlimits.h"

//---------------------------------------------------------------------------
FieldLimits::FieldLimits()
	: predicate([](double, double, double) { return true; }),
	  regionDescription("none")
{
}

//---------------------------------------------------------------------------
FieldLimits::FieldLimits(Predicate aPredicate, const QString &aDescription)
	: predicate(aPredicate),
	  regionDescription(aDescription)
{
}

//---------------------------------------------------------------------------
FieldLimits FieldLimits::sphere(double rMax)
{
	return FieldLimits([rMax](double x, double y, double z)
		{ return (x * x + y * y + z * z) <= rMax * rMax; },
		"sphere(r<=" + QString::number(rMax) + ")");
}

//---------------------------------------------------------------------------
FieldLimits FieldLimits::cylinder(double rhoMax, double zMax)
{
	return FieldLimits([rhoMax, zMax](double x, double y, double z)
		{ return (x * x + y * y) <= rhoMax * rhoMax && fabs(z) <= zMax; },
		"cylinder(rho<=" + QString::number(rhoMax) + ", |z|<=" + QString::number(zMax) + ")");
}

//---------------------------------------------------------------------------
FieldLimits FieldLimits::box(double xMax, double yMax, double zMax)
{
	return FieldLimits([xMax, yMax, zMax](double x, double y, double z)
		{ return fabs(x) <= xMax && fabs(y) <= yMax && fabs(z) <= zMax; },
		"box(|x|<=" + QString::number(xMax) + ", |y|<=" + QString::number(yMax) +
		", |z|<=" + QString::number(zMax) + ")");
}

//---------------------------------------------------------------------------
FieldLimits FieldLimits::fromSettings(QSettings *settings, bool *ok)
{
	QString region = settings->value("FieldLimits/Region", "none").toString().toLower();
	bool ok1 = true, ok2 = true, ok3 = true;

	*ok = false;

	if (region == "none")
	{
		*ok = true;
		return FieldLimits();
	}
	else if (region == "sphere")
	{
		double rMax = settings->value("FieldLimits/RMax").toDouble(&ok1);

		if (ok1 && rMax > 0.0)
		{
			*ok = true;
			return sphere(rMax);
		}
	}
	else if (region == "cylinder")
	{
		double rhoMax = settings->value("FieldLimits/RhoMax").toDouble(&ok1);
		double zMax = settings->value("FieldLimits/ZMax").toDouble(&ok2);

		if (ok1 && ok2 && rhoMax > 0.0 && zMax > 0.0)
		{
			*ok = true;
			return cylinder(rhoMax, zMax);
		}
	}
	else if (region == "box")
	{
		double xMax = settings->value("FieldLimits/XMax").toDouble(&ok1);
		double yMax = settings->value("FieldLimits/YMax").toDouble(&ok2);
		double zMax = settings->value("FieldLimits/ZMax").toDouble(&ok3);

		if (ok1 && ok2 && ok3 && xMax > 0.0 && yMax > 0.0 && zMax > 0.0)
		{
			*ok = true;
			return box(xMax, yMax, zMax);
		}
	}

	qWarning() << "Invalid field limits in settings, region:" << region;

	// not callable, rejected by MercuryiPS
	return FieldLimits(Predicate(), region);
}

//---------------------------------------------------------------------------
bool FieldLimits::admits(double x, double y, double z) const
{
	if (!predicate)
		return false;

	return predicate(x, y, z);
}
