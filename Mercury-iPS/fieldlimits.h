#ifndef FIELDLIMITS_H
#define FIELDLIMITS_H

#include <QString>
#include <functional>

class QSettings;

//---------------------------------------------------------------------------
// Admissible region for target fields, a predicate over (x, y, z) in tesla.
// A default constructed FieldLimits admits everything.
//---------------------------------------------------------------------------
class FieldLimits
{
public:
	typedef std::function<bool(double x, double y, double z)> Predicate;

	FieldLimits();
	FieldLimits(Predicate aPredicate, const QString &aDescription = "custom");

	static FieldLimits sphere(double rMax);
	static FieldLimits cylinder(double rhoMax, double zMax);
	static FieldLimits box(double xMax, double yMax, double zMax);

	// reads FieldLimits/Region and its bounds, *ok is false for an unknown
	// region or a non-positive bound
	static FieldLimits fromSettings(QSettings *settings, bool *ok);

	bool isValid(void) const { return static_cast<bool>(predicate); }
	bool admits(double x, double y, double z) const;
	QString description(void) const { return regionDescription; }

private:
	Predicate predicate;
	QString regionDescription;
};

#endif // FIELDLIMITS_H
