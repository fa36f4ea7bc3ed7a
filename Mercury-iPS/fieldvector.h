#ifndef FIELDVECTOR_H
#define FIELDVECTOR_H

#include <QString>

//---------------------------------------------------------------------------
// A magnetic field vector (T) kept consistent in Cartesian (x, y, z),
// spherical (r, theta, phi) and cylindrical (rho, phi, z) form. Angles are
// in radians, theta measured from +z and phi from +x.
//---------------------------------------------------------------------------
class FieldVector
{
public:
	enum Coordinate
	{
		X = 0,
		Y,
		Z,
		R,
		THETA,
		PHI,
		RHO
	};

	FieldVector();
	FieldVector(double x, double y, double z);

	static FieldVector fromSpherical(double r, double theta, double phi);
	static FieldVector fromCylindrical(double rho, double phi, double z);

	static QString coordinateName(Coordinate coordinate);
	static bool coordinateFromName(const QString &name, Coordinate *coordinate);

	double x(void) const { return _x; }
	double y(void) const { return _y; }
	double z(void) const { return _z; }
	double r(void) const { return _r; }
	double theta(void) const { return _theta; }
	double phi(void) const { return _phi; }
	double rho(void) const { return _rho; }

	double component(Coordinate coordinate) const;
	void getComponents(double *x, double *y, double *z) const;

	// copy with one coordinate changed, the other members of the same
	// coordinate system are held constant
	FieldVector withComponent(Coordinate coordinate, double value) const;
	void setComponent(Coordinate coordinate, double value);

	double distance(const FieldVector &other) const;
	bool isClose(const FieldVector &other, double tolerance = 1e-9) const;
	QString toString(void) const;

private:
	void computeFromCartesian(void);
	void computeFromSpherical(void);
	void computeFromCylindrical(void);

	double _x, _y, _z;
	double _r, _theta, _phi;
	double _rho;
};

#endif // FIELDVECTOR_H
