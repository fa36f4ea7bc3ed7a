#include "stdafx.h"
#include "fieldvector.h"

//---------------------------------------------------------------------------
// Local constants
//---------------------------------------------------------------------------
namespace
{
	const char *coordinateNames[] = { "x", "y", "z", "r", "theta", "phi", "rho" };
}

//---------------------------------------------------------------------------
FieldVector::FieldVector()
{
	_x = _y = _z = 0.0;
	_r = _theta = _phi = 0.0;
	_rho = 0.0;
}

//---------------------------------------------------------------------------
FieldVector::FieldVector(double x, double y, double z)
{
	_x = x;
	_y = y;
	_z = z;
	_theta = _phi = 0.0;
	computeFromCartesian();
}

//---------------------------------------------------------------------------
FieldVector FieldVector::fromSpherical(double r, double theta, double phi)
{
	FieldVector vec;

	vec._r = r;
	vec._theta = theta;
	vec._phi = phi;
	vec.computeFromSpherical();

	return vec;
}

//---------------------------------------------------------------------------
FieldVector FieldVector::fromCylindrical(double rho, double phi, double z)
{
	FieldVector vec;

	vec._rho = rho;
	vec._phi = phi;
	vec._z = z;
	vec.computeFromCylindrical();

	return vec;
}

//---------------------------------------------------------------------------
QString FieldVector::coordinateName(Coordinate coordinate)
{
	return coordinateNames[coordinate];
}

//---------------------------------------------------------------------------
bool FieldVector::coordinateFromName(const QString &name, Coordinate *coordinate)
{
	for (int i = X; i <= RHO; i++)
	{
		if (name.compare(coordinateNames[i], Qt::CaseInsensitive) == 0)
		{
			*coordinate = (Coordinate)i;
			return true;
		}
	}

	return false;
}

//---------------------------------------------------------------------------
double FieldVector::component(Coordinate coordinate) const
{
	switch (coordinate)
	{
	case X:
		return _x;
	case Y:
		return _y;
	case Z:
		return _z;
	case R:
		return _r;
	case THETA:
		return _theta;
	case PHI:
		return _phi;
	case RHO:
		return _rho;
	}

	return NAN;
}

//---------------------------------------------------------------------------
void FieldVector::getComponents(double *x, double *y, double *z) const
{
	*x = _x;
	*y = _y;
	*z = _z;
}

//---------------------------------------------------------------------------
FieldVector FieldVector::withComponent(Coordinate coordinate, double value) const
{
	FieldVector vec(*this);

	vec.setComponent(coordinate, value);

	return vec;
}

//---------------------------------------------------------------------------
void FieldVector::setComponent(Coordinate coordinate, double value)
{
	switch (coordinate)
	{
	case X:
		_x = value;
		computeFromCartesian();
		break;

	case Y:
		_y = value;
		computeFromCartesian();
		break;

	case Z:
		_z = value;
		computeFromCartesian();
		break;

	case R:
		_r = value;
		computeFromSpherical();
		break;

	case THETA:
		_theta = value;
		computeFromSpherical();
		break;

	case PHI:
		_phi = value;
		computeFromSpherical();
		break;

	case RHO:
		_rho = value;
		computeFromCylindrical();
		break;
	}
}

//---------------------------------------------------------------------------
double FieldVector::distance(const FieldVector &other) const
{
	double dx = _x - other._x;
	double dy = _y - other._y;
	double dz = _z - other._z;

	return sqrt(dx * dx + dy * dy + dz * dz);
}

//---------------------------------------------------------------------------
bool FieldVector::isClose(const FieldVector &other, double tolerance) const
{
	return distance(other) <= tolerance;
}

//---------------------------------------------------------------------------
QString FieldVector::toString(void) const
{
	return "FieldVector(x=" + QString::number(_x, 'g', 10) + ", y=" + QString::number(_y, 'g', 10) +
		", z=" + QString::number(_z, 'g', 10) + ")";
}

//---------------------------------------------------------------------------
// At the origin (or on the z axis) the angles are undefined; the previous
// theta and phi are kept so that a following angle change is not lost.
//---------------------------------------------------------------------------
void FieldVector::computeFromCartesian(void)
{
	_rho = sqrt(_x * _x + _y * _y);
	_r = sqrt(_x * _x + _y * _y + _z * _z);

	if (_rho > 0.0)
		_phi = atan2(_y, _x);

	if (_r > 0.0)
		_theta = acos(qBound(-1.0, _z / _r, 1.0));
}

//---------------------------------------------------------------------------
// A negative magnitude or an angle outside its range is folded back, the
// stored r, theta, phi and rho always describe the Cartesian triple.
//---------------------------------------------------------------------------
void FieldVector::computeFromSpherical(void)
{
	_x = _r * sin(_theta) * cos(_phi);
	_y = _r * sin(_theta) * sin(_phi);
	_z = _r * cos(_theta);
	computeFromCartesian();
}

//---------------------------------------------------------------------------
void FieldVector::computeFromCylindrical(void)
{
	_x = _rho * cos(_phi);
	_y = _rho * sin(_phi);
	computeFromCartesian();
}
