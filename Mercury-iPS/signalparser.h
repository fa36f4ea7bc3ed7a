#ifndef SIGNALPARSER_H
#define SIGNALPARSER_H

#include <QString>

//---------------------------------------------------------------------------
// Reply value parsing for the MercuryiPS signal grammar, e.g. "0.0123T",
// "12.345mA" or ":HOLD". Values are returned in SI units.
//---------------------------------------------------------------------------

// remove the colon framing from a reply payload
QString preparseResponse(const QString &response);

// Numeric value of a reply scaled to SI. ourScaling is applied on top of the
// instrument's own prefix, e.g. 1/60 to convert a per-minute rate to per-second.
// On a malformed number *ok is set false and NAN is returned.
double parseSignal(const QString &response, double ourScaling = 1.0, bool *ok = nullptr);

// SI prefix factor for the leading character of a scale+unit suffix
double scaleFactor(const QString &scaleAndUnit);

#endif // SIGNALPARSER_H
