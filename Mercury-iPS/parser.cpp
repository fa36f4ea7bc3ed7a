#include "stdafx.h"
#include "parser.h"
#include <iostream>

#define DELIMITER	":"		// colon
#define SEPARATOR ": \t"	// colon, space, or tab
#define SPACE " \t"			// space or tab

const int BUFFER_SIZE = 1024;

/************************************************************
	This file exposes the MercuryiPS driver as a line based
	command interface on stdin/stdout, so that a controlling
	process can drive the magnet without linking the driver.

	Queries end in '?' and write exactly one line. Commands
	write nothing. Errors are queued and read with SYST:ERR?.
	Input is case-insensitive.

	Queries:
		*IDN?  SYST:ERR?  RAMPING?
		<A>:VOLT?  <A>:CURR?  <A>:CURR:PERS?  <A>:CURR:TARG?
		<A>:FIELD?  <A>:FIELD:PERS?  <A>:FIELD:TARG?
		<A>:RATE:CURR?  <A>:RATE:FIELD?  <A>:ATOB?  <A>:STATE?
		TARG:<C>?

	Commands:
		*CLS  EXIT  RAMP [SAFE|SIMUL]
		CONF:<A>:FIELD:TARG <value>  CONF:<A>:CURR:TARG <value>
		CONF:<A>:RATE:FIELD <value>  CONF:<A>:ATOB <value>
		CONF:<A>:STATE HOLD|TOSET|CLAMP|TOZERO
		CONF:TARG:<C> <value>

	<A> is X, Y or Z; <C> is X, Y, Z, R, THETA, PHI or RHO.
************************************************************/

//---------------------------------------------------------------------------
// Command and query parsing tokens
//---------------------------------------------------------------------------
const char _SYST[] = "SYST";
const char _SYSTEM[] = "SYSTEM";
const char _ERR[] = "ERR";
const char _ERROR[] = "ERROR";
const char _EXIT[] = "EXIT";
const char _CLS[] = "*CLS";
const char _IDN[] = "*IDN";
const char _CONFIGURE[] = "CONFIGURE";
const char _CONF[] = "CONF";
const char _RAMP[] = "RAMP";
const char _RAMPING[] = "RAMPING";
const char _SAFE[] = "SAFE";
const char _SIMUL[] = "SIMUL";
const char _CURR[] = "CURR";
const char _CURRENT[] = "CURRENT";
const char _VOLT[] = "VOLT";
const char _VOLTAGE[] = "VOLTAGE";
const char _PERS[] = "PERS";
const char _PERSISTENT[] = "PERSISTENT";
const char _TARG[] = "TARG";
const char _TARGET[] = "TARGET";
const char _FIELD[] = "FIELD";
const char _RATE[] = "RATE";
const char _ATOB[] = "ATOB";
const char _STATE[] = "STATE";
const char _HOLD[] = "HOLD";
const char _TOSET[] = "TOSET";
const char _CLAMP[] = "CLAMP";
const char _TOZERO[] = "TOZERO";

//---------------------------------------------------------------------------
// Class methods
//---------------------------------------------------------------------------
Parser::Parser(QObject *parent)
	: QObject(parent)
{
	stopParsing = false;
	mercury = NULL;
}

//---------------------------------------------------------------------------
Parser::~Parser()
{
	stopParsing = true;
}

//---------------------------------------------------------------------------
void Parser::stop(void)
{
	// takes effect after the next line, getline() blocks until input
	stopParsing = true;
}

//---------------------------------------------------------------------------
// --- PROCESS LOOP ---
// Reads stdin until EOF or EXIT.
void Parser::process(void)
{
	if (mercury == NULL)
	{
		qDebug("Mercury-iPS parser aborted; no data source specified");
	}
	else
	{
		qDebug("Mercury-iPS stdin Parser Start");
		std::string input;
		stopParsing = false;

		while (!stopParsing && std::getline(std::cin, input))
		{
			QString output = parseLine(QString::fromStdString(input));

			if (!output.isEmpty())
			{
				output += "\n";
				std::cout.write(output.toLocal8Bit(), output.size());
				std::cout.flush();
			}
		}

		qDebug("Mercury-iPS stdin Parser End");
	}

	emit finished();
}

//---------------------------------------------------------------------------
QString Parser::parseLine(const QString &line)
{
	char input[BUFFER_SIZE];
	char output[BUFFER_SIZE];

	if (mercury == NULL)
		return QString();

	#ifdef DEBUG
	if (!line.isEmpty())
		qDebug() << line;
	#endif

	// save input for error messages
	inputStr = line.trimmed().toUpper();

	if (inputStr.isEmpty())
		return QString();

	QByteArray bytes = inputStr.toLocal8Bit().left(BUFFER_SIZE - 1);
	memcpy(input, bytes.constData(), bytes.size());
	input[bytes.size()] = '\0';
	output[0] = '\0';

	parseInput(input, output);

	return QString(output);
}

//---------------------------------------------------------------------------
void Parser::addToErrorQueue(MercuryError error)
{
	mercury->reportError(error, mercuryErrorString(error) + ": " + inputStr);
}

//---------------------------------------------------------------------------
void Parser::parseInput(char *commbuf, char *outputBuffer)
{
	char* word;    // string tokens
	char* pos;

	pos = strchr(commbuf, '?');

	/************************************************************
	The command is a query.
	************************************************************/
	if (pos != NULL)
	{		// found a ?
			// terminate string at the question mark
		*pos = '\0';

		// get first token
		word = strtok(commbuf, DELIMITER);

		if (word == NULL)
		{
			addToErrorQueue(MercuryError::UNRECOGNIZED_QUERY);
			return; // no match
		}

		MercurySlavePS *psu = mercury->axis(QString(word));

		// X?, Y?, Z? axis queries
		if (strlen(word) == 1 && psu != NULL)
		{
			parse_query_axis(psu, word, outputBuffer);
		}

		// *IDN?
		else if (!strcmp(word, _IDN))
		{
			bool ok;
			MercuryIdn idn = mercury->identity(&ok);

			if (ok)
			{
				QString str = idn.vendor + "," + idn.model + "," + idn.serial + "," + idn.firmware;
				snprintf(outputBuffer, BUFFER_SIZE, "%s", str.toLocal8Bit().constData());
			}
		}

		// SYSTem:ERRor?
		else if (!strcmp(word, _SYST) || !strcmp(word, _SYSTEM))
		{
			word = strtok(NULL, DELIMITER);

			if (word != NULL && (!strcmp(word, _ERR) || !strcmp(word, _ERROR)))
				snprintf(outputBuffer, BUFFER_SIZE, "%s", mercury->takeError().toLocal8Bit().constData());
			else
				addToErrorQueue(MercuryError::UNRECOGNIZED_QUERY);
		}

		// RAMPING?
		else if (!strcmp(word, _RAMPING))
		{
			bool ok;
			bool ramping = mercury->isRamping(&ok);

			if (ok)
				snprintf(outputBuffer, BUFFER_SIZE, "%d", ramping ? 1 : 0);
		}

		// TARGet:<C>?
		else if (!strcmp(word, _TARG) || !strcmp(word, _TARGET))
		{
			parse_query_T(word, outputBuffer);
		}

		// no match
		else
		{
			addToErrorQueue(MercuryError::UNRECOGNIZED_QUERY);
		}
	}

	/************************************************************
	The command is not a query (no return data).
	************************************************************/
	else
	{
		// get first token
		word = strtok(commbuf, SEPARATOR);
		if (word == NULL)
		{
			addToErrorQueue(MercuryError::UNRECOGNIZED_COMMAND);	// no match, error
			return; // no match
		}

		// switch on first character
		switch (*word)
		{
			// tests *CLS
			case '*':
				if (!strcmp(word, _CLS))
				{
					mercury->clearErrorHistory();
				}
				else
				{
					addToErrorQueue(MercuryError::UNRECOGNIZED_COMMAND);	// no match, error
				}
				break;

			// tests EXIT
			case 'E':
				if (strcmp(word, _EXIT) == 0)
				{
					stopParsing = true;
					emit exit_app();
				}
				else
				{
					addToErrorQueue(MercuryError::UNRECOGNIZED_COMMAND);	// no match, error
				}
				break;

			// tests all CONFigure commands
			case  'C':
				if (strcmp(word, _CONF) == 0 || strcmp(word, _CONFIGURE) == 0)
				{
					// get next token
					word = strtok(NULL, SEPARATOR);
					if (word == NULL)
					{
						addToErrorQueue(MercuryError::UNRECOGNIZED_COMMAND);	// no match, error
					}
					else
					{
						parse_configure(word);
					}
				}
				else
				{
					addToErrorQueue(MercuryError::UNRECOGNIZED_COMMAND);	// no match, error
				}
				break;

			// tests RAMP [SAFE|SIMUL]
			case  'R':
				if (strcmp(word, _RAMP) == 0)
				{
					parse_ramp();
				}
				else
				{
					addToErrorQueue(MercuryError::UNRECOGNIZED_COMMAND);	// no match, error
				}
				break;

			default:
				addToErrorQueue(MercuryError::UNRECOGNIZED_COMMAND);	// no match, error
				break;
		}
	}
}

//---------------------------------------------------------------------------
// tests <A>:VOLTage?, <A>:CURRent[:PERSistent|:TARGet]?,
//       <A>:FIELD[:PERSistent|:TARGet]?, <A>:RATE:CURRent|FIELD?,
//       <A>:ATOB?, <A>:STATE?
//---------------------------------------------------------------------------
void Parser::parse_query_axis(MercurySlavePS *psu, char* word, char* outputBuffer)
{
	bool ok = false;
	double value = NAN;

	word = strtok(NULL, DELIMITER);		// get next token

	if (word == NULL)
	{
		addToErrorQueue(MercuryError::UNRECOGNIZED_QUERY);	// no match, error
		return;
	}

	// <A>:VOLTage?
	if (strcmp(word, _VOLT) == 0 || strcmp(word, _VOLTAGE) == 0)
	{
		value = psu->voltage(&ok);
	}

	// <A>:CURRent?, <A>:CURRent:PERSistent?, <A>:CURRent:TARGet?
	else if (strcmp(word, _CURR) == 0 || strcmp(word, _CURRENT) == 0)
	{
		word = strtok(NULL, DELIMITER);

		if (word == NULL)
			value = psu->current(&ok);
		else if (strcmp(word, _PERS) == 0 || strcmp(word, _PERSISTENT) == 0)
			value = psu->currentPersistent(&ok);
		else if (strcmp(word, _TARG) == 0 || strcmp(word, _TARGET) == 0)
			value = psu->currentTarget(&ok);
		else
		{
			addToErrorQueue(MercuryError::UNRECOGNIZED_QUERY);
			return;
		}
	}

	// <A>:FIELD?, <A>:FIELD:PERSistent?, <A>:FIELD:TARGet?
	else if (strcmp(word, _FIELD) == 0)
	{
		word = strtok(NULL, DELIMITER);

		if (word == NULL)
			value = psu->field(&ok);
		else if (strcmp(word, _PERS) == 0 || strcmp(word, _PERSISTENT) == 0)
			value = psu->fieldPersistent(&ok);
		else if (strcmp(word, _TARG) == 0 || strcmp(word, _TARGET) == 0)
			value = psu->fieldTarget(&ok);
		else
		{
			addToErrorQueue(MercuryError::UNRECOGNIZED_QUERY);
			return;
		}
	}

	// <A>:RATE:CURRent?, <A>:RATE:FIELD?
	else if (strcmp(word, _RATE) == 0)
	{
		word = strtok(NULL, DELIMITER);

		if (word != NULL && (strcmp(word, _CURR) == 0 || strcmp(word, _CURRENT) == 0))
			value = psu->currentRampRate(&ok);
		else if (word != NULL && strcmp(word, _FIELD) == 0)
			value = psu->fieldRampRate(&ok);
		else
		{
			addToErrorQueue(MercuryError::UNRECOGNIZED_QUERY);
			return;
		}
	}

	// <A>:ATOB?
	else if (strcmp(word, _ATOB) == 0)
	{
		value = psu->atob(&ok);
	}

	// <A>:STATE?
	else if (strcmp(word, _STATE) == 0)
	{
		RampStatus status = psu->rampStatus(&ok);

		if (ok)
			snprintf(outputBuffer, BUFFER_SIZE, "%s", rampStatusName(status).toLocal8Bit().constData());

		return;
	}

	else
	{
		addToErrorQueue(MercuryError::UNRECOGNIZED_QUERY);	// no match, error
		return;
	}

	// a failed read is already on the error queue
	if (ok)
		snprintf(outputBuffer, BUFFER_SIZE, "%0.10g", value);
}

//---------------------------------------------------------------------------
// tests TARGet:X|Y|Z|R|THETA|PHI|RHO?
//---------------------------------------------------------------------------
void Parser::parse_query_T(char* word, char* outputBuffer)
{
	FieldVector::Coordinate coordinate;

	word = strtok(NULL, DELIMITER);	// get next token

	if (word == NULL || !FieldVector::coordinateFromName(QString(word), &coordinate))
	{
		addToErrorQueue(MercuryError::UNRECOGNIZED_QUERY);	// no match, error
		return;
	}

	snprintf(outputBuffer, BUFFER_SIZE, "%0.10g", mercury->target(coordinate));
}

//---------------------------------------------------------------------------
// tests CONFigure:<A>:..., CONFigure:TARGet:<C>
//---------------------------------------------------------------------------
void Parser::parse_configure(char* word)
{
	MercurySlavePS *psu = mercury->axis(QString(word));

	if (strlen(word) == 1 && psu != NULL)
	{
		parse_configure_axis(psu, word);
	}
	else if (strcmp(word, _TARG) == 0 || strcmp(word, _TARGET) == 0)
	{
		parse_configure_T(word);
	}
	else
	{
		addToErrorQueue(MercuryError::UNRECOGNIZED_COMMAND);	// no match, error
	}
}

//---------------------------------------------------------------------------
// tests CONFigure:<A>:FIELD:TARGet, CONFigure:<A>:CURRent:TARGet,
//       CONFigure:<A>:RATE:FIELD, CONFigure:<A>:ATOB, CONFigure:<A>:STATE
//---------------------------------------------------------------------------
void Parser::parse_configure_axis(MercurySlavePS *psu, char* word)
{
	double value;

	word = strtok(NULL, SEPARATOR);	// get next token

	if (word == NULL)
	{
		addToErrorQueue(MercuryError::UNRECOGNIZED_COMMAND);
		return;
	}

	if (strcmp(word, _FIELD) == 0 || strcmp(word, _CURR) == 0 || strcmp(word, _CURRENT) == 0)
	{
		bool isField = (strcmp(word, _FIELD) == 0);

		word = strtok(NULL, SEPARATOR);

		if (word == NULL || (strcmp(word, _TARG) != 0 && strcmp(word, _TARGET) != 0))
		{
			addToErrorQueue(MercuryError::UNRECOGNIZED_COMMAND);
			return;
		}

		if (nextValue(&value))
		{
			if (isField)
				psu->setFieldTarget(value);
			else
				psu->setCurrentTarget(value);
		}
	}
	else if (strcmp(word, _RATE) == 0)
	{
		word = strtok(NULL, SEPARATOR);

		if (word == NULL || strcmp(word, _FIELD) != 0)
		{
			addToErrorQueue(MercuryError::UNRECOGNIZED_COMMAND);
			return;
		}

		if (nextValue(&value))
			psu->setFieldRampRate(value);
	}
	else if (strcmp(word, _ATOB) == 0)
	{
		if (nextValue(&value))
			psu->setAtob(value);
	}
	else if (strcmp(word, _STATE) == 0)
	{
		word = strtok(NULL, SPACE);

		if (word == NULL)
			addToErrorQueue(MercuryError::MISSING_PARAMETER);
		else if (strcmp(word, _HOLD) == 0)
			psu->setRampStatus(RampStatus::HOLD);
		else if (strcmp(word, _TOSET) == 0)
			psu->setRampStatus(RampStatus::TO_SET);
		else if (strcmp(word, _CLAMP) == 0)
			psu->setRampStatus(RampStatus::CLAMP);
		else if (strcmp(word, _TOZERO) == 0)
			psu->setRampStatus(RampStatus::TO_ZERO);
		else
			addToErrorQueue(MercuryError::INVALID_ARGUMENT);
	}
	else
	{
		addToErrorQueue(MercuryError::UNRECOGNIZED_COMMAND);	// no match, error
	}
}

//---------------------------------------------------------------------------
// tests CONFigure:TARGet:X|Y|Z|R|THETA|PHI|RHO <value>
//---------------------------------------------------------------------------
void Parser::parse_configure_T(char* word)
{
	FieldVector::Coordinate coordinate;
	double value;

	word = strtok(NULL, SEPARATOR);

	if (word == NULL || !FieldVector::coordinateFromName(QString(word), &coordinate))
	{
		addToErrorQueue(MercuryError::UNRECOGNIZED_COMMAND);
		return;
	}

	// a rejected target is queued by the driver
	if (nextValue(&value))
		mercury->setTarget(coordinate, value);
}

//---------------------------------------------------------------------------
void Parser::parse_ramp(void)
{
	char *word = strtok(NULL, SPACE);

	if (word == NULL || strcmp(word, _SIMUL) == 0)
		mercury->rampToTarget(RampMode::SIMULTANEOUS);
	else if (strcmp(word, _SAFE) == 0)
		mercury->rampToTarget(RampMode::SAFE);
	else
		addToErrorQueue(MercuryError::INVALID_ARGUMENT);
}

//---------------------------------------------------------------------------
bool Parser::nextValue(double *value)
{
	char *arg = strtok(NULL, SPACE);		// look for value

	if (arg == NULL)
	{
		addToErrorQueue(MercuryError::MISSING_PARAMETER);
		return false;
	}

	bool ok;
	double temp = QByteArray(arg).toDouble(&ok);

	if (!ok || !qIsFinite(temp))
	{
		addToErrorQueue(MercuryError::NON_NUMERICAL_ENTRY);
		return false;
	}

	*value = temp;
	return true;
}
