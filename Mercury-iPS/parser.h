#ifndef PARSER_H
#define PARSER_H

#include <QObject>
#include <atomic>
#include "mercuryips.h"

//---------------------------------------------------------------------------
// Parser class
//---------------------------------------------------------------------------
class Parser : public QObject
{
	Q_OBJECT

public:
	Parser(QObject *parent = Q_NULLPTR);
	~Parser();
	void setDataSource(MercuryiPS *src) { mercury = src; }
	void stop(void);

	// parse one input line, returns the reply (empty for commands)
	QString parseLine(const QString &line);

public slots:
	void process(void);

signals:
	void finished();
	void exit_app(void);

private:
	std::atomic<bool> stopParsing;
	MercuryiPS *mercury;
	QString inputStr;

	void addToErrorQueue(MercuryError error);
	void parseInput(char *commbuf, char *outputBuffer);
	void parse_query_axis(MercurySlavePS *psu, char *word, char *outputBuffer);
	void parse_query_T(char *word, char *outputBuffer);
	void parse_configure(char *word);
	void parse_configure_axis(MercurySlavePS *psu, char *word);
	void parse_configure_T(char *word);
	void parse_ramp(void);
	bool nextValue(double *value);
};

#endif // PARSER_H
