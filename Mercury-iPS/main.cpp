#include "stdafx.h"
#include "version.h"
#include "mercuryips.h"
#include "parser.h"

//---------------------------------------------------------------------------
int main(int argc, char *argv[])
{
	QCoreApplication app(argc, argv);

	QCoreApplication::setOrganizationName(VER_ORGANIZATION_STR);
	QCoreApplication::setApplicationName(VER_APPLICATION_STR);
	QCoreApplication::setApplicationVersion(VER_APPLICATION_VERSION);

	// define the optional command line argument(s)
	QCommandLineParser cmdLineParse;
	cmdLineParse.setApplicationDescription("MercuryiPS three axis magnet power supply driver");
	cmdLineParse.addHelpOption();
	cmdLineParse.addVersionOption();

	// A resource name option with a value (-a, --address)
	QCommandLineOption addressOption(QStringList() << "a" << "address",
		QCoreApplication::translate("main", "Connect to <resource>, e.g. TCPIP0::192.168.0.10::7020::SOCKET."),
		QCoreApplication::translate("main", "resource"));
	cmdLineParse.addOption(addressOption);

	// A boolean option with multiple names (-s, --sim)
	QCommandLineOption simOption(QStringList() << "s" << "sim",
		QCoreApplication::translate("main", "Use the built-in simulated instrument."));
	cmdLineParse.addOption(simOption);

	// An ini file option with a value (-c, --config)
	QCommandLineOption configOption(QStringList() << "c" << "config",
		QCoreApplication::translate("main", "Read settings from <file> instead of the default location."),
		QCoreApplication::translate("main", "file"));
	cmdLineParse.addOption(configOption);

	// A reply timeout option with a value (-t, --timeout)
	QCommandLineOption timeoutOption(QStringList() << "t" << "timeout",
		QCoreApplication::translate("main", "Reply timeout in <msec>."),
		QCoreApplication::translate("main", "msec"));
	cmdLineParse.addOption(timeoutOption);

	// Process the actual command line arguments given by the user
	cmdLineParse.process(app);

	QSettings *settings;

	if (cmdLineParse.isSet(configOption))
		settings = new QSettings(cmdLineParse.value(configOption), QSettings::IniFormat);
	else
		settings = new QSettings();

	// command line overrides the stored settings
	QString address = settings->value("Address", "").toString();
	bool simulated = settings->value("Simulated", false).toBool();
	int timeout = settings->value("Timeout", 1000).toInt();

	if (cmdLineParse.isSet(addressOption))
		address = cmdLineParse.value(addressOption);

	if (cmdLineParse.isSet(simOption))
		simulated = true;

	if (cmdLineParse.isSet(timeoutOption))
	{
		bool ok;
		int value = cmdLineParse.value(timeoutOption).toInt(&ok);

		if (!ok || value <= 0)
		{
			qCritical() << "Invalid timeout:" << cmdLineParse.value(timeoutOption);
			delete settings;
			return 1;
		}

		timeout = value;
	}

	QStringList uids;
	QStringList defaults = MercuryiPS::defaultAxisUids();
	uids << settings->value("Axes/X", defaults.at(X_AXIS)).toString()
		 << settings->value("Axes/Y", defaults.at(Y_AXIS)).toString()
		 << settings->value("Axes/Z", defaults.at(Z_AXIS)).toString();

	bool limitsOk;
	FieldLimits limits = FieldLimits::fromSettings(settings, &limitsOk);

	delete settings;

	MercuryiPS mercury("mercury", address, simulated, limits, uids);

	if (!mercury.isValid())
	{
		qCritical().noquote() << "Configuration error:" << mercuryErrorString(mercury.error());
		return 1;
	}

	mercury.setTimeout(timeout);

	if (mercury.connectToInstrument() != MercuryError::NO_MERCURY_ERROR)
	{
		qCritical().noquote() << "Unable to connect to" << (simulated ? QString("simulated instrument") : address);
		return 2;
	}

	Parser parser;
	parser.setDataSource(&mercury);

	QObject::connect(&parser, SIGNAL(finished()), &app, SLOT(quit()));

	// parsing starts once the event loop runs
	QTimer::singleShot(0, &parser, SLOT(process()));

	int result = app.exec();

	mercury.disconnectFromInstrument();

	return result;
}
