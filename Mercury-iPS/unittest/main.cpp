#include <catch2/catch_session.hpp>

#include <QCoreApplication>

// Qt networking needs an application object in the test process
int main(int argc, char *argv[])
{
	QCoreApplication app(argc, argv);

	return Catch::Session().run(argc, argv);
}
