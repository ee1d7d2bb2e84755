
#include "MainWindow.h"
#include "Recollections/Recollections.h"
#include "Settings.h"
#include "Util/version.h"

#include <QApplication>
#include <QStringList>

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace {

constexpr const char cmdLineHelp[] =
	"Usage: savkit-demo [-V|-version] [-h|-help]\n";

/**
 * @brief Writes Qt log messages to stderr, tagged with their severity and,
 * for messages logged through a QLoggingCategory, the category's name.
 *
 * @param type The type of the message (debug, warning, info, critical, fatal).
 * @param context The context of the message, its category is used as a prefix.
 * @param msg The message to log.
 */
void MessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg) {

	QString text = msg;
	if (context.category && qstrcmp(context.category, "default") != 0) {
		text = QStringLiteral("[%1] %2").arg(QLatin1String(context.category), msg);
	}

	switch (type) {
	case QtDebugMsg:
#ifndef NDEBUG
		fprintf(stderr, "Debug: %s\n", qPrintable(text));
#endif
		break;
	case QtWarningMsg:
		fprintf(stderr, "Warning: %s\n", qPrintable(text));
		break;
	case QtInfoMsg:
		fprintf(stderr, "Info: %s\n", qPrintable(text));
		break;
	case QtCriticalMsg:
		fprintf(stderr, "Critical: %s\n", qPrintable(text));
		break;
	case QtFatalMsg:
		fprintf(stderr, "Fatal: %s\n", qPrintable(text));
		abort();
	}
}

}

/**
 * @brief Main entry point for the SavKit demo.
 *
 * @param argc The number of command line arguments.
 * @param argv The command line arguments as an array of strings.
 * @return The exit code of the application.
 */
int main(int argc, char *argv[]) {

	// Respond to -V or -version and -h or -help even if there is no display
	for (int i = 1; i < argc; i++) {
		if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "-version") == 0) {
			printf("SavKit Demo version %d.%d\n", SAVKIT_VERSION_MAJ, SAVKIT_VERSION_REV);
			return EXIT_SUCCESS;
		}

		if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "-help") == 0) {
			fputs(cmdLineHelp, stdout);
			return EXIT_SUCCESS;
		}
	}

	qInstallMessageHandler(MessageHandler);

	QApplication app(argc, argv);
	QApplication::setApplicationName(QStringLiteral("savkit-demo"));

	const QStringList arguments = QApplication::arguments();
	if (arguments.size() > 1) {
		qWarning("SavKit: unrecognized argument: %s", qPrintable(arguments[1]));
		fputs(cmdLineHelp, stderr);
		return EXIT_FAILURE;
	}

	Settings::Load();

	if (Settings::rememberGeometry) {
		Recollections::Init(Settings::RecollectionsFile());
	}

	MainWindow window;
	window.show();

	const int result = QApplication::exec();

	if (!Settings::Save()) {
		qWarning("SavKit: Unable to save settings in %s", qPrintable(Settings::ConfigFile()));
	}

	return result;
}
