
#include "Settings.h"
#include "Util/Environment.h"

#include <QSettings>
#include <QStandardPaths>
#include <QtDebug>

namespace Settings {

namespace {

bool settingsLoaded_ = false;

}

bool rememberGeometry = true;
bool startWithAActive = false;
bool startWithBActive = false;

/**
 * @brief Returns the configuration directory.
 *
 * @return The path to the configuration directory.
 *
 * @note If the environment variable `SAVKIT_HOME` is set,
 * it will be used as the configuration directory.
 */
QString ConfigDirectory() {
	if (std::optional<QString> savkitHome = GetEnvironmentVariable("SAVKIT_HOME")) {
		return *savkitHome;
	}

	const QString configDir = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
	return QStringLiteral("%1/savkit").arg(configDir);
}

/**
 * @brief Gets the path of the configuration file.
 *
 * @return The path to the configuration file.
 */
QString ConfigFile() {
	return QStringLiteral("%1/config.ini").arg(ConfigDirectory());
}

/**
 * @brief Gets the path of the file where widgets remember their geometry.
 *
 * @return The path to the recollections file.
 */
QString RecollectionsFile() {
	return QStringLiteral("%1/recollections.yaml").arg(ConfigDirectory());
}

/**
 * @brief Loads the user preferences from the configuration file.
 *
 * Missing entries keep their defaults. Only the first call has any effect.
 */
void Load() {

	if (settingsLoaded_) {
		return; // Already loaded
	}

	const QString filename = ConfigFile();
	QSettings settings(filename, QSettings::IniFormat);

	rememberGeometry = settings.value(QLatin1String("savkit.rememberGeometry"), rememberGeometry).toBool();
	startWithAActive = settings.value(QLatin1String("savkit.startWithAActive"), startWithAActive).toBool();
	startWithBActive = settings.value(QLatin1String("savkit.startWithBActive"), startWithBActive).toBool();

	if (settings.status() != QSettings::NoError) {
		qWarning("SavKit: error reading %s, using defaults", qPrintable(filename));
	}

	settingsLoaded_ = true;
}

/**
 * @brief Saves the current settings to the configuration file.
 *
 * @return `true` if the settings were saved successfully, `false` otherwise.
 */
bool Save() {
	const QString filename = ConfigFile();
	QSettings settings(filename, QSettings::IniFormat);

	settings.setValue(QLatin1String("savkit.rememberGeometry"), rememberGeometry);
	settings.setValue(QLatin1String("savkit.startWithAActive"), startWithAActive);
	settings.setValue(QLatin1String("savkit.startWithBActive"), startWithBActive);

	settings.sync();
	return settings.status() == QSettings::NoError;
}

}
