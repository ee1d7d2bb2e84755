
#include "Recollections/Recollections.h"
#include "Yaml.h"

#include <QDir>
#include <QFileInfo>
#include <QSaveFile>
#include <QtDebug>

#include <map>

namespace Recollections {

namespace {

using RecollectionDb = std::map<QString, QString>;

QString recollectionsFile_;

/**
 * @brief Reads the whole recollections file.
 *
 * @return The stored name/value pairs, or an empty optional if the file could
 * not be read or is not a mapping.
 */
std::optional<RecollectionDb> ReadDb() {

	if (!QFileInfo::exists(recollectionsFile_)) {
		return RecollectionDb();
	}

	try {
		const YAML::Node root = YAML::LoadFile(recollectionsFile_.toUtf8().toStdString());

		RecollectionDb db;
		if (root.IsNull()) {
			return db;
		}

		if (!root.IsMap()) {
			qWarning("SavKit: %s does not contain a mapping", qPrintable(recollectionsFile_));
			return {};
		}

		for (auto it = root.begin(); it != root.end(); ++it) {
			db[it->first.as<QString>()] = it->second.as<QString>();
		}

		return db;
	} catch (const YAML::Exception &ex) {
		qWarning("SavKit: Error reading %s:\n%s", qPrintable(recollectionsFile_), ex.what());
	}

	return {};
}

/**
 * @brief Replaces the contents of the recollections file.
 *
 * @param db The name/value pairs to store.
 */
void WriteDb(const RecollectionDb &db) {
	try {
		YAML::Emitter out;
		out << YAML::BeginMap;
		for (const auto &[name, value] : db) {
			out << YAML::Key << name.toStdString();
			out << YAML::Value << value.toStdString();
		}
		out << YAML::EndMap;

		QSaveFile file(recollectionsFile_);
		if (!file.open(QIODevice::WriteOnly)) {
			qWarning("SavKit: Error opening %s: %s", qPrintable(recollectionsFile_), qPrintable(file.errorString()));
			return;
		}

		file.write(out.c_str());
		file.write("\n");

		if (!file.commit()) {
			qWarning("SavKit: Error writing %s: %s", qPrintable(recollectionsFile_), qPrintable(file.errorString()));
		}
	} catch (const YAML::Exception &ex) {
		qWarning("SavKit: Error writing %s:\n%s", qPrintable(recollectionsFile_), ex.what());
	}
}

}

/**
 * @brief Sets the file where recollections are stored.
 *
 * The file, and its directory, are created if they do not exist yet. This
 * should normally be called early in the application's main().
 *
 * @param filename The path of the data file, an empty string disables the mechanism.
 */
void Init(const QString &filename) {

	recollectionsFile_ = filename;

	if (filename.isEmpty()) {
		return;
	}

	const QFileInfo info(filename);
	if (info.exists()) {
		return;
	}

	if (!QDir().mkpath(info.absolutePath())) {
		qWarning("SavKit: Unable to create directory %s", qPrintable(info.absolutePath()));
		return;
	}

	WriteDb(RecollectionDb());
}

/**
 * @brief Gets the file where recollections are stored.
 *
 * @return The path given to Init(), or an empty string if not initialised.
 */
QString DataFile() {
	return recollectionsFile_;
}

/**
 * @brief Recalls the value associated with a name.
 *
 * @param name The name the value was remembered under.
 * @return The value, or an empty optional if not initialised or nothing has
 * been remembered under `name`.
 */
std::optional<QString> Recall(const QString &name) {

	if (recollectionsFile_.isEmpty()) {
		return {};
	}

	const std::optional<RecollectionDb> db = ReadDb();
	if (!db) {
		return {};
	}

	auto it = db->find(name);
	if (it == db->end()) {
		return {};
	}

	return it->second;
}

/**
 * @brief Recalls the value associated with a name, or a default.
 *
 * @param name The name the value was remembered under.
 * @param defaultValue The value to use if nothing is remembered under `name`.
 * @return The remembered value or `defaultValue`.
 */
QString RecallOrElse(const QString &name, const QString &defaultValue) {
	return Recall(name).value_or(defaultValue);
}

/**
 * @brief Remembers a value under a name for later recall.
 *
 * The file is re-read before being rewritten so that values remembered by
 * other processes sharing it are kept.
 *
 * @param name The name to remember the value under.
 * @param value The value to remember.
 */
void Remember(const QString &name, const QString &value) {

	if (recollectionsFile_.isEmpty()) {
		return;
	}

	std::optional<RecollectionDb> db = ReadDb();
	if (!db) {
		// NOTE: don't clobber a file we failed to understand
		qWarning("SavKit: not remembering %s", qPrintable(name));
		return;
	}

	(*db)[name] = value;
	WriteDb(*db);
}

}
