
#include "Util/Environment.h"

#include <QByteArray>

/**
 * @brief Get an environment variable's value.
 *
 * @param name The name of the environment variable to retrieve.
 * @return The value of the environment variable, or an empty optional if it is
 * not set or is set to an empty string.
 */
std::optional<QString> GetEnvironmentVariable(const char *name) {
	const QByteArray envValue = qgetenv(name);
	if (envValue.isEmpty()) {
		return {};
	}
	return QString::fromLocal8Bit(envValue);
}
