
#include "Sav/Condns.h"

#include <QString>

namespace Sav {

/**
 * @brief Formats a condition set for diagnostics.
 *
 * @param condns The condition set to format.
 * @return The condition set as a zero padded hexadecimal string, e.g. `0x0000000000000a02`.
 */
QString ToString(Condns condns) {
	return QStringLiteral("0x%1").arg(static_cast<qulonglong>(condns.value()), 16, 16, QLatin1Char('0'));
}

}
