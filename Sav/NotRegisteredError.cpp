
#include "Sav/NotRegisteredError.h"

namespace Sav {

/**
 * @brief NotRegisteredError constructor.
 *
 * @param id The handle that could not be found in the registry.
 */
NotRegisteredError::NotRegisteredError(WidgetId id)
	: id_(id) {

	if (id.isNull()) {
		error_ = "widget not registered (null handle)";
	} else {
		error_ = "widget not registered (slot " + std::to_string(id.index()) + ", generation " + std::to_string(id.generation()) + ")";
	}
}

/**
 * @brief Returns the error message.
 *
 * @return The error message string.
 */
const char *NotRegisteredError::what() const noexcept {
	return error_.c_str();
}

}
