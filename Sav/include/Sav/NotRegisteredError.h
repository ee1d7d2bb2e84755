
#ifndef SAV_NOT_REGISTERED_ERROR_H_
#define SAV_NOT_REGISTERED_ERROR_H_

#include "Sav/WidgetId.h"

#include <exception>
#include <string>

namespace Sav {

// Thrown when asked to remove a control that is not (or no longer) registered.
class NotRegisteredError final : public std::exception {
public:
	explicit NotRegisteredError(WidgetId id);

public:
	const char *what() const noexcept override;
	WidgetId id() const noexcept { return id_; }

private:
	WidgetId id_;
	std::string error_;
};

}

#endif
