
#ifndef SAV_WIDGET_ID_H_
#define SAV_WIDGET_ID_H_

#include <cstdint>

namespace Sav {

class Enforcer;

/**
 * @brief Handle for a control registered with an Enforcer.
 *
 * The generation makes handles of removed registrations stale, even when
 * their slot has since been reused. A default constructed handle is never
 * valid.
 */
class WidgetId {
	friend class Enforcer;

public:
	WidgetId() = default;

public:
	bool isNull() const { return generation_ == 0; }
	uint32_t index() const { return index_; }
	uint32_t generation() const { return generation_; }

public:
	bool operator==(const WidgetId &rhs) const { return index_ == rhs.index_ && generation_ == rhs.generation_; }
	bool operator!=(const WidgetId &rhs) const { return !(*this == rhs); }

private:
	WidgetId(uint32_t index, uint32_t generation)
		: index_(index), generation_(generation) {
	}

private:
	uint32_t index_      = 0;
	uint32_t generation_ = 0;
};

}

#endif
