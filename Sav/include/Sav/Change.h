
#ifndef SAV_CHANGE_H_
#define SAV_CHANGE_H_

#include "Sav/Condns.h"

namespace Sav {

/**
 * @brief An atomic, partial update to a condition set.
 *
 * `changedCondns()` selects which conditions are being changed and
 * `newValues()` gives the values that they should take. Conditions outside of
 * `changedCondns()` are left alone.
 */
class Change {
public:
	constexpr Change() = default;
	constexpr Change(Condns changedCondns, Condns newValues)
		: changedCondns_(changedCondns), newValues_(newValues) {
	}

public:
	constexpr Condns changedCondns() const { return changedCondns_; }
	constexpr Condns newValues() const { return newValues_; }

	// a change is valid when it only sets values for conditions it claims to change
	constexpr bool isValid() const { return changedCondns_.isSupersetOf(newValues_); }

	/**
	 * @brief Computes the result of applying this change to `current`.
	 *
	 * @param current The condition set before the change.
	 * @return `(current & ~changed) | (values & changed)`.
	 */
	constexpr Condns applyTo(Condns current) const {
		return (current & ~changedCondns_) | (newValues_ & changedCondns_);
	}

public:
	constexpr bool operator==(const Change &rhs) const { return changedCondns_ == rhs.changedCondns_ && newValues_ == rhs.newValues_; }
	constexpr bool operator!=(const Change &rhs) const { return !(*this == rhs); }

private:
	Condns changedCondns_;
	Condns newValues_;
};

}

#endif
