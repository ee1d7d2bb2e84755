
#ifndef SAV_CONDNS_H_
#define SAV_CONDNS_H_

#include <cstdint>

class QString;

namespace Sav {

/**
 * @brief A set of boolean flags representing the conditions that define an
 * application's state. Up to 64 conditions can be used to describe a state.
 *
 * The meaning of each bit is decided by the application; the engine only ever
 * does mask arithmetic on them.
 */
class Condns {
public:
	constexpr Condns() = default;
	constexpr explicit Condns(uint64_t value)
		: value_(value) {
	}

public:
	constexpr uint64_t value() const { return value_; }
	constexpr bool isEmpty() const { return value_ == 0; }

	// true if all of our flags are also set in `other`
	constexpr bool isSubsetOf(Condns other) const { return (value_ & other.value_) == value_; }

	// true if all of the flags in `other` are also set in us
	constexpr bool isSupersetOf(Condns other) const { return (value_ & other.value_) == other.value_; }

public:
	constexpr Condns operator|(Condns rhs) const { return Condns(value_ | rhs.value_); }
	constexpr Condns operator&(Condns rhs) const { return Condns(value_ & rhs.value_); }
	constexpr Condns operator~() const { return Condns(~value_); }

	Condns &operator|=(Condns rhs) {
		value_ |= rhs.value_;
		return *this;
	}

	Condns &operator&=(Condns rhs) {
		value_ &= rhs.value_;
		return *this;
	}

	constexpr bool operator==(Condns rhs) const { return value_ == rhs.value_; }
	constexpr bool operator!=(Condns rhs) const { return value_ != rhs.value_; }

private:
	uint64_t value_ = 0;
};

constexpr Condns DONT_CARE{};

QString ToString(Condns condns);

}

#endif
