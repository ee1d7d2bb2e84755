
#ifndef SAV_POLICY_H_
#define SAV_POLICY_H_

#include "Sav/Condns.h"

#include <optional>

namespace Sav {

/**
 * @brief The conditions required for a control to be sensitive, visible or both.
 *
 * Each part is satisfied when every condition in its required set is
 * currently true. A part that is not present leaves that property of the
 * control untouched.
 */
class Policy {
public:
	static Policy Sensitivity(Condns required) {
		return Policy(required, std::nullopt);
	}

	static Policy Visibility(Condns required) {
		return Policy(std::nullopt, required);
	}

	static Policy Both(Condns sensitive, Condns visible) {
		return Policy(sensitive, visible);
	}

public:
	const std::optional<Condns> &sensitivity() const { return sensitivity_; }
	const std::optional<Condns> &visibility() const { return visibility_; }

	/**
	 * @brief Combines this policy with a newer one for the same control.
	 *
	 * @param newer The policy being registered now.
	 * @return A policy where each part present in `newer` replaces ours.
	 */
	Policy replacedBy(const Policy &newer) const {
		return Policy(newer.sensitivity_ ? newer.sensitivity_ : sensitivity_,
					  newer.visibility_ ? newer.visibility_ : visibility_);
	}

public:
	bool operator==(const Policy &rhs) const { return sensitivity_ == rhs.sensitivity_ && visibility_ == rhs.visibility_; }
	bool operator!=(const Policy &rhs) const { return !(*this == rhs); }

private:
	Policy(std::optional<Condns> sensitivity, std::optional<Condns> visibility)
		: sensitivity_(sensitivity), visibility_(visibility) {
	}

private:
	std::optional<Condns> sensitivity_;
	std::optional<Condns> visibility_;
};

}

#endif
