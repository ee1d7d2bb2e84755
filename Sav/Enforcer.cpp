
#include "Sav/Enforcer.h"
#include "Sav/NotRegisteredError.h"
#include "Util/Raise.h"

#include <QAction>
#include <QWidget>
#include <QtDebug>

namespace Sav {

/**
 * @brief Constructor for the Enforcer class.
 *
 * @param initial The condition set in effect before any change is applied.
 */
Enforcer::Enforcer(Condns initial)
	: current_(initial) {
}

/**
 * @brief Creates a shareable enforcer.
 *
 * @param initial The condition set in effect before any change is applied.
 * @return A new enforcer with no registered controls.
 */
std::shared_ptr<Enforcer> Enforcer::withInitialCondns(Condns initial) {
	return std::make_shared<Enforcer>(initial);
}

/**
 * @brief Registers a widget, or updates the policy of one already registered.
 *
 * The policy is enforced immediately. A part of `policy` that is present
 * replaces the same part of any earlier policy for this widget.
 *
 * @note Visibility is applied with QWidget::setVisible(), so a widget without
 * a parent is shown as a top level window once its visibility conditions
 * hold. Give such widgets a parent before registering them, or use a
 * sensitivity only policy.
 *
 * @param widget The widget to manage. It is not owned by the enforcer.
 * @param policy The conditions the widget's sensitivity and/or visibility depend on.
 * @return The widget's handle; re-registering returns the first handle.
 */
WidgetId Enforcer::addWidget(QWidget *widget, const Policy &policy) {
	return addTarget(widget, policy);
}

/**
 * @brief Registers an action, or updates the policy of one already registered.
 *
 * @param action The action to manage. It is not owned by the enforcer.
 * @param policy The conditions the action's sensitivity and/or visibility depend on.
 * @return The action's handle; re-registering returns the first handle.
 */
WidgetId Enforcer::addAction(QAction *action, const Policy &policy) {
	return addTarget(action, policy);
}

WidgetId Enforcer::addTarget(QObject *target, const Policy &policy) {

	if (!target) {
		qWarning("SavKit: attempt to register a null control");
		return WidgetId();
	}

	auto it = slotIndex_.find(target);
	if (it != slotIndex_.end()) {
		const uint32_t index = it->second;
		Slot &slot           = slots_[index];

		if (slot.target) {
			slot.policy = slot.policy->replacedBy(policy);

			const WidgetId id(index, slot.generation);
			enforce(target, *slot.policy);
			return id;
		}

		// the control that was registered at this address has been destroyed
		releaseSlot(index);
	}

	uint32_t index;
	if (!freeSlots_.empty()) {
		index = freeSlots_.back();
		freeSlots_.pop_back();
	} else {
		index = static_cast<uint32_t>(slots_.size());
		slots_.emplace_back();
	}

	Slot &slot  = slots_[index];
	slot.key    = target;
	slot.target = target;
	slot.policy = policy;
	slotIndex_.emplace(target, index);

	const WidgetId id(index, slot.generation);
	enforce(target, policy);
	return id;
}

/**
 * @brief Unregisters a control. Its current sensitivity and visibility are left as they are.
 *
 * @param id The handle returned when the control was registered.
 *
 * @throws NotRegisteredError if `id` is null, stale or was already removed.
 */
void Enforcer::removeWidget(WidgetId id) {
	if (!findSlot(id)) {
		Raise<NotRegisteredError>(id);
	}

	releaseSlot(id.index());
}

/**
 * @brief Updates the current conditions and re-applies every registered policy.
 *
 * Applying the same change twice has the same effect as applying it once.
 *
 * @param change The conditions that changed and their new values.
 */
void Enforcer::applyChangedCondns(const Change &change) {

	if (!change.isValid()) {
		qWarning("SavKit: change sets conditions outside of its mask (mask %s, values %s)",
				 qPrintable(ToString(change.changedCondns())),
				 qPrintable(ToString(change.newValues())));
	}

	current_ = change.applyTo(current_);

	// NOTE: indexing rather than iterating, a control's handlers may register
	// further controls while we are enforcing
	for (size_t i = 0; i < slots_.size(); ++i) {
		if (!slots_[i].policy) {
			continue;
		}

		if (!slots_[i].target) {
			qDebug("SavKit: reclaiming slot %zu, its control was destroyed without being removed", i);
			releaseSlot(static_cast<uint32_t>(i));
			continue;
		}

		enforce(slots_[i].target.data(), *slots_[i].policy);
	}
}

/**
 * @brief Checks whether a handle refers to a live registration.
 *
 * @param id The handle to check.
 * @return true if removing `id` would succeed.
 */
bool Enforcer::isRegistered(WidgetId id) const {
	return findSlot(id) != nullptr;
}

/**
 * @brief Gets the policy currently in effect for a registered control.
 *
 * @param id The control's handle.
 * @return The merged policy, or an empty optional if `id` is not registered.
 */
std::optional<Policy> Enforcer::policy(WidgetId id) const {
	if (const Slot *slot = findSlot(id)) {
		return slot->policy;
	}

	return {};
}

const Enforcer::Slot *Enforcer::findSlot(WidgetId id) const {
	if (id.isNull() || id.index() >= slots_.size()) {
		return nullptr;
	}

	const Slot &slot = slots_[id.index()];
	if (!slot.policy || slot.generation != id.generation()) {
		return nullptr;
	}

	return &slot;
}

void Enforcer::releaseSlot(uint32_t index) {
	Slot &slot = slots_[index];

	auto it = slotIndex_.find(slot.key);
	if (it != slotIndex_.end() && it->second == index) {
		slotIndex_.erase(it);
	}

	slot.key = nullptr;
	slot.target.clear();
	slot.policy.reset();

	// skip 0 on wrap around, it is reserved for null handles
	if (++slot.generation == 0) {
		slot.generation = 1;
	}

	freeSlots_.push_back(index);
}

void Enforcer::enforce(QObject *target, Policy policy) const {

	const std::optional<Condns> &sensitivity = policy.sensitivity();
	const std::optional<Condns> &visibility  = policy.visibility();

	// NOTE: handlers run by setEnabled may destroy the control
	QPointer<QObject> guard(target);

	if (auto widget = qobject_cast<QWidget *>(target)) {
		if (sensitivity) {
			widget->setEnabled(current_.isSupersetOf(*sensitivity));
		}

		if (visibility && guard) {
			widget->setVisible(current_.isSupersetOf(*visibility));
		}
	} else if (auto action = qobject_cast<QAction *>(target)) {
		if (sensitivity) {
			action->setEnabled(current_.isSupersetOf(*sensitivity));
		}

		if (visibility && guard) {
			action->setVisible(current_.isSupersetOf(*visibility));
		}
	}
}

}
