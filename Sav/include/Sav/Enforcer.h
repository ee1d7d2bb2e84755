
#ifndef SAV_ENFORCER_H_
#define SAV_ENFORCER_H_

#include "Sav/Change.h"
#include "Sav/Condns.h"
#include "Sav/Policy.h"
#include "Sav/WidgetId.h"

#include <QPointer>

#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

class QAction;
class QObject;
class QWidget;

namespace Sav {

/**
 * @brief Keeps the sensitivity and visibility of a dynamic set of controls in
 * step with the application's current conditions.
 *
 * The enforcer does not own the controls it manages; they belong to their
 * parent widgets. It is meant to be shared (via std::shared_ptr) between the
 * owner of a UI tree and the signal handlers that report condition changes,
 * all on the GUI thread.
 */
class Enforcer {
public:
	explicit Enforcer(Condns initial = DONT_CARE);
	Enforcer(const Enforcer &)            = delete;
	Enforcer &operator=(const Enforcer &) = delete;
	~Enforcer()                           = default;

public:
	static std::shared_ptr<Enforcer> withInitialCondns(Condns initial);

public:
	WidgetId addWidget(QWidget *widget, const Policy &policy);
	WidgetId addAction(QAction *action, const Policy &policy);
	void removeWidget(WidgetId id);
	void applyChangedCondns(const Change &change);

public:
	bool isRegistered(WidgetId id) const;
	std::optional<Policy> policy(WidgetId id) const;
	Condns currentCondns() const { return current_; }
	size_t size() const { return slots_.size() - freeSlots_.size(); }

private:
	struct Slot {
		const QObject *key = nullptr;
		QPointer<QObject> target;
		std::optional<Policy> policy;
		uint32_t generation = 1;
	};

private:
	WidgetId addTarget(QObject *target, const Policy &policy);
	const Slot *findSlot(WidgetId id) const;
	void releaseSlot(uint32_t index);
	void enforce(QObject *target, Policy policy) const;

private:
	std::vector<Slot> slots_;
	std::vector<uint32_t> freeSlots_;
	std::unordered_map<const QObject *, uint32_t> slotIndex_;
	Condns current_;
};

}

#endif
