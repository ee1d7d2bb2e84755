
#include "Sav/Conditions.h"

#include <QItemSelectionModel>
#include <QModelIndex>

#include <algorithm>
#include <vector>

namespace Sav {

namespace {

Condns SelectionCondns(int rows) {
	switch (rows) {
	case 0:
		return SELN_NONE;
	case 1:
		return SELN_MADE | SELN_UNIQUE | SELN_MADE_OR_HOVER_OK | SELN_UNIQUE_OR_HOVER_OK;
	case 2:
		return SELN_MADE | SELN_PAIR | SELN_MADE_OR_HOVER_OK;
	default:
		return SELN_MADE | SELN_MADE_OR_HOVER_OK;
	}
}

}

/**
 * @brief Counts the distinct rows that have at least one selected item.
 *
 * @param selection The selection model to inspect, may be nullptr.
 * @return The number of selected rows, 0 if `selection` is nullptr.
 */
int CountSelectedRows(const QItemSelectionModel *selection) {

	if (!selection) {
		return 0;
	}

	const QModelIndexList indexes = selection->selectedIndexes();

	std::vector<QModelIndex> rows;
	rows.reserve(static_cast<size_t>(indexes.size()));

	for (const QModelIndex &index : indexes) {
		rows.push_back(index.sibling(index.row(), 0));
	}

	std::sort(rows.begin(), rows.end());
	rows.erase(std::unique(rows.begin(), rows.end()), rows.end());
	return static_cast<int>(rows.size());
}

/**
 * @brief Describes the state of a selection as a change to the selection conditions.
 *
 * @param selection The selection model to inspect, may be nullptr.
 * @return A change covering SELN_CONDITIONS.
 */
Change SelectionChange(const QItemSelectionModel *selection) {
	return Change(SELN_CONDITIONS, SelectionCondns(CountSelectedRows(selection)));
}

/**
 * @brief Describes the state of a selection and of the mouse hover as a change.
 *
 * When nothing is selected but the mouse is over an item, the hovered item
 * can stand in for the selection so the "or hover ok" conditions are set.
 *
 * @param selection The selection model to inspect, may be nullptr.
 * @param hoverOk Whether the mouse is over a valid item.
 * @return A change covering SELN_CONDITIONS and HOVER_CONDITIONS.
 */
Change SelectionChange(const QItemSelectionModel *selection, bool hoverOk) {

	Condns condns = SelectionCondns(CountSelectedRows(selection));

	if (hoverOk && condns.isSupersetOf(SELN_NONE)) {
		condns |= SELN_MADE_OR_HOVER_OK | SELN_UNIQUE_OR_HOVER_OK | SELN_NONE_BUT_HOVER_OK;
	}

	condns |= HoverChange(hoverOk).newValues();
	return Change(SELN_CONDITIONS | HOVER_CONDITIONS, condns);
}

/**
 * @brief Describes the mouse hover state as a change.
 *
 * @param hoverOk Whether the mouse is over a valid item.
 * @return A change covering HOVER_CONDITIONS.
 */
Change HoverChange(bool hoverOk) {
	return Change(HOVER_CONDITIONS, hoverOk ? HOVER_OK : HOVER_NOT_OK);
}

}
