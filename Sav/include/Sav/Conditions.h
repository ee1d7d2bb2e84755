
#ifndef SAV_CONDITIONS_H_
#define SAV_CONDITIONS_H_

#include "Sav/Change.h"
#include "Sav/Condns.h"

#include <cstdint>

class QItemSelectionModel;

namespace Sav {

// Conditions describing an item view's selection, useful for tailoring pop up menus.
constexpr Condns SELN_NONE{1u << 0};
constexpr Condns SELN_MADE{1u << 1};
constexpr Condns SELN_UNIQUE{1u << 2};
constexpr Condns SELN_PAIR{1u << 3};
constexpr Condns SELN_MADE_OR_HOVER_OK{1u << 4};
constexpr Condns SELN_UNIQUE_OR_HOVER_OK{1u << 5};
constexpr Condns SELN_NONE_BUT_HOVER_OK{1u << 6};
constexpr Condns SELN_CONDITIONS{(1u << 7) - 1};

// Conditions for the mouse hovering over an item (or other area of interest).
constexpr Condns HOVER_OK{1u << 7};
constexpr Condns HOVER_NOT_OK{1u << 8};
constexpr Condns HOVER_CONDITIONS = HOVER_OK | HOVER_NOT_OK;

// The first bit available for application defined conditions.
constexpr uint64_t NEXT_FLAG = 1u << 9;

int CountSelectedRows(const QItemSelectionModel *selection);
Change SelectionChange(const QItemSelectionModel *selection);
Change SelectionChange(const QItemSelectionModel *selection, bool hoverOk);
Change HoverChange(bool hoverOk);

}

#endif
