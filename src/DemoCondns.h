
#ifndef DEMO_CONDNS_H_
#define DEMO_CONDNS_H_

#include "Sav/Conditions.h"
#include "Sav/Condns.h"

// Conditions owned by the demo. Each ACTIVE/INACTIVE pair is kept mutually
// exclusive by the handlers that change it.
constexpr Sav::Condns A_ACTIVE{Sav::NEXT_FLAG};
constexpr Sav::Condns A_INACTIVE{Sav::NEXT_FLAG << 1};
constexpr Sav::Condns B_ACTIVE{Sav::NEXT_FLAG << 2};
constexpr Sav::Condns B_INACTIVE{Sav::NEXT_FLAG << 3};

constexpr Sav::Condns A_CONDITIONS = A_ACTIVE | A_INACTIVE;
constexpr Sav::Condns B_CONDITIONS = B_ACTIVE | B_INACTIVE;

#endif
