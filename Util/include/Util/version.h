
#ifndef VERSION_H_
#define VERSION_H_

constexpr auto SAVKIT_VERSION_MAJ = 2026;
constexpr auto SAVKIT_VERSION_REV = 1;
constexpr auto SAVKIT_VERSION     = (SAVKIT_VERSION_MAJ * 1000 + SAVKIT_VERSION_REV);

#endif
