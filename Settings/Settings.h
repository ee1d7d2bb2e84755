#ifndef SETTINGS_H_
#define SETTINGS_H_

#include <QString>

namespace Settings {

void Load();
bool Save();

// Paths
QString ConfigDirectory();
QString ConfigFile();
QString RecollectionsFile();

// Standard
extern bool rememberGeometry;
extern bool startWithAActive;
extern bool startWithBActive;

}

#endif
