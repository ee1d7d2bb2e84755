
#ifndef RECOLLECTIONS_H_
#define RECOLLECTIONS_H_

#include <QString>

#include <optional>

// Lets widgets remember configuration data (size, position, etc.) from one
// session to the next. Until Init() has been given a file, nothing is
// recalled and nothing is remembered.
namespace Recollections {

void Init(const QString &filename);
QString DataFile();

std::optional<QString> Recall(const QString &name);
QString RecallOrElse(const QString &name, const QString &defaultValue);
void Remember(const QString &name, const QString &value);

}

#endif
