
#ifndef ENVIRONMENT_H
#define ENVIRONMENT_H

#include <QString>

#include <optional>

std::optional<QString> GetEnvironmentVariable(const char *name);

#endif
