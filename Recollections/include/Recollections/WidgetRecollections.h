
#ifndef WIDGET_RECOLLECTIONS_H_
#define WIDGET_RECOLLECTIONS_H_

#include <QList>
#include <QSize>
#include <QString>

#include <optional>

class QSplitter;
class QWidget;

namespace Recollections {

QString WindowSizeKey(const QString &name);
QString SplitterSizesKey(const QString &name);

QString FormatSize(const QSize &size);
std::optional<QSize> ParseSize(const QString &text);
QString FormatSizes(const QList<int> &sizes);
std::optional<QList<int>> ParseSizes(const QString &text);

QSize RecallWindowSize(QWidget *window, const QString &name, const QSize &defaultSize);
QList<int> RecallSplitterSizes(QSplitter *splitter, const QString &name, const QList<int> &defaultSizes);

}

#endif
