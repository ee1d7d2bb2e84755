
#include "Recollections/WidgetRecollections.h"
#include "Recollections/Recollections.h"

#include <QEvent>
#include <QResizeEvent>
#include <QSplitter>
#include <QStringList>
#include <QWidget>
#include <QtDebug>

namespace Recollections {

namespace {

// Remembers the size of the widget it is installed on whenever it is resized.
class SizeRecorder : public QObject {
public:
	SizeRecorder(const QString &key, QObject *parent)
		: QObject(parent), key_(key) {
	}

protected:
	bool eventFilter(QObject *watched, QEvent *event) override {
		if (event->type() == QEvent::Resize) {
			auto resizeEvent = static_cast<QResizeEvent *>(event);
			Remember(key_, FormatSize(resizeEvent->size()));
		}

		return QObject::eventFilter(watched, event);
	}

private:
	QString key_;
};

}

QString WindowSizeKey(const QString &name) {
	return QStringLiteral("%1::window::last_size").arg(name);
}

QString SplitterSizesKey(const QString &name) {
	return QStringLiteral("%1::splitter::last_sizes").arg(name);
}

/**
 * @brief Formats a size as `WIDTHxHEIGHT`.
 */
QString FormatSize(const QSize &size) {
	return QStringLiteral("%1x%2").arg(size.width()).arg(size.height());
}

/**
 * @brief Parses a size written by FormatSize().
 *
 * @param text The text to parse.
 * @return The size, or an empty optional if `text` is not two positive
 * integers separated by an 'x'.
 */
std::optional<QSize> ParseSize(const QString &text) {

	const QStringList parts = text.split(QLatin1Char('x'));
	if (parts.size() != 2) {
		return {};
	}

	bool widthOk;
	bool heightOk;
	const int width  = parts[0].trimmed().toInt(&widthOk);
	const int height = parts[1].trimmed().toInt(&heightOk);

	if (!widthOk || !heightOk || width <= 0 || height <= 0) {
		return {};
	}

	return QSize(width, height);
}

/**
 * @brief Formats a list of pane sizes as a comma separated list.
 */
QString FormatSizes(const QList<int> &sizes) {
	QStringList parts;
	for (int size : sizes) {
		parts.append(QString::number(size));
	}
	return parts.join(QLatin1Char(','));
}

/**
 * @brief Parses a list of pane sizes written by FormatSizes().
 *
 * @param text The text to parse.
 * @return The sizes, or an empty optional if any entry is not a non-negative integer.
 */
std::optional<QList<int>> ParseSizes(const QString &text) {

	QList<int> sizes;
	const QStringList parts = text.split(QLatin1Char(','));
	for (const QString &part : parts) {
		bool ok;
		const int size = part.trimmed().toInt(&ok);
		if (!ok || size < 0) {
			return {};
		}
		sizes.append(size);
	}

	return sizes;
}

/**
 * @brief Resizes a window to its remembered size and keeps remembering its size.
 *
 * @param window The window to resize.
 * @param name The name the window's size is remembered under.
 * @param defaultSize The size to use when nothing usable is remembered.
 * @return The size the window was given.
 */
QSize RecallWindowSize(QWidget *window, const QString &name, const QSize &defaultSize) {

	const QString key = WindowSizeKey(name);

	QSize size = defaultSize;
	if (std::optional<QString> text = Recall(key)) {
		if (std::optional<QSize> lastSize = ParseSize(*text)) {
			size = *lastSize;
		} else {
			qWarning("SavKit: error parsing \"%s\" for \"%s\"", qPrintable(*text), qPrintable(key));
		}
	} else {
		qDebug("SavKit: %s: unknown", qPrintable(key));
	}

	window->resize(size);
	window->installEventFilter(new SizeRecorder(key, window));
	return size;
}

/**
 * @brief Restores a splitter's pane sizes and keeps remembering them as it is moved.
 *
 * @param splitter The splitter to restore.
 * @param name The name the pane sizes are remembered under.
 * @param defaultSizes The pane sizes to use when nothing usable is remembered.
 * @return The pane sizes the splitter was given.
 */
QList<int> RecallSplitterSizes(QSplitter *splitter, const QString &name, const QList<int> &defaultSizes) {

	const QString key = SplitterSizesKey(name);

	QList<int> sizes = defaultSizes;
	if (std::optional<QString> text = Recall(key)) {
		std::optional<QList<int>> lastSizes = ParseSizes(*text);
		if (lastSizes && lastSizes->size() == splitter->count()) {
			sizes = *lastSizes;
		} else {
			qWarning("SavKit: error parsing \"%s\" for \"%s\"", qPrintable(*text), qPrintable(key));
		}
	} else {
		qDebug("SavKit: %s: unknown", qPrintable(key));
	}

	splitter->setSizes(sizes);

	QObject::connect(splitter, &QSplitter::splitterMoved, splitter, [splitter, key]() {
		Remember(key, FormatSizes(splitter->sizes()));
	});

	return sizes;
}

}
