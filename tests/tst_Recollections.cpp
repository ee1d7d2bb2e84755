
#include "Recollections/Recollections.h"
#include "Recollections/WidgetRecollections.h"

#include <QFile>
#include <QResizeEvent>
#include <QSplitter>
#include <QTemporaryDir>
#include <QWidget>
#include <QtTest>

#include <memory>

class TestRecollections : public QObject {
	Q_OBJECT

private Q_SLOTS:
	void init();
	void cleanup();
	void disabledWithoutFile();
	void initCreatesFile();
	void rememberAndRecall();
	void survivesReinit();
	void unreadableFileIsLeftAlone();
	void parseSize();
	void parseSizes();
	void windowSizeDefault();
	void windowSizeRestored();
	void windowSizeRemembered();
	void windowSizeMalformed();
	void splitterSizes();
	void splitterSizesWrongCount();

private:
	QString dataFile() const { return dir_->filePath(QStringLiteral("config/recollections.yaml")); }

private:
	std::unique_ptr<QTemporaryDir> dir_;
};

void TestRecollections::init() {
	dir_ = std::make_unique<QTemporaryDir>();
	QVERIFY(dir_->isValid());
	Recollections::Init(dataFile());
}

void TestRecollections::cleanup() {
	Recollections::Init(QString());
	dir_.reset();
}

void TestRecollections::disabledWithoutFile() {
	Recollections::Init(QString());
	QVERIFY(Recollections::DataFile().isEmpty());

	Recollections::Remember(QStringLiteral("key"), QStringLiteral("value"));
	QVERIFY(!Recollections::Recall(QStringLiteral("key")));
	QCOMPARE(Recollections::RecallOrElse(QStringLiteral("key"), QStringLiteral("fallback")), QStringLiteral("fallback"));
}

void TestRecollections::initCreatesFile() {
	QCOMPARE(Recollections::DataFile(), dataFile());
	QVERIFY(QFile::exists(dataFile()));
	QVERIFY(!Recollections::Recall(QStringLiteral("anything")));
}

void TestRecollections::rememberAndRecall() {
	Recollections::Remember(QStringLiteral("main::window::last_size"), QStringLiteral("640x480"));
	Recollections::Remember(QStringLiteral("name with spaces: and colon"), QStringLiteral("value, with comma"));

	QCOMPARE(Recollections::Recall(QStringLiteral("main::window::last_size")).value_or(QString()), QStringLiteral("640x480"));
	QCOMPARE(Recollections::RecallOrElse(QStringLiteral("name with spaces: and colon"), QString()), QStringLiteral("value, with comma"));
	QCOMPARE(Recollections::RecallOrElse(QStringLiteral("missing"), QStringLiteral("fallback")), QStringLiteral("fallback"));

	// later values replace earlier ones
	Recollections::Remember(QStringLiteral("main::window::last_size"), QStringLiteral("800x600"));
	QCOMPARE(Recollections::RecallOrElse(QStringLiteral("main::window::last_size"), QString()), QStringLiteral("800x600"));
}

void TestRecollections::survivesReinit() {
	Recollections::Remember(QStringLiteral("key"), QStringLiteral("value"));

	Recollections::Init(QString());
	QVERIFY(!Recollections::Recall(QStringLiteral("key")));

	// as at the start of a new session
	Recollections::Init(dataFile());
	QCOMPARE(Recollections::RecallOrElse(QStringLiteral("key"), QString()), QStringLiteral("value"));
}

void TestRecollections::unreadableFileIsLeftAlone() {
	{
		QFile file(dataFile());
		QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
		file.write("- just\n- a list\n");
	}

	const QByteArray expected = QStringLiteral("SavKit: %1 does not contain a mapping").arg(dataFile()).toLocal8Bit();

	QTest::ignoreMessage(QtWarningMsg, expected.constData());
	QVERIFY(!Recollections::Recall(QStringLiteral("key")));

	QTest::ignoreMessage(QtWarningMsg, expected.constData());
	QTest::ignoreMessage(QtWarningMsg, "SavKit: not remembering key");
	Recollections::Remember(QStringLiteral("key"), QStringLiteral("value"));

	QFile file(dataFile());
	QVERIFY(file.open(QIODevice::ReadOnly));
	QCOMPARE(file.readAll(), QByteArray("- just\n- a list\n"));
}

void TestRecollections::parseSize() {
	QCOMPARE(Recollections::ParseSize(QStringLiteral("640x480")).value_or(QSize()), QSize(640, 480));
	QCOMPARE(Recollections::ParseSize(Recollections::FormatSize(QSize(12, 34))).value_or(QSize()), QSize(12, 34));
	QVERIFY(!Recollections::ParseSize(QStringLiteral("640")));
	QVERIFY(!Recollections::ParseSize(QStringLiteral("x")));
	QVERIFY(!Recollections::ParseSize(QStringLiteral("0x480")));
	QVERIFY(!Recollections::ParseSize(QStringLiteral("-1x5")));
	QVERIFY(!Recollections::ParseSize(QStringLiteral("1x2x3")));
}

void TestRecollections::parseSizes() {
	QCOMPARE(Recollections::FormatSizes({100, 0, 250}), QStringLiteral("100,0,250"));
	QCOMPARE(Recollections::ParseSizes(QStringLiteral("100, 0,250")).value_or(QList<int>()), QList<int>({100, 0, 250}));
	QVERIFY(!Recollections::ParseSizes(QStringLiteral("1,,2")));
	QVERIFY(!Recollections::ParseSizes(QStringLiteral("1,-2")));
	QVERIFY(!Recollections::ParseSizes(QString()));
}

void TestRecollections::windowSizeDefault() {
	QWidget window;
	QCOMPARE(Recollections::RecallWindowSize(&window, QStringLiteral("test"), QSize(320, 200)), QSize(320, 200));
	QCOMPARE(window.size(), QSize(320, 200));
}

void TestRecollections::windowSizeRestored() {
	Recollections::Remember(Recollections::WindowSizeKey(QStringLiteral("test")), QStringLiteral("333x222"));

	QWidget window;
	QCOMPARE(Recollections::RecallWindowSize(&window, QStringLiteral("test"), QSize(320, 200)), QSize(333, 222));
	QCOMPARE(window.size(), QSize(333, 222));
}

void TestRecollections::windowSizeRemembered() {
	QWidget window;
	Recollections::RecallWindowSize(&window, QStringLiteral("test"), QSize(320, 200));

	QResizeEvent event(QSize(321, 123), window.size());
	QCoreApplication::sendEvent(&window, &event);

	QCOMPARE(Recollections::RecallOrElse(QStringLiteral("test::window::last_size"), QString()), QStringLiteral("321x123"));
}

void TestRecollections::windowSizeMalformed() {
	Recollections::Remember(Recollections::WindowSizeKey(QStringLiteral("test")), QStringLiteral("bogus"));

	QWidget window;
	QTest::ignoreMessage(QtWarningMsg, "SavKit: error parsing \"bogus\" for \"test::window::last_size\"");
	QCOMPARE(Recollections::RecallWindowSize(&window, QStringLiteral("test"), QSize(320, 200)), QSize(320, 200));
}

void TestRecollections::splitterSizes() {
	QSplitter splitter;
	splitter.addWidget(new QWidget);
	splitter.addWidget(new QWidget);

	Recollections::Remember(QStringLiteral("test::splitter::last_sizes"), QStringLiteral("100,200"));
	QCOMPARE(Recollections::RecallSplitterSizes(&splitter, QStringLiteral("test"), {50, 50}), QList<int>({100, 200}));

	Recollections::Remember(QStringLiteral("test::splitter::last_sizes"), QStringLiteral("stale"));
	Q_EMIT splitter.splitterMoved(10, 1);

	const std::optional<QString> stored = Recollections::Recall(QStringLiteral("test::splitter::last_sizes"));
	QVERIFY(stored);
	QVERIFY(*stored != QStringLiteral("stale"));

	const std::optional<QList<int>> sizes = Recollections::ParseSizes(*stored);
	QVERIFY(sizes);
	QCOMPARE(static_cast<int>(sizes->size()), splitter.count());
}

void TestRecollections::splitterSizesWrongCount() {
	QSplitter splitter;
	splitter.addWidget(new QWidget);
	splitter.addWidget(new QWidget);

	Recollections::Remember(QStringLiteral("test::splitter::last_sizes"), QStringLiteral("1,2,3"));

	QTest::ignoreMessage(QtWarningMsg, "SavKit: error parsing \"1,2,3\" for \"test::splitter::last_sizes\"");
	QCOMPARE(Recollections::RecallSplitterSizes(&splitter, QStringLiteral("test"), {50, 50}), QList<int>({50, 50}));
}

QTEST_MAIN(TestRecollections)

#include "tst_Recollections.moc"
