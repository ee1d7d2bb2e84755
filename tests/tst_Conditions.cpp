
#include "Sav/Conditions.h"

#include <QItemSelectionModel>
#include <QStandardItemModel>
#include <QtTest>

using Sav::Change;
using Sav::Condns;

class TestConditions : public QObject {
	Q_OBJECT

private Q_SLOTS:
	void init();
	void cleanup();
	void bitsDoNotOverlap();
	void countsDistinctRows();
	void nullSelection();
	void selectionConditions();
	void selectionWithHover();
	void hover();

private:
	void selectRows(std::initializer_list<int> rows);

private:
	QStandardItemModel *model_      = nullptr;
	QItemSelectionModel *selection_ = nullptr;
};

void TestConditions::init() {
	model_ = new QStandardItemModel(5, 3, this);
	for (int row = 0; row < model_->rowCount(); ++row) {
		for (int column = 0; column < model_->columnCount(); ++column) {
			model_->setItem(row, column, new QStandardItem(QStringLiteral("%1,%2").arg(row).arg(column)));
		}
	}

	selection_ = new QItemSelectionModel(model_, this);
}

void TestConditions::cleanup() {
	delete selection_;
	delete model_;
	selection_ = nullptr;
	model_     = nullptr;
}

void TestConditions::selectRows(std::initializer_list<int> rows) {
	for (int row : rows) {
		selection_->select(model_->index(row, 0), QItemSelectionModel::Select | QItemSelectionModel::Rows);
	}
}

void TestConditions::bitsDoNotOverlap() {
	QVERIFY((Sav::SELN_CONDITIONS & Sav::HOVER_CONDITIONS).isEmpty());
	QVERIFY(Sav::SELN_CONDITIONS.isSupersetOf(Sav::SELN_NONE | Sav::SELN_MADE | Sav::SELN_UNIQUE | Sav::SELN_PAIR));
	QVERIFY(Sav::SELN_CONDITIONS.isSupersetOf(Sav::SELN_MADE_OR_HOVER_OK | Sav::SELN_UNIQUE_OR_HOVER_OK | Sav::SELN_NONE_BUT_HOVER_OK));
	QVERIFY(((Sav::SELN_CONDITIONS | Sav::HOVER_CONDITIONS) & Condns(Sav::NEXT_FLAG)).isEmpty());
	QCOMPARE(Sav::NEXT_FLAG, (Sav::SELN_CONDITIONS | Sav::HOVER_CONDITIONS).value() + 1);
}

void TestConditions::countsDistinctRows() {
	QCOMPARE(Sav::CountSelectedRows(selection_), 0);

	// several cells of one row are one row
	selection_->select(model_->index(1, 0), QItemSelectionModel::Select);
	selection_->select(model_->index(1, 2), QItemSelectionModel::Select);
	QCOMPARE(Sav::CountSelectedRows(selection_), 1);

	selectRows({3});
	QCOMPARE(Sav::CountSelectedRows(selection_), 2);

	selectRows({0, 4});
	QCOMPARE(Sav::CountSelectedRows(selection_), 4);
}

void TestConditions::nullSelection() {
	QCOMPARE(Sav::CountSelectedRows(nullptr), 0);
	QCOMPARE(Sav::SelectionChange(nullptr), Change(Sav::SELN_CONDITIONS, Sav::SELN_NONE));
}

void TestConditions::selectionConditions() {
	const Change none = Sav::SelectionChange(selection_);
	QVERIFY(none.isValid());
	QCOMPARE(none.changedCondns(), Sav::SELN_CONDITIONS);
	QCOMPARE(none.newValues(), Sav::SELN_NONE);

	selectRows({2});
	QCOMPARE(Sav::SelectionChange(selection_).newValues(),
			 Sav::SELN_MADE | Sav::SELN_UNIQUE | Sav::SELN_MADE_OR_HOVER_OK | Sav::SELN_UNIQUE_OR_HOVER_OK);

	selectRows({4});
	QCOMPARE(Sav::SelectionChange(selection_).newValues(),
			 Sav::SELN_MADE | Sav::SELN_PAIR | Sav::SELN_MADE_OR_HOVER_OK);

	selectRows({0});
	QCOMPARE(Sav::SelectionChange(selection_).newValues(),
			 Sav::SELN_MADE | Sav::SELN_MADE_OR_HOVER_OK);

	// the rest of the condition set is untouched
	const Condns application(Sav::NEXT_FLAG);
	const Condns updated = Sav::SelectionChange(selection_).applyTo(application | Sav::SELN_NONE | Sav::HOVER_OK);
	QCOMPARE(updated, application | Sav::HOVER_OK | Sav::SELN_MADE | Sav::SELN_MADE_OR_HOVER_OK);
}

void TestConditions::selectionWithHover() {
	const Condns hoverOnly = Sav::SELN_NONE | Sav::SELN_MADE_OR_HOVER_OK | Sav::SELN_UNIQUE_OR_HOVER_OK | Sav::SELN_NONE_BUT_HOVER_OK;

	const Change hovering = Sav::SelectionChange(selection_, true);
	QVERIFY(hovering.isValid());
	QCOMPARE(hovering.changedCondns(), Sav::SELN_CONDITIONS | Sav::HOVER_CONDITIONS);
	QCOMPARE(hovering.newValues(), hoverOnly | Sav::HOVER_OK);

	QCOMPARE(Sav::SelectionChange(selection_, false).newValues(), Sav::SELN_NONE | Sav::HOVER_NOT_OK);

	// a real selection takes precedence over the hovered item
	selectRows({1, 2});
	QCOMPARE(Sav::SelectionChange(selection_, true).newValues(),
			 Sav::SELN_MADE | Sav::SELN_PAIR | Sav::SELN_MADE_OR_HOVER_OK | Sav::HOVER_OK);
}

void TestConditions::hover() {
	QCOMPARE(Sav::HoverChange(true), Change(Sav::HOVER_CONDITIONS, Sav::HOVER_OK));
	QCOMPARE(Sav::HoverChange(false), Change(Sav::HOVER_CONDITIONS, Sav::HOVER_NOT_OK));

	const Condns current = Sav::HoverChange(true).applyTo(Sav::HOVER_NOT_OK | Sav::SELN_NONE);
	QCOMPARE(current, Sav::HOVER_OK | Sav::SELN_NONE);
}

QTEST_MAIN(TestConditions)

#include "tst_Conditions.moc"
