#include "MainWindow.h"
#include "DemoCondns.h"
#include "Recollections/WidgetRecollections.h"
#include "Sav/Conditions.h"
#include "Sav/Policy.h"
#include "Settings.h"

#include <QInputDialog>
#include <QMenu>
#include <QMessageBox>

/**
 * @brief Constructor for the MainWindow class.
 *
 * @param parent The parent widget, defaults to nullptr.
 * @param flags The window flags, defaults to Qt::WindowFlags().
 */
MainWindow::MainWindow(QWidget *parent, Qt::WindowFlags flags)
	: QMainWindow(parent, flags) {

	ui.setupUi(this);

	const Sav::Condns initial = (Settings::startWithAActive ? A_ACTIVE : A_INACTIVE) |
								(Settings::startWithBActive ? B_ACTIVE : B_INACTIVE);

	enforcer_ = Sav::Enforcer::withInitialCondns(initial);

	// NOTE: set before the slots are connected, the enforcer already knows
	ui.checkA->setChecked(Settings::startWithAActive);
	ui.checkB->setChecked(Settings::startWithBActive);

	ui.listItems->addItems({
		tr("alpha"),
		tr("beta"),
		tr("gamma"),
		tr("delta"),
	});

	connectSlots();
	registerControls();
	applyChange(Sav::SelectionChange(ui.listItems->selectionModel(), false));

	if (Settings::rememberGeometry) {
		recallGeometry();
	}
}

/**
 * @brief Connects the slots for the window's controls and actions.
 */
void MainWindow::connectSlots() {
	connect(ui.checkA, &QCheckBox::toggled, this, &MainWindow::checkA_toggled);
	connect(ui.checkB, &QCheckBox::toggled, this, &MainWindow::checkB_toggled);
	connect(ui.listItems->selectionModel(), &QItemSelectionModel::selectionChanged, this, &MainWindow::listItems_selectionChanged);
	connect(ui.listItems, &QListWidget::customContextMenuRequested, this, &MainWindow::listItems_customContextMenuRequested);
	connect(ui.action_Quit, &QAction::triggered, this, &MainWindow::close);
	connect(ui.action_Remove, &QAction::triggered, this, &MainWindow::action_Remove_triggered);
	connect(ui.action_Rename, &QAction::triggered, this, &MainWindow::action_Rename_triggered);
	connect(ui.action_Compare, &QAction::triggered, this, &MainWindow::action_Compare_triggered);
	connect(ui.action_Inspect, &QAction::triggered, this, &MainWindow::action_Inspect_triggered);
}

/**
 * @brief Hands the controls whose state depends on the current conditions to the enforcer.
 */
void MainWindow::registerControls() {
	// handles stay usable for removal, a removed control can be handed back later
	const Sav::WidgetId buttonA = enforcer_->addWidget(ui.buttonA, Sav::Policy::Sensitivity(A_ACTIVE));
	enforcer_->removeWidget(buttonA);
	enforcer_->addWidget(ui.buttonA, Sav::Policy::Sensitivity(A_ACTIVE));

	enforcer_->addWidget(ui.checkBNotA, Sav::Policy::Sensitivity(A_INACTIVE | B_ACTIVE));

	enforcer_->addAction(ui.action_Remove, Sav::Policy::Sensitivity(Sav::SELN_MADE));
	enforcer_->addAction(ui.action_Rename, Sav::Policy::Sensitivity(Sav::SELN_UNIQUE));
	enforcer_->addAction(ui.action_Compare, Sav::Policy::Sensitivity(Sav::SELN_PAIR));
	enforcer_->addAction(ui.action_Inspect, Sav::Policy::Sensitivity(Sav::SELN_UNIQUE_OR_HOVER_OK));

	enforcer_->addWidget(ui.groupDetails, Sav::Policy::Visibility(Sav::SELN_UNIQUE));
}

/**
 * @brief Restores the window and splitter sizes from the last session.
 */
void MainWindow::recallGeometry() {
	Recollections::RecallWindowSize(this, QLatin1String("savkit_demo"), QSize(480, 360));
	Recollections::RecallSplitterSizes(ui.splitter, QLatin1String("savkit_demo"), {240, 240});
}

/**
 * @brief Reports a change of conditions to the enforcer.
 *
 * @param change The conditions that changed and their new values.
 */
void MainWindow::applyChange(const Sav::Change &change) {
	enforcer_->applyChangedCondns(change);
	ui.statusbar->showMessage(tr("Conditions: %1").arg(Sav::ToString(enforcer_->currentCondns())));
}

void MainWindow::checkA_toggled(bool checked) {
	applyChange(Sav::Change(A_CONDITIONS, checked ? A_ACTIVE : A_INACTIVE));
}

void MainWindow::checkB_toggled(bool checked) {
	applyChange(Sav::Change(B_CONDITIONS, checked ? B_ACTIVE : B_INACTIVE));
}

void MainWindow::listItems_selectionChanged() {
	applyChange(Sav::SelectionChange(ui.listItems->selectionModel(), false));
	updateDetails();
}

/**
 * @brief Pops up the item menu, letting the item under the mouse stand in for
 * the selection when nothing is selected.
 *
 * @param pos The position of the request in list coordinates.
 */
void MainWindow::listItems_customContextMenuRequested(const QPoint &pos) {

	hoverIndex_ = ui.listItems->indexAt(pos);
	applyChange(Sav::SelectionChange(ui.listItems->selectionModel(), hoverIndex_.isValid()));

	QMenu menu(this);
	menu.addAction(ui.action_Inspect);
	menu.addSeparator();
	menu.addAction(ui.action_Rename);
	menu.addAction(ui.action_Compare);
	menu.addAction(ui.action_Remove);
	menu.exec(ui.listItems->viewport()->mapToGlobal(pos));

	hoverIndex_ = QPersistentModelIndex();
	applyChange(Sav::SelectionChange(ui.listItems->selectionModel(), false));
}

/**
 * @brief Gets the item that single item actions apply to.
 *
 * @return The only selected item, otherwise the item under the mouse when the
 * context menu was opened, otherwise nullptr.
 */
QListWidgetItem *MainWindow::targetItem() const {
	const QList<QListWidgetItem *> selected = ui.listItems->selectedItems();
	if (selected.size() == 1) {
		return selected.front();
	}

	if (selected.isEmpty() && hoverIndex_.isValid()) {
		return ui.listItems->item(hoverIndex_.row());
	}

	return nullptr;
}

void MainWindow::updateDetails() {
	const QList<QListWidgetItem *> selected = ui.listItems->selectedItems();
	if (selected.size() == 1) {
		ui.labelDetails->setText(tr("Row %1: %2").arg(ui.listItems->row(selected.front())).arg(selected.front()->text()));
	} else {
		ui.labelDetails->clear();
	}
}

void MainWindow::action_Remove_triggered() {
	qDeleteAll(ui.listItems->selectedItems());

	// NOTE: removing rows does not emit selectionChanged
	listItems_selectionChanged();
}

void MainWindow::action_Rename_triggered() {
	QListWidgetItem *item = targetItem();
	if (!item) {
		return;
	}

	bool ok;
	const QString name = QInputDialog::getText(this, tr("Rename"), tr("New name:"), QLineEdit::Normal, item->text(), &ok);
	if (ok && !name.isEmpty()) {
		item->setText(name);
		updateDetails();
	}
}

void MainWindow::action_Compare_triggered() {
	const QList<QListWidgetItem *> selected = ui.listItems->selectedItems();
	if (selected.size() != 2) {
		return;
	}

	const QString first  = selected[0]->text();
	const QString second = selected[1]->text();

	if (first == second) {
		QMessageBox::information(this, tr("Compare"), tr("\"%1\" and \"%2\" are the same").arg(first, second));
	} else {
		QMessageBox::information(this, tr("Compare"), tr("\"%1\" and \"%2\" differ").arg(first, second));
	}
}

void MainWindow::action_Inspect_triggered() {
	QListWidgetItem *item = targetItem();
	if (!item) {
		return;
	}

	QMessageBox::information(this, tr("Inspect"), tr("Row %1: %2").arg(ui.listItems->row(item)).arg(item->text()));
}
