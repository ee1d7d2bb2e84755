#ifndef MAIN_WINDOW_H_
#define MAIN_WINDOW_H_

#include "Sav/Change.h"
#include "Sav/Enforcer.h"

#include <QMainWindow>
#include <QPersistentModelIndex>

#include <memory>

#include "ui_MainWindow.h"

class MainWindow final : public QMainWindow {
	Q_OBJECT

public:
	explicit MainWindow(QWidget *parent = nullptr, Qt::WindowFlags flags = Qt::WindowFlags());
	~MainWindow() override = default;

public:
	std::shared_ptr<Sav::Enforcer> enforcer() const { return enforcer_; }

private:
	void applyChange(const Sav::Change &change);
	void connectSlots();
	void recallGeometry();
	void registerControls();
	void updateDetails();
	QListWidgetItem *targetItem() const;

private:
	void checkA_toggled(bool checked);
	void checkB_toggled(bool checked);
	void listItems_selectionChanged();
	void listItems_customContextMenuRequested(const QPoint &pos);
	void action_Remove_triggered();
	void action_Rename_triggered();
	void action_Compare_triggered();
	void action_Inspect_triggered();

public:
	Ui::MainWindow ui;

private:
	std::shared_ptr<Sav::Enforcer> enforcer_;
	QPersistentModelIndex hoverIndex_;
};

#endif
