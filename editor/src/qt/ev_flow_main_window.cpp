#include "EvflEditor/editor/qt/ev_flow_main_window.hpp"
#include "EvflEditor/core/logger.hpp"
#include "EvflEditor/editor/qt/ev_dialogs.hpp"

#include <QAction>
#include <QCloseEvent>
#include <QFileDialog>
#include <QFileInfo>
#include <QKeySequence>
#include <QMenuBar>
#include <QStatusBar>

namespace EvflEditor::editor::qt {

EVFlowMainWindow::EVFlowMainWindow(EditorSettings &settings, EventBus &bus,
                                   QWidget *parent)
    : QMainWindow(parent), m_settings(settings), m_flowData(bus),
      m_document(m_flowData) {
  m_subscriptions.push_back(bus.subscribe<events::FlowDataChangedEvent>(
      [this](const events::FlowDataChangedEvent &) { updateTitle(); }));
  m_subscriptions.push_back(bus.subscribe<events::FlowSavedEvent>(
      [this](const events::FlowSavedEvent &) { updateTitle(); }));
}

EVFlowMainWindow::~EVFlowMainWindow() {
  for (const auto &sub : m_subscriptions) {
    m_flowData.bus().unsubscribe(sub);
  }
}

QMenu *EVFlowMainWindow::createFileMenu() {
  QMenu *fileMenu = menuBar()->addMenu(tr("&File"));

  QAction *openAction = fileMenu->addAction(tr("&Open..."));
  openAction->setShortcut(QKeySequence::Open);
  connect(openAction, &QAction::triggered, this,
          &EVFlowMainWindow::openFileDialog);

  QAction *saveAction = fileMenu->addAction(tr("&Save"));
  saveAction->setShortcut(QKeySequence::Save);
  connect(saveAction, &QAction::triggered, this, [this]() { save(); });

  QAction *saveAsAction = fileMenu->addAction(tr("Save &As..."));
  saveAsAction->setShortcut(QKeySequence::SaveAs);
  connect(saveAsAction, &QAction::triggered, this, [this]() { saveAs(); });

  fileMenu->addSeparator();

  QAction *exitAction = fileMenu->addAction(tr("E&xit"));
  exitAction->setShortcut(QKeySequence::Quit);
  connect(exitAction, &QAction::triggered, this, &QWidget::close);

  updateTitle();
  return fileMenu;
}

void EVFlowMainWindow::createHelpMenu() {
  QMenu *helpMenu = menuBar()->addMenu(tr("&Help"));
  QAction *aboutAction = helpMenu->addAction(tr("&About"));
  connect(aboutAction, &QAction::triggered, this, [this]() {
    EVMessageDialog::showInfo(this, tr("About %1").arg(applicationTitle()),
                              aboutText());
  });
}

bool EVFlowMainWindow::openFile(const QString &path) {
  auto opened = m_document.open(path);
  if (opened.isError()) {
    EVMessageDialog::showError(
        this, tr("Error"),
        tr("Failed to open %1:\n%2")
            .arg(QFileInfo(path).fileName(),
                 QString::fromStdString(opened.error().message)));
    return false;
  }
  rememberDirectory(path);
  updateTitle();
  onFlowOpened();
  return true;
}

void EVFlowMainWindow::openFileDialog() {
  if (!maybeSave()) {
    return;
  }
  const QString path = QFileDialog::getOpenFileName(
      this, tr("Open Event Flow"), m_settings.lastDirectory,
      tr(FlowDocument::FILE_FILTER));
  if (!path.isEmpty()) {
    openFile(path);
  }
}

bool EVFlowMainWindow::save() {
  if (!m_flowData.hasFlow()) {
    EVMessageDialog::showWarning(this, tr("Nothing to Save"),
                                 tr("No event flow is open."));
    return false;
  }
  if (!m_document.hasPath()) {
    return saveAs();
  }

  auto saved = m_document.save();
  if (saved.isError()) {
    EVMessageDialog::showError(this, tr("Error"),
                               tr("Failed to save file:\n%1")
                                   .arg(QString::fromStdString(saved.error().message)));
    return false;
  }
  statusBar()->showMessage(tr("Saved %1").arg(m_document.displayName()), 3000);
  return true;
}

bool EVFlowMainWindow::saveAs() {
  if (!m_flowData.hasFlow()) {
    EVMessageDialog::showWarning(this, tr("Nothing to Save"),
                                 tr("No event flow is open."));
    return false;
  }

  const QString startDir =
      m_document.hasPath() ? m_document.path() : m_settings.lastDirectory;
  const QString path = QFileDialog::getSaveFileName(
      this, tr("Save Event Flow"), startDir, tr(FlowDocument::FILE_FILTER));
  if (path.isEmpty()) {
    return false;
  }

  auto saved = m_document.saveAs(path);
  if (saved.isError()) {
    EVMessageDialog::showError(this, tr("Error"),
                               tr("Failed to save file:\n%1")
                                   .arg(QString::fromStdString(saved.error().message)));
    return false;
  }
  rememberDirectory(path);
  statusBar()->showMessage(tr("Saved %1").arg(m_document.displayName()), 3000);
  return true;
}

bool EVFlowMainWindow::maybeSave() {
  if (!m_flowData.isModified()) {
    return true;
  }

  const auto choice = EVMessageDialog::showQuestion(
      this, tr("Unsaved Changes"),
      tr("The event flow has been modified.\nDo you want to save your changes?"),
      {EVDialogButton::Cancel, EVDialogButton::Discard, EVDialogButton::Save},
      EVDialogButton::Save);

  switch (choice) {
  case EVDialogButton::Save:
    return save();
  case EVDialogButton::Discard:
    return true;
  default:
    return false;
  }
}

void EVFlowMainWindow::closeEvent(QCloseEvent *event) {
  if (maybeSave()) {
    event->accept();
  } else {
    event->ignore();
  }
}

void EVFlowMainWindow::updateTitle() {
  setWindowModified(m_flowData.isModified());
  setWindowTitle(QStringLiteral("%1[*] - %2")
                     .arg(m_document.displayName(), applicationTitle()));
}

void EVFlowMainWindow::rememberDirectory(const QString &path) {
  const QString dir = QFileInfo(path).absolutePath();
  if (dir == m_settings.lastDirectory) {
    return;
  }
  m_settings.lastDirectory = dir;
  m_settings.saveDefault();
  EVFLEDITOR_LOG_DEBUG("Last directory set to {}", dir.toStdString());
}

} // namespace EvflEditor::editor::qt
