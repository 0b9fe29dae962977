// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "shell/ShellWindow.hpp"
#include "shell/PillarInstaller.hpp"
#include "shell/ShellConstants.hpp"

#include <windowing/WindowManager.hpp>
#include <windowing/tabs/TabManager.hpp>

#include <QtGui/QAction>
#include <QtGui/QCloseEvent>
#include <QtGui/QKeySequence>
#include <QtWidgets/QLabel>
#include <QtWidgets/QMenuBar>
#include <QtWidgets/QMessageBox>
#include <QtWidgets/QStatusBar>
#include <QtWidgets/QToolBar>

Q_LOGGING_CATEGORY(shelllog, "isopgem.shell")

namespace Shell {

using namespace Qt::StringLiterals;

ShellWindow::ShellWindow(const Config::AppConfig& config,
                         Windowing::IWindowStateStore* store,
                         QWidget* parent)
    : QMainWindow(parent)
    , m_config(config)
{
    setObjectName(QString::fromLatin1(Constants::kMainWindowObjectName));
    setWindowTitle(m_config.ui.window.title);
    resize(m_config.ui.window.width, m_config.ui.window.height);
    setDockNestingEnabled(true);

    m_windows = new Windowing::WindowManager(this, store, m_config, this);
    connect(m_windows, &Windowing::WindowManager::windowClosed, this, &ShellWindow::onSurfaceClosed);

    m_tabs = new Windowing::TabManager(m_windows->dispatcher(), m_config.ui, this);
    setCentralWidget(m_tabs);

    initMenus();
    initToolBar();
    initStatusBar();

    m_pillars = std::make_unique<PillarInstaller>(m_tabs, m_windows);
    m_pillarTabIds = m_pillars->installEnabled(m_config.pillars);

    qCInfo(shelllog) << "Shell ready with" << m_pillarTabIds.size() << "pillars";
}

ShellWindow::~ShellWindow() = default;

QString ShellWindow::statusText() const
{
    return m_statusLabel ? m_statusLabel->text() : QString();
}

void ShellWindow::initMenus()
{
    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));
    QAction* exitAction = fileMenu->addAction(tr("E&xit"));
    exitAction->setObjectName(u"action.exit"_s);
    exitAction->setShortcut(QKeySequence(u"Ctrl+Q"_s));
    exitAction->setStatusTip(tr("Exit the application"));
    connect(exitAction, &QAction::triggered, this, &QWidget::close);

    QMenu* viewMenu = menuBar()->addMenu(tr("&View"));
    QAction* saveAction = viewMenu->addAction(tr("&Save Layout"));
    saveAction->setObjectName(u"action.saveLayout"_s);
    connect(saveAction, &QAction::triggered, this, [this] { saveLayout(); });

    menuBar()->addMenu(tr("&Tools"));

    QMenu* helpMenu = menuBar()->addMenu(tr("&Help"));
    QAction* aboutAction = helpMenu->addAction(tr("&About"));
    aboutAction->setObjectName(u"action.about"_s);
    connect(aboutAction, &QAction::triggered, this, &ShellWindow::showAbout);
}

void ShellWindow::initToolBar()
{
    m_toolBar = new QToolBar(tr("Main Toolbar"), this);
    m_toolBar->setObjectName(QString::fromLatin1(Constants::kMainToolbarObjectName));
    m_toolBar->setMovable(false);
    m_toolBar->setFloatable(false);
    addToolBar(m_toolBar);
}

void ShellWindow::initStatusBar()
{
    m_statusLabel = new QLabel(tr("Ready"), this);
    m_statusLabel->setObjectName(QString::fromLatin1(Constants::kStatusLabelObjectName));
    statusBar()->addWidget(m_statusLabel);
}

void ShellWindow::showAbout()
{
    QMessageBox::about(this,
                       tr("About %1").arg(m_config.application.name),
                       tr("%1 %2").arg(m_config.application.name, m_config.application.version));
}

void ShellWindow::onSurfaceClosed(const QString& key)
{
    if (m_statusLabel)
        m_statusLabel->setText(tr("Closed %1").arg(key));
}

void ShellWindow::restoreLayout()
{
    m_windows->restoreState();
}

bool ShellWindow::saveLayout()
{
    const Utils::Result r = m_windows->saveState();
    if (!r.ok()) {
        qCWarning(shelllog).noquote() << u"Layout saved with errors: %1"_s.arg(r.message());
        statusBar()->showMessage(tr("Layout saved with %n error(s)", nullptr, int(r.errorCount())),
                                 Constants::kStatusMessageTimeoutMs);
        return false;
    }
    statusBar()->showMessage(tr("Layout saved"), Constants::kStatusMessageTimeoutMs);
    return true;
}

void ShellWindow::closeEvent(QCloseEvent* event)
{
    if (!m_shutDown) {
        m_shutDown = true;
        saveLayout();
        m_windows->closeAll();
    }
    event->accept();
}

} // namespace Shell
