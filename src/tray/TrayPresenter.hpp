#pragma once

#include <QIcon>
#include <QMenu>
#include <QObject>
#include <QSystemTrayIcon>

#include "sessions/tray_sink.hpp"

namespace sessionwatch {

// TrayPresenter owns the tray icon and its session menu.
class TrayPresenter : public QObject, public TraySink
{
    Q_OBJECT
public:
    // Throws TrayUnavailableError when the desktop offers no system tray.
    explicit TrayPresenter(QObject *parent = nullptr);
    ~TrayPresenter() override;

    void update(IndicatorState state, const SessionSet &sessions) override;
    void ensureAvailable() override;

signals:
    void refreshRequested();
    void quitRequested();

private slots:
    void onTrayActivated(QSystemTrayIcon::ActivationReason reason);

private:
    void rebuildMenu(const SessionSet &sessions);

    QSystemTrayIcon m_trayIcon;
    QMenu m_menu;
    QIcon m_normalIcon;
    QIcon m_warningIcon;
};

} // namespace sessionwatch
