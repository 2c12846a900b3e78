#pragma once

#include <memory>

#include <QObject>

#include "common/config.hpp"

namespace sessionwatch {

class ChangeFilterSink;
class SessionMonitor;
class TrayPresenter;
class UtmpSessionSource;

/**
 * TrayApp owns everything the indicator needs for the lifetime of the
 * process: the session source, the tray icon and the refresh loop.
 * Members are torn down in reverse order, so the monitor stops before the
 * icon is removed.
 */
class TrayApp : public QObject
{
    Q_OBJECT
public:
    // Throws TrayUnavailableError when no system tray exists.
    explicit TrayApp(const TrayConfig &config, QObject *parent = nullptr);
    ~TrayApp() override;

    void start();

signals:
    void finished(int exitCode);

private:
    TrayConfig m_config;
    std::unique_ptr<UtmpSessionSource> m_source;
    std::unique_ptr<TrayPresenter> m_presenter;
    std::unique_ptr<ChangeFilterSink> m_sink;
    std::unique_ptr<SessionMonitor> m_monitor;
};

} // namespace sessionwatch
