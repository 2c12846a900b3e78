#include "tray/TrayApp.hpp"

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "sessions/session_monitor.hpp"
#include "sessions/utmp_session_source.hpp"
#include "tray/TrayPresenter.hpp"
#include "sessions/tray_sink.hpp"

namespace sessionwatch {

TrayApp::TrayApp(const TrayConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_source(std::make_unique<UtmpSessionSource>(config.utmpPath,
                                                   config.ignoredHosts,
                                                   config.currentLine))
    , m_presenter(std::make_unique<TrayPresenter>())
    , m_sink(std::make_unique<ChangeFilterSink>(*m_presenter))
    , m_monitor(std::make_unique<SessionMonitor>(*m_source, *m_sink,
                                                 config.pollIntervalMs))
{
    if (config.watchUtmp) {
        m_monitor->watchFile(config.utmpPath);
    }

    connect(m_presenter.get(), &TrayPresenter::refreshRequested,
            m_monitor.get(), &SessionMonitor::scheduleRefresh);
    connect(m_presenter.get(), &TrayPresenter::quitRequested, this, [this]() {
        SWLOG_INFO(QStringLiteral("TrayApp"),
                   QStringLiteral("quitRequested"),
                   QStringLiteral("tray_quit"),
                   QStringLiteral("user_action"),
                   nlohmann::json::object());
        emit finished(0);
    });
    connect(m_monitor.get(), &SessionMonitor::stopped, this, &TrayApp::finished);
}

TrayApp::~TrayApp()
{
    m_monitor.reset();
    m_sink.reset();
    m_presenter.reset();
}

void TrayApp::start()
{
    SWLOG_INFO(QStringLiteral("TrayApp"),
               QStringLiteral("start"),
               QStringLiteral("tray_start"),
               QStringLiteral("user_start"),
               (nlohmann::json{{"utmpPath", m_config.utmpPath.toStdString()},
                               {"intervalMs", m_config.pollIntervalMs},
                               {"watch", m_config.watchUtmp},
                               {"currentLine", m_config.currentLine.toStdString()}}));
    m_monitor->start();
}

} // namespace sessionwatch
