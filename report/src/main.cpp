#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTimer>
#include <QDebug>

#include "report_app.hpp"
#include "report_config.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("cutline-report"));
    app.setApplicationVersion(QStringLiteral("0.1"));

    qSetMessagePattern(QStringLiteral(
        "%{time yyyy-MM-dd hh:mm:ss.zzz} "
        "%{if-debug}D%{endif}%{if-info}I%{endif}%{if-warning}W%{endif}"
        "%{if-critical}C%{endif}%{if-fatal}F%{endif} %{message}"));

    cutline::ReportConfig config;
    QString error;
    if (!cutline::loadReportConfig(app, &config, &error)) {
        qCritical().noquote() << "cutline-report:" << error;
        return 1;
    }

    if (!config.verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    }

    qDebug() << "cutline-report: settings from" << config.settingsPath;

    cutline::ReportApp reportApp(config);
    QTimer::singleShot(0, &reportApp, &cutline::ReportApp::start);

    return app.exec();
}
