#include "log_manager.h"
#include <QDateTime>
#include <QLoggingCategory>
#include <QMutexLocker>

#include <cstdio>
#include <cstdlib>

LogManager::~LogManager() {
    QMutexLocker locker(&m_mutex);
    if (m_ts.device()) {
        m_ts.flush();
    }
}

QString LogManager::filterRulesFor(Verbosity verbosity) {
    switch (verbosity) {
        case Verbosity::Quiet:
            return QStringLiteral("*.debug=false\n*.info=false");
        case Verbosity::Normal:
            return QStringLiteral("*.debug=false");
        case Verbosity::Verbose:
            return QStringLiteral("*.debug=true");
    }
    return QString();
}

void LogManager::install(Verbosity verbosity) {
    m_verbosity = verbosity;
    QLoggingCategory::setFilterRules(filterRulesFor(verbosity));
    qInstallMessageHandler(customMessageHandler);
}

bool LogManager::setLogFile(const QString& path) {
    QMutexLocker locker(&m_mutex);
    if (m_file.isOpen()) {
        m_ts.flush();
        m_ts.setDevice(nullptr);
        m_file.close();
    }
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start ---\n";
    m_ts.flush();
    return true;
}

bool LogManager::shouldFlushImmediately(const QString& level) const {
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

void LogManager::addLog(const QString& message, const QString& level) {
    const QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    const QString marker = m_dryRun.load() ? QStringLiteral(" [DRY RUN]") : QString();
    const QString logEntry = QString("[%1] [%2]%3 %4").arg(timestamp, level, marker, message);

    // Workers log concurrently; keep lines whole.
    QMutexLocker locker(&m_mutex);
    fprintf(stderr, "%s\n", logEntry.toLocal8Bit().constData());
    fflush(stderr);

    if (m_ts.device()) {
        m_ts << logEntry << '\n';
        if (shouldFlushImmediately(level)) {
            m_ts.flush();
        }
    }
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    QString level;
    switch (type) {
        case QtDebugMsg:
            level = "DEBUG";
            break;
        case QtInfoMsg:
            level = "INFO";
            break;
        case QtWarningMsg:
            level = "WARN";
            break;
        case QtCriticalMsg:
            level = "ERROR";
            break;
        case QtFatalMsg:
            level = "FATAL";
            break;
    }

    LogManager::instance().addLog(msg, level);

    if (type == QtFatalMsg) {
        abort();
    }
}
