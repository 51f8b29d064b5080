#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QMutex>
#include <QFile>
#include <QTextStream>
#include <QString>
#include <atomic>

// Console/file sink behind Qt's message macros. Components log with
// qDebug/qInfo/qWarning/qCritical; the level threshold is set once at startup.
class LogManager {
public:
    enum class Verbosity { Quiet, Normal, Verbose };

    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager();

    // Installs the Qt message handler and the logging filter rules for the level.
    void install(Verbosity verbosity);

    // Also append every line to the given file. Returns false if it can't be opened.
    bool setLogFile(const QString& path);

    // While set, every line carries a dry-run marker.
    void setDryRun(bool dryRun) { m_dryRun.store(dryRun); }
    bool isDryRun() const { return m_dryRun.load(); }

    Verbosity verbosity() const { return m_verbosity; }

    void addLog(const QString& message, const QString& level = "INFO");

    static QString filterRulesFor(Verbosity verbosity);

private:
    LogManager() = default;
    Q_DISABLE_COPY(LogManager)

    bool shouldFlushImmediately(const QString& level) const;

    QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    Verbosity m_verbosity = Verbosity::Normal;
    std::atomic_bool m_dryRun{false};
};

// Custom message handler for qDebug/qInfo/qWarning/qCritical
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
