#ifndef CONSOLEOBSERVER_H
#define CONSOLEOBSERVER_H

#include "exportevents.h"
#include <QObject>
#include <QTextStream>
#include <QTimer>

// Prints the events of one export run, polling the channel on a timer
class ConsoleObserver : public QObject
{
    Q_OBJECT

public:
    explicit ConsoleObserver(ExportEventChannel *channel,
                             QObject *parent = nullptr);

    void start(int intervalMs = 100);
    bool isFinished() const { return m_finished; }

    qint64 scanned() const { return m_scanned; }
    qint64 exported() const { return m_exported; }
    qint64 errors() const { return m_errors; }

public slots:
    void poll();

signals:
    void finished();

private:
    void handleEvent(const ExportEvent &event);
    void printLog(const QString &message);
    void printProgress();

    ExportEventChannel *m_channel;
    QTimer m_timer;
    QTextStream m_out;
    QTextStream m_err;

    qint64 m_scanned = 0;
    qint64 m_exported = 0;
    qint64 m_errors = 0;
    qint64 m_progressTotal = 0;
    qint64 m_progressValue = 0;
    int m_lastReportedPercent = -1;
    bool m_indeterminate = false;
    bool m_finished = false;
};

#endif // CONSOLEOBSERVER_H
