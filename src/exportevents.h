#ifndef EXPORTEVENTS_H
#define EXPORTEVENTS_H

#include <QList>
#include <QMutex>
#include <QQueue>
#include <QString>

struct ExportEvent {
    enum class Type {
        Log,
        ScannedCount,
        ExportedCount,
        ErrorCount,
        ProgressTotal,
        ProgressTick,
        ProgressIndeterminate,
        Done,
    };

    Type type = Type::Log;
    // Count, total or tick delta depending on type
    qint64 value = 0;
    QString message;

    static ExportEvent log(const QString &message);
    static ExportEvent scannedCount(qint64 count);
    static ExportEvent exportedCount(qint64 count);
    static ExportEvent errorCount(qint64 count);
    static ExportEvent progressTotal(qint64 total);
    static ExportEvent progressTick(qint64 delta);
    static ExportEvent progressIndeterminate();
    static ExportEvent done();
};

const char *exportEventTypeName(ExportEvent::Type type);

/**
 * @brief FIFO between the export worker and whoever watches it
 *
 * One producer pushes, one consumer drains without blocking. Once Done has
 * been pushed the channel is closed and further events are dropped.
 */
class ExportEventChannel
{
public:
    // Returns false when the channel is already closed
    bool push(const ExportEvent &event);

    // Removes and returns everything queued so far, never waits
    QList<ExportEvent> drain();

    bool isEmpty() const;
    bool isClosed() const;

private:
    mutable QMutex m_mutex;
    QQueue<ExportEvent> m_events;
    bool m_closed = false;
};

#endif // EXPORTEVENTS_H
