#ifndef EXPORTENGINE_H
#define EXPORTENGINE_H

#include "exportevents.h"
#include "exportplanner.h"
#include "waexporter.h"

class CancellationToken;
class MediaBackend;

/**
 * @brief Walks the planned folders and exports the files inside the range
 *
 * One folder of one root at a time, files in enumeration order. The
 * counters belong to the engine and only leave it as event snapshots.
 * Cancellation is honored before each root, each folder and each file,
 * never in the middle of a transfer.
 */
class ExportEngine
{
public:
    enum class State { Idle, Scanning, Filtering, Transferring, Finished };

    ExportEngine(MediaBackend &backend, ExportEventChannel &channel,
                 const CancellationToken &token);

    /**
     * @brief Runs the whole export and closes the channel
     *
     * Done is pushed exactly once, after the summary line, whatever the
     * outcome. Calling run() a second time is not supported.
     */
    ExportSummary run(const ExportRequest &request,
                      const ExportPlanner &planner = ExportPlanner());

    State state() const { return m_state; }
    ExportOutcome outcome() const { return m_outcome; }
    ExportSummary summary() const;

    static QString summaryLine(qint64 scanned, qint64 exported,
                               qint64 errors);

private:
    ExportOutcome execute(const ExportRequest &request,
                          const ExportPlanner &planner);
    void exportFolder(const PlannedFolder &folder,
                      const ExportRequest &request);
    void processFile(FileRecord &record, const ExportRequest &request);
    void finish(ExportOutcome outcome);

    // True once cancellation has been requested
    bool checkpoint();

    void emitEvent(const ExportEvent &event);
    void log(const QString &message);
    void recordError(const QString &message);

    MediaBackend &m_backend;
    ExportEventChannel &m_channel;
    const CancellationToken &m_token;

    State m_state = State::Idle;
    ExportOutcome m_outcome = ExportOutcome::Fatal;
    bool m_cancelLogged = false;
    QString m_message;
    qint64 m_scanned = 0;
    qint64 m_exported = 0;
    qint64 m_errors = 0;
};

#endif // EXPORTENGINE_H
