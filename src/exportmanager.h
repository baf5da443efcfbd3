#ifndef EXPORTMANAGER_H
#define EXPORTMANAGER_H

#include "adbbridge.h"
#include "exportevents.h"
#include "exportplanner.h"
#include "waexporter.h"
#include <QFuture>

class CancellationToken;

/**
 * @brief Entry point of an export run
 *
 * Validates the request, picks the backend, plans and drives the engine.
 * Every run ends with Done on the channel, including rejected requests and
 * runs that fail before the engine starts.
 */
class ExportManager
{
public:
    explicit ExportManager(AdbBridge *bridge);

    // Pure check of the request, no device or backend I/O happens here
    static RequestValidation checkRequest(const ExportRequest &request);

    /**
     * @brief checkRequest() plus creation of the destination folder
     */
    static RequestValidation validateRequest(const ExportRequest &request);

    // Blocks until the run is over
    ExportSummary run(const ExportRequest &request,
                      ExportEventChannel &channel,
                      const CancellationToken &token);

    /**
     * @brief Runs the export on a worker thread
     *
     * @p channel and @p token must stay alive until the future finishes.
     */
    QFuture<ExportSummary> start(const ExportRequest &request,
                                 ExportEventChannel &channel,
                                 const CancellationToken &token);

    DeviceListResult listDevices();

private:
    AdbBridge *m_bridge;
    ExportPlanner m_planner;
};

#endif // EXPORTMANAGER_H
