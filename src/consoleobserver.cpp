/*
 * waexporter: A free and open-source WhatsApp media export tool.
 *
 * Copyright (C) 2025 Uncore <https://github.com/uncor3>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */


#include "consoleobserver.h"
#include <QTime>
#include <algorithm>
#include <cstdio>

ConsoleObserver::ConsoleObserver(ExportEventChannel *channel, QObject *parent)
    : QObject(parent), m_channel(channel), m_out(stdout), m_err(stderr)
{
    connect(&m_timer, &QTimer::timeout, this, &ConsoleObserver::poll);
}

void ConsoleObserver::start(int intervalMs)
{
    m_timer.start(intervalMs);
}

void ConsoleObserver::poll()
{
    if (m_finished)
        return;

    const QList<ExportEvent> events = m_channel->drain();
    for (const ExportEvent &event : events) {
        handleEvent(event);
        if (m_finished)
            break;
    }
    m_out.flush();
}

void ConsoleObserver::handleEvent(const ExportEvent &event)
{
    switch (event.type) {
    case ExportEvent::Type::Log:
        printLog(event.message);
        break;
    case ExportEvent::Type::ScannedCount:
        m_scanned = event.value;
        break;
    case ExportEvent::Type::ExportedCount:
        m_exported = event.value;
        break;
    case ExportEvent::Type::ErrorCount:
        m_errors = event.value;
        break;
    case ExportEvent::Type::ProgressTotal:
        m_indeterminate = false;
        m_progressTotal = std::max<qint64>(event.value, 1);
        m_progressValue = 0;
        m_lastReportedPercent = -1;
        break;
    case ExportEvent::Type::ProgressTick:
        if (!m_indeterminate && m_progressTotal > 0) {
            m_progressValue =
                std::min(m_progressValue + event.value, m_progressTotal);
            printProgress();
        }
        break;
    case ExportEvent::Type::ProgressIndeterminate:
        m_indeterminate = true;
        m_progressTotal = 0;
        break;
    case ExportEvent::Type::Done:
        m_timer.stop();
        m_finished = true;
        m_out.flush();
        emit finished();
        break;
    }
}

void ConsoleObserver::printLog(const QString &message)
{
    m_out << "[" << QTime::currentTime().toString("HH:mm:ss") << "] "
          << message << Qt::endl;
}

void ConsoleObserver::printProgress()
{
    const int percent =
        static_cast<int>(m_progressValue * 100 / m_progressTotal);
    // One line per ten percent keeps the log readable
    if (percent / 10 == m_lastReportedPercent / 10 &&
        m_lastReportedPercent >= 0)
        return;

    m_lastReportedPercent = percent;
    m_err << "Progress: " << m_progressValue << "/" << m_progressTotal
          << " (" << percent << "%)  Scanned: " << m_scanned
          << "  Exported: " << m_exported << "  Errors: " << m_errors
          << Qt::endl;
}
