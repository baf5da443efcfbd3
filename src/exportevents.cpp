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


#include "exportevents.h"
#include <QDebug>
#include <QMutexLocker>

ExportEvent ExportEvent::log(const QString &message)
{
    return ExportEvent{Type::Log, 0, message};
}

ExportEvent ExportEvent::scannedCount(qint64 count)
{
    return ExportEvent{Type::ScannedCount, count, QString()};
}

ExportEvent ExportEvent::exportedCount(qint64 count)
{
    return ExportEvent{Type::ExportedCount, count, QString()};
}

ExportEvent ExportEvent::errorCount(qint64 count)
{
    return ExportEvent{Type::ErrorCount, count, QString()};
}

ExportEvent ExportEvent::progressTotal(qint64 total)
{
    return ExportEvent{Type::ProgressTotal, total, QString()};
}

ExportEvent ExportEvent::progressTick(qint64 delta)
{
    return ExportEvent{Type::ProgressTick, delta, QString()};
}

ExportEvent ExportEvent::progressIndeterminate()
{
    return ExportEvent{Type::ProgressIndeterminate, 0, QString()};
}

ExportEvent ExportEvent::done()
{
    return ExportEvent{Type::Done, 0, QString()};
}

const char *exportEventTypeName(ExportEvent::Type type)
{
    switch (type) {
    case ExportEvent::Type::Log:
        return "log";
    case ExportEvent::Type::ScannedCount:
        return "scanned";
    case ExportEvent::Type::ExportedCount:
        return "exported";
    case ExportEvent::Type::ErrorCount:
        return "errors";
    case ExportEvent::Type::ProgressTotal:
        return "progress_total";
    case ExportEvent::Type::ProgressTick:
        return "progress_tick";
    case ExportEvent::Type::ProgressIndeterminate:
        return "progress_indeterminate";
    case ExportEvent::Type::Done:
        return "done";
    }
    return "unknown";
}

bool ExportEventChannel::push(const ExportEvent &event)
{
    QMutexLocker locker(&m_mutex);
    if (m_closed) {
        qWarning() << "Dropping" << exportEventTypeName(event.type)
                   << "event pushed after done";
        return false;
    }

    m_events.enqueue(event);
    if (event.type == ExportEvent::Type::Done)
        m_closed = true;
    return true;
}

QList<ExportEvent> ExportEventChannel::drain()
{
    QMutexLocker locker(&m_mutex);
    QList<ExportEvent> events;
    events.reserve(m_events.size());
    while (!m_events.isEmpty())
        events.append(m_events.dequeue());
    return events;
}

bool ExportEventChannel::isEmpty() const
{
    QMutexLocker locker(&m_mutex);
    return m_events.isEmpty();
}

bool ExportEventChannel::isClosed() const
{
    QMutexLocker locker(&m_mutex);
    return m_closed;
}
