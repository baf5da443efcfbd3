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


#include "waexporter.h"

QDateTime ExportRequest::startOfDay(const QDate &date)
{
    // Midnight does not exist on some DST transition days
    return date.startOfDay();
}

QDateTime ExportRequest::endOfDay(const QDate &date)
{
    return date.addDays(1).startOfDay().addSecs(-1);
}

QString exportOutcomeName(ExportOutcome outcome)
{
    switch (outcome) {
    case ExportOutcome::Completed:
        return "completed";
    case ExportOutcome::Cancelled:
        return "cancelled";
    case ExportOutcome::Fatal:
        return "fatal";
    case ExportOutcome::Rejected:
        return "rejected";
    }
    return "unknown";
}

QString transferModeName(TransferMode mode)
{
    return mode == TransferMode::Move ? "move" : "copy";
}
