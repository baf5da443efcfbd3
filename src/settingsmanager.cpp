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


#include "settingsmanager.h"
#include "waexporter.h"
#include <QDebug>
#include <QtGlobal>

namespace
{
const char *const kAdbPathKey = "adb/path";
const char *const kSubfoldersKey = "export/subfolders";
const char *const kDestinationKey = "export/lastDestination";
const char *const kStartDateKey = "export/lastStartDate";
const char *const kEndDateKey = "export/lastEndDate";

// Range preselected until the user picks one
const QDate kDefaultStartDate(2025, 9, 17);
const QDate kDefaultEndDate(2025, 12, 17);
} // namespace

SettingsManager *SettingsManager::sharedInstance()
{
    static SettingsManager instance;
    return &instance;
}

SettingsManager::SettingsManager() : m_settings(TOOL_NAME, TOOL_NAME) {}

QString SettingsManager::adbPath() const
{
    const QString fromEnv = qEnvironmentVariable(ADB_PATH_ENV);
    if (!fromEnv.isEmpty())
        return fromEnv;
    return m_settings.value(kAdbPathKey, ADB_DEFAULT_PROGRAM).toString();
}

void SettingsManager::setAdbPath(const QString &path)
{
    m_settings.setValue(kAdbPathKey, path);
}

QStringList SettingsManager::defaultSubfolders() const
{
    const QStringList stored = m_settings.value(kSubfoldersKey).toStringList();
    return stored.isEmpty() ? DEFAULT_SUBFOLDERS : stored;
}

void SettingsManager::setDefaultSubfolders(const QStringList &subfolders)
{
    m_settings.setValue(kSubfoldersKey, subfolders);
}

QString SettingsManager::lastDestination() const
{
    return m_settings.value(kDestinationKey).toString();
}

void SettingsManager::setLastDestination(const QString &path)
{
    m_settings.setValue(kDestinationKey, path);
}

QDate SettingsManager::lastStartDate() const
{
    const QDate date = QDate::fromString(
        m_settings.value(kStartDateKey).toString(), DATE_FORMAT);
    return date.isValid() ? date : kDefaultStartDate;
}

QDate SettingsManager::lastEndDate() const
{
    const QDate date = QDate::fromString(
        m_settings.value(kEndDateKey).toString(), DATE_FORMAT);
    return date.isValid() ? date : kDefaultEndDate;
}

void SettingsManager::setLastDateRange(const QDate &start, const QDate &end)
{
    m_settings.setValue(kStartDateKey, start.toString(DATE_FORMAT));
    m_settings.setValue(kEndDateKey, end.toString(DATE_FORMAT));
    m_settings.sync();
    if (m_settings.status() != QSettings::NoError)
        qWarning() << "Could not save settings to" << m_settings.fileName();
}
