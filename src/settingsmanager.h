#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QDate>
#include <QSettings>
#include <QString>
#include <QStringList>

class SettingsManager
{
public:
    static SettingsManager *sharedInstance();

    // WAEXPORTER_ADB wins over the stored value
    QString adbPath() const;
    void setAdbPath(const QString &path);

    QStringList defaultSubfolders() const;
    void setDefaultSubfolders(const QStringList &subfolders);

    QString lastDestination() const;
    void setLastDestination(const QString &path);

    QDate lastStartDate() const;
    QDate lastEndDate() const;
    void setLastDateRange(const QDate &start, const QDate &end);

private:
    SettingsManager();

    mutable QSettings m_settings;
};

#endif // SETTINGSMANAGER_H
