/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef BRIDGESETTINGSTEST_H
#define BRIDGESETTINGSTEST_H

#include <QObject>
#include <QTemporaryDir>

namespace CodingBridge
{

class BridgeSettingsTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testDefaults();
    void testDeriveWebSocketUrl_data();
    void testDeriveWebSocketUrl();
    void testTokenAddedOnce();
    void testWebSocketUrlOverride();
    void testTimeoutClamped();
    void testSettingsChangedSignal();
    void testPersistence();
    void testTransientChanges();

private:
    QString configPath(const QString &name) const;

    QTemporaryDir m_dir;
};

}

#endif // BRIDGESETTINGSTEST_H
