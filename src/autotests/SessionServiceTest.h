/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONSERVICETEST_H
#define SESSIONSERVICETEST_H

#include <QObject>

namespace TranscriptLens
{

class SessionServiceTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testSessionDetails();
    void testSessionPage();
    void testSessionPageClamped();
    void testMissingSession();
    void testAgentTranscript();
    void testAgentIdNormalized();
    void testMissingAgent();
    void testEmptyAgentId();
    void testDetailsJson();
};

}

#endif // SESSIONSERVICETEST_H
