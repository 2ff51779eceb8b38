/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    transcriptlens-dump - print a parsed Claude transcript as JSON

    Reads one session transcript (.jsonl), runs it through the transcript
    parser and writes the result to stdout as compact JSON.

    Usage:
        transcriptlens-dump <file.jsonl> [--page N] [--page-size N]
                            [--summary] [--tools] [--structured-ids-only]

    Page size, summary length and model pricing come from transcriptlensrc.
*/

#include "PricingTable.h"
#include "SessionAggregator.h"
#include "TranscriptParser.h"
#include "TranscriptSettings.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

using namespace TranscriptLens;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("transcriptlens-dump"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Print a parsed Claude session transcript as JSON"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("file"), QStringLiteral("Session transcript (.jsonl)"));

    QCommandLineOption pageOption(QStringList() << QStringLiteral("p") << QStringLiteral("page"),
                                  QStringLiteral("Print one page of messages, newest first (1 = newest)"),
                                  QStringLiteral("n"));
    parser.addOption(pageOption);

    QCommandLineOption pageSizeOption(QStringList() << QStringLiteral("n") << QStringLiteral("page-size"),
                                      QStringLiteral("Messages per page (default: configured session page size)"),
                                      QStringLiteral("n"));
    parser.addOption(pageSizeOption);

    QCommandLineOption summaryOption(QStringLiteral("summary"), QStringLiteral("Print only the summary and session stats"));
    parser.addOption(summaryOption);

    QCommandLineOption toolsOption(QStringLiteral("tools"), QStringLiteral("Print tool use counts by tool name"));
    parser.addOption(toolsOption);

    QCommandLineOption structuredOption(QStringLiteral("structured-ids-only"),
                                        QStringLiteral("Only link sub-agents through structured fields, never by scanning result text"));
    parser.addOption(structuredOption);

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        QTextStream err(stderr);
        err << "Error: exactly one transcript file is required\n";
        return 1;
    }

    QFile file(args.first());
    if (!file.open(QIODevice::ReadOnly)) {
        QTextStream err(stderr);
        err << "Error: cannot read " << args.first() << ": " << file.errorString() << "\n";
        return 1;
    }
    const QByteArray rawText = file.readAll();
    file.close();

    TranscriptSettings settings;
    ParserOptions options = settings.parserOptions();

    if (parser.isSet(pageSizeOption)) {
        bool ok = false;
        const int pageSize = parser.value(pageSizeOption).toInt(&ok);
        if (!ok || pageSize < 1) {
            QTextStream err(stderr);
            err << "Error: --page-size must be a positive number\n";
            return 1;
        }
        options.pageSize = pageSize;
    }
    if (parser.isSet(structuredOption)) {
        options.agentIdRecovery = AgentIdRecovery::Mode::StructuredOnly;
    }

    const PricingTable pricing = settings.pricingTable();
    const TranscriptParser transcriptParser(pricing, options);
    const ParsedSession session = transcriptParser.parse(rawText);

    QJsonObject output;
    if (parser.isSet(toolsOption)) {
        const QMap<QString, int> breakdown = SessionAggregator::toolBreakdown(session.messages);
        for (auto it = breakdown.constBegin(); it != breakdown.constEnd(); ++it) {
            output[it.key()] = it.value();
        }
    } else if (parser.isSet(summaryOption)) {
        output[QStringLiteral("summary")] = session.summary;
        output[QStringLiteral("stats")] = session.stats.toJson();
    } else if (parser.isSet(pageOption)) {
        bool ok = false;
        const int page = parser.value(pageOption).toInt(&ok);
        if (!ok) {
            QTextStream err(stderr);
            err << "Error: --page must be a number\n";
            return 1;
        }
        output = transcriptParser.page(session, page).toJson();
    } else {
        output = session.toJson();
    }

    QTextStream out(stdout);
    out << QJsonDocument(output).toJson(QJsonDocument::Compact) << "\n";
    return 0;
}
