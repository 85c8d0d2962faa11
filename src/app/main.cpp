/*
 * main.cpp - pagestamp command-line tool
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QCommandLineParser>
#include <QFile>
#include <QFileInfo>
#include <QGuiApplication>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QStringList>
#include <QTextStream>

#include "documentprocessor.h"
#include "pagesetup.h"
#include "watermarksettings.h"

static QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

static bool readSettingsFile(const QString &path, QJsonObject &watermark, QJsonObject &page)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        err() << QObject::tr("Cannot open settings file %1: %2").arg(path, file.errorString())
              << Qt::endl;
        return false;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        err() << QObject::tr("Invalid settings file %1: %2").arg(path, parseError.errorString())
              << Qt::endl;
        return false;
    }
    const QJsonObject root = doc.object();
    watermark = root.value(QLatin1String("watermark")).toObject();
    page = root.value(QLatin1String("page")).toObject();
    return true;
}

int main(int argc, char *argv[])
{
    // No windows are shown; images and fonts only need a platform plugin
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
        qputenv("QT_QPA_PLATFORM", "offscreen");

    QGuiApplication app(argc, argv);
    QGuiApplication::setApplicationName(QStringLiteral("pagestamp"));
    QGuiApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QObject::tr("Paginate extracted document markup into a watermarked PDF"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("input"),
                                 QObject::tr("HTML markup file to convert"));

    const QCommandLineOption outputOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        QObject::tr("Write the PDF to <file> (default: input name with .pdf)"),
        QStringLiteral("file"));
    const QCommandLineOption settingsOption(
        {QStringLiteral("s"), QStringLiteral("settings")},
        QObject::tr("Read watermark and page settings from a JSON <file>"),
        QStringLiteral("file"));
    const QCommandLineOption textOption(
        {QStringLiteral("t"), QStringLiteral("text")},
        QObject::tr("Watermark <text>"), QStringLiteral("text"));
    const QCommandLineOption templateOption(
        QStringLiteral("template"),
        QObject::tr("Watermark template: corporate, confidential, draft or custom"),
        QStringLiteral("name"));
    const QCommandLineOption positionOption(
        QStringLiteral("position"),
        QObject::tr("Watermark position: center, corner, custom or multiple"),
        QStringLiteral("type"));
    const QCommandLineOption opacityOption(
        QStringLiteral("opacity"),
        QObject::tr("Watermark opacity in percent (0-100)"), QStringLiteral("percent"));
    const QCommandLineOption verboseOption(
        {QStringLiteral("v"), QStringLiteral("verbose")},
        QObject::tr("Print diagnostic output"));
    parser.addOptions({outputOption, settingsOption, textOption, templateOption,
                       positionOption, opacityOption, verboseOption});
    parser.process(app);

    if (!parser.isSet(verboseOption))
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        err() << QObject::tr("Expected exactly one input file") << Qt::endl;
        parser.showHelp(1);
    }

    const QString inputPath = args.first();
    QFile input(inputPath);
    if (!input.open(QIODevice::ReadOnly)) {
        err() << QObject::tr("Cannot open %1: %2").arg(inputPath, input.errorString()) << Qt::endl;
        return 1;
    }
    const QString markup = QString::fromUtf8(input.readAll());
    input.close();

    QJsonObject watermarkJson;
    QJsonObject pageJson;
    if (parser.isSet(settingsOption)
        && !readSettingsFile(parser.value(settingsOption), watermarkJson, pageJson))
        return 1;

    // Command-line values override the settings file
    if (parser.isSet(textOption))
        watermarkJson[QLatin1String("text")] = parser.value(textOption);
    if (parser.isSet(templateOption))
        watermarkJson[QLatin1String("template")] = parser.value(templateOption);
    if (parser.isSet(positionOption)) {
        QJsonObject position = watermarkJson.value(QLatin1String("position")).toObject();
        position[QLatin1String("type")] = parser.value(positionOption);
        watermarkJson[QLatin1String("position")] = position;
    }
    if (parser.isSet(opacityOption)) {
        bool ok = false;
        const double opacity = parser.value(opacityOption).toDouble(&ok);
        if (!ok) {
            err() << QObject::tr("Invalid opacity: %1").arg(parser.value(opacityOption))
                  << Qt::endl;
            return 1;
        }
        watermarkJson[QLatin1String("opacity")] = opacity;
    }

    const Watermark::Settings settings = Watermark::Settings::fromJson(watermarkJson);

    DocumentProcessor processor;
    processor.setPageSetup(PageSetup::fromJson(pageJson));
    processor.setProgressCallback([](const ProcessingProgress &progress) {
        qInfo().noquote() << QStringLiteral("[%1%] %2").arg(progress.percent, 3).arg(progress.stage);
    });

    const ProcessingResult result = processor.process(markup, settings);
    if (!result.ok()) {
        err() << QObject::tr("No PDF produced: %1").arg(result.errorMessage) << Qt::endl;
        return 1;
    }
    if (result.usedFallback)
        err() << QObject::tr("Warning: document could not be processed (%1); "
                             "wrote a processing notice instead").arg(result.errorMessage)
              << Qt::endl;

    QString outputPath = parser.value(outputOption);
    if (outputPath.isEmpty()) {
        const QFileInfo fi(inputPath);
        outputPath = fi.path() + QLatin1Char('/') + fi.completeBaseName() + QStringLiteral(".pdf");
    }

    QSaveFile output(outputPath);
    if (!output.open(QIODevice::WriteOnly)) {
        err() << QObject::tr("Cannot write %1: %2").arg(outputPath, output.errorString())
              << Qt::endl;
        return 1;
    }
    output.write(result.pdf);
    if (!output.commit()) {
        err() << QObject::tr("Cannot write %1: %2").arg(outputPath, output.errorString())
              << Qt::endl;
        return 1;
    }

    qInfo().noquote() << QObject::tr("Wrote %1 (%2 pages)").arg(outputPath).arg(result.pageCount);
    return 0;
}
