#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QTextStream>

#include "PlanFacade.h"

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("feederplan");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Meter to transformer/breaker balancing and LV connection planning");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("project", "FeederPlan XML project file");

    QCommandLineOption sampleOpt("sample", "Use the built-in sample project");
    QCommandLineOption consolidateOpt("consolidate", "Run the breaker consolidation pass");
    QCommandLineOption jsonOpt("json", "Write results and connections as JSON");
    QCommandLineOption prettyOpt("pretty", "Indent JSON output");
    QCommandLineOption printOpt("print", "Print the text report to stdout");
    QCommandLineOption outputOpt(QStringList() << "o" << "output", "Write JSON to <file> instead of stdout", "file");
    parser.addOptions({sampleOpt, consolidateOpt, jsonOpt, prettyOpt, printOpt, outputOpt});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty() && !parser.isSet(sampleOpt)) {
        qCritical().noquote() << "No project file given (use --sample for the built-in project)";
        return 1;
    }

    PlanFacade facade;
    const QString loadErr = parser.isSet(sampleOpt) ? facade.loadSample() : facade.loadProject(args.first());
    if (!loadErr.isEmpty())
        return 2;

    if (parser.isSet(consolidateOpt))
        facade.setConsolidation(true);

    if (!facade.calculate().isEmpty())
        return 3;

    const bool wantJson = parser.isSet(jsonOpt) || parser.isSet(outputOpt);
    if (parser.isSet(printOpt) || !wantJson)
        facade.printReport();

    if (wantJson) {
        const QString doc = facade.planJson(parser.isSet(prettyOpt));
        if (parser.isSet(outputOpt)) {
            const QString path = parser.value(outputOpt);
            QFile f(path);
            if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
                qCritical().noquote() << "Cannot write" << path << ":" << f.errorString();
                return 4;
            }
            QTextStream out(&f);
            out << doc << "\n";
            qInfo().noquote() << "Plan written to" << path;
        } else {
            QTextStream out(stdout);
            out << doc << "\n";
        }
    }
    return 0;
}
