#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QFile>
#include <QTextStream>
#include "Services/CrewPayConfig.h"
#include "Services/PayrollServices.h"
#include "Services/RecalculationEngine.h"
#include "Services/ReplacementOrchestrator.h"
#include "Services/UploadProcessor.h"
#include "Repositories/FlightDutyRepository.h"
#include "dbservice/dbconfig.h"
#include "logger/logger.h"

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

void printMessages(const QString& label, const QStringList& messages)
{
    for (const QString& message : messages) {
        out() << label << ": " << message << Qt::endl;
    }
}

bool readKey(const QCommandLineParser& parser, const QCommandLineOption& userOption,
             const QCommandLineOption& monthOption, const QCommandLineOption& yearOption,
             QUuid& userId, int& month, int& year)
{
    userId = QUuid(parser.value(userOption));
    if (userId.isNull()) {
        out() << "error: --user must be a UUID" << Qt::endl;
        return false;
    }

    month = parser.value(monthOption).toInt();
    year = parser.value(yearOption).toInt();

    QString error;
    if (!ReplacementOrchestrator::validateMonthYear(month, year, &error)) {
        out() << "error: " << error << Qt::endl;
        return false;
    }
    return true;
}

bool readPosition(const QCommandLineParser& parser, const QCommandLineOption& positionOption,
                  DutyTypes::Position& position)
{
    if (!DutyTypes::positionFromString(parser.value(positionOption), position)) {
        out() << "error: --position must be CCM or SCCM" << Qt::endl;
        return false;
    }
    return true;
}

void printCalculation(const MonthlyCalculationModel* calculation)
{
    if (!calculation) {
        return;
    }
    out() << QString("%1/%2  duty hours %3  flight pay %4  per diem %5  ASBY %6")
             .arg(calculation->month()).arg(calculation->year())
             .arg(calculation->totalDutyHours(), 0, 'f', 2)
             .arg(calculation->flightPay(), 0, 'f', 2)
             .arg(calculation->perDiemPay(), 0, 'f', 2)
             .arg(calculation->asbyPay(), 0, 'f', 2)
          << Qt::endl;
    out() << QString("fixed %1  variable %2  total %3")
             .arg(calculation->totalFixed(), 0, 'f', 2)
             .arg(calculation->totalVariable(), 0, 'f', 2)
             .arg(calculation->totalSalary(), 0, 'f', 2)
          << Qt::endl;
}

bool askConfirmation(const QString& summary)
{
    out() << summary << " Continue? [y/N] " << Qt::flush;
    QTextStream in(stdin);
    const QString answer = in.readLine().trimmed().toLower();
    return answer == "y" || answer == "yes";
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("crewpay");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Crew roster ingestion and salary engine");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "upload, check, recalc, delete or init-db");
    parser.addPositionalArgument("file", "Roster file (upload only)", "[file]");

    QCommandLineOption configOption(QStringList() << "c" << "config",
                                    QCoreApplication::translate("main", "Path to database config file"),
                                    QCoreApplication::translate("main", "config"),
                                    "config/database.ini");
    parser.addOption(configOption);

    QCommandLineOption logLevelOption(QStringList() << "l" << "log-level",
                                      QCoreApplication::translate("main", "Log level (debug, info, warning, error, fatal)"),
                                      QCoreApplication::translate("main", "level"));
    parser.addOption(logLevelOption);

    QCommandLineOption settingsOption("settings",
                                      QCoreApplication::translate("main", "Path to engine settings file"),
                                      QCoreApplication::translate("main", "settings"),
                                      "config/crewpay.ini");
    parser.addOption(settingsOption);

    QCommandLineOption userOption("user", QCoreApplication::translate("main", "User id"),
                                  QCoreApplication::translate("main", "uuid"));
    QCommandLineOption positionOption("position", QCoreApplication::translate("main", "CCM or SCCM"),
                                      QCoreApplication::translate("main", "position"), "CCM");
    QCommandLineOption monthOption("month", QCoreApplication::translate("main", "Month (1-12)"),
                                   QCoreApplication::translate("main", "month"));
    QCommandLineOption yearOption("year", QCoreApplication::translate("main", "Year"),
                                  QCoreApplication::translate("main", "year"));
    QCommandLineOption replaceOption("replace", QCoreApplication::translate("main", "Replace existing data of the month"));
    QCommandLineOption yesOption("yes", QCoreApplication::translate("main", "Do not ask before replacing or deleting"));
    QCommandLineOption dryRunOption("dry-run", QCoreApplication::translate("main", "Parse and calculate without storing"));
    parser.addOptions({userOption, positionOption, monthOption, yearOption, replaceOption, yesOption, dryRunOption});

    if (argc <= 1) {
        parser.showHelp();
        return 0;
    }

    parser.process(app);

    const QStringList arguments = parser.positionalArguments();
    if (arguments.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = arguments.first();

    // Settings first, an explicit --log-level overrides the file
    CrewPayConfig config;
    if (QFile::exists(parser.value(settingsOption))) {
        config.load(parser.value(settingsOption));
    }
    if (parser.isSet(logLevelOption)) {
        config.setLogLevel(parser.value(logLevelOption));
    }
    config.applyLogging();

    PayrollServices services;
    QObject::connect(&services, &PayrollServices::errorOccurred, [](const QString &error) {
        LOG_ERROR(QString("Service error: %1").arg(error));
    });

    const QString configPath = parser.value(configOption);
    DbConfig dbConfig;
    if (QFile::exists(configPath)) {
        LOG_INFO(QString("Loading database configuration from: %1").arg(configPath));
        dbConfig = DbConfig::fromFile(configPath);
    } else if (qEnvironmentVariableIsSet("CREWPAY_DB_NAME")) {
        LOG_INFO("Loading database configuration from environment");
        dbConfig = DbConfig::fromEnvironment();
    } else {
        LOG_WARNING(QString("Config file not found: %1, using bundled defaults").arg(configPath));
        dbConfig = DbConfig::fromResource();
    }

    if (!services.initialize(dbConfig, config)) {
        LOG_FATAL("Failed to initialize payroll services");
        return 1;
    }

    int exitCode = 1;

    if (command == "init-db") {
        exitCode = services.applySchema() ? 0 : 1;
        out() << (exitCode == 0 ? "Schema applied" : "Schema could not be applied") << Qt::endl;
    }
    else if (command == "upload") {
        QUuid userId;
        int month = 0;
        int year = 0;
        DutyTypes::Position position = DutyTypes::Position::CCM;
        if (arguments.size() < 2) {
            out() << "error: upload needs a roster file" << Qt::endl;
        } else if (readKey(parser, userOption, monthOption, yearOption, userId, month, year)
                   && readPosition(parser, positionOption, position)) {
            UploadOptions options;
            options.userId = userId;
            options.position = position;
            options.month = month;
            options.year = year;
            options.replaceExisting = parser.isSet(replaceOption);

            UploadResult result;
            if (parser.isSet(dryRunOption)) {
                QFile file(arguments.at(1));
                if (!file.open(QIODevice::ReadOnly)) {
                    result.errors.append(QString("Cannot open %1: %2").arg(arguments.at(1), file.errorString()));
                } else {
                    result = services.uploadProcessor()->dryRun(file.readAll(), arguments.at(1), options);
                }
            } else {
                const bool assumeYes = parser.isSet(yesOption);
                result = services.uploadProcessor()->processFile(
                    arguments.at(1), options,
                    [](int percent, const QString& message) {
                        out() << QString("[%1%] %2").arg(percent, 3).arg(message) << Qt::endl;
                    },
                    [assumeYes](const ExistingDataCheck&, const QString& summary) {
                        return assumeYes || askConfirmation(summary);
                    });
            }

            out() << QString("%1 flight duties, %2 layover rest periods")
                     .arg(result.flightDuties.size()).arg(result.layoverRestPeriods.size()) << Qt::endl;
            printCalculation(result.monthlyCalculation.data());
            if (result.requiresConfirmation && !options.replaceExisting) {
                out() << "Run again with --replace to overwrite the existing month" << Qt::endl;
            }
            printMessages("warning", result.warnings);
            printMessages("error", result.errors);
            exitCode = result.success ? 0 : 1;
        }
    }
    else if (command == "check") {
        QUuid userId;
        int month = 0;
        int year = 0;
        if (readKey(parser, userOption, monthOption, yearOption, userId, month, year)) {
            const ExistingDataCheck check =
                services.replacementOrchestrator()->checkForExistingData(userId, month, year);
            if (!check.error.isEmpty()) {
                out() << "error: " << check.error << Qt::endl;
            } else {
                out() << ReplacementOrchestrator::createReplacementSummary(month, year, check.flightCount) << Qt::endl;
                exitCode = 0;
            }
        }
    }
    else if (command == "recalc") {
        QUuid userId;
        int month = 0;
        int year = 0;
        DutyTypes::Position position = DutyTypes::Position::CCM;
        if (readKey(parser, userOption, monthOption, yearOption, userId, month, year)
            && readPosition(parser, positionOption, position)) {
            const RecalculationResult result =
                services.recalculationEngine()->recalculateMonthlyTotals(userId, month, year, position);
            printCalculation(result.calculation.data());
            printMessages("warning", result.warnings);
            printMessages("error", result.errors);
            exitCode = result.success ? 0 : 1;
        }
    }
    else if (command == "delete") {
        QUuid userId;
        int month = 0;
        int year = 0;
        if (readKey(parser, userOption, monthOption, yearOption, userId, month, year)) {
            ReplacementOrchestrator* orchestrator = services.replacementOrchestrator();
            const ExistingDataCheck check = orchestrator->checkForExistingData(userId, month, year);
            const QString summary = ReplacementOrchestrator::createReplacementSummary(month, year, check.flightCount);

            if (!check.error.isEmpty()) {
                out() << "error: " << check.error << Qt::endl;
            } else if (!check.exists) {
                out() << summary << Qt::endl;
                exitCode = 0;
            } else if (parser.isSet(yesOption) || askConfirmation(summary)) {
                ReplacementResult result;
                const bool deleted = services.flightDutyRepository()->executeInTransaction([&]() {
                    result = orchestrator->replaceRosterData(userId, month, year, "Deleted from command line");
                    return result.success;
                });
                out() << QString("Deleted %1 flight duties").arg(deleted ? result.deletedFlights : 0) << Qt::endl;
                printMessages("error", result.errors);
                exitCode = deleted ? 0 : 1;
            } else {
                out() << "Nothing deleted" << Qt::endl;
                exitCode = 0;
            }
        }
    }
    else {
        out() << "error: unknown command " << command << Qt::endl;
        parser.showHelp(1);
    }

    services.shutdown();
    return exitCode;
}
