#include <QApplication>
#include <QCommandLineParser>

#include "../Header/AppConfig.h"
#include "../Header/LightSimulationApp.h"
#include "../Header/Logging.h"

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    QApplication::setApplicationName("RefractionVis");
    QApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Light wave refraction across three media");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList() << "c" << "config",
                                    "Read start-up settings from <file>.", "file");
    parser.addOption(configOption);
    parser.process(app);

    AppConfig config;
    if (parser.isSet(configOption)) {
        // A missing or unreadable file leaves the defaults in place
        loadAppConfig(parser.value(configOption), config);
    }

    LightSimulationApp window(config);
    window.showMaximized();
    return app.exec();
}
