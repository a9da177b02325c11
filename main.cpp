#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QLoggingCategory>

#include <cstdio>

#include "ConfigLoader.h"
#include "midiprocessor.h"
#include "xtalk/policies/PolicyRegistry.h"

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("xtalk");
    QCoreApplication::setApplicationVersion("1.0");

    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} "
                       "%{if-debug}DEBUG%{endif}%{if-info}INFO%{endif}%{if-warning}WARN%{endif}"
                       "%{if-critical}ERROR%{endif}%{if-fatal}FATAL%{endif} %{message}");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "MIDI cross-talk cancellation filter. Incoming notes pass through a chain of policies "
        "(cross-talk cancellation, chokes, velocity curves, replacements, ...) before they reach the output.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption inputOpt({"I", "input"}, "MIDI input port to read from (port number or substring of a port name).", "port");
    QCommandLineOption outputOpt({"O", "output"}, "MIDI output port to write to (port number or substring of a port name).", "port");
    QCommandLineOption clientOpt({"c", "client"}, "Name of the MIDI client to use.", "name", "xtalk");
    QCommandLineOption apiOpt({"a", "api"}, "MIDI API to use (jack, alsa, default).", "api", "default");
    QCommandLineOption pluginsOpt("plugins", "Comma-separated list of policies, applied in the given order.", "list");
    QCommandLineOption configOpt("plugins-config", "JSON configuration file for the policies.", "file", "config.json");
    QCommandLineOption listOpt("list", "List the available MIDI APIs, their ports and the known policies, then exit.");
    QCommandLineOption debugOpt("debug", "Print debug output.");
    parser.addOptions({inputOpt, outputOpt, clientOpt, apiOpt, pluginsOpt, configOpt, listOpt, debugOpt});
    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet(debugOpt) ? "*.debug=true" : "*.debug=false");

    if (parser.isSet(listOpt)) {
        for (const auto& line : MidiProcessor::describePorts()) std::printf("%s\n", qPrintable(line));
        std::printf("Policies:\n");
        for (const auto& kind : xtalk::policies::PolicyRegistry::kinds()) {
            std::printf("  %s: %s\n", qPrintable(kind), qPrintable(xtalk::policies::PolicyRegistry::describe(kind)));
        }
        return 0;
    }

    // A missing default config file is fine: every policy runs with its defaults.
    QString configPath = parser.value(configOpt);
    if (!parser.isSet(configOpt) && !QFileInfo::exists(configPath)) {
        qDebug().noquote() << "main: no policy configuration found at" << configPath;
        configPath.clear();
    }

    ConfigLoader loader;
    const PipelineConfig config = loader.loadConfig(configPath);
    if (!config.isValid) {
        qCritical().noquote() << "main: invalid configuration:" << config.error;
        return 1;
    }

    MidiProcessor::Options options;
    options.input = parser.value(inputOpt);
    options.output = parser.value(outputOpt);
    options.client = parser.value(clientOpt);
    options.api = parser.value(apiOpt);
    options.chain = ConfigLoader::resolveChain(parser.value(pluginsOpt).split(',', Qt::SkipEmptyParts), config);

    MidiProcessor processor(options, config);
    QString error;
    if (!processor.initialize(&error)) {
        qCritical().noquote() << "main:" << error;
        return 1;
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &processor, &MidiProcessor::shutdown);
    return app.exec();
}
