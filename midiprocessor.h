#ifndef MIDIPROCESSOR_H
#define MIDIPROCESSOR_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <mutex>
#include <string>
#include <vector>

#include "RtMidi.h"
#include "PipelineConfig.h"
#include "xtalk/engine/Clock.h"
#include "xtalk/engine/OutputSink.h"

class QThread;

namespace xtalk::engine {
class Pipeline;
}
namespace xtalk::io {
class QProcessLauncher;
}
namespace xtalk::control {
class ControlServer;
}

// Host process: RtMidi input -> pipeline thread -> RtMidi outputs.
//
// Note events are stamped on arrival and queued to the pipeline thread; any other MIDI
// message goes straight to the main output. Control servers run on a thread of their own.
class MidiProcessor : public QObject, public xtalk::engine::OutputSink {
    Q_OBJECT

public:
    struct Options {
        QString input;           // port number or name substring; empty opens a virtual port
        QString output;
        QString client = "xtalk";
        QString api = "default";
        QStringList chain;       // policy kinds, in order
    };

    MidiProcessor(const Options& options, const PipelineConfig& config, QObject* parent = nullptr);
    ~MidiProcessor() override;

    bool initialize(QString* outError);
    void shutdown();

    // OutputSink; called on the pipeline thread.
    void send(xtalk::engine::OutputPort port, const xtalk::engine::Event& e) override;

    static bool findApi(const QString& name, RtMidi::Api* out);
    static QStringList describePorts();

private:
    bool openPorts(RtMidi::Api api, QString* outError);
    bool buildPipeline(QString* outError);
    bool startControlServers(QString* outError);
    void sendRaw(RtMidiOut* port, const std::vector<unsigned char>& message);
    static int findPort(RtMidi& midi, const QString& selector);

    static void inputCallback(double deltatime, std::vector<unsigned char>* message, void* userData);
    static void errorCallback(RtMidiError::Type type, const std::string& errorText, void* userData);

    const Options m_options;
    const PipelineConfig m_config;

    // --- MIDI Ports ---
    RtMidiIn* m_midiIn = nullptr;
    RtMidiOut* m_midiOut = nullptr;
    RtMidiOut* m_referenceOut = nullptr; // only with a time policy in the chain
    std::mutex m_outMutex;               // outputs are written from the pipeline and the RtMidi thread

    // --- Pipeline (lives on m_pipelineThread) ---
    xtalk::engine::SteadyClock m_clock;
    QThread* m_pipelineThread = nullptr;
    xtalk::engine::Pipeline* m_pipeline = nullptr;
    xtalk::io::QProcessLauncher* m_launcher = nullptr;

    // --- Control (lives on m_controlThread) ---
    QThread* m_controlThread = nullptr;
    QVector<xtalk::control::ControlServer*> m_servers;
};

#endif // MIDIPROCESSOR_H
