#include "midiprocessor.h"

#include <QDebug>
#include <QThread>

#include "ConfigLoader.h"
#include "xtalk/control/ControlServer.h"
#include "xtalk/engine/Pipeline.h"
#include "xtalk/io/ProcessLauncher.h"
#include "xtalk/policies/ReplacePolicy.h"
#include "xtalk/policies/TimeCheckPolicy.h"

using xtalk::engine::Event;
using xtalk::engine::OutputPort;

MidiProcessor::MidiProcessor(const Options& options, const PipelineConfig& config, QObject* parent)
    : QObject(parent), m_options(options), m_config(config) {}

MidiProcessor::~MidiProcessor() {
    shutdown();
}

bool MidiProcessor::findApi(const QString& name, RtMidi::Api* out) {
    const QString wanted = name.trimmed().toLower();
    if (wanted.isEmpty() || wanted == "default") {
        if (out) *out = RtMidi::UNSPECIFIED;
        return true;
    }
    std::vector<RtMidi::Api> apis;
    RtMidi::getCompiledApi(apis);
    for (const auto api : apis) {
        const QString display = QString::fromStdString(RtMidi::getApiDisplayName(api)).toLower();
        const QString id = QString::fromStdString(RtMidi::getApiName(api)).toLower();
        if (display.contains(wanted) || id == wanted) {
            if (out) *out = api;
            return true;
        }
    }
    return false;
}

QStringList MidiProcessor::describePorts() {
    QStringList lines;
    std::vector<RtMidi::Api> apis;
    RtMidi::getCompiledApi(apis);
    lines << "Available APIs:";
    for (const auto api : apis) {
        lines << QString("%1: %2").arg(QString::fromStdString(RtMidi::getApiName(api)),
                                       QString::fromStdString(RtMidi::getApiDisplayName(api)));
        try {
            RtMidiIn in(api, "xtalk-list");
            for (unsigned int i = 0; i < in.getPortCount(); ++i) {
                lines << QString("  input %1: %2").arg(i).arg(QString::fromStdString(in.getPortName(i)));
            }
            RtMidiOut out(api, "xtalk-list");
            for (unsigned int i = 0; i < out.getPortCount(); ++i) {
                lines << QString("  output %1: %2").arg(i).arg(QString::fromStdString(out.getPortName(i)));
            }
        } catch (const RtMidiError& e) {
            lines << QString("  error while reading from the API: %1").arg(QString::fromStdString(e.getMessage()));
        }
    }
    return lines;
}

int MidiProcessor::findPort(RtMidi& midi, const QString& selector) {
    bool isNumber = false;
    const int index = selector.toInt(&isNumber);
    if (isNumber) return (index >= 0 && index < int(midi.getPortCount())) ? index : -1;

    const std::string name = selector.toStdString();
    for (unsigned int i = 0; i < midi.getPortCount(); i++) {
        if (midi.getPortName(i).find(name) != std::string::npos) return (int)i;
    }
    return -1;
}

bool MidiProcessor::initialize(QString* outError) {
    RtMidi::Api api = RtMidi::UNSPECIFIED;
    if (!findApi(m_options.api, &api)) {
        if (outError) *outError = QString("no such MIDI API: %1").arg(m_options.api);
        return false;
    }

    if (!buildPipeline(outError)) return false;
    if (!openPorts(api, outError)) return false;
    if (!startControlServers(outError)) return false;

    // Only now may events reach the pipeline.
    m_midiIn->setCallback(&MidiProcessor::inputCallback, this);
    m_midiIn->ignoreTypes(false, false, false);

    qInfo().noquote() << "MidiProcessor: running";
    return true;
}

bool MidiProcessor::buildPipeline(QString* outError) {
    m_pipelineThread = new QThread(this);
    m_pipelineThread->setObjectName("pipeline");

    m_pipeline = new xtalk::engine::Pipeline(&m_clock);
    m_launcher = new xtalk::io::QProcessLauncher();

    xtalk::policies::PolicyEnvironment env;
    env.launcher = m_launcher;
    if (!ConfigLoader::buildPipeline(m_config, m_options.chain, env, m_pipeline, outError)) {
        delete m_pipeline;
        m_pipeline = nullptr;
        delete m_launcher;
        m_launcher = nullptr;
        return false;
    }
    m_pipeline->setOutputSink(this);

    m_pipeline->moveToThread(m_pipelineThread);
    m_launcher->moveToThread(m_pipelineThread);
    m_pipelineThread->start(QThread::TimeCriticalPriority);

    // Policies start on the pipeline thread so their timers belong to it.
    auto* pipeline = m_pipeline;
    QMetaObject::invokeMethod(m_pipeline, [pipeline]() { pipeline->start(); }, Qt::BlockingQueuedConnection);
    return true;
}

bool MidiProcessor::openPorts(RtMidi::Api api, QString* outError) {
    const std::string client = m_options.client.toStdString();
    try {
        m_midiIn = new RtMidiIn(api, client);
        m_midiOut = new RtMidiOut(api, client);
        m_midiIn->setErrorCallback(&MidiProcessor::errorCallback, this);
        m_midiOut->setErrorCallback(&MidiProcessor::errorCallback, this);

        if (m_options.output.isEmpty()) {
            m_midiOut->openVirtualPort("output");
        } else {
            const int port = findPort(*m_midiOut, m_options.output);
            if (port < 0) {
                if (outError) *outError = QString("MIDI output port not found: %1").arg(m_options.output);
                return false;
            }
            m_midiOut->openPort(unsigned(port), "output");
        }

        if (m_options.input.isEmpty()) {
            m_midiIn->openVirtualPort("input");
        } else {
            const int port = findPort(*m_midiIn, m_options.input);
            if (port < 0) {
                if (outError) *outError = QString("MIDI input port not found: %1").arg(m_options.input);
                return false;
            }
            m_midiIn->openPort(unsigned(port), "input");
        }

        // The reference click goes to a port of its own so it can be routed to a separate sound.
        for (int i = 0; i < m_pipeline->size(); ++i) {
            auto* time = dynamic_cast<xtalk::policies::TimeCheckPolicy*>(m_pipeline->policy(i));
            if (!time) continue;
            m_referenceOut = new RtMidiOut(api, client);
            m_referenceOut->setErrorCallback(&MidiProcessor::errorCallback, this);
            m_referenceOut->openVirtualPort(time->config().client.toStdString());
            qInfo().noquote() << "MidiProcessor: reference output" << time->config().client;
            break;
        }
    } catch (const RtMidiError& e) {
        if (outError) *outError = QString("MIDI error: %1").arg(QString::fromStdString(e.getMessage()));
        return false;
    }

    qInfo().noquote() << QString("MidiProcessor: input '%1', output '%2'")
                             .arg(m_options.input.isEmpty() ? QString("virtual") : m_options.input,
                                  m_options.output.isEmpty() ? QString("virtual") : m_options.output);
    return true;
}

bool MidiProcessor::startControlServers(QString* outError) {
    for (int i = 0; i < m_pipeline->size(); ++i) {
        auto* replace = dynamic_cast<xtalk::policies::ReplacePolicy*>(m_pipeline->policy(i));
        if (!replace || !replace->config().server) continue;

        if (!m_controlThread) {
            m_controlThread = new QThread(this);
            m_controlThread->setObjectName("control");
            m_controlThread->start();
        }

        xtalk::control::ControlServerConfig cfg;
        cfg.address = replace->config().address;
        cfg.port = quint16(replace->config().port);
        cfg.timeoutMs = replace->config().timeoutMs;

        auto* server = new xtalk::control::ControlServer(replace, cfg);
        server->moveToThread(m_controlThread);
        m_servers.push_back(server);

        bool ok = false;
        QMetaObject::invokeMethod(server, "start", Qt::BlockingQueuedConnection, Q_RETURN_ARG(bool, ok));
        if (!ok) {
            if (outError) *outError = QString("replace: control server: %1").arg(server->lastError());
            return false;
        }
    }
    return true;
}

void MidiProcessor::shutdown() {
    if (m_midiIn) {
        try {
            m_midiIn->cancelCallback();
            m_midiIn->closePort();
        } catch (const RtMidiError& e) {
            qWarning().noquote() << "MidiProcessor:" << QString::fromStdString(e.getMessage());
        }
    }

    // Servers reference policies owned by the pipeline: they go first.
    for (auto* server : m_servers) {
        QMetaObject::invokeMethod(server, "stop", Qt::BlockingQueuedConnection);
        server->deleteLater(); // runs on the control thread as it finishes
    }
    m_servers.clear();
    if (m_controlThread) {
        m_controlThread->quit();
        m_controlThread->wait();
        delete m_controlThread;
        m_controlThread = nullptr;
    }

    if (m_pipeline) {
        auto* pipeline = m_pipeline;
        auto* launcher = m_launcher;
        QMetaObject::invokeMethod(pipeline, [pipeline]() { pipeline->stop(); }, Qt::BlockingQueuedConnection);
        pipeline->deleteLater();
        launcher->deleteLater();
        m_pipeline = nullptr;
        m_launcher = nullptr;
    }
    if (m_pipelineThread) {
        m_pipelineThread->quit();
        m_pipelineThread->wait();
        delete m_pipelineThread;
        m_pipelineThread = nullptr;
    }

    delete m_midiIn;
    m_midiIn = nullptr;
    delete m_midiOut;
    m_midiOut = nullptr;
    delete m_referenceOut;
    m_referenceOut = nullptr;
}

void MidiProcessor::send(OutputPort port, const Event& e) {
    RtMidiOut* out = (port == OutputPort::Reference) ? m_referenceOut : m_midiOut;
    if (!out) return;
    sendRaw(out, e.toMidi());
}

void MidiProcessor::sendRaw(RtMidiOut* port, const std::vector<unsigned char>& message) {
    std::lock_guard<std::mutex> lock(m_outMutex);
    try {
        port->sendMessage(&message);
    } catch (const RtMidiError& e) {
        qWarning().noquote() << "MidiProcessor: send failed:" << QString::fromStdString(e.getMessage());
    }
}

// --- Static Callbacks (RtMidi thread) ---
void MidiProcessor::inputCallback(double deltatime, std::vector<unsigned char>* message, void* userData) {
    Q_UNUSED(deltatime);
    auto* self = static_cast<MidiProcessor*>(userData);
    if (!self || !message || message->empty()) return;

    Event e;
    if (!Event::fromMidi(*message, self->m_clock.nowMs(), &e)) {
        self->sendRaw(self->m_midiOut, *message);
        return;
    }

    auto* pipeline = self->m_pipeline;
    if (!pipeline) return;
    QMetaObject::invokeMethod(pipeline, [pipeline, e]() { pipeline->dispatchToSink(e); }, Qt::QueuedConnection);
}

void MidiProcessor::errorCallback(RtMidiError::Type type, const std::string& errorText, void* userData) {
    Q_UNUSED(userData);
    if (type == RtMidiError::WARNING || type == RtMidiError::DEBUG_WARNING) {
        qWarning().noquote() << "MidiProcessor: RtMidi:" << QString::fromStdString(errorText);
        return;
    }
    qCritical().noquote() << "MidiProcessor: RtMidi error:" << QString::fromStdString(errorText);
}
