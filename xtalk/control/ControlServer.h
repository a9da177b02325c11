#pragma once

#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QObject>
#include <QString>

#include <atomic>
#include <mutex>

class QTcpServer;
class QTcpSocket;
class QTimer;

namespace xtalk::engine {
class Policy;
}

namespace xtalk::control {

struct ControlServerConfig {
    QString address = "localhost";
    quint16 port = 1560; // 0 picks a free port
    int timeoutMs = 5000;
};

// Line based TCP command interface for one policy.
//
// Each received line is handed to Policy::handleCommand() and answered with "OK" or
// "ERROR <reason>". Blank lines are ignored. A client that leaves a partial line pending
// for longer than the timeout, or sends a line longer than kMaxLineBytes, is disconnected.
//
// Meant to be moved to its own thread; start() and stop() must run on that thread
// (invoke them with Qt::BlockingQueuedConnection from elsewhere).
class ControlServer : public QObject {
    Q_OBJECT
public:
    static constexpr int kMaxLineBytes = 1024;

    ControlServer(engine::Policy* target, const ControlServerConfig& config, QObject* parent = nullptr);
    ~ControlServer() override;

    // Valid after a successful start().
    quint16 serverPort() const { return m_boundPort.load(); }
    QString lastError() const;
    int clientCount() const { return m_clientCount.load(); }

public slots:
    bool start();
    void stop();

private slots:
    void onNewConnection();

private:
    struct Client {
        QByteArray buffer;
        QTimer* lineTimer = nullptr; // owned by the socket
    };

    void onReadyRead(QTcpSocket* socket);
    void onLineTimeout(QTcpSocket* socket);
    void dropClient(QTcpSocket* socket);
    void reply(QTcpSocket* socket, const QString& line);
    static QHostAddress resolve(const QString& address);

    engine::Policy* m_target; // not owned
    const ControlServerConfig m_cfg;

    QTcpServer* m_server = nullptr;
    QHash<QTcpSocket*, Client> m_clients;

    std::atomic<quint16> m_boundPort{0};
    std::atomic<int> m_clientCount{0};
    mutable std::mutex m_errorMutex;
    QString m_lastError;
};

} // namespace xtalk::control
