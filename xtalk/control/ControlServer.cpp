#include "xtalk/control/ControlServer.h"

#include <QDebug>
#include <QHostInfo>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>

#include "xtalk/engine/Policy.h"

namespace xtalk::control {

ControlServer::ControlServer(engine::Policy* target, const ControlServerConfig& config, QObject* parent)
    : QObject(parent), m_target(target), m_cfg(config) {}

ControlServer::~ControlServer() {
    stop();
}

QString ControlServer::lastError() const {
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return m_lastError;
}

QHostAddress ControlServer::resolve(const QString& address) {
    const QString a = address.trimmed();
    if (a.isEmpty() || a == "localhost") return QHostAddress(QHostAddress::LocalHost);
    if (a == "*" || a == "any") return QHostAddress(QHostAddress::Any);

    QHostAddress ip;
    if (ip.setAddress(a)) return ip;

    const QHostInfo info = QHostInfo::fromName(a);
    for (const auto& candidate : info.addresses()) {
        if (candidate.protocol() == QAbstractSocket::IPv4Protocol) return candidate;
    }
    return info.addresses().isEmpty() ? QHostAddress() : info.addresses().first();
}

bool ControlServer::start() {
    if (m_server) return true;

    const QHostAddress address = resolve(m_cfg.address);
    if (address.isNull()) {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_lastError = QString("cannot resolve address '%1'").arg(m_cfg.address);
        qWarning().noquote() << "ControlServer:" << m_lastError;
        return false;
    }

    m_server = new QTcpServer(this);
    if (!m_server->listen(address, m_cfg.port)) {
        {
            std::lock_guard<std::mutex> lock(m_errorMutex);
            m_lastError = QString("cannot listen on %1:%2: %3")
                              .arg(m_cfg.address).arg(m_cfg.port).arg(m_server->errorString());
            qWarning().noquote() << "ControlServer:" << m_lastError;
        }
        delete m_server;
        m_server = nullptr;
        return false;
    }

    connect(m_server, &QTcpServer::newConnection, this, &ControlServer::onNewConnection);
    m_boundPort = m_server->serverPort();
    qInfo().noquote() << QString("ControlServer: %1 commands on %2:%3")
                             .arg(m_target ? m_target->kind() : QString("<none>"))
                             .arg(address.toString())
                             .arg(m_boundPort.load());
    return true;
}

void ControlServer::stop() {
    const auto sockets = m_clients.keys();
    for (auto* socket : sockets) {
        socket->disconnect(this);
        socket->abort();
        socket->deleteLater();
    }
    m_clients.clear();
    m_clientCount = 0;

    if (m_server) {
        m_server->close();
        delete m_server;
        m_server = nullptr;
        m_boundPort = 0;
    }
}

void ControlServer::onNewConnection() {
    while (m_server && m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();

        Client client;
        client.lineTimer = new QTimer(socket);
        client.lineTimer->setSingleShot(true);
        client.lineTimer->setInterval(m_cfg.timeoutMs);
        m_clients.insert(socket, client);
        m_clientCount = m_clients.size();

        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() { dropClient(socket); });
        connect(client.lineTimer, &QTimer::timeout, this, [this, socket]() { onLineTimeout(socket); });

        qDebug().noquote() << "ControlServer: client connected from" << socket->peerAddress().toString();
    }
}

void ControlServer::reply(QTcpSocket* socket, const QString& line) {
    socket->write(line.toUtf8());
    socket->write("\n");
}

void ControlServer::onReadyRead(QTcpSocket* socket) {
    auto it = m_clients.find(socket);
    if (it == m_clients.end()) return;

    it->buffer.append(socket->readAll());

    int newline = -1;
    while ((newline = it->buffer.indexOf('\n')) >= 0) {
        QByteArray raw = it->buffer.left(newline);
        it->buffer.remove(0, newline + 1);
        if (raw.size() > kMaxLineBytes) break;
        if (raw.endsWith('\r')) raw.chop(1);

        const QString line = QString::fromUtf8(raw).trimmed();
        if (line.isEmpty()) continue;

        const engine::CommandResult result = m_target ? m_target->handleCommand(line)
                                                      : engine::CommandResult::failure("no target");
        if (!result.ok) {
            qWarning().noquote() << QString("ControlServer: '%1' rejected: %2").arg(line, result.error);
        } else {
            qDebug().noquote() << QString("ControlServer: '%1' ok").arg(line);
        }
        reply(socket, result.toResponseLine());
    }

    if (it->buffer.size() > kMaxLineBytes || newline > kMaxLineBytes) {
        qWarning().noquote() << "ControlServer: line too long, disconnecting" << socket->peerAddress().toString();
        reply(socket, QString("ERROR line too long"));
        socket->flush();
        it->lineTimer->stop();
        socket->disconnectFromHost();
        return;
    }

    if (it->buffer.isEmpty()) it->lineTimer->stop();
    else if (!it->lineTimer->isActive()) it->lineTimer->start();
}

void ControlServer::onLineTimeout(QTcpSocket* socket) {
    if (!m_clients.contains(socket)) return;
    qWarning().noquote() << "ControlServer: timed out waiting for a complete line, disconnecting"
                         << socket->peerAddress().toString();
    socket->abort();
    dropClient(socket);
}

void ControlServer::dropClient(QTcpSocket* socket) {
    if (m_clients.remove(socket) == 0) return;
    m_clientCount = m_clients.size();
    qDebug().noquote() << "ControlServer: client disconnected";
    socket->deleteLater();
}

} // namespace xtalk::control
