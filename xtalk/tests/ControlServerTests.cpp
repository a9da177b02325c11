#include "xtalk/control/ControlServer.h"
#include "xtalk/policies/ReplacePolicy.h"

#include <QCoreApplication>
#include <QDeadlineTimer>
#include <QHostAddress>
#include <QTcpSocket>
#include <QThread>
#include <QtGlobal>

#include <memory>

using xtalk::control::ControlServer;
using xtalk::control::ControlServerConfig;
using xtalk::policies::ReplaceConfig;
using xtalk::policies::ReplacePolicy;
using xtalk::policies::ReplaceRule;

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectStrEq(const QString& a, const QString& b, const QString& msg) {
    expect(a == b, msg + QString(" (got '%1' expected '%2')").arg(a, b));
}

static ReplaceConfig twoRules() {
    ReplaceRule a;
    a.id = "a";
    a.from = {38};
    a.to = 40;
    ReplaceRule b;
    b.id = "b";
    b.from = {38};
    b.to = 41;
    ReplaceConfig cfg;
    cfg.rules = {a, b};
    return cfg;
}

// Runs a ControlServer on a thread of its own for the lifetime of the fixture.
struct ServerFixture {
    QThread thread;
    ControlServer* server = nullptr;
    bool started = false;

    ServerFixture(xtalk::engine::Policy* target, int timeoutMs) {
        ControlServerConfig cfg;
        cfg.address = "127.0.0.1";
        cfg.port = 0;
        cfg.timeoutMs = timeoutMs;
        server = new ControlServer(target, cfg);
        server->moveToThread(&thread);
        thread.start();
        QMetaObject::invokeMethod(server, "start", Qt::BlockingQueuedConnection, Q_RETURN_ARG(bool, started));
    }

    ~ServerFixture() {
        QMetaObject::invokeMethod(server, "stop", Qt::BlockingQueuedConnection);
        server->deleteLater();
        thread.quit();
        thread.wait();
    }

    std::unique_ptr<QTcpSocket> connect() const {
        auto socket = std::make_unique<QTcpSocket>();
        socket->connectToHost(QHostAddress::LocalHost, server->serverPort());
        if (!socket->waitForConnected(3000)) return nullptr;
        return socket;
    }
};

static QString readLine(QTcpSocket* socket, int timeoutMs = 3000) {
    QDeadlineTimer deadline(timeoutMs);
    while (!socket->canReadLine()) {
        if (deadline.hasExpired() || !socket->waitForReadyRead(int(deadline.remainingTime()))) return QString("<timeout>");
    }
    return QString::fromUtf8(socket->readLine()).trimmed();
}

static QString roundTrip(QTcpSocket* socket, const QByteArray& line) {
    socket->write(line);
    socket->flush();
    return readLine(socket);
}

static bool waitForDisconnect(QTcpSocket* socket, int timeoutMs) {
    if (socket->state() == QAbstractSocket::UnconnectedState) return true;
    return socket->waitForDisconnected(timeoutMs);
}

} // namespace

static void testCommands() {
    ReplacePolicy replace(twoRules());
    ServerFixture fx(&replace, 5000);
    expect(fx.started, "Server: listens on an ephemeral port: " + fx.server->lastError());
    expect(fx.server->serverPort() != 0, "Server: bound port reported");
    if (!fx.started) return;

    auto client = fx.connect();
    expect(client != nullptr, "Server: client connects");
    if (!client) return;

    expectStrEq(roundTrip(client.get(), "unique a\n"), "OK", "Server: unique a");
    expectStrEq(replace.enabledGroups().join(','), "a", "Server: command applied to the policy");

    expectStrEq(roundTrip(client.get(), "bogus\n"), "ERROR unknown command bogus", "Server: unknown command");
    expectStrEq(roundTrip(client.get(), "enable nobody\r\n"), "ERROR unknown id nobody", "Server: unknown id, CRLF accepted");
    expectStrEq(replace.enabledGroups().join(','), "a", "Server: failed commands change nothing");

    client->write("\n\nenable b\nnext\n");
    client->flush();
    expectStrEq(readLine(client.get()), "OK", "Server: first of two pipelined commands");
    expectStrEq(readLine(client.get()), "OK", "Server: second of two pipelined commands");
    expectStrEq(replace.enabledGroups().join(','), "b", "Server: next selects the group after a uniquely");

    // A command split across writes is applied once complete.
    client->write("disa");
    client->flush();
    QThread::msleep(50);
    expectStrEq(roundTrip(client.get(), "ble b\n"), "OK", "Server: partial line completed");
    expect(replace.enabledGroups().isEmpty(), "Server: disable b applied");

    auto second = fx.connect();
    expect(second != nullptr, "Server: concurrent client connects");
    if (second) {
        expectStrEq(roundTrip(second.get(), "toggle a\n"), "OK", "Server: second client served");
        expectStrEq(roundTrip(client.get(), "toggle a\n"), "OK", "Server: first client still served");
        expectStrEq(replace.enabledGroups().join(','), "", "Server: both toggles applied");
    }
}

static void testLimits() {
    ReplacePolicy replace(twoRules());
    ServerFixture fx(&replace, 300);
    expect(fx.started, "Limits: server started");
    if (!fx.started) return;

    auto longLine = fx.connect();
    expect(longLine != nullptr, "Limits: client connects");
    if (longLine) {
        longLine->write(QByteArray(ControlServer::kMaxLineBytes + 100, 'x'));
        longLine->flush();
        expectStrEq(readLine(longLine.get()), "ERROR line too long", "Limits: overlong line rejected");
        expect(waitForDisconnect(longLine.get(), 3000), "Limits: overlong line disconnects");
    }

    auto stalled = fx.connect();
    expect(stalled != nullptr, "Limits: stalled client connects");
    if (stalled) {
        stalled->write("enable a");
        stalled->flush();
        expect(waitForDisconnect(stalled.get(), 3000), "Limits: partial line times out");
        expect(!replace.isRuleEnabled(0), "Limits: timed out partial line never applied");
    }

    auto healthy = fx.connect();
    expect(healthy != nullptr, "Limits: server still accepts clients");
    if (healthy) expectStrEq(roundTrip(healthy.get(), "enable a\n"), "OK", "Limits: others unaffected");
}

static void testListenFailure() {
    ReplacePolicy replace(twoRules());
    ServerFixture first(&replace, 1000);
    if (!first.started) {
        expect(false, "ListenFailure: first server started");
        return;
    }

    ControlServerConfig cfg;
    cfg.address = "127.0.0.1";
    cfg.port = first.server->serverPort();
    ControlServer clash(&replace, cfg);
    expect(!clash.start(), "ListenFailure: port in use reported");
    expect(clash.lastError().contains("cannot listen"), "ListenFailure: error explains: " + clash.lastError());
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testCommands();
    testLimits();
    testListenFailure();

    if (g_failures == 0) {
        qInfo("ControlServerTests: PASS");
        return 0;
    }

    qWarning("ControlServerTests: FAIL (%d failures)", g_failures);
    return 1;
}
