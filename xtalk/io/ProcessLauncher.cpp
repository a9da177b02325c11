#include "xtalk/io/ProcessLauncher.h"

#include <QDebug>
#include <QProcess>

namespace xtalk::io {

QProcessLauncher::QProcessLauncher(QObject* parent) : QObject(parent) {}

QProcessLauncher::~QProcessLauncher() {
    for (QProcess* p : findChildren<QProcess*>()) {
        p->disconnect(this);
        if (p->state() == QProcess::NotRunning) continue;
        p->terminate();
        if (!p->waitForFinished(1000)) p->kill();
    }
}

void QProcessLauncher::spawn(const QStringList& command) {
    if (command.isEmpty() || command.first().isEmpty()) {
        qWarning() << "Exec: refusing to run an empty command";
        return;
    }

    auto* proc = new QProcess(this);
    proc->setProgram(command.first());
    proc->setArguments(command.mid(1));
    proc->setStandardInputFile(QProcess::nullDevice());
    proc->setProcessChannelMode(QProcess::ForwardedChannels);

    const QString printable = command.join(' ');
    connect(proc, &QProcess::errorOccurred, this, [proc, printable](QProcess::ProcessError error) {
        qWarning().noquote() << QString("Exec: '%1' failed: %2 (%3)").arg(printable, proc->errorString()).arg(int(error));
        // FailedToStart never emits finished().
        if (error == QProcess::FailedToStart) proc->deleteLater();
    });
    connect(proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this,
            [proc, printable](int exitCode, QProcess::ExitStatus status) {
                if (status == QProcess::CrashExit) {
                    qWarning().noquote() << QString("Exec: '%1' crashed").arg(printable);
                } else if (exitCode != 0) {
                    qWarning().noquote() << QString("Exec: '%1' returned a non-zero exit code %2").arg(printable).arg(exitCode);
                } else {
                    qDebug().noquote() << QString("Exec: '%1' finished").arg(printable);
                }
                proc->deleteLater();
            });

    qDebug().noquote() << "Exec: starting" << printable;
    proc->start();
}

int QProcessLauncher::runningCount() const {
    int n = 0;
    for (const QProcess* p : findChildren<QProcess*>()) {
        if (p->state() != QProcess::NotRunning) ++n;
    }
    return n;
}

} // namespace xtalk::io
