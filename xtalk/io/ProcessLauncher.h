#pragma once

#include <QObject>
#include <QStringList>

namespace xtalk::io {

// Process-execution capability used by the exec policy. spawn() never blocks the caller.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;
    virtual void spawn(const QStringList& command) = 0;
};

// QProcess-backed launcher. Must live on a thread with a running event loop (the pipeline
// thread); finished processes are reaped asynchronously and failures are only logged.
class QProcessLauncher : public QObject, public ProcessLauncher {
    Q_OBJECT
public:
    explicit QProcessLauncher(QObject* parent = nullptr);
    ~QProcessLauncher() override;

    void spawn(const QStringList& command) override;
    int runningCount() const;
};

} // namespace xtalk::io
