// Bulk transfer through an rsync subprocess over ssh.
// Used for directory-heavy drops; progress comes from --info=progress2.
#pragma once
#include <QString>
#include <QStringList>
#include <functional>
#include "TransferTypes.hpp"
#include "remotebridge/SftpError.hpp"
#include "remotebridge/SftpTypes.hpp"

class RsyncTransport {
public:
    using ProgressCB = std::function<void(quint64 done, qint64 total)>;
    using CancelCB = std::function<bool()>;

    explicit RsyncTransport(QString program = QStringLiteral("rsync"));
    virtual ~RsyncTransport() = default;

    void setProgram(const QString& p) { program_ = p; }
    const QString& program() const { return program_; }

    // Runs one record to completion on the calling thread (a queue worker).
    // Cancellation terminates the child; ErrorKind::Cancelled is reported.
    virtual bool run(const remotebridge::SessionOptions& endpoint, const TransferRecord& rec,
                     ProgressCB progress, CancelCB shouldCancel, remotebridge::Error& err);

    static QStringList buildArguments(const remotebridge::SessionOptions& endpoint,
                                      TransferRecord::Direction direction,
                                      const QString& src, const QString& dst, bool srcIsDir);
    // "  1,234,567  45%  1.20MB/s  0:00:03 (xfr#2, to-chk=1/4)"
    static bool parseProgress(const QString& line, quint64& bytes, int& percent);
    static remotebridge::ErrorKind classifyFailure(int exitCode, const QString& stderrText);

private:
    QString program_;
};
