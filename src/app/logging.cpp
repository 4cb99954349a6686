#include "app/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

#include <cstdio>

namespace vaultsync::app {
namespace {

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/vaultsync.log"));
}

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct FileSink {
    QMutex mu;
    QFile file;
    bool opened = false;
};

FileSink& sink() {
    static FileSink s{};
    return s;
}

void open_once(FileSink& s) {
    if (s.opened) return;
    s.opened = true;

    const auto path = compute_log_file_path();
    if (path.isEmpty()) {
        return;
    }

    QDir(QFileInfo(path).absolutePath()).mkpath(QStringLiteral("."));
    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "vaultsync: cannot open log file %s\n", qPrintable(path));
    }
}

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    auto& s = sink();
    QMutexLocker lock(&s.mu);
    open_once(s);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto category = ctx.category ? QString::fromLatin1(ctx.category) : QString{};
    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), category, msg);

    if (s.file.isOpen()) {
        s.file.write(line.toUtf8());
        s.file.flush();
    }
    // The "SYNC:" trace is logged on the default category.
    const bool echo = type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg ||
                      (type == QtInfoMsg && category == QLatin1String("default"));
    if (echo) {
        std::fputs(line.toLocal8Bit().constData(), stderr);
    }
}

} // namespace

void install_file_logging() {
    qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    return compute_log_file_path();
}

} // namespace vaultsync::app
