#include <QCoreApplication>
#include <QDebug>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QEventLoop>
#include <QFutureWatcher>
#include <QTextStream>
#include <QTimer>
#include <QUrl>
#include <QtConcurrent>

#include <atomic>
#include <csignal>
#include <functional>

import kiln.core.operation;
import kiln.core.chunkeddownloader;
import kiln.core.fat32formatter;
import kiln.core.imageburner;
import kiln.device.device_handle;
import kiln.device.unmounter;
import kiln.services.app_settings;
import kiln.services.debug_log;
import kiln.utils.download_utils;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace utils = kiln::utils;

namespace {

std::atomic<bool> g_interrupted{false};

void onInterrupt(int)
{
    g_interrupted.store(true);
}

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

// Polls the interrupt flag on the main thread and forwards it to the running operation.
QTimer* watchInterrupt(QObject* parent, const std::function<void()>& cancel)
{
    auto* timer = new QTimer(parent);
    timer->setInterval(100);
    QObject::connect(timer, &QTimer::timeout, parent, [timer, cancel]() {
        if (!g_interrupted.load()) return;
        err() << "\nCancelling..." << Qt::endl;
        timer->stop();
        cancel();
    });
    timer->start();
    return timer;
}

QString percentOf(qint64 done, qint64 total)
{
    if (total <= 0) return utils::formatBytes(done);
    return QStringLiteral("%1% (%2 / %3)")
        .arg(100.0 * static_cast<double>(done) / static_cast<double>(total), 0, 'f', 1)
        .arg(utils::formatBytes(done), utils::formatBytes(total));
}

OperationResult runDownload(const QStringList& args, const QCommandLineParser& parser,
                            const AppSettings& settings, DebugLog* log)
{
    if (args.isEmpty()) {
        return OperationResult::failure(ErrorKind::InvalidArgument,
                                        QStringLiteral("usage: kiln download <url> [dest]"));
    }
    const QUrl url = QUrl::fromUserInput(args.at(0));
    const QString dest = args.size() > 1 ? args.at(1) : utils::fileNameFromUrl(url);

    bool okSize = true;
    const qint64 expectedSize = parser.isSet(QStringLiteral("size"))
                                    ? parser.value(QStringLiteral("size")).toLongLong(&okSize) : -1;
    bool okChunks = true;
    const int chunks = parser.isSet(QStringLiteral("chunks"))
                           ? parser.value(QStringLiteral("chunks")).toInt(&okChunks) : settings.downloadChunks;
    if (!okSize || !okChunks) {
        return OperationResult::failure(ErrorKind::InvalidArgument, QStringLiteral("--size and --chunks take integers"));
    }

    ChunkedDownloader downloader(url, dest, expectedSize, chunks);
    downloader.setDebugLog(log);
    downloader.setUserAgent(settings.userAgent);
    downloader.setMinChunkedSize(settings.minChunkedSize);
    if (parser.isSet(QStringLiteral("sha256"))) downloader.setExpectedChecksum(parser.value(QStringLiteral("sha256")));

    OperationResult result;
    QEventLoop loop;
    QObject::connect(&downloader, &ChunkedDownloader::started, &loop, [](qint64 total, bool chunked) {
        out() << (chunked ? "Chunked download, " : "Single-stream download, ")
              << (total > 0 ? utils::formatBytes(total) : QStringLiteral("unknown size")) << Qt::endl;
    });
    QObject::connect(&downloader, &ChunkedDownloader::progress, &loop, [](qint64 received, qint64 total) {
        out() << "\rDownloading " << percentOf(received, total) << "    " << Qt::flush;
    });
    QObject::connect(&downloader, &ChunkedDownloader::finished, &loop, [&](const OperationResult& r) {
        result = r;
        loop.quit();
    });
    watchInterrupt(&loop, [&downloader]() { downloader.cancel(); });

    QTimer::singleShot(0, &downloader, &ChunkedDownloader::start);
    loop.exec();
    out() << Qt::endl;
    return result;
}

OperationResult runFormat(const QStringList& args, const QCommandLineParser& parser,
                          const AppSettings& settings, DebugLog* log)
{
    if (args.isEmpty()) {
        return OperationResult::failure(ErrorKind::InvalidArgument, QStringLiteral("usage: kiln format <device>"));
    }
    const QString device = args.at(0);
    const QString label = parser.isSet(QStringLiteral("label")) ? parser.value(QStringLiteral("label"))
                                                                : settings.volumeLabel;
    bool okStart = true;
    const qint64 start = parser.isSet(QStringLiteral("start-sector"))
                             ? parser.value(QStringLiteral("start-sector")).toLongLong(&okStart)
                             : settings.partitionStartSector;
    bool okSize = true;
    const qint64 totalBytes = parser.isSet(QStringLiteral("size"))
                                  ? parser.value(QStringLiteral("size")).toLongLong(&okSize) : -1;
    if (!okStart || !okSize) {
        return OperationResult::failure(ErrorKind::InvalidArgument,
                                        QStringLiteral("--start-sector and --size take integers"));
    }
    bool partitionTable = settings.writePartitionTable;
    if (parser.isSet(QStringLiteral("partition-table"))) partitionTable = true;
    if (parser.isSet(QStringLiteral("no-partition-table"))) partitionTable = false;

    RawDeviceHandle handle;
    Fat32Formatter formatter(&handle);
    formatter.setDebugLog(log);
    formatter.setPartitionStartSector(start);
    formatter.setWritePartitionTable(partitionTable);

    QEventLoop loop;
    QObject::connect(&formatter, &Fat32Formatter::progress, &loop, [](const FormatProgress& p) {
        switch (p.stage) {
        case FormatProgress::Stage::Started:           out() << "Formatting started" << Qt::endl; break;
        case FormatProgress::Stage::CreatingPartition: out() << "Writing partition table" << Qt::endl; break;
        case FormatProgress::Stage::Formatting:        out() << "Writing file system structures" << Qt::endl; break;
        case FormatProgress::Stage::Completed:         out() << "Format completed" << Qt::endl; break;
        case FormatProgress::Stage::Cancelled:         out() << "Format cancelled" << Qt::endl; break;
        case FormatProgress::Stage::Error:             break;
        }
    });
    watchInterrupt(&loop, [&formatter]() { formatter.cancel(); });

    QFutureWatcher<OperationResult> watcher;
    QObject::connect(&watcher, &QFutureWatcher<OperationResult>::finished, &loop, &QEventLoop::quit);
    watcher.setFuture(QtConcurrent::run([&formatter, device, label, totalBytes]() {
        return formatter.format(device, label, totalBytes);
    }));
    loop.exec();
    return watcher.result();
}

OperationResult runBurn(const QStringList& args, const AppSettings& settings, DebugLog* log)
{
    if (args.size() < 2) {
        return OperationResult::failure(ErrorKind::InvalidArgument, QStringLiteral("usage: kiln burn <image> <device>"));
    }
    const QString image = args.at(0);
    const QString device = args.at(1);

    RawDeviceHandle handle;
    SystemUnmounter unmounter;
    ImageBurner burner(&handle, &unmounter);
    burner.setDebugLog(log);
    burner.setChunkSize(settings.burnChunkBytes);
    burner.setWipeBeforeWrite(settings.wipeBeforeBurn);
    burner.setUnmountTimeoutMs(settings.unmountTimeoutMs);

    QEventLoop loop;
    QObject::connect(&burner, &ImageBurner::progress, &loop, [](const BurnProgress& p) {
        switch (p.phase) {
        case BurnProgress::Phase::Started:
            out() << "Burning " << utils::formatBytes(p.total) << Qt::endl;
            break;
        case BurnProgress::Phase::Writing:
            out() << "\rWriting   " << percentOf(p.processed, p.total) << "    " << Qt::flush;
            break;
        case BurnProgress::Phase::Verifying:
            out() << "\rVerifying " << percentOf(p.processed, p.total) << "    " << Qt::flush;
            break;
        case BurnProgress::Phase::Completed:
            out() << "\nBurn completed and verified" << Qt::endl;
            break;
        case BurnProgress::Phase::Cancelled:
            out() << "\nBurn cancelled" << Qt::endl;
            break;
        case BurnProgress::Phase::Error:
            out() << Qt::endl;
            break;
        }
    });
    watchInterrupt(&loop, [&burner]() { burner.cancel(); });

    QFutureWatcher<OperationResult> watcher;
    QObject::connect(&watcher, &QFutureWatcher<OperationResult>::finished, &loop, &QEventLoop::quit);
    watcher.setFuture(QtConcurrent::run([&burner, image, device]() {
        return burner.burn(image, device);
    }));
    loop.exec();
    return watcher.result();
}

int exitCodeFor(const OperationResult& result)
{
    switch (result.outcome) {
    case Outcome::Completed: return 0;
    case Outcome::Cancelled: return 2;
    case Outcome::Error:     return 1;
    }
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Kiln"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    qRegisterMetaType<OperationResult>("OperationResult");
    qRegisterMetaType<FormatProgress>("FormatProgress");
    qRegisterMetaType<BurnProgress>("BurnProgress");

    AppSettings settings;
    settings.load();

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Provision SD cards and USB drives: download, format, burn."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("download | format | burn"));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."), QStringLiteral("[args...]"));
    parser.addOptions({
        {QStringLiteral("log"), QStringLiteral("Debug log file."), QStringLiteral("path")},
        {QStringLiteral("copy-log"), QStringLiteral("Copy the debug log into a directory when done, e.g. the card."), QStringLiteral("dir")},
        {QStringLiteral("size"), QStringLiteral("download: expected size; format: device size in bytes."), QStringLiteral("bytes")},
        {QStringLiteral("chunks"), QStringLiteral("download: number of chunks."), QStringLiteral("n")},
        {QStringLiteral("sha256"), QStringLiteral("download: expected checksum."), QStringLiteral("hex")},
        {QStringLiteral("label"), QStringLiteral("format: volume label."), QStringLiteral("label")},
        {QStringLiteral("start-sector"), QStringLiteral("format: first sector of the partition."), QStringLiteral("sector")},
        {QStringLiteral("partition-table"), QStringLiteral("format: write an MBR partition table.")},
        {QStringLiteral("no-partition-table"), QStringLiteral("format: format the device without an MBR.")},
    });
    parser.process(app);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) parser.showHelp(1);
    const QString command = args.takeFirst();

    DebugLog log;
    QString logPath = parser.value(QStringLiteral("log"));
    if (logPath.isEmpty()) logPath = settings.logPath;
    if (logPath.isEmpty()) logPath = DebugLog::defaultPath();
    if (!log.open(logPath)) {
        qWarning() << "Debug log unavailable at" << logPath;
    }

    std::signal(SIGINT, onInterrupt);

    OperationResult result;
    if (command == QLatin1String("download")) {
        result = runDownload(args, parser, settings, &log);
    } else if (command == QLatin1String("format")) {
        result = runFormat(args, parser, settings, &log);
    } else if (command == QLatin1String("burn")) {
        result = runBurn(args, settings, &log);
    } else {
        err() << "Unknown command: " << command << Qt::endl;
        parser.showHelp(1);
    }

    if (result.isError()) {
        err() << result.toString() << Qt::endl;
        const QString hint = OperationResult::guidance(result.category());
        if (!hint.isEmpty()) err() << hint << Qt::endl;
    } else if (result.isCancelled() && !result.detail.isEmpty()) {
        err() << result.detail << Qt::endl;
    }
    if (log.isOpen()) err() << "Debug log: " << log.path() << Qt::endl;

    const QString copyDir = parser.value(QStringLiteral("copy-log"));
    if (!copyDir.isEmpty() && log.isOpen()) {
        log.log(QStringLiteral("Copying debug log to %1").arg(copyDir));
        if (log.copyTo(copyDir)) {
            err() << "Debug log copied to " << QDir(copyDir).filePath(QStringLiteral("installer_debug.txt")) << Qt::endl;
        } else {
            err() << "Could not copy the debug log to " << copyDir << Qt::endl;
        }
    }

    return exitCodeFor(result);
}
