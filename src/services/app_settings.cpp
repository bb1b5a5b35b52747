module;
#include <QSettings>
#include <QString>
#include <QtGlobal>

module kiln.services.app_settings;

void AppSettings::load()
{
    QSettings settings;
    settings.beginGroup(settingsGroup());
    volumeLabel = settings.value(QStringLiteral("volumeLabel"), volumeLabel).toString();
    downloadChunks = settings.value(QStringLiteral("downloadChunks"), downloadChunks).toInt();
    minChunkedSize = settings.value(QStringLiteral("minChunkedSize"), minChunkedSize).toLongLong();
    userAgent = settings.value(QStringLiteral("userAgent"), userAgent).toString();
    partitionStartSector = settings.value(QStringLiteral("partitionStartSector"), partitionStartSector).toLongLong();
    writePartitionTable = settings.value(QStringLiteral("writePartitionTable"), writePartitionTable).toBool();
    burnChunkBytes = settings.value(QStringLiteral("burnChunkBytes"), burnChunkBytes).toLongLong();
    wipeBeforeBurn = settings.value(QStringLiteral("wipeBeforeBurn"), wipeBeforeBurn).toBool();
    unmountTimeoutMs = settings.value(QStringLiteral("unmountTimeoutMs"), unmountTimeoutMs).toInt();
    logPath = settings.value(QStringLiteral("logPath"), logPath).toString();
    settings.endGroup();

    if (downloadChunks < 1) downloadChunks = 8;
    if (burnChunkBytes < 512 || burnChunkBytes % 512 != 0) burnChunkBytes = 4LL * 1024 * 1024;
    if (partitionStartSector < 0) partitionStartSector = 2048;
}

void AppSettings::save() const
{
    QSettings settings;
    settings.beginGroup(settingsGroup());
    settings.setValue(QStringLiteral("volumeLabel"), volumeLabel);
    settings.setValue(QStringLiteral("downloadChunks"), downloadChunks);
    settings.setValue(QStringLiteral("minChunkedSize"), minChunkedSize);
    settings.setValue(QStringLiteral("userAgent"), userAgent);
    settings.setValue(QStringLiteral("partitionStartSector"), partitionStartSector);
    settings.setValue(QStringLiteral("writePartitionTable"), writePartitionTable);
    settings.setValue(QStringLiteral("burnChunkBytes"), burnChunkBytes);
    settings.setValue(QStringLiteral("wipeBeforeBurn"), wipeBeforeBurn);
    settings.setValue(QStringLiteral("unmountTimeoutMs"), unmountTimeoutMs);
    settings.setValue(QStringLiteral("logPath"), logPath);
    settings.endGroup();
}
