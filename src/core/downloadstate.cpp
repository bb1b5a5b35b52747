module;
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QString>
#include <QVector>
#include <QtGlobal>

module kiln.core.downloadstate;

import kiln.core.chunkplan;
import kiln.utils.download_utils;

namespace utils = kiln::utils;

OperationResult DownloadState::create(const QString& url,
                                      qint64 totalSize,
                                      const QString& destPath,
                                      int chunkCount,
                                      DownloadState& out)
{
    QVector<ChunkState> chunks;
    const OperationResult planned = ChunkPlan::plan(totalSize, chunkCount, chunks);
    if (!planned.ok()) return planned;

    DownloadState state;
    state.m_url = url;
    state.m_totalSize = totalSize;
    state.m_destPath = utils::normalizeFilePath(destPath);
    state.m_chunks = chunks;
    state.m_downloadedBytes = 0;
    out = state;
    return OperationResult::success();
}

void DownloadState::markComplete(int index, qint64 bytes)
{
    if (index < 0 || index >= m_chunks.size()) return;
    ChunkState& chunk = m_chunks[index];
    if (chunk.completed) return;
    chunk.completed = true;
    m_downloadedBytes += bytes;
}

QVector<int> DownloadState::incompleteChunkIndices() const
{
    QVector<int> out;
    for (int i = 0; i < m_chunks.size(); ++i) {
        if (!m_chunks.at(i).completed) out.push_back(i);
    }
    return out;
}

double DownloadState::completionPercentage() const
{
    if (m_totalSize <= 0) return 0.0;
    return static_cast<double>(m_downloadedBytes) / static_cast<double>(m_totalSize) * 100.0;
}

bool DownloadState::isComplete() const
{
    for (const ChunkState& c : m_chunks) {
        if (!c.completed) return false;
    }
    return !m_chunks.isEmpty();
}

void DownloadState::recomputeDownloadedBytes()
{
    qint64 sum = 0;
    for (const ChunkState& c : m_chunks) {
        if (c.completed) sum += c.length();
    }
    m_downloadedBytes = sum;
}

bool DownloadState::matches(const QString& url, qint64 totalSize) const
{
    return m_url == url && m_totalSize == totalSize;
}

bool DownloadState::isValid() const
{
    return m_totalSize > 0 && ChunkPlan::isContiguous(m_chunks, m_totalSize);
}

QJsonObject DownloadState::toJson() const
{
    QJsonObject obj;
    obj.insert("url", m_url);
    obj.insert("total_size", m_totalSize);
    obj.insert("dest_path", m_destPath);
    QJsonArray chunks;
    for (const ChunkState& c : m_chunks) {
        QJsonObject chunkObj;
        chunkObj.insert("start", c.start);
        chunkObj.insert("end", c.end);
        chunkObj.insert("completed", c.completed);
        chunks.append(chunkObj);
    }
    obj.insert("chunks", chunks);
    obj.insert("downloaded_bytes", m_downloadedBytes);
    return obj;
}

bool DownloadState::fromJson(const QJsonObject& obj, DownloadState& out)
{
    if (!obj.value("url").isString()) return false;
    if (!obj.value("total_size").isDouble()) return false;
    if (!obj.value("dest_path").isString()) return false;
    if (!obj.value("chunks").isArray()) return false;
    if (!obj.value("downloaded_bytes").isDouble()) return false;

    DownloadState state;
    state.m_url = obj.value("url").toString();
    state.m_totalSize = obj.value("total_size").toInteger();
    state.m_destPath = obj.value("dest_path").toString();
    state.m_downloadedBytes = obj.value("downloaded_bytes").toInteger();

    const QJsonArray chunks = obj.value("chunks").toArray();
    for (const QJsonValue& value : chunks) {
        if (!value.isObject()) return false;
        const QJsonObject chunkObj = value.toObject();
        if (!chunkObj.value("start").isDouble() || !chunkObj.value("end").isDouble()) return false;
        if (!chunkObj.value("completed").isBool()) return false;
        ChunkState c;
        c.start = chunkObj.value("start").toInteger();
        c.end = chunkObj.value("end").toInteger();
        c.completed = chunkObj.value("completed").toBool();
        state.m_chunks.push_back(c);
    }

    if (!state.isValid()) return false;
    if (state.m_downloadedBytes < 0 || state.m_downloadedBytes > state.m_totalSize) return false;
    out = state;
    return true;
}

OperationResult DownloadState::save() const
{
    const QString path = stateFilePath(m_destPath);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Cannot open state file" << path << file.errorString();
        return OperationResult::failure(ErrorKind::IoError,
                                        QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
    }
    const QByteArray payload = QJsonDocument(toJson()).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size() || !file.commit()) {
        qWarning() << "Cannot commit state file" << path << file.errorString();
        return OperationResult::failure(ErrorKind::IoError,
                                        QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
    }
    return OperationResult::success();
}

DownloadState::LoadResult DownloadState::load(const QString& destPath, DownloadState& out)
{
    const QString path = stateFilePath(destPath);
    QFile file(path);
    if (!file.exists()) return LoadResult::NotFound;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot read state file" << path << file.errorString();
        return LoadResult::IoError;
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "State file does not parse" << path << err.errorString();
        return LoadResult::Corrupt;
    }
    if (!fromJson(doc.object(), out)) {
        qWarning() << "State file is inconsistent" << path;
        return LoadResult::Corrupt;
    }
    return LoadResult::Ok;
}

bool DownloadState::remove(const QString& destPath)
{
    const QString path = stateFilePath(destPath);
    if (!QFile::exists(path)) return true;
    return QFile::remove(path);
}

bool DownloadState::exists(const QString& destPath)
{
    return utils::fileExistsPath(stateFilePath(destPath));
}

QString DownloadState::stateFilePath(const QString& destPath)
{
    return utils::partialStatePath(destPath);
}
