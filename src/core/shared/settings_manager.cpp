#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace cr {

namespace {

void readInt(const QJsonObject& json, const char* key, int* out)
{
    const QString name = QString::fromLatin1(key);
    if (json.contains(name)) {
        *out = json.value(name).toInt(*out);
    }
}

void readDouble(const QJsonObject& json, const char* key, double* out)
{
    const QString name = QString::fromLatin1(key);
    if (json.contains(name)) {
        *out = json.value(name).toDouble(*out);
    }
}

void readString(const QJsonObject& json, const char* key, QString* out)
{
    const QString name = QString::fromLatin1(key);
    if (json.contains(name)) {
        *out = json.value(name).toString(*out);
    }
}

} // namespace

std::optional<RagSettings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<RagSettings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(crCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(crCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const RagSettings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const RagSettings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(crCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(crCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(crCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/citerag/settings.json");
}

QJsonObject SettingsManager::toJson(const RagSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("hybridRetrieval"), settings.hybridRetrieval);
    json.insert(QStringLiteral("denseTopK"), settings.denseTopK);
    json.insert(QStringLiteral("sparseTopK"), settings.sparseTopK);
    json.insert(QStringLiteral("minCosineSimilarity"), settings.minCosineSimilarity);
    json.insert(QStringLiteral("bm25MinScore"), settings.bm25MinScore);
    json.insert(QStringLiteral("bm25K1"), settings.bm25K1);
    json.insert(QStringLiteral("bm25B"), settings.bm25B);
    json.insert(QStringLiteral("bm25Epsilon"), settings.bm25Epsilon);
    json.insert(QStringLiteral("rrfK"), settings.rrfK);
    json.insert(QStringLiteral("fusedTopK"), settings.fusedTopK);
    json.insert(QStringLiteral("maxContextChars"), settings.maxContextChars);
    json.insert(QStringLiteral("maxContextCitations"), settings.maxContextCitations);
    json.insert(QStringLiteral("maxAnswerCitations"), settings.maxAnswerCitations);
    json.insert(QStringLiteral("streamSuppressionBatch"), settings.streamSuppressionBatch);
    json.insert(QStringLiteral("generationMaxRetries"), settings.generationMaxRetries);
    json.insert(QStringLiteral("generationBackoffMs"), settings.generationBackoffMs);
    json.insert(QStringLiteral("refusalMessage"), settings.refusalMessage);
    json.insert(QStringLiteral("degradedMessage"), settings.degradedMessage);
    return json;
}

RagSettings SettingsManager::fromJson(const QJsonObject& json)
{
    RagSettings settings;

    if (json.contains(QStringLiteral("hybridRetrieval"))) {
        settings.hybridRetrieval = json.value(QStringLiteral("hybridRetrieval"))
                                       .toBool(settings.hybridRetrieval);
    }

    readInt(json, "denseTopK", &settings.denseTopK);
    readInt(json, "sparseTopK", &settings.sparseTopK);
    readDouble(json, "minCosineSimilarity", &settings.minCosineSimilarity);
    readDouble(json, "bm25MinScore", &settings.bm25MinScore);
    readDouble(json, "bm25K1", &settings.bm25K1);
    readDouble(json, "bm25B", &settings.bm25B);
    readDouble(json, "bm25Epsilon", &settings.bm25Epsilon);
    readInt(json, "rrfK", &settings.rrfK);
    readInt(json, "fusedTopK", &settings.fusedTopK);
    readInt(json, "maxContextChars", &settings.maxContextChars);
    readInt(json, "maxContextCitations", &settings.maxContextCitations);
    readInt(json, "maxAnswerCitations", &settings.maxAnswerCitations);
    readInt(json, "streamSuppressionBatch", &settings.streamSuppressionBatch);
    readInt(json, "generationMaxRetries", &settings.generationMaxRetries);
    readInt(json, "generationBackoffMs", &settings.generationBackoffMs);
    readString(json, "refusalMessage", &settings.refusalMessage);
    readString(json, "degradedMessage", &settings.degradedMessage);

    return settings;
}

std::optional<QString> SettingsManager::validate(const RagSettings& settings)
{
    if (settings.denseTopK <= 0) {
        return QStringLiteral("denseTopK");
    }
    if (settings.sparseTopK <= 0) {
        return QStringLiteral("sparseTopK");
    }
    if (settings.rrfK < 0) {
        return QStringLiteral("rrfK");
    }
    if (settings.fusedTopK <= 0) {
        return QStringLiteral("fusedTopK");
    }
    if (settings.maxContextChars <= 0) {
        return QStringLiteral("maxContextChars");
    }
    if (settings.maxContextCitations <= 0) {
        return QStringLiteral("maxContextCitations");
    }
    if (settings.maxAnswerCitations <= 0) {
        return QStringLiteral("maxAnswerCitations");
    }
    if (settings.streamSuppressionBatch <= 0) {
        return QStringLiteral("streamSuppressionBatch");
    }
    if (settings.generationMaxRetries <= 0) {
        return QStringLiteral("generationMaxRetries");
    }
    if (settings.generationBackoffMs < 0) {
        return QStringLiteral("generationBackoffMs");
    }
    if (settings.bm25K1 < 0.0 || settings.bm25B < 0.0 || settings.bm25B > 1.0) {
        return QStringLiteral("bm25");
    }
    return std::nullopt;
}

} // namespace cr
