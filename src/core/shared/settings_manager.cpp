#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace rb {

namespace {

QJsonObject weightsToJson(const ScoringWeights& weights)
{
    QJsonObject json;
    json.insert(QStringLiteral("exactMatchBonus"), weights.exactMatchBonus);
    json.insert(QStringLiteral("keywordPhrasePoints"), weights.keywordPhrasePoints);
    json.insert(QStringLiteral("keywordRegexPoints"), weights.keywordRegexPoints);
    json.insert(QStringLiteral("similarityWeight"), weights.similarityWeight);
    json.insert(QStringLiteral("priorityWeight"), weights.priorityWeight);
    json.insert(QStringLiteral("similarityMatchThreshold"), weights.similarityMatchThreshold);
    return json;
}

ScoringWeights weightsFromJson(const QJsonObject& json)
{
    ScoringWeights weights;
    weights.exactMatchBonus = json.value(QStringLiteral("exactMatchBonus"))
                                  .toInt(weights.exactMatchBonus);
    weights.keywordPhrasePoints = json.value(QStringLiteral("keywordPhrasePoints"))
                                      .toInt(weights.keywordPhrasePoints);
    weights.keywordRegexPoints = json.value(QStringLiteral("keywordRegexPoints"))
                                     .toInt(weights.keywordRegexPoints);
    weights.similarityWeight = json.value(QStringLiteral("similarityWeight"))
                                   .toInt(weights.similarityWeight);
    weights.priorityWeight = json.value(QStringLiteral("priorityWeight"))
                                 .toInt(weights.priorityWeight);
    weights.similarityMatchThreshold =
        json.value(QStringLiteral("similarityMatchThreshold"))
            .toDouble(weights.similarityMatchThreshold);
    return weights;
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return loadFromFile(settingsFilePath());
}

std::optional<Settings> SettingsManager::loadFromFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(rbCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(rbCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return saveToFile(settings, settingsFilePath());
}

bool SettingsManager::saveToFile(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(rbCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(rbCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(rbCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/rulebot/settings.json");
}

QString SettingsManager::defaultDbPath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/rulebot/rulebot.db");
}

Settings SettingsManager::applyEnvironment(Settings settings)
{
    if (qEnvironmentVariableIsSet("RULEBOT_DEBUG")) {
        settings.debug = qEnvironmentVariable("RULEBOT_DEBUG") == QLatin1String("1");
    }

    const QString dbOverride = qEnvironmentVariable("RULEBOT_DB_PATH").trimmed();
    if (!dbOverride.isEmpty()) {
        settings.dbPath = dbOverride;
    }

    if (settings.dbPath.isEmpty()) {
        settings.dbPath = defaultDbPath();
    }
    return settings;
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("defaultBotSlug"), settings.defaultBotSlug);
    json.insert(QStringLiteral("debug"), settings.debug);
    json.insert(QStringLiteral("keywordCacheEntries"), settings.keywordCacheEntries);
    json.insert(QStringLiteral("weights"), weightsToJson(settings.weights));
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.defaultBotSlug = json.value(QStringLiteral("defaultBotSlug"))
                                  .toString(settings.defaultBotSlug);
    settings.debug = json.value(QStringLiteral("debug")).toBool(settings.debug);

    if (json.contains(QStringLiteral("keywordCacheEntries"))) {
        settings.keywordCacheEntries = std::max(
            0, json.value(QStringLiteral("keywordCacheEntries")).toInt(settings.keywordCacheEntries));
    }

    if (json.value(QStringLiteral("weights")).isObject()) {
        settings.weights = weightsFromJson(json.value(QStringLiteral("weights")).toObject());
    }

    return settings;
}

} // namespace rb
