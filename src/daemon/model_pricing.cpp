#include "daemon/model_pricing.hpp"

#include <algorithm>
#include <cctype>

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace tracedeck {

namespace {

constexpr double kTokensPerMillion = 1000000.0;

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

double perMillion(const nlohmann::json &entry, const char *key)
{
    if (!entry.contains(key) || !entry.at(key).is_number()) {
        return 0.0;
    }
    return entry.at(key).get<double>() * kTokensPerMillion;
}

} // namespace

ModelPricing::ModelPricing()
{
    m_prices = {
        {"claude-opus-4", {15.0, 75.0, 1.875, 18.75}},
        {"claude-sonnet-4", {3.0, 15.0, 0.30, 3.75}},
        {"claude-3-5-haiku", {0.8, 4.0, 0.08, 1.0}},
        {"gpt-5", {2.0, 10.0, 0.0, 0.0}},
        {"gpt-4.1", {2.0, 8.0, 0.5, 0.0}},
        {"o3", {2.0, 8.0, 0.5, 0.0}},
    };
}

void ModelPricing::setPrice(const std::string &model, const ModelPrice &price)
{
    m_prices[toLower(model)] = price;
}

std::optional<ModelPrice> ModelPricing::priceFor(const std::string &model) const
{
    if (model.empty()) {
        return std::nullopt;
    }
    const std::string name = toLower(model);

    for (const char *prefix : {"", "anthropic/", "claude-", "openai/"}) {
        const auto it = m_prices.find(prefix + name);
        if (it != m_prices.end()) {
            return it->second;
        }
    }

    const std::pair<const char *, const char *> families[] = {
        {"opus", "claude-opus-4"},
        {"sonnet", "claude-sonnet-4"},
        {"haiku", "claude-3-5-haiku"},
        {"gpt-5", "gpt-5"},
        {"gpt-4.1", "gpt-4.1"},
        {"o3", "o3"},
    };
    for (const auto &[needle, key] : families) {
        if (name.find(needle) != std::string::npos) {
            const auto it = m_prices.find(key);
            if (it != m_prices.end()) {
                return it->second;
            }
        }
    }
    return std::nullopt;
}

double ModelPricing::estimateCost(const std::optional<std::string> &model,
                                  int64_t inputTokens,
                                  int64_t outputTokens,
                                  int64_t cacheReadTokens,
                                  int64_t cacheCreationTokens) const
{
    if (!model) {
        return 0.0;
    }
    const auto price = priceFor(*model);
    if (!price) {
        return 0.0;
    }

    return (static_cast<double>(inputTokens) * price->inputPerMillion
            + static_cast<double>(outputTokens) * price->outputPerMillion
            + static_cast<double>(cacheReadTokens) * price->cacheReadPerMillion
            + static_cast<double>(cacheCreationTokens) * price->cacheWritePerMillion)
        / kTokensPerMillion;
}

double ModelPricing::estimateCost(const UsageStats &stats) const
{
    return estimateCost(stats.model,
                        stats.inputTokens,
                        stats.outputTokens,
                        stats.cacheReadTokens,
                        stats.cacheCreationTokens);
}

bool ModelPricing::loadOverrides(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }

    const QByteArray data = file.readAll();
    const auto document = nlohmann::json::parse(data.constData(),
                                                data.constData() + data.size(),
                                                nullptr,
                                                false);
    if (document.is_discarded() || !document.is_object()) {
        TDLOG_WARN(QStringLiteral("ModelPricing"),
                   QStringLiteral("loadOverrides"),
                   QStringLiteral("price_file_invalid"),
                   QStringLiteral("json_parse_failed"),
                   QStringLiteral("keep_builtin_table"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json({{"path", path.toStdString()}}));
        return false;
    }

    int loaded = 0;
    for (const auto &[model, entry] : document.items()) {
        if (!entry.is_object() || !entry.contains("input_cost_per_token")) {
            continue;
        }
        ModelPrice price;
        price.inputPerMillion = perMillion(entry, "input_cost_per_token");
        price.outputPerMillion = perMillion(entry, "output_cost_per_token");
        price.cacheReadPerMillion = perMillion(entry, "cache_read_input_token_cost");
        price.cacheWritePerMillion = perMillion(entry, "cache_creation_input_token_cost");
        m_prices[toLower(model)] = price;
        ++loaded;
    }

    TDLOG_INFO(QStringLiteral("ModelPricing"),
               QStringLiteral("loadOverrides"),
               QStringLiteral("price_file_loaded"),
               QStringLiteral("startup"),
               QStringLiteral("merge_over_builtin"),
               logging::defaultWho(),
               QString(),
               nlohmann::json({{"path", path.toStdString()}, {"models", loaded}}));
    return true;
}

} // namespace tracedeck
