#pragma once

#include <map>
#include <optional>
#include <string>

#include <QString>

#include "common/models.hpp"

namespace tracedeck {

// USD per million tokens.
struct ModelPrice {
    double inputPerMillion = 0.0;
    double outputPerMillion = 0.0;
    double cacheReadPerMillion = 0.0;
    double cacheWritePerMillion = 0.0;
};

/**
 * Static per-model rate table with fuzzy model-name matching. Estimates are
 * approximate. Models that match nothing cost zero.
 */
class ModelPricing {
public:
    ModelPricing();

    std::optional<ModelPrice> priceFor(const std::string &model) const;

    double estimateCost(const std::optional<std::string> &model,
                        int64_t inputTokens,
                        int64_t outputTokens,
                        int64_t cacheReadTokens = 0,
                        int64_t cacheCreationTokens = 0) const;

    double estimateCost(const UsageStats &stats) const;

    // Merges a price file of the form
    // {"model": {"input_cost_per_token": ..., "output_cost_per_token": ...,
    //            "cache_read_input_token_cost": ..., "cache_creation_input_token_cost": ...}}
    // over the built-in table. Returns false if the file is missing or unparseable.
    bool loadOverrides(const QString &path);

    void setPrice(const std::string &model, const ModelPrice &price);

private:
    std::map<std::string, ModelPrice> m_prices;
};

} // namespace tracedeck
