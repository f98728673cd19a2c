#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "daemon/model_pricing.hpp"

class ModelPricingTests : public QObject
{
    Q_OBJECT
private slots:
    void testFamilyMatching();
    void testEstimateCost();
    void testUnknownModelIsFree();
    void testLoadOverrides();
    void testInvalidOverrideFile();
};

void ModelPricingTests::testFamilyMatching()
{
    const tracedeck::ModelPricing pricing;

    const auto sonnet = pricing.priceFor("claude-sonnet-4-5-20250929");
    QVERIFY(sonnet.has_value());
    QCOMPARE(sonnet->inputPerMillion, 3.0);
    QCOMPARE(sonnet->outputPerMillion, 15.0);

    const auto prefixed = pricing.priceFor("Anthropic/Claude-Opus-4");
    QVERIFY(prefixed.has_value());
    QCOMPARE(prefixed->outputPerMillion, 75.0);

    const auto codex = pricing.priceFor("gpt-5-codex");
    QVERIFY(codex.has_value());
    QCOMPARE(codex->inputPerMillion, 2.0);
}

void ModelPricingTests::testEstimateCost()
{
    const tracedeck::ModelPricing pricing;

    const double cost = pricing.estimateCost(std::string("claude-sonnet-4"),
                                             1000000, 100000, 2000000, 0);
    QVERIFY(qFuzzyCompare(cost, 3.0 + 1.5 + 0.6));

    tracedeck::UsageStats stats;
    stats.model = "claude-3-5-haiku-latest";
    stats.inputTokens = 500000;
    stats.outputTokens = 250000;
    QVERIFY(qFuzzyCompare(pricing.estimateCost(stats), 0.4 + 1.0));
}

void ModelPricingTests::testUnknownModelIsFree()
{
    const tracedeck::ModelPricing pricing;
    QVERIFY(!pricing.priceFor("mystery-model").has_value());
    QCOMPARE(pricing.estimateCost(std::string("mystery-model"), 1000, 1000), 0.0);
    QCOMPARE(pricing.estimateCost(std::nullopt, 1000, 1000), 0.0);
}

void ModelPricingTests::testLoadOverrides()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("prices.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"({
        "mystery-model": {"input_cost_per_token": 0.000001, "output_cost_per_token": 0.000002},
        "sample_spec": {"max_tokens": 10}
    })");
    file.close();

    tracedeck::ModelPricing pricing;
    QVERIFY(pricing.loadOverrides(path));
    const auto price = pricing.priceFor("Mystery-Model");
    QVERIFY(price.has_value());
    QVERIFY(qFuzzyCompare(price->inputPerMillion, 1.0));
    QVERIFY(qFuzzyCompare(price->outputPerMillion, 2.0));
    QVERIFY(!pricing.priceFor("sample_spec").has_value());
    QVERIFY(pricing.priceFor("claude-sonnet-4").has_value());
}

void ModelPricingTests::testInvalidOverrideFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("broken.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{not json");
    file.close();

    tracedeck::ModelPricing pricing;
    QVERIFY(!pricing.loadOverrides(path));
    QVERIFY(!pricing.loadOverrides(dir.filePath(QStringLiteral("missing.json"))));
    QVERIFY(pricing.priceFor("claude-opus-4").has_value());
}

QTEST_MAIN(ModelPricingTests)
#include "test_model_pricing.moc"
