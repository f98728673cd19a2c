#include "inspect/InspectCli.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

#include <QDateTime>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "daemon/correlating_parser.hpp"
#include "daemon/model_pricing.hpp"
#include "daemon/session_store.hpp"
#include "daemon/usage_probe.hpp"

namespace tracedeck {

namespace {

constexpr size_t kPreviewChars = 100;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  tracedeck-inspect parse PATH [--format summary|json]\n"
        "  tracedeck-inspect sessions [--format summary|json] [--data-dir DIR]\n"
        "  tracedeck-inspect messages SESSION_ID [--format summary|json] [--data-dir DIR]\n"
        "  tracedeck-inspect usage [--command CMD]\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("summary");
    }
    return value.toLower();
}

bool validFormat(const QString &format)
{
    return format == QStringLiteral("summary") || format == QStringLiteral("json");
}

std::string formatLocalTime(Timestamp timestamp)
{
    QDateTime dt = QDateTime::fromMSecsSinceEpoch(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch())
            .count(),
        Qt::UTC);
    dt = dt.toLocalTime();
    return dt.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")).toStdString();
}

std::string preview(const std::string &text)
{
    std::string flat = text;
    for (char &c : flat) {
        if (c == '\n' || c == '\r' || c == '\t') {
            c = ' ';
        }
    }
    if (flat.size() <= kPreviewChars) {
        return flat;
    }
    size_t cut = kPreviewChars;
    while (cut > 0 && (static_cast<unsigned char>(flat[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return flat.substr(0, cut) + "...";
}

void renderMessages(const std::vector<Message> &messages)
{
    for (const auto &message : messages) {
        std::cout << std::setw(5) << message.sequence << "  "
                  << formatLocalTime(message.timestamp) << "  "
                  << std::left << std::setw(10) << toMessageTypeString(message.type)
                  << std::right;
        if (message.type == MessageType::Tool) {
            std::cout << "[" << message.toolName.value_or("?") << "] ";
        }
        std::cout << preview(message.content);
        if (message.inProgress) {
            std::cout << "  (in progress)";
        } else if (message.toolDuration) {
            std::ostringstream duration;
            duration << std::fixed << std::setprecision(1) << *message.toolDuration;
            std::cout << "  (" << duration.str() << "s)";
        }
        std::cout << "\n";
    }
}

void renderParseSummary(const ParseResult &result, const ModelPricing &pricing)
{
    const UsageStats &stats = result.stats;
    std::cout << "Format:       " << toFormatString(result.format) << "\n";
    std::cout << "Session:      " << result.sessionId.value_or("-") << "\n";
    std::cout << "Project:      " << result.projectPath.value_or("-") << "\n";
    std::cout << "Model:        " << stats.model.value_or("-") << "\n";
    std::cout << "Messages:     " << result.messages.size() << "\n";
    std::cout << "Tokens:       " << stats.inputTokens << " in, " << stats.outputTokens
              << " out, " << stats.cacheReadTokens << " cache read, "
              << stats.cacheCreationTokens << " cache write\n";
    std::cout << "Context:      " << stats.contextUsed << " / " << stats.contextLimit << " ("
              << std::fixed << std::setprecision(1) << stats.contextPercentage() << "%)\n";
    std::cout << "Est. cost:    $" << std::fixed << std::setprecision(4)
              << pricing.estimateCost(stats) << "\n";
    std::cout << "Last prompt:  " << preview(result.lastUserPrompt.value_or("-")) << "\n";
    std::cout << "Last tool:    " << result.lastTool.value_or("-") << "\n";
    if (result.session) {
        std::cout << "Status:       " << toWorkStatusString(result.session->workStatus) << " / "
                  << toAttentionString(result.session->attentionReason) << "\n";
        std::cout << "Prompts:      " << result.session->promptCount << ", tools: "
                  << result.session->toolCount << "\n";
    }
    std::cout << "\n";
    std::cout.unsetf(std::ios::floatfield);
    renderMessages(result.messages);
}

} // namespace

InspectCli::InspectCli(const Config &config)
    : m_config(config)
{
}

int InspectCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString dataDir = getArgValue(args, QStringLiteral("--data-dir"));
    if (!dataDir.isEmpty()) {
        m_config.setDataDir(dataDir);
    }

    const QString command = args.at(1);
    TDLOG_INFO(QStringLiteral("InspectCli"),
               QStringLiteral("run"),
               QStringLiteral("inspect_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"command", command.toStdString()}});

    try {
        if (command == QStringLiteral("parse")) {
            return runParse(args);
        }
        if (command == QStringLiteral("sessions")) {
            return runSessions(args);
        }
        if (command == QStringLiteral("messages")) {
            return runMessages(args);
        }
        if (command == QStringLiteral("usage")) {
            return runUsage(args);
        }
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 2;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int InspectCli::runParse(const QStringList &args)
{
    if (args.size() < 3 || args.at(2).startsWith(QStringLiteral("--"))) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        std::cerr << "Invalid format. Use summary or json." << std::endl;
        return 1;
    }

    const std::string path = args.at(2).toStdString();
    bool readable = false;
    const std::vector<std::string> lines = CorrelatingParser::readLines(path, &readable);
    if (!readable) {
        std::cerr << "Cannot read transcript: " << path << std::endl;
        return 1;
    }

    const CorrelatingParser parser;
    const ParseResult result = parser.parseLines(lines, path);

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(result).dump(2, ' ', false,
                                                 nlohmann::json::error_handler_t::replace)
                  << std::endl;
        return 0;
    }

    ModelPricing pricing;
    if (!m_config.pricingFile.isEmpty() && QFileInfo::exists(m_config.pricingFile)
        && !pricing.loadOverrides(m_config.pricingFile)) {
        std::cerr << "Warning: ignoring unreadable price file "
                  << m_config.pricingFile.toStdString() << std::endl;
    }
    renderParseSummary(result, pricing);
    return 0;
}

int InspectCli::runSessions(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        std::cerr << "Invalid format. Use summary or json." << std::endl;
        return 1;
    }

    SessionStore store(m_config.dbPath.toStdString());
    const std::vector<Session> sessions = store.listSessions();

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(sessions).dump(2, ' ', false,
                                                   nlohmann::json::error_handler_t::replace)
                  << std::endl;
        return 0;
    }

    if (sessions.empty()) {
        std::cout << "No sessions recorded.\n";
        return 0;
    }
    for (const auto &session : sessions) {
        const std::string name = session.customName.value_or(session.firstPrompt.value_or(""));
        std::cout << session.id << "  " << toFormatString(session.format) << "  "
                  << std::left << std::setw(10) << toWorkStatusString(session.workStatus)
                  << std::right << "  " << formatLocalTime(session.lastActivityAt) << "  "
                  << (session.projectName.empty() ? "-" : session.projectName) << "  "
                  << preview(name);
        if (session.endedAt) {
            std::cout << "  (ended: " << session.endReason.value_or("unknown") << ")";
        }
        std::cout << "\n";
    }
    return 0;
}

int InspectCli::runMessages(const QStringList &args)
{
    if (args.size() < 3 || args.at(2).startsWith(QStringLiteral("--"))) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        std::cerr << "Invalid format. Use summary or json." << std::endl;
        return 1;
    }

    const std::string sessionId = args.at(2).toStdString();
    SessionStore store(m_config.dbPath.toStdString());
    if (!store.sessionExists(sessionId)) {
        std::cerr << "Session not found: " << sessionId << std::endl;
        return 1;
    }
    const std::vector<Message> messages = store.readMessages(sessionId);

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(messages).dump(2, ' ', false,
                                                   nlohmann::json::error_handler_t::replace)
                  << std::endl;
        return 0;
    }
    renderMessages(messages);
    return 0;
}

int InspectCli::runUsage(const QStringList &args)
{
    QString command = getArgValue(args, QStringLiteral("--command"));
    if (command.isEmpty()) {
        command = m_config.usageCommand;
    }
    if (command.isEmpty()) {
        std::cerr << "No usage command configured (set TRACEDECK_USAGE_COMMAND or --command)."
                  << std::endl;
        return 1;
    }

    const auto probe = ProcessUsageProbe::fromCommandLine(
        command, std::chrono::milliseconds(m_config.usageTimeoutMs));
    const UsageSnapshot snapshot = probe->fetchUsage();
    if (!snapshot.ok) {
        std::cerr << "Usage query failed: " << snapshot.error << std::endl;
        return 1;
    }

    nlohmann::json payload{
        {"fetchedAt", toIso8601Utc(snapshot.fetchedAt)},
        {"stale", snapshot.stale},
        {"usage", snapshot.payload},
    };
    std::cout << payload.dump(2) << std::endl;
    return 0;
}

} // namespace tracedeck
