// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ServerManager.hpp>
#include <mcphub/Config.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <format>
#include <print>
#include <thread>

namespace
{

auto statusReport(const mcphub::ServerManager& manager) -> nlohmann::json
{
    auto servers = nlohmann::json::array();
    for (const auto& status: manager.serverStatus())
        servers.push_back(mcphub::toJson(status));

    return nlohmann::json {
        { "servers", std::move(servers) },
        { "statistics", mcphub::toJson(manager.statistics()) },
    };
}

auto runCall(mcphub::ServerManager& manager, std::string_view toolName, std::string_view argsText) -> int
{
    auto arguments = mcphub::json::parse(argsText);
    if (!arguments || !arguments->is_object())
    {
        mcphub::log::error("--args must be a JSON object");
        return 1;
    }

    auto result = manager.callTool(toolName, *arguments);
    if (!result)
    {
        mcphub::log::error("{}", result.error());
        return 1;
    }

    if (mcphub::isToolError(*result))
    {
        mcphub::log::error("Tool '{}' reported an error: {}", toolName, mcphub::toolResultText(*result));
        return 1;
    }

    std::println("{}", mcphub::toolResultText(*result));
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcphub - supervises MCP tool servers and routes tool calls to them" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto logLevel = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file")->required();
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* statusCommand = app.add_subcommand("status", "Connect all servers and print their status");
    auto* toolsCommand = app.add_subcommand("tools", "Connect all servers and list the merged tools");

    auto toolName = std::string {};
    auto argsText = std::string { "{}" };
    auto* callCommand = app.add_subcommand("call", "Connect all servers and call one tool");
    callCommand->add_option("tool", toolName, "Tool name")->required();
    callCommand->add_option("--args", argsText, "Tool arguments as a JSON object");

    auto watchSeconds = 60;
    auto* watchCommand = app.add_subcommand("watch", "Connect all servers and run the health check");
    watchCommand->add_option("--seconds", watchSeconds, "How long to watch")->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);

    auto configResult = mcphub::loadConfigFromFile(configPath);
    if (!configResult)
    {
        mcphub::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    if (config.logLevel)
        mcphub::log::setLevel(*config.logLevel);
    if (!logLevel.empty())
    {
        auto const level = mcphub::log::parseLevel(logLevel);
        if (!level)
        {
            mcphub::log::error("Unknown log level: {}", logLevel);
            return 1;
        }
        mcphub::log::setLevel(*level);
    }
    if (verbose)
        mcphub::log::setLevel(mcphub::log::Level::Debug);

    auto manager = mcphub::ServerManager(std::move(config.servers), config.manager);
    auto const connected = manager.connectAll();
    for (const auto& [name, ok]: connected)
    {
        if (!ok)
            mcphub::log::warning("MCP server '{}' is not available", name);
    }

    auto exitCode = 0;

    if (*statusCommand)
    {
        std::println("{}", statusReport(manager).dump(2));
    }
    else if (*toolsCommand)
    {
        auto tools = nlohmann::json::array();
        for (const auto& tool: manager.allTools())
            tools.push_back(mcphub::toJson(tool));
        std::println("{}", tools.dump(2));
    }
    else if (*callCommand)
    {
        exitCode = runCall(manager, toolName, argsText);
    }
    else if (*watchCommand)
    {
        manager.startHealthCheck();
        std::this_thread::sleep_for(std::chrono::seconds(watchSeconds));
        manager.stopHealthCheck();
        std::println("{}", statusReport(manager).dump(2));
    }

    manager.disconnectAll();
    return exitCode;
}
