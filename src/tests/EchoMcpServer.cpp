// SPDX-License-Identifier: Apache-2.0
//
// Minimal MCP tool server speaking newline-delimited JSON-RPC on stdio.
// Used by the integration tests as a real child process.

#include <mcp/JsonRpc.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

namespace
{

void reply(const nlohmann::json& message)
{
    std::cout << message.dump() << '\n' << std::flush;
}

auto textContent(const std::string& text) -> nlohmann::json
{
    return nlohmann::json {
        { "content", nlohmann::json::array({ { { "type", "text" }, { "text", text } } }) },
    };
}

auto toolList(bool withExit) -> nlohmann::json
{
    auto tools = nlohmann::json::array({
        {
            { "name", "echo" },
            { "description", "Returns the given text" },
            { "inputSchema",
              {
                  { "type", "object" },
                  { "properties", { { "text", { { "type", "string" }, { "description", "Text to echo" } } } } },
                  { "required", nlohmann::json::array({ "text" }) },
              } },
        },
    });

    if (withExit)
    {
        tools.push_back({
            { "name", "exit" },
            { "description", "Terminates the server after answering" },
            { "inputSchema", { { "type", "object" }, { "properties", nlohmann::json::object() } } },
        });
    }
    return tools;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "echo-mcp-server - MCP test server with an echo tool" };

    auto noPing = false;
    auto withExit = false;
    app.add_flag("--no-ping", noPing, "Answer ping with 'method not found'");
    app.add_flag("--with-exit-tool", withExit, "Offer an 'exit' tool that terminates the server");

    CLI11_PARSE(app, argc, argv);

    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        if (line.empty())
            continue;

        auto const request = nlohmann::json::parse(line, nullptr, false);
        if (request.is_discarded() || !request.is_object())
        {
            std::cerr << "echo-mcp-server: ignoring malformed line\n";
            continue;
        }

        // Notifications need no answer.
        if (!request.contains("id"))
            continue;

        auto const id = request["id"];
        auto const method = request.value("method", "");
        auto const params = request.value("params", nlohmann::json::object());

        auto const success = [&](nlohmann::json result) {
            reply({ { "jsonrpc", "2.0" }, { "id", id }, { "result", std::move(result) } });
        };
        auto const failure = [&](int code, const std::string& message) {
            reply({ { "jsonrpc", "2.0" }, { "id", id }, { "error", { { "code", code }, { "message", message } } } });
        };

        if (method == "initialize")
        {
            success({
                { "protocolVersion", "2024-11-05" },
                { "serverInfo", { { "name", "echo-mcp-server" }, { "version", "1.0.0" } } },
                { "capabilities", { { "tools", nlohmann::json::object() } } },
            });
        }
        else if (method == "tools/list")
        {
            success({ { "tools", toolList(withExit) } });
        }
        else if (method == "ping" && !noPing)
        {
            success(nlohmann::json::object());
        }
        else if (method == "tools/call")
        {
            auto const name = params.value("name", "");
            auto const arguments = params.value("arguments", nlohmann::json::object());
            if (name == "echo")
            {
                success(textContent(arguments.value("text", "")));
            }
            else if (name == "exit" && withExit)
            {
                success(textContent("bye"));
                return EXIT_SUCCESS;
            }
            else
            {
                auto result = textContent("Unknown tool: " + name);
                result["isError"] = true;
                success(std::move(result));
            }
        }
        else
        {
            failure(mcphub::jsonrpc::MethodNotFoundCode, "Method not found: " + method);
        }
    }

    return EXIT_SUCCESS;
}
