/// Tool client example: lists servers, their tools, and calls a tool.
/// Usage: ./tool_client <config.json> servers
///        ./tool_client <config.json> tools <server>
///        ./tool_client <config.json> call <server> <tool> [json-arguments]
/// Set TOOLBRIDGE_DEBUG=1 to see protocol traffic and server stderr.

#include <toolbridge/toolbridge.hpp>
#include <cstdlib>
#include <iostream>

namespace {

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <config.json> servers\n"
              << "       " << argv0 << " <config.json> tools <server>\n"
              << "       " << argv0 << " <config.json> call <server> <tool> [json-arguments]\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }
    if (std::getenv("TOOLBRIDGE_DEBUG")) {
        toolbridge::set_log_level(toolbridge::LogLevel::Debug);
    } else {
        toolbridge::set_log_level(toolbridge::LogLevel::Warning);
    }

    std::string command = argv[2];
    try {
        toolbridge::ConnectionManager manager(toolbridge::load_config(argv[1]));
        toolbridge::ToolHub hub(manager);

        if (command == "servers") {
            for (const auto& s : hub.server_summaries()) {
                std::cout << s.name << " - " << s.description
                          << (s.connected ? "" : " (unavailable)") << "\n";
                for (const auto& t : s.tools) {
                    std::cout << "  " << t.tool_name;
                    if (!t.description.empty()) std::cout << " - " << t.description;
                    std::cout << "\n";
                }
            }
        } else if (command == "tools" && argc >= 4) {
            auto tools = hub.get_tools_for_server(argv[3]);
            if (tools.empty()) std::cout << "(no tools)\n";
            for (const auto& t : tools) {
                std::cout << t.tool_name;
                if (!t.description.empty()) std::cout << " - " << t.description;
                std::cout << "\n    " << t.parameter_schema.dump() << "\n";
            }
        } else if (command == "call" && argc >= 5) {
            nlohmann::json args = nlohmann::json::object();
            if (argc >= 6) {
                try {
                    args = nlohmann::json::parse(argv[5]);
                } catch (const nlohmann::json::parse_error& e) {
                    std::cerr << "Arguments are not valid JSON: " << e.what() << "\n";
                    return 1;
                }
            }
            auto result = hub.execute_tool(argv[3], argv[4], args);
            std::cout << result.text() << "\n";
            if (result.structured_content) {
                std::cout << result.structured_content->dump(2) << "\n";
            }
            hub.shutdown();
            return result.is_error ? 2 : 0;
        } else {
            usage(argv[0]);
            return 1;
        }

        hub.shutdown();
    } catch (const toolbridge::TimeoutError& e) {
        std::cerr << "Timed out: " << e.what() << "\n";
        return 3;
    } catch (const toolbridge::ToolBridgeError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
