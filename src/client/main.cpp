#include <iostream>
#include <iomanip>
#include <cstdlib>
#include <stdexcept>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>
#include "platform.hpp"

using json = nlohmann::json;

namespace {

    const char* const kSocketName = "semsearch.sock";

    void print_usage() {
        std::cerr << "Usage: semsearch <command> [args...]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  ping                                 - Test connection\n";
        std::cerr << "  status                               - Daemon status\n";
        std::cerr << "  models                               - List embedding models\n";
        std::cerr << "  backends                             - List index backends\n";
        std::cerr << "  list                                 - List built indices\n";
        std::cerr << "  build [model_id] [backend_id]        - Build an index over the documents\n";
        std::cerr << "  query <index_id> <top_k> <text...>   - Search an index\n";
        std::cerr << "  batch <index_id> <top_k> <text>...   - Search with several queries\n";
        std::cerr << "  remove <index_id>                    - Delete an index\n";
        std::cerr << "  shutdown                             - Stop the daemon\n";
        std::cerr << "Set SEMSEARCH_SOCKET to use a socket other than " << kSocketName << ".\n";
    }

    std::string join(const std::vector<std::string>& words, size_t from) {
        std::string out;
        for (size_t i = from; i < words.size(); ++i) {
            if (!out.empty()) out += ' ';
            out += words[i];
        }
        return out;
    }

    int parse_top_k(const std::string& arg) {
        try {
            return std::stoi(arg);
        } catch (const std::exception&) {
            throw std::invalid_argument("top_k must be an integer, got '" + arg + "'");
        }
    }

    json make_request(const std::string& command, const std::vector<std::string>& args) {
        json params = json::object();

        if (command == "ping" || command == "status" || command == "models" ||
            command == "backends" || command == "shutdown") {
            return {{"method", command}, {"params", params}};
        }
        if (command == "list") {
            return {{"method", "list_indices"}, {"params", params}};
        }
        if (command == "build") {
            if (args.size() > 0) params["model_id"] = args[0];
            if (args.size() > 1) params["backend_id"] = args[1];
            return {{"method", "build"}, {"params", params}};
        }
        if (command == "query" || command == "batch") {
            if (args.size() < 3) throw std::invalid_argument(command + " needs <index_id> <top_k> <text>");
            params["index_id"] = args[0];
            params["top_k"] = parse_top_k(args[1]);
            if (command == "query") {
                params["text"] = join(args, 2);
                return {{"method", "query"}, {"params", params}};
            }
            params["texts"] = std::vector<std::string>(args.begin() + 2, args.end());
            return {{"method", "batch_query"}, {"params", params}};
        }
        if (command == "remove") {
            if (args.empty()) throw std::invalid_argument("remove needs <index_id>");
            params["index_id"] = args[0];
            return {{"method", "remove_index"}, {"params", params}};
        }
        throw std::invalid_argument("unknown command '" + command + "'");
    }

    void print_results(const json& results) {
        for (const auto& r : results) {
            std::cout << "#" << r.value("rank", 0) << "  "
                      << std::fixed << std::setprecision(4) << r.value("similarity_score", 0.0)
                      << "  " << r.value("source_document", "") << " [chunk " << r.value("chunk_index", 0) << "]\n";
            std::cout << "    " << r.value("content", "") << "\n";
        }
    }

}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    json request;
    try {
        request = make_request(command, args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage();
        return 1;
    }

    auto client = semsearch::platform::Client::create();
    if (!client) {
        std::cerr << "Error: Failed to create client platform interface.\n";
        return 1;
    }

    const char* socket_env = std::getenv("SEMSEARCH_SOCKET");
    const std::string socket_name = socket_env ? socket_env : kSocketName;
    if (!client->connect(socket_name)) {
        std::cerr << "Error: Could not connect to semsearchd daemon. Is it running?\n";
        return 1;
    }

    std::string response = client->send(request.dump());
    if (response.empty()) {
        std::cerr << "Error: No response from daemon.\n";
        return 1;
    }

    json reply = json::parse(response, nullptr, false);
    if (reply.is_discarded()) {
        std::cout << response << "\n";
        return 1;
    }
    if (reply.contains("error")) {
        const auto& error = reply["error"];
        std::cerr << "Error [" << error.value("kind", "Unknown") << "]: " << error.value("message", "") << "\n";
        return 2;
    }

    const json& result = reply["result"];
    if (command == "query") {
        print_results(result);
    } else if (command == "batch") {
        for (size_t i = 0; i < result.size() && i + 2 < args.size(); ++i) {
            std::cout << "== " << args[i + 2] << "\n";
            if (result[i].contains("error")) {
                std::cout << "   error [" << result[i]["error"].value("kind", "") << "]: "
                          << result[i]["error"].value("message", "") << "\n";
            } else {
                print_results(result[i]["results"]);
            }
        }
    } else {
        std::cout << result.dump(2) << "\n";
    }

    return 0;
}
