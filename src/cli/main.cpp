#include "crimrag/chunking/chunker.hpp"
#include "crimrag/config.hpp"
#include "crimrag/error.hpp"
#include "crimrag/filter.hpp"
#include "crimrag/index/qdrant_index.hpp"
#include "crimrag/ingest/ingestor.hpp"
#include "crimrag/logging.hpp"
#include "crimrag/net/http_client.hpp"
#include "crimrag/pipeline/context_factory.hpp"
#include "crimrag/pipeline/pipeline.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace crimrag;

namespace {

constexpr int EXIT_USAGE = 2;

void print_usage(std::ostream& out) {
    out << "Usage:\n"
        << "  crimrag_cli [--config FILE] query \"<question>\" [options]\n"
        << "  crimrag_cli [--config FILE] ingest <file>...\n"
        << "  crimrag_cli [--config FILE] [interactive]\n"
        << "\n"
        << "Query options:\n"
        << "  --k N                 number of documents to retrieve\n"
        << "  --filter FIELD=V[,V]  metadata filter, repeatable\n"
        << "  --lambda X            MMR relevance/diversity trade-off in [0, 1]\n"
        << "  --rerank, --no-rerank override reranker.enabled\n"
        << "  --max-context N       context token budget\n"
        << "  --timeout-ms N        per-call timeout\n"
        << "  --sources             print retrieved chunk ids per source\n";
}

void print_help() {
    std::cout << "Commands:\n"
              << "  /help          show this help\n"
              << "  /sources on    list chunk ids per source after each answer\n"
              << "  /sources off   hide them\n"
              << "  /quit          exit\n"
              << "Anything else is sent as a question.\n";
}

struct Arguments {
    std::string config_file = "config.yaml";
    std::string mode = "interactive";
    std::vector<std::string> positional;
    pipeline::QueryOptions options;
    bool show_sources = false;
};

std::size_t parse_size(const std::string& flag, const std::string& value) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed != value.size() || parsed <= 0) {
        throw InputError(flag + " expects a positive integer, got '" + value + "'", "parse_arguments");
    }
    return static_cast<std::size_t>(parsed);
}

double parse_double(const std::string& flag, const std::string& value) {
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size()) {
        throw InputError(flag + " expects a number, got '" + value + "'", "parse_arguments");
    }
    return parsed;
}

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;
    std::vector<std::string> tokens(argv + 1, argv + argc);

    auto value_of = [&tokens](std::size_t& i) -> const std::string& {
        if (i + 1 >= tokens.size()) {
            throw InputError(tokens[i] + " expects a value", "parse_arguments");
        }
        return tokens[++i];
    };

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        if (token == "--config") {
            args.config_file = value_of(i);
        } else if (token == "--k") {
            args.options.k = parse_size(token, value_of(i));
        } else if (token == "--filter") {
            const auto [field, values] = MetadataFilter::parse_clause(value_of(i));
            args.options.filters.require_any(field, values);
        } else if (token == "--lambda") {
            args.options.diversity_lambda = parse_double(token, value_of(i));
        } else if (token == "--rerank") {
            args.options.use_reranker = true;
        } else if (token == "--no-rerank") {
            args.options.use_reranker = false;
        } else if (token == "--max-context") {
            args.options.max_context_tokens = parse_size(token, value_of(i));
        } else if (token == "--timeout-ms") {
            args.options.timeout = std::chrono::milliseconds(parse_size(token, value_of(i)));
        } else if (token == "--sources") {
            args.show_sources = true;
        } else if (token.rfind("--", 0) == 0) {
            throw InputError("unknown option " + token, "parse_arguments");
        } else {
            args.positional.push_back(token);
        }
    }

    if (!args.positional.empty()) {
        args.mode = args.positional.front();
        args.positional.erase(args.positional.begin());
    }
    return args;
}

void print_sources(const std::vector<Citation>& sources) {
    for (const auto& citation : sources) {
        std::cout << "  [" << citation.number << "] " << citation.document_name << ":";
        for (const auto& id : citation.chunk_ids) {
            std::cout << " " << id;
        }
        std::cout << "\n";
    }
}

// Prints one result. Returns false when the query failed.
bool print_result(const pipeline::QueryResult& result, bool show_sources) {
    if (!result.ok()) {
        std::cerr << "Error [" << error_code_name(result.error->kind) << "]: " << result.error->message;
        if (result.error->retryable()) {
            std::cerr << " (temporary, try again later)";
        }
        std::cerr << std::endl;
        return false;
    }
    std::cout << *result.response << std::endl;
    if (show_sources && !result.sources.empty()) {
        std::cout << "\nRetrieved chunks:\n";
        print_sources(result.sources);
    }
    return true;
}

int run_query(const pipeline::Pipeline& engine, const Arguments& args) {
    if (args.positional.size() != 1) {
        std::cerr << "query expects exactly one question" << std::endl;
        print_usage(std::cerr);
        return EXIT_USAGE;
    }
    const auto result = engine.run(args.positional.front(), args.options);
    if (!result.ok() && result.error->kind == ErrorCode::INPUT_ERROR) {
        std::cerr << "Invalid query: " << result.error->message << std::endl;
        return EXIT_USAGE;
    }
    return print_result(result, args.show_sources) ? EXIT_SUCCESS : EXIT_FAILURE;
}

int run_ingest(const Config& config, const std::shared_ptr<net::HttpClient>& http_client, const Arguments& args) {
    if (args.positional.empty()) {
        std::cerr << "ingest expects at least one file" << std::endl;
        print_usage(std::cerr);
        return EXIT_USAGE;
    }
    if (config.index.backend == "memory") {
        LOG_WARNING("Ingesting into the memory backend; chunks are discarded on exit");
    }

    auto embedder = pipeline::make_embedder(config.embedding, http_client);
    const std::chrono::milliseconds timeout(config.index.service.timeout_ms);

    Config ingest_config = config;
    ingest_config.index.corpus_dir.clear();
    auto target = pipeline::make_index(ingest_config, embedder, http_client);
    if (auto qdrant = std::dynamic_pointer_cast<index::QdrantIndex>(target)) {
        qdrant->ensure_collection(embedder->dimension(), timeout);
    }

    std::shared_ptr<pipeline::AuditSink> audit;
    if (config.audit.enabled) {
        audit = std::make_shared<pipeline::JsonlAuditLog>(config.audit.directory);
    }
    const ingest::Ingestor ingestor(target, chunking::Chunker(config.chunking), 64, audit, config.index.collection);
    std::size_t total = 0;
    for (const auto& path : args.positional) {
        const auto document = ingest::load_document(path);
        const std::size_t written = ingestor.ingest(document, timeout);
        std::cout << document.document_id << ": " << written << " chunks" << std::endl;
        total += written;
    }
    std::cout << "Ingested " << args.positional.size() << " documents (" << total << " chunks)" << std::endl;
    return EXIT_SUCCESS;
}

int run_interactive(const pipeline::Pipeline& engine, Arguments args) {
    std::cout << "Criminology research assistant. Type /help for commands." << std::endl;

    std::string line;
    while (true) {
        std::cout << "\n> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) {
            continue;
        }
        line = line.substr(first, line.find_last_not_of(" \t\r") - first + 1);

        if (line == "/quit" || line == "/exit") {
            break;
        }
        if (line == "/help") {
            print_help();
            continue;
        }
        if (line == "/sources on" || line == "/sources off") {
            args.show_sources = line == "/sources on";
            std::cout << "Source details " << (args.show_sources ? "enabled" : "disabled") << std::endl;
            continue;
        }
        if (line.front() == '/') {
            std::cout << "Unknown command " << line << ". Type /help." << std::endl;
            continue;
        }

        print_result(engine.run(line, args.options), args.show_sources);
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
    Arguments args;
    try {
        args = parse_arguments(argc, argv);
    } catch (const InputError& e) {
        std::cerr << e.what() << std::endl;
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    if (args.mode == "help") {
        print_usage(std::cout);
        return EXIT_SUCCESS;
    }
    if (args.mode != "query" && args.mode != "ingest" && args.mode != "interactive") {
        std::cerr << "unknown command " << args.mode << std::endl;
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    try {
        const Config config = load_config(args.config_file);
        initialize_logging(config.logging.level, config.logging.file, config.logging.console_output);
        LOG_INFO("Configuration loaded from " + args.config_file);

        auto http_client = std::make_shared<net::HttpClient>();

        if (args.mode == "ingest") {
            return run_ingest(config, http_client, args);
        }

        const pipeline::Pipeline engine(pipeline::make_pipeline_context(config, http_client));
        if (args.mode == "query") {
            return run_query(engine, args);
        }
        return run_interactive(engine, std::move(args));

    } catch (const CrimragException& e) {
        LOG_CRITICAL(e.full_message());
        std::cerr << e.full_message() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error in main: " + std::string(e.what()));
        return EXIT_FAILURE;
    }
}
