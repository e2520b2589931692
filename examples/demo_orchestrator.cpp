/**
 * Maestro Demo Orchestrator
 *
 * Interactive CLI running an orchestrator and two simulated specialists on an
 * in-process relay. The orchestrator routes with a local GGUF model; the
 * specialists answer their delegations with the same model.
 *
 * Usage:
 *   ./demo_orchestrator <model_path> [options]
 *
 * Options:
 *   --data-dir <path>        Where conversations and the event ledger live (default: ./maestro-data)
 *   --context-size <int>     Context window size (default: 8192)
 *   --temperature <float>    Sampling temperature for specialists (default: 0.7)
 *   --max-cycles <int>       Routing cycles per run (default: 20)
 *   --log-level <level>      trace, debug, info, warn, error (default: info)
 *   --help                   Show this help message
 */

#include "maestro/maestro.hpp"
#include "maestro/completion/llama_completion_service.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <deque>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted = true;
    }
}

struct CLIArgs {
    std::string model_path;
    std::string data_dir = "./maestro-data";
    int context_size = 8192;
    float temperature = 0.7f;
    int max_cycles = 20;
    std::string log_level = "info";
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cout << "Maestro Demo Orchestrator\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " <model_path> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --data-dir <path>        Data directory (default: ./maestro-data)\n";
    std::cout << "  --context-size <int>     Context window size (default: 8192)\n";
    std::cout << "  --temperature <float>    Specialist sampling temperature (default: 0.7)\n";
    std::cout << "  --max-cycles <int>       Routing cycles per run (default: 20)\n";
    std::cout << "  --log-level <level>      Log level (default: info)\n";
    std::cout << "  --help                   Show this help message\n\n";
    std::cout << "Interactive Commands:\n";
    std::cout << "  /new                     Start a new conversation\n";
    std::cout << "  /status                  Show the routing context of the current conversation\n";
    std::cout << "  /explain <question>      Ask why the conversation was routed as it was\n";
    std::cout << "  /phase <name> [text]     Move the conversation to another phase\n";
    std::cout << "  /quit, /exit             Exit the application\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;
    if (argc < 2 || std::string(argv[1]) == "--help") {
        args.help = true;
        return args;
    }
    args.model_path = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            args.help = true;
            return args;
        } else if (arg == "--data-dir" && i + 1 < argc) {
            args.data_dir = argv[++i];
        } else if (arg == "--context-size" && i + 1 < argc) {
            args.context_size = std::stoi(argv[++i]);
        } else if (arg == "--temperature" && i + 1 < argc) {
            args.temperature = std::stof(argv[++i]);
        } else if (arg == "--max-cycles" && i + 1 < argc) {
            args.max_cycles = std::stoi(argv[++i]);
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            args.help = true;
            return args;
        }
    }
    return args;
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

// ============================================================================
// Simulated specialist
// ============================================================================

/**
 * Answers every delegation addressed to one specialist by asking the model,
 * then publishes a completion back to the delegator. Work runs on a private
 * thread so the relay's delivery thread never blocks on inference.
 */
class SimulatedSpecialist {
public:
    SimulatedSpecialist(maestro::AgentDefinition agent,
                        std::string persona,
                        maestro::RuntimeContext context,
                        std::shared_ptr<maestro::network::AgentPublisher> publisher)
        : agent_(std::move(agent))
        , persona_(std::move(persona))
        , context_(std::move(context))
        , publisher_(std::move(publisher))
    {}

    ~SimulatedSpecialist() {
        stop();
    }

    maestro::Expected<void> start() {
        maestro::network::Filter filter;
        filter.kinds = {maestro::network::kinds::kGenericReply};
        filter.tags[maestro::network::tags::kRecipient] = {agent_.pubkey};

        auto subscription = context_.network->subscribe({filter}, [this](const maestro::network::Event& event) {
            if (!event.tag_value(maestro::network::tags::kTurn)) {
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            inbox_.push_back(event);
            cv_.notify_one();
        });
        if (!subscription) {
            return tl::unexpected(subscription.error());
        }
        subscription_ = *subscription;
        running_ = true;
        worker_ = std::thread([this]() { run(); });
        return {};
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return;
            }
            running_ = false;
        }
        cv_.notify_all();
        context_.network->unsubscribe(subscription_);
        if (worker_.joinable()) {
            worker_.join();
        }
    }

private:
    void run() {
        while (true) {
            maestro::network::Event request;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return !inbox_.empty() || !running_; });
                if (!running_) {
                    return;
                }
                request = std::move(inbox_.front());
                inbox_.pop_front();
            }
            handle(request);
        }
    }

    void handle(const maestro::network::Event& request) {
        const auto conversation = request.tag_value(maestro::network::tags::kConversation).value_or("");
        const auto turn = request.tag_value(maestro::network::tags::kTurn).value_or("");
        context_.log().info("{} picked up turn {}", agent_.slug, turn);

        auto status = publisher_->publish_status(agent_.slug, conversation, "working", "Working on " + turn);
        if (!status) {
            context_.log().warn("{} status not published: {}", agent_.slug, status.error().to_string());
        }

        maestro::completion::CompletionRequest completion_request;
        completion_request.format = maestro::completion::ResponseFormat::Text;
        completion_request.messages = {
            maestro::Message::system(persona_),
            maestro::Message::user(request.content)
        };
        auto answer = context_.completion->complete(completion_request);
        const std::string content = answer ? answer->content : "Could not complete: " + answer.error().to_string();

        auto published = publisher_->publish_completion(agent_.slug, conversation, turn, request.pubkey, content);
        if (!published) {
            context_.log().error("{} completion not published: {}", agent_.slug, published.error().to_string());
        }
    }

    maestro::AgentDefinition agent_;
    std::string persona_;
    maestro::RuntimeContext context_;
    std::shared_ptr<maestro::network::AgentPublisher> publisher_;
    maestro::network::SubscriptionId subscription_ = 0;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<maestro::network::Event> inbox_;
    bool running_ = false;
    std::thread worker_;
};

// ============================================================================
// Setup helpers
// ============================================================================

maestro::Expected<maestro::AgentDefinition> add_agent(maestro::AgentRegistry& registry,
                                                      const std::string& slug,
                                                      const std::string& name,
                                                      maestro::AgentRole role,
                                                      const std::string& description) {
    auto signer = maestro::network::SchnorrSigner::generate();
    if (!signer) {
        return tl::unexpected(signer.error());
    }
    maestro::AgentDefinition definition{slug, "", name, std::move(role), description};
    auto registered = registry.register_agent(definition, *signer);
    if (!registered) {
        return tl::unexpected(registered.error());
    }
    return *registry.find(slug);
}

void print_conversation(maestro::Orchestrator& orchestrator, const std::string& conversation_id) {
    auto conversation = orchestrator.conversation(conversation_id);
    if (!conversation) {
        std::cout << "No conversation yet.\n";
        return;
    }
    print_separator();
    std::cout << maestro::engine::render_routing_context(*conversation) << "\n";
    print_separator();
}

int main(int argc, char** argv) {
    CLIArgs args = parse_args(argc, argv);
    if (args.help) {
        print_usage(argv[0]);
        return args.model_path.empty() ? 1 : 0;
    }
    std::signal(SIGINT, signal_handler);

    maestro::LogConfig log_config;
    log_config.name = "maestro";
    log_config.level = args.log_level;
    auto logger = maestro::make_logger(log_config);
    if (!logger) {
        std::cerr << "Error: " << logger.error().to_string() << "\n";
        return 1;
    }

    maestro::completion::LlamaConfig llama_config;
    llama_config.model_path = args.model_path;
    llama_config.context_size = args.context_size;
    llama_config.sampling.temperature = args.temperature;

    std::cout << "Loading model: " << args.model_path << "\n";
    auto completion = maestro::completion::LlamaCompletionService::create(llama_config);
    if (!completion) {
        std::cerr << "Error: " << completion.error().to_string() << "\n";
        return 1;
    }

    auto registry = std::make_shared<maestro::AgentRegistry>();
    auto orchestrator_agent = add_agent(*registry, "orchestrator", "Orchestrator", maestro::OrchestratorRole{},
                                        "Routes work between specialists");
    auto researcher = add_agent(*registry, "researcher", "Researcher",
                                maestro::SpecialistRole{{maestro::Capability::Retrieval}},
                                "Investigates requirements and gathers facts");
    auto writer = add_agent(*registry, "writer", "Writer",
                            maestro::SpecialistRole{{maestro::Capability::Tools}},
                            "Produces plans, code and documents");
    for (const auto* agent : {&orchestrator_agent, &researcher, &writer}) {
        if (!*agent) {
            std::cerr << "Error: " << agent->error().to_string() << "\n";
            return 1;
        }
    }

    auto relay = std::make_shared<maestro::network::LocalRelay>();

    maestro::RuntimeContext context;
    context.logger = *logger;
    context.agents = registry;
    context.network = relay;
    context.completion = *completion;

    maestro::Config config;
    config.data_dir = args.data_dir;
    config.max_routing_cycles = args.max_cycles;
    config.log = log_config;

    auto created = maestro::Orchestrator::create(config, context);
    if (!created) {
        std::cerr << "Error: " << created.error().to_string() << "\n";
        return 1;
    }
    auto& orchestrator = **created;

    auto publisher = std::make_shared<maestro::network::AgentPublisher>(context);
    SimulatedSpecialist researcher_sim(*researcher,
        "You are a meticulous researcher. Answer with findings only, in a few short paragraphs.",
        context, publisher);
    SimulatedSpecialist writer_sim(*writer,
        "You are a senior engineer and writer. Produce the requested artifact concisely.",
        context, publisher);

    for (auto* sim : {&researcher_sim, &writer_sim}) {
        auto started = sim->start();
        if (!started) {
            std::cerr << "Error: " << started.error().to_string() << "\n";
            return 1;
        }
    }
    auto started = orchestrator.start();
    if (!started) {
        std::cerr << "Error: " << started.error().to_string() << "\n";
        return 1;
    }

    auto user = maestro::network::SchnorrSigner::generate();
    if (!user) {
        std::cerr << "Error: " << user.error().to_string() << "\n";
        return 1;
    }

    std::cout << "\nType a request and press Enter. Type '/help' for commands.\n\n";

    std::string conversation_id;
    std::string line;
    while (!g_interrupted) {
        std::cout << "You: " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (line.empty()) {
            continue;
        }
        if (line == "/quit" || line == "/exit") {
            break;
        }
        if (line == "/help") {
            print_usage(argv[0]);
            continue;
        }
        if (line == "/new") {
            conversation_id.clear();
            std::cout << "Next message starts a new conversation.\n";
            continue;
        }
        if (line == "/status") {
            print_conversation(orchestrator, conversation_id);
            continue;
        }
        if (line.rfind("/explain ", 0) == 0) {
            auto answer = orchestrator.explain(conversation_id, line.substr(9));
            std::cout << (answer ? *answer : "Error: " + answer.error().to_string()) << "\n";
            continue;
        }
        if (line.rfind("/phase ", 0) == 0) {
            const std::string rest = line.substr(7);
            const auto space = rest.find(' ');
            const std::string phase = rest.substr(0, space);
            const std::string instructions = space == std::string::npos ? "" : rest.substr(space + 1);
            auto transition = orchestrator.change_phase(conversation_id, phase, instructions, "requested by user");
            if (transition) {
                std::cout << "Phase: " << transition->from << " -> " << transition->to << "\n";
            } else {
                std::cout << "Error: " << transition.error().to_string() << "\n";
            }
            continue;
        }

        maestro::network::Event message;
        message.kind = maestro::network::kinds::kTextNote;
        message.content = line;
        message.tags.push_back({maestro::network::tags::kRecipient, orchestrator_agent->pubkey});
        if (!conversation_id.empty()) {
            message.tags.push_back({maestro::network::tags::kConversation, conversation_id, "", "root"});
        }
        auto sent = publisher->publish_as(**user, std::move(message));
        if (!sent) {
            std::cerr << "Error: " << sent.error().to_string() << "\n";
            continue;
        }
        if (conversation_id.empty()) {
            conversation_id = sent->id;
            std::cout << "Conversation " << conversation_id << " started.\n";
        }
        std::cout << "Routing in progress. Use /status to follow it.\n";
    }

    std::cout << "\nShutting down...\n";
    researcher_sim.stop();
    writer_sim.stop();
    orchestrator.stop();
    relay->close();
    return 0;
}
