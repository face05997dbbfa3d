#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "lxcri/errors.h"
#include "lxcri/lifecycle.h"
#include "lxcri/options.h"
#include "lxcri/process.h"
#include "lxcri/state.h"
#include "lxcri/template_cache.h"

enum GlobalOptionValue {
    OPT_DEBUG = 1000,
    OPT_LOG,
    OPT_LOG_FORMAT,
    OPT_ROOT,
    OPT_CONFIG,
    OPT_VERSION,
    OPT_HELP
};

struct CreateOptions {
    std::string id;
    std::string bundle;
};

struct ExecOptions {
    std::string id;
    std::vector<std::string> args;
};

bool parse_create_options(int argc, char* const argv[], CreateOptions& options) {
    static struct option create_long_options[] = {
            {"bundle", required_argument, nullptr, 'b'},
            {nullptr, 0, nullptr, 0}
    };

    opterr = 0;
    optind = 1;

    int option;
    while ((option = getopt_long(argc, argv, "+b:", create_long_options, nullptr)) != -1) {
        switch (option) {
            case 'b':
                options.bundle = optarg;
                break;
            case '?': {
                int idx = std::max(0, optind - 1);
                std::cerr << "Unknown create option: " << argv[idx] << std::endl;
                optind = 1;
                return false;
            }
            default:
                std::cerr << "Unknown create option encountered." << std::endl;
                optind = 1;
                return false;
        }
    }

    if (optind >= argc) {
        std::cerr << "Error: Container id is required." << std::endl;
        optind = 1;
        return false;
    }

    options.id = argv[optind];
    if (optind + 1 < argc) {
        std::cerr << "Error: Unexpected argument: " << argv[optind + 1] << std::endl;
        optind = 1;
        return false;
    }
    if (options.bundle.empty()) {
        std::cerr << "Error: --bundle is required." << std::endl;
        optind = 1;
        return false;
    }

    optind = 1;
    return true;
}

bool parse_exec_options(int argc, char* const argv[], ExecOptions& options) {
    int index = 1;
    if (index >= argc) {
        std::cerr << "Error: Container id is required." << std::endl;
        return false;
    }
    options.id = argv[index++];
    if (index < argc && std::strcmp(argv[index], "--") == 0) {
        ++index;
    }
    for (; index < argc; ++index) {
        options.args.emplace_back(argv[index]);
    }
    if (options.args.empty()) {
        std::cerr << "Error: Command to execute is required." << std::endl;
        return false;
    }
    return true;
}

bool parse_signal(const std::string& value, int& signal) {
    static const std::pair<const char*, int> kSignals[] = {
            {"HUP", SIGHUP},
            {"INT", SIGINT},
            {"QUIT", SIGQUIT},
            {"KILL", SIGKILL},
            {"USR1", SIGUSR1},
            {"USR2", SIGUSR2},
            {"TERM", SIGTERM},
    };
    if (value.empty()) {
        return false;
    }
    if (std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        try {
            signal = std::stoi(value);
        } catch (const std::exception&) {
            return false;
        }
        return signal > 0 && signal < NSIG;
    }
    std::string name = value;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (name.rfind("SIG", 0) == 0) {
        name = name.substr(3);
    }
    for (const auto& entry : kSignals) {
        if (name == entry.first) {
            signal = entry.second;
            return true;
        }
    }
    return false;
}

EngineConfig build_engine_config() {
    std::string path = g_global_options.config_path.empty() ? DEFAULT_CONFIG_PATH : g_global_options.config_path;
    EngineConfig config = load_engine_config(path);
    if (!g_global_options.root_path.empty()) {
        config.state_root = g_global_options.root_path;
    }
    return config;
}

int report_error(const RuntimeError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    log_debug(std::string("error code ") + error_code_name(e.code()));
    return 1;
}

void show_state(LifecycleOrchestrator& engine, const std::string& id) {
    std::cout << engine.state(id).to_json() << std::endl;
}

void list_containers(LifecycleOrchestrator& engine) {
    json entries = json::array();
    for (const auto& state : engine.list()) {
        entries.push_back(state.to_json_object());
    }
    std::cout << entries.dump(4) << std::endl;
}

int exec_container(LifecycleOrchestrator& engine, const ExecOptions& options) {
    CommandOutput output = engine.exec(options.id, options.args);
    std::cout << output.stdout_output;
    std::cerr << output.stderr_output;
    return output.timed_out ? 1 : output.exit_code;
}

int template_command(LifecycleOrchestrator& engine, int argc, char* const argv[]) {
    TemplateCache& templates = engine.templates();
    std::string action = argc >= 2 ? argv[1] : "list";

    if (action == "list" && argc <= 2) {
        json entries = json::array();
        for (const auto& info : templates.list()) {
            entries.push_back(json(info));
        }
        std::cout << entries.dump(4) << std::endl;
        return 0;
    }
    if (action == "prune" && argc <= 3) {
        int days = 30;
        if (argc == 3) {
            try {
                days = std::stoi(argv[2]);
            } catch (const std::exception&) {
                std::cerr << "Invalid prune age: " << argv[2] << std::endl;
                return 1;
            }
        }
        for (const auto& name : templates.prune(days)) {
            std::cout << name << std::endl;
        }
        return 0;
    }
    if (argc != 3) {
        std::cerr << "Usage: template list | template prune [days] | template verify|info|remove <name>" << std::endl;
        return 1;
    }
    std::string name = argv[2];
    if (action == "verify") {
        bool ok = templates.verify(name);
        std::cout << name << (ok ? ": ok" : ": invalid") << std::endl;
        return ok ? 0 : 1;
    }
    if (action == "info") {
        auto info = templates.find(name);
        if (!info) {
            std::cerr << "Error: Template '" << name << "' not found" << std::endl;
            return 1;
        }
        std::cout << json(*info).dump(4) << std::endl;
        return 0;
    }
    if (action == "remove") {
        if (!templates.remove(name, true)) {
            std::cerr << "Error: Template '" << name << "' not found" << std::endl;
            return 1;
        }
        return 0;
    }
    std::cerr << "Error: Unknown template command '" << action << "'" << std::endl;
    return 1;
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [global options] <command> [arguments]\n"
              << "\n"
              << "Global options:\n"
              << "  --debug                 Enable verbose debug logging\n"
              << "  --log <path>            Write logs to the given file\n"
              << "  --log-format <fmt>      Log format (text|json)\n"
              << "  --root <path>           Path to the state directory\n"
              << "  --config <path>         Engine configuration file (default: " << DEFAULT_CONFIG_PATH << ")\n"
              << "  --help                  Show this help message\n"
              << "  --version               Show version information\n"
              << "\n"
              << "Commands:\n"
              << "  create --bundle <ref> <id>   Create a container from an OCI bundle or template\n"
              << "  start  <id>                  Start a created or stopped container\n"
              << "  stop   <id>                  Stop a running container\n"
              << "  kill   <id> [signal]         Signal a container (default: SIGTERM, graceful shutdown)\n"
              << "  delete [--force] <id>        Delete a container\n"
              << "  state  <id>                  Show the state of a container\n"
              << "  list                         List containers\n"
              << "  exec   <id> [--] <cmd...>    Run a command inside a running container\n"
              << "  template list                List cached templates\n"
              << "  template info|verify|remove <name>\n"
              << "  template prune [days]        Forget templates unused for the given days (default: 30)\n"
              << "\n"
              << "A bundle reference is an OCI bundle directory, a template archive path\n"
              << "or a storage template such as local:vztmpl/debian-12.tar.zst.\n"
              << std::endl;
}

// Runs one command against `engine`; argv[0] is the command name.
int dispatch_command(LifecycleOrchestrator& engine, int command_argc, char* command_argv[], const char* prog) {
    std::string command = command_argv[0];
    try {
        if (command == "create") {
            CreateOptions create_opts;
            if (!parse_create_options(command_argc, command_argv, create_opts)) {
                return 1;
            }
            ContainerState state = engine.create(create_opts.id, create_opts.bundle);
            log_info("Container '" + state.id + "' created with VMID " + std::to_string(state.vmid));
        } else if (command == "start" || command == "stop" || command == "state") {
            if (command_argc != 2) {
                print_usage(prog);
                return 1;
            }
            std::string id = command_argv[1];
            if (command == "start") {
                engine.start(id);
            } else if (command == "stop") {
                engine.stop(id);
            } else {
                show_state(engine, id);
            }
        } else if (command == "kill") {
            if (command_argc < 2 || command_argc > 3) {
                print_usage(prog);
                return 1;
            }
            int sig = SIGTERM;
            if (command_argc == 3 && !parse_signal(command_argv[2], sig)) {
                std::cerr << "Invalid signal value: " << command_argv[2] << std::endl;
                return 1;
            }
            engine.kill(command_argv[1], sig);
        } else if (command == "delete") {
            bool force = false;
            std::string id;
            for (int i = 1; i < command_argc; ++i) {
                std::string arg = command_argv[i];
                if (arg == "--force" || arg == "-f") {
                    force = true;
                    continue;
                }
                if (arg.rfind("-", 0) == 0) {
                    std::cerr << "Unknown delete option: " << arg << std::endl;
                    return 1;
                }
                id = arg;
                if (i + 1 < command_argc) {
                    std::cerr << "Error: Unexpected argument: " << command_argv[i + 1] << std::endl;
                    return 1;
                }
                break;
            }
            if (id.empty()) {
                std::cerr << "Error: Container id is required." << std::endl;
                return 1;
            }
            engine.remove(id, force);
        } else if (command == "list") {
            list_containers(engine);
        } else if (command == "exec") {
            ExecOptions exec_opts;
            if (!parse_exec_options(command_argc, command_argv, exec_opts)) {
                return 1;
            }
            return exec_container(engine, exec_opts);
        } else if (command == "template") {
            return template_command(engine, command_argc, command_argv);
        } else {
            std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
            print_usage(prog);
            return 1;
        }
    } catch (const RuntimeError& e) {
        return report_error(e);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    opterr = 0;
    optind = 1;

    static struct option global_long_options[] = {
            {"debug", no_argument, nullptr, OPT_DEBUG},
            {"log", required_argument, nullptr, OPT_LOG},
            {"log-format", required_argument, nullptr, OPT_LOG_FORMAT},
            {"root", required_argument, nullptr, OPT_ROOT},
            {"config", required_argument, nullptr, OPT_CONFIG},
            {"version", no_argument, nullptr, OPT_VERSION},
            {"help", no_argument, nullptr, OPT_HELP},
            {nullptr, 0, nullptr, 0}
    };

    int global_opt;
    while ((global_opt = getopt_long(argc, argv, "+", global_long_options, nullptr)) != -1) {
        switch (global_opt) {
            case OPT_DEBUG:
                g_global_options.debug = true;
                break;
            case OPT_LOG:
                g_global_options.log_path = optarg;
                if (!configure_log_destination(g_global_options.log_path)) {
                    return 1;
                }
                break;
            case OPT_LOG_FORMAT:
                g_global_options.log_format = optarg;
                if (g_global_options.log_format != "text" && g_global_options.log_format != "json") {
                    std::cerr << "Warning: Unsupported log format '" << g_global_options.log_format
                              << "', defaulting to text." << std::endl;
                    g_global_options.log_format = "text";
                }
                break;
            case OPT_ROOT:
                g_global_options.root_path = optarg ? optarg : "";
                while (g_global_options.root_path.size() > 1 && g_global_options.root_path.back() == '/') {
                    g_global_options.root_path.pop_back();
                }
                break;
            case OPT_CONFIG:
                g_global_options.config_path = optarg;
                break;
            case OPT_VERSION:
                std::cout << "lxcri version " << RUNTIME_VERSION << std::endl;
                return 0;
            case OPT_HELP:
                print_usage(argv[0]);
                return 0;
            case '?': {
                int idx = std::max(0, optind - 1);
                std::cerr << "Unknown global option: " << argv[idx] << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            default:
                std::cerr << "Unknown option encountered." << std::endl;
                return 1;
        }
    }

    if (optind >= argc) {
        print_usage(argv[0]);
        return 1;
    }

    char** command_argv = argv + optind;
    int command_argc = argc - optind;

    EngineConfig config;
    try {
        config = build_engine_config();
    } catch (const RuntimeError& e) {
        return report_error(e);
    }

    SystemCommandRunner runner;
    LifecycleOrchestrator engine(config, runner);
    return dispatch_command(engine, command_argc, command_argv, argv[0]);
}
