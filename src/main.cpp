#include <fstream>
#include <future>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "behavior/registry.hpp"
#include "orbital/context.hpp"
#include "orbital/error.hpp"
#include "orbital/eval.hpp"
#include "orbital/printer.hpp"
#include "orbital/reader.hpp"

namespace {

std::string read_text_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw orbital::orbital_error("failed to open file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Effects have nowhere to go from the command line, so they are echoed.
orbital::eval_context make_cli_context() {
    orbital::effect_handlers handlers;
    auto store = std::make_shared<orbital::entity_store>();
    handlers.mutate_entity = [store](const orbital::map_entries& changes) {
        store->apply_changes(changes);
        std::cout << "; set " << orbital::write_json(orbital::make_map(changes)) << '\n';
    };
    handlers.emit = [](const std::string& event, const orbital::value& payload) {
        std::cout << "; emit " << event << ' ' << orbital::write_json(payload) << '\n';
    };
    handlers.navigate = [](const std::string& route, const orbital::value&) {
        std::cout << "; navigate " << route << '\n';
    };
    handlers.persist = [](const std::string& action, const orbital::value& data) {
        std::cout << "; persist " << action << ' ' << orbital::write_json(data) << '\n';
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    };
    handlers.notify = [](const std::string& message, const std::string& severity) {
        std::cout << "; notify [" << severity << "] " << message << '\n';
    };
    handlers.render_ui = [](const std::string& slot, const orbital::value& pattern, const orbital::value& props, const orbital::value&) {
        std::cout << "; render-ui " << slot << ' ' << orbital::write_json(pattern) << ' ' << orbital::write_json(props) << '\n';
    };

    orbital::eval_context ctx = orbital::create_effect_context(orbital::create_minimal_context(), handlers);
    ctx.entity = store;
    ctx.now = orbital::wall_clock_ms();
    return ctx;
}

void eval_and_print(const std::vector<orbital::value>& exprs, orbital::eval_context& ctx) {
    for (const orbital::value& expr : exprs) {
        ctx.now = orbital::wall_clock_ms();
        const orbital::value result = orbital::default_evaluator().evaluate(expr, ctx);
        std::cout << orbital::print_value(result) << '\n';
    }
}

int run_script(const std::string& path, orbital::eval_context& ctx) {
    const auto source = read_text_file(path);
    eval_and_print(orbital::read_all_json(source), ctx);
    return 0;
}

void print_catalog() {
    for (const auto& def : behavior::std_registry().all()) {
        std::cout << def->name << " (" << def->category << ") " << def->description << '\n';
    }
}

int run_repl(orbital::eval_context& ctx) {
    std::string buffer;
    while (true) {
        std::cout << (buffer.empty() ? "orbital> " : "......> ");
        std::cout.flush();

        std::string line;
        if (!std::getline(std::cin, line)) {
            std::cout << '\n';
            break;
        }

        if (buffer.empty() && (line == ":q" || line == ":quit" || line == ":exit")) {
            break;
        }
        if (buffer.empty() && line == ":behaviors") {
            print_catalog();
            continue;
        }

        buffer += line;
        buffer.push_back('\n');

        try {
            eval_and_print(orbital::read_all_json(buffer), ctx);
            buffer.clear();
        } catch (const orbital::parse_error& e) {
            if (e.incomplete()) {
                continue;
            }
            std::cerr << "parse error: " << e.what() << '\n';
            buffer.clear();
        } catch (const orbital::orbital_error& e) {
            std::cerr << "error: " << e.what() << '\n';
            buffer.clear();
        }
    }

    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        orbital::eval_context ctx = make_cli_context();
        if (argc > 1) {
            return run_script(argv[1], ctx);
        }
        return run_repl(ctx);
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
