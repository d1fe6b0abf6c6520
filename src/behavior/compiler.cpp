#include "behavior/compiler.hpp"

#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "orbital/expression.hpp"
#include "orbital/printer.hpp"
#include "orbital/reader.hpp"

namespace behavior {
namespace {

using orbital::value;

class document_reader {
public:
    explicit document_reader(std::string behavior_name) : name_(std::move(behavior_name)) {}

    [[noreturn]] void fail(const std::string& message) const {
        throw behavior_compile_error((name_.empty() ? std::string("behavior") : name_) + ": " + message);
    }

    std::string optional_string(const value& map, std::string_view key, const std::string& where) const {
        const value found = orbital::map_get(map, key);
        if (orbital::is_nullish(found)) {
            return {};
        }
        if (!orbital::is_string(found)) {
            fail(where + "." + std::string(key) + " must be a string");
        }
        return orbital::string_value(found);
    }

    std::string required_string(const value& map, std::string_view key, const std::string& where) const {
        std::string text = optional_string(map, key, where);
        if (text.empty()) {
            fail(where + " requires a non-empty '" + std::string(key) + "'");
        }
        return text;
    }

    const orbital::array_items& optional_array(const value& map, std::string_view key, const std::string& where) const {
        static const orbital::array_items empty;
        const value* found = orbital::map_find(map, key);
        if (!found || orbital::is_nullish(*found)) {
            return empty;
        }
        if (!orbital::is_array(*found)) {
            fail(where + "." + std::string(key) + " must be an array");
        }
        return orbital::array_value(*found);
    }

    std::vector<std::string> string_list(const value& map, std::string_view key, const std::string& where) const {
        std::vector<std::string> out;
        for (const value& item : optional_array(map, key, where)) {
            if (!orbital::is_string(item)) {
                fail(where + "." + std::string(key) + " entries must be strings");
            }
            out.push_back(orbital::string_value(item));
        }
        return out;
    }

    std::optional<orbital::sexpr> optional_expr(const value& map, std::string_view key) const {
        const value* found = orbital::map_find(map, key);
        if (!found || orbital::is_nullish(*found)) {
            return std::nullopt;
        }
        return *found;
    }

    std::vector<orbital::sexpr> effect_list(const value& map, std::string_view key, const std::string& where) const {
        std::vector<orbital::sexpr> out;
        for (const value& effect : optional_array(map, key, where)) {
            if (!orbital::is_call(effect)) {
                fail(where + "." + std::string(key) + " entries must be calls, got " + orbital::print_value(effect));
            }
            out.push_back(effect);
        }
        return out;
    }

    state_decl compile_state(const value& form) const {
        state_decl s;
        if (orbital::is_string(form)) {
            s.name = orbital::string_value(form);
        } else if (orbital::is_map(form)) {
            s.name = required_string(form, "name", "state");
            s.is_initial = orbital::is_truthy(orbital::map_get(form, "isInitial"));
            s.is_final = orbital::is_truthy(orbital::map_get(form, "isFinal"));
            s.description = optional_string(form, "description", "state");
        } else {
            fail("state must be a string or an object");
        }
        if (s.name.empty()) {
            fail("state name cannot be empty");
        }
        return s;
    }

    event_decl compile_event(const value& form) const {
        event_decl e;
        if (orbital::is_string(form)) {
            e.key = orbital::string_value(form);
            e.name = e.key;
        } else if (orbital::is_map(form)) {
            e.key = required_string(form, "key", "event");
            e.name = optional_string(form, "name", "event");
            if (e.name.empty()) {
                e.name = e.key;
            }
            e.description = optional_string(form, "description", "event");
            e.payload_schema = orbital::map_get(form, "payload");
        } else {
            fail("event must be a string or an object");
        }
        return e;
    }

    transition compile_transition(const value& form, std::size_t index) const {
        const std::string where = "transition " + std::to_string(index);
        if (!orbital::is_map(form)) {
            fail(where + " must be an object");
        }

        transition t;
        t.event = required_string(form, "event", where);

        const value from = orbital::map_get(form, "from");
        if (orbital::is_nullish(from)) {
            t.any_state = true;
        } else if (orbital::is_string(from)) {
            if (orbital::string_value(from) == "*") {
                t.any_state = true;
            } else {
                t.from.push_back(orbital::string_value(from));
            }
        } else if (orbital::is_array(from)) {
            t.from = string_list(form, "from", where);
            if (t.from.empty()) {
                fail(where + ".from cannot be an empty list");
            }
        } else {
            fail(where + ".from must be a state name, a list of names or '*'");
        }

        const std::string to = optional_string(form, "to", where);
        if (!to.empty()) {
            t.to = to;
        }
        t.guard = optional_expr(form, "guard");
        t.effects = effect_list(form, "effects", where);
        return t;
    }

    tick_decl compile_tick(const value& form, std::size_t index) const {
        const std::string where = "tick " + std::to_string(index);
        if (!orbital::is_map(form)) {
            fail(where + " must be an object");
        }

        tick_decl t;
        t.name = required_string(form, "name", where);
        t.description = optional_string(form, "description", where);
        const value priority = orbital::map_get(form, "priority");
        if (!orbital::is_nullish(priority)) {
            if (!orbital::is_number(priority)) {
                fail(where + ".priority must be a number");
            }
            t.priority = orbital::number_value(priority);
        }

        const value interval = orbital::map_get(form, "interval");
        if (orbital::is_nullish(interval) || (orbital::is_string(interval) && orbital::string_value(interval) == "frame")) {
            t.interval.kind = interval_kind::frame;
        } else if (orbital::is_number(interval)) {
            const double ms = orbital::number_value(interval);
            if (!(ms > 0.0) || !std::isfinite(ms)) {
                fail(where + ".interval must be a positive number of milliseconds");
            }
            t.interval.kind = interval_kind::fixed_ms;
            t.interval.ms = ms;
        } else if (orbital::is_string(interval)) {
            const std::optional<orbital::binding_ref> ref = orbital::parse_binding(orbital::string_value(interval));
            if (!ref || ref->root != "config" || ref->path.size() != 1) {
                fail(where + ".interval must be 'frame', a number or '@config.<name>'");
            }
            t.interval.kind = interval_kind::config_ref;
            t.interval.config_key = ref->path.front();
        } else {
            fail(where + ".interval must be 'frame', a number or '@config.<name>'");
        }

        t.applies_to = string_list(form, "appliesTo", where);
        t.guard = optional_expr(form, "guard");
        t.effects = effect_list(form, "effects", where);
        return t;
    }

    data_entity compile_entity(const value& form) const {
        if (!orbital::is_map(form)) {
            fail("data entity must be an object");
        }
        data_entity d;
        d.name = required_string(form, "name", "data entity");
        d.description = optional_string(form, "description", "data entity");
        d.runtime = orbital::is_truthy(orbital::map_get(form, "runtime"));
        d.singleton = orbital::is_truthy(orbital::map_get(form, "singleton"));
        for (const value& field_form : optional_array(form, "fields", "data entity " + d.name)) {
            if (!orbital::is_map(field_form)) {
                fail("data entity " + d.name + ": field must be an object");
            }
            entity_field f;
            f.name = required_string(field_form, "name", "field");
            f.type = optional_string(field_form, "type", "field");
            f.description = optional_string(field_form, "description", "field");
            f.required = orbital::is_truthy(orbital::map_get(field_form, "required"));
            f.default_value = orbital::map_get(field_form, "default");
            d.fields.push_back(std::move(f));
        }
        return d;
    }

    std::vector<config_field> compile_config_fields(const value& schema, std::string_view key) const {
        std::vector<config_field> out;
        const std::string where = "configSchema";
        for (const value& form : optional_array(schema, key, where)) {
            if (!orbital::is_map(form)) {
                fail("configSchema." + std::string(key) + " entries must be objects");
            }
            config_field f;
            f.name = required_string(form, "name", "config field");
            f.type = optional_string(form, "type", "config field");
            f.description = optional_string(form, "description", "config field");
            f.default_value = orbital::map_get(form, "default");
            for (const value& option : optional_array(form, "enum", "config field " + f.name)) {
                f.allowed.push_back(option);
            }
            out.push_back(std::move(f));
        }
        return out;
    }

private:
    std::string name_;
};

}  // namespace

definition compile_definition(const value& doc) {
    if (!orbital::is_map(doc)) {
        throw behavior_compile_error("behavior document must be an object");
    }

    document_reader reader("");
    definition def;
    def.name = reader.required_string(doc, "name", "behavior");
    reader = document_reader(def.name);
    def.category = reader.optional_string(doc, "category", "behavior");
    def.description = reader.optional_string(doc, "description", "behavior");
    def.suggested_for = reader.string_list(doc, "suggestedFor", "behavior");

    for (const value& form : reader.optional_array(doc, "dataEntities", "behavior")) {
        def.data_entities.push_back(reader.compile_entity(form));
    }

    const value machine = orbital::map_get(doc, "stateMachine");
    if (!orbital::is_map(machine)) {
        reader.fail("stateMachine must be an object");
    }
    for (const value& form : reader.optional_array(machine, "states", "stateMachine")) {
        def.states.push_back(reader.compile_state(form));
    }
    if (def.states.empty()) {
        reader.fail("state machine must have at least one state");
    }
    for (const value& form : reader.optional_array(machine, "events", "stateMachine")) {
        def.events.push_back(reader.compile_event(form));
    }
    const orbital::array_items& transitions = reader.optional_array(machine, "transitions", "stateMachine");
    for (std::size_t i = 0; i < transitions.size(); ++i) {
        def.transitions.push_back(reader.compile_transition(transitions[i], i));
    }

    def.initial = reader.optional_string(machine, "initial", "stateMachine");
    if (def.initial.empty()) {
        for (const state_decl& s : def.states) {
            if (s.is_initial) {
                def.initial = s.name;
                break;
            }
        }
    }
    if (def.initial.empty()) {
        def.initial = def.states.front().name;
    }
    if (!def.has_state(def.initial)) {
        reader.fail("initial state '" + def.initial + "' is not declared");
    }

    const orbital::array_items& ticks = reader.optional_array(doc, "ticks", "behavior");
    for (std::size_t i = 0; i < ticks.size(); ++i) {
        def.ticks.push_back(reader.compile_tick(ticks[i], i));
    }

    const value schema = orbital::map_get(doc, "configSchema");
    if (!orbital::is_nullish(schema)) {
        if (!orbital::is_map(schema)) {
            reader.fail("configSchema must be an object");
        }
        def.config_required = reader.compile_config_fields(schema, "required");
        def.config_optional = reader.compile_config_fields(schema, "optional");
    }

    def.initial_effects = reader.effect_list(doc, "initialEffects", "behavior");
    return def;
}

definition compile_definition_text(const std::string& json_text) {
    return compile_definition(orbital::read_json(json_text));
}

std::vector<std::string> validate_definition(const definition& def) {
    std::vector<std::string> problems;

    if (def.name.rfind("std/", 0) != 0) {
        problems.push_back("Behavior name should start with 'std/' (got: " + def.name + ")");
    }
    if (!is_known_category(def.category)) {
        problems.push_back("Invalid category: " + def.category);
    }
    if (def.states.empty()) {
        problems.push_back("State machine must have at least one state");
    }

    for (const transition& t : def.transitions) {
        if (!def.has_event(t.event)) {
            problems.push_back("Transition uses undeclared event: " + t.event);
        }
        for (const std::string& from : t.from) {
            if (!def.has_state(from)) {
                problems.push_back("Transition from undeclared state: " + from);
            }
        }
        if (t.to && !def.has_state(*t.to)) {
            problems.push_back("Transition to undeclared state: " + *t.to);
        }
    }

    for (const tick_decl& tick : def.ticks) {
        for (const std::string& state : tick.applies_to) {
            if (!def.has_state(state)) {
                problems.push_back("Tick " + tick.name + " applies to undeclared state: " + state);
            }
        }
    }

    return problems;
}

value resolve_config(const definition& def, const value& overrides) {
    orbital::map_entries resolved;
    for (const config_field& f : def.config_optional) {
        if (!orbital::is_undefined(f.default_value)) {
            resolved[f.name] = f.default_value;
        }
    }
    if (orbital::is_map(overrides)) {
        for (const auto& [key, item] : orbital::map_value(overrides)) {
            resolved[key] = item;
        }
    }

    for (const config_field& f : def.config_required) {
        const auto it = resolved.find(f.name);
        if (it == resolved.end() || orbital::is_nullish(it->second)) {
            throw behavior_error(def.name + ": missing required config '" + f.name + "'");
        }
    }

    for (const config_field& f : def.config_optional) {
        if (f.allowed.empty()) {
            continue;
        }
        const auto it = resolved.find(f.name);
        if (it == resolved.end() || orbital::is_nullish(it->second)) {
            continue;
        }
        bool allowed = false;
        for (const value& option : f.allowed) {
            allowed = allowed || orbital::deep_equal(option, it->second);
        }
        if (!allowed) {
            throw behavior_error(def.name + ": config '" + f.name + "' does not allow " + orbital::print_value(it->second));
        }
    }

    return orbital::make_map(std::move(resolved));
}

value default_entity_data(const definition& def) {
    orbital::map_entries out;
    for (const data_entity& d : def.data_entities) {
        for (const entity_field& f : d.fields) {
            out[f.name] = orbital::is_undefined(f.default_value) ? orbital::make_null() : f.default_value;
        }
    }
    return orbital::make_map(std::move(out));
}

}  // namespace behavior
