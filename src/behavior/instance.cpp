#include "behavior/instance.hpp"

#include <sstream>

#include "orbital/printer.hpp"

namespace behavior {

instance::instance(const definition* definition_ptr)
    : def(definition_ptr), entity(std::make_shared<orbital::entity_store>()), config(orbital::make_map()) {}

std::string dump_stats(const instance& inst) {
    const orbital::dispatch_profile_stats& s = inst.stats;
    std::ostringstream out;
    out << "behavior=" << (inst.def ? inst.def->name : std::string{}) << '\n';
    out << "state=" << inst.state << '\n';
    out << "events=" << s.events << '\n';
    out << "transitions=" << s.transitions << '\n';
    out << "guard_rejections=" << s.guard_rejections << '\n';
    out << "guard_errors=" << s.guard_errors << '\n';
    out << "unmatched_events=" << s.unmatched_events << '\n';
    out << "ticks_run=" << s.ticks_run << '\n';
    out << "ticks_skipped=" << s.ticks_skipped << '\n';
    out << "dispatch_last_ns=" << s.dispatch_time.last.count() << '\n';
    out << "dispatch_max_ns=" << s.dispatch_time.max.count() << '\n';
    out << "tick_last_ns=" << s.tick_time.last.count() << '\n';
    out << "tick_max_ns=" << s.tick_time.max.count() << '\n';
    return out.str();
}

std::string dump_entity(const instance& inst) {
    std::ostringstream out;
    const orbital::value data = inst.entity ? inst.entity->snapshot() : orbital::make_map();
    for (const auto& [key, item] : orbital::map_value(data)) {
        out << key << '=' << orbital::print_value(item) << '\n';
    }
    return out.str();
}

}  // namespace behavior
