#include "forge/doctor_plugin.h"
#include "forge/json_mini.h"
#include "forge/system_deps.h"
#include "forge/util.h"

#include <json-c/json.h>

#include <sstream>

namespace forge {

CapabilityList DoctorPlugin::get_capabilities() const {
    CapabilityDescriptor tools;
    tools.name = "tools";
    tools.description = "Comma-separated binaries to check (default: catalog system deps)";
    tools.kind = ValueKind::STRING;
    return {tools};
}

static std::vector<std::string> split_tools(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string item;
    while (std::getline(in, item, ',')) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

RunOutcome DoctorPlugin::run(const ArgMap& args, ExecutionContext& ctx) {
    std::vector<std::string> tools = catalog_tools_;
    auto it = args.find("tools");
    if (it != args.end() && std::holds_alternative<std::string>(it->second)) {
        tools = split_tools(std::get<std::string>(it->second));
    }
    if (tools.empty()) return RunOutcome::success("Nothing to check");

    std::vector<DependencyCheck> checks;
    for (size_t i = 0; i < tools.size(); i++) {
        if (ctx.cancelled()) return RunOutcome::cancelled();
        ctx.progress((double)i / (double)tools.size(), "checking " + tools[i]);
        auto one = check_dependencies({tools[i]});
        checks.push_back(one.front());
    }
    ctx.progress(1.0, "done");

    std::ostringstream text;
    std::vector<std::string> missing;
    for (const auto& c : checks) {
        if (c.available) {
            text << "  ok       " << c.name << " (" << c.path << ")\n";
        } else {
            text << "  missing  " << c.name << "\n";
            missing.push_back(c.name);
        }
    }

    json_object* data = json_object_new_object();
    json_object_object_add(data, "output", json_mini::new_string(text.str()));
    json_object_object_add(data, "missing", json_mini::new_string_array(missing));
    std::string data_json = json_object_to_json_string_ext(data, JSON_C_TO_STRING_PLAIN);
    json_object_put(data);

    if (missing.empty()) {
        return RunOutcome(RunStatus::SUCCESS, "All " + std::to_string(checks.size()) + " tools found", data_json);
    }
    return RunOutcome(RunStatus::PARTIAL,
                      std::to_string(missing.size()) + " of " + std::to_string(checks.size()) + " tools missing",
                      data_json);
}

} // namespace forge
