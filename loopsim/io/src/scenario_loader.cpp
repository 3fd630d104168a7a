#include <loopsim/io/scenario_loader.hpp>
#include <loopsim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <array>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <utility>

namespace loopsim::io {

namespace {

using namespace loopsim::core;

constexpr std::array<std::pair<StepOp, std::string_view>, 7> STEP_OPS{{
    {StepOp::Post, "post"},
    {StepOp::PostAtFront, "post_at_front"},
    {StepOp::Advance, "advance"},
    {StepOp::Idle, "idle"},
    {StepOp::IdleFor, "idle_for"},
    {StepOp::RunOneTask, "run_one_task"},
    {StepOp::Teardown, "teardown"},
}};

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

int64_t get_int64(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsInt64()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer", context);
    }
    return member.GetInt64();
}

int64_t get_non_negative(const rapidjson::Value& val, const char* name,
                         const std::string& context) {
    int64_t value = get_int64(val, name, context);
    if (value < 0) {
        throw LoaderError(std::string("field '") + name + "' must not be negative", context);
    }
    return value;
}

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name,
                                  const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

// Optional getters
int64_t get_int64_or(const rapidjson::Value& val, const char* name, int64_t default_val,
                     const std::string& context) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    return get_int64(val, name, context);
}

bool get_bool_or(const rapidjson::Value& val, const char* name, bool default_val,
                 const std::string& context) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    const auto& member = val[name];
    if (!member.IsBool()) {
        throw LoaderError(std::string("field '") + name + "' must be a boolean", context);
    }
    return member.GetBool();
}

StepOp parse_op(const std::string& name, const std::string& context) {
    for (const auto& [op, spelling] : STEP_OPS) {
        if (spelling == name) {
            return op;
        }
    }
    throw LoaderError("unknown op '" + name + "'", context);
}

void parse_loops(ScenarioData& result, const rapidjson::Document& doc) {
    const auto& loops = get_array(doc, "loops", "scenario");
    std::set<std::string> names;
    bool has_main = false;

    for (rapidjson::SizeType idx = 0; idx < loops.Size(); ++idx) {
        const auto& loop_obj = loops[idx];
        std::string ctx = "loops[" + std::to_string(idx) + "]";
        if (!loop_obj.IsObject()) {
            throw LoaderError("loop must be an object", ctx);
        }

        LoopSpec spec;
        spec.name = get_string(loop_obj, "name", ctx);
        if (spec.name.empty()) {
            throw LoaderError("loop name must not be empty", ctx);
        }
        if (!names.insert(spec.name).second) {
            throw LoaderError("duplicate loop name '" + spec.name + "'", ctx);
        }

        spec.main = get_bool_or(loop_obj, "main", false, ctx);
        if (spec.main) {
            if (has_main) {
                throw LoaderError("only one loop may be the main loop", ctx);
            }
            has_main = true;
        }
        result.loops.push_back(std::move(spec));
    }
}

StepSpec parse_step(const rapidjson::Value& step_obj, const std::string& ctx) {
    if (!step_obj.IsObject()) {
        throw LoaderError("step must be an object", ctx);
    }

    StepSpec step;
    step.op = parse_op(get_string(step_obj, "op", ctx), ctx);

    switch (step.op) {
        case StepOp::Post:
            step.loop = get_string(step_obj, "loop", ctx);
            step.label = get_string(step_obj, "label", ctx);
            // Negative delays are accepted; posting treats them as zero
            step.delay = duration_from_millis(get_int64_or(step_obj, "delay_ms", 0, ctx));
            step.repeat_count = static_cast<uint64_t>(
                step_obj.HasMember("repeat_count") ? get_non_negative(step_obj, "repeat_count", ctx)
                                                   : 0);
            if (step.repeat_count > 0) {
                step.repeat_every =
                    duration_from_millis(get_non_negative(step_obj, "repeat_every_ms", ctx));
            }
            break;
        case StepOp::PostAtFront:
            step.loop = get_string(step_obj, "loop", ctx);
            step.label = get_string(step_obj, "label", ctx);
            break;
        case StepOp::Advance:
            step.amount = duration_from_millis(get_non_negative(step_obj, "by_ms", ctx));
            break;
        case StepOp::IdleFor:
            step.loop = get_string(step_obj, "loop", ctx);
            step.amount = duration_from_millis(get_non_negative(step_obj, "duration_ms", ctx));
            break;
        case StepOp::Idle:
        case StepOp::RunOneTask:
            step.loop = get_string(step_obj, "loop", ctx);
            break;
        case StepOp::Teardown:
            break;
    }
    return step;
}

void parse_scenario_impl(ScenarioData& result, const rapidjson::Document& doc) {
    result.start_time = time_from_millis(get_int64_or(doc, "start_time_ms", 0, "scenario"));
    if (result.start_time < TimePoint::epoch()) {
        throw LoaderError("field 'start_time_ms' must not be negative", "scenario");
    }

    parse_loops(result, doc);

    if (!doc.HasMember("steps")) {
        // A scenario without steps only creates its loops
        return;
    }
    const auto& steps = get_array(doc, "steps", "scenario");
    for (rapidjson::SizeType idx = 0; idx < steps.Size(); ++idx) {
        result.steps.push_back(parse_step(steps[idx], "steps[" + std::to_string(idx) + "]"));
    }
}

} // anonymous namespace

std::string_view step_op_name(StepOp op) noexcept {
    for (const auto& [candidate, spelling] : STEP_OPS) {
        if (candidate == op) {
            return spelling;
        }
    }
    return "unknown";
}

ScenarioData load_scenario(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_scenario_from_string(oss.str());
}

ScenarioData load_scenario_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "scenario");
    }

    ScenarioData result;
    parse_scenario_impl(result, doc);
    return result;
}

} // namespace loopsim::io
