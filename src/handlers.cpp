#include "stategraph/kernel/handlers.hpp"

#include <stdexcept>
#include <string>

#include "stategraph/kernel/value_utils.hpp"
#include "stategraph/node.hpp"

namespace sg { namespace handlers {

static NodeOutput handler_constant(const NodeContext& ctx) {
    const YAML::Node& P = ctx.node.parameters;
    if (!P || !P.IsMap() || !P["output"]) {
        throw GraphError(GraphErrc::InvalidParameter,
                         "emit:constant needs parameters.output (node '" + ctx.node.id + "').");
    }
    return NodeOutput{ clone_value(P["output"]) };
}

static NodeOutput handler_text(const NodeContext& ctx) {
    const std::string text = as_str(ctx.node.parameters, "text");
    return NodeOutput{ StateValue(text) };
}

static NodeOutput handler_sequence(const NodeContext& ctx) {
    const YAML::Node& P = ctx.node.parameters;
    if (!P || !P.IsMap() || !P["outputs"] || !P["outputs"].IsSequence() || P["outputs"].size() == 0) {
        throw GraphError(GraphErrc::InvalidParameter,
                         "emit:sequence needs a non-empty parameters.outputs (node '" + ctx.node.id + "').");
    }
    const YAML::Node outputs = P["outputs"];
    std::size_t idx = ctx.visit == 0 ? 0 : ctx.visit - 1;
    if (idx >= outputs.size()) idx = outputs.size() - 1;
    return NodeOutput{ clone_value(outputs[idx]) };
}

static NodeOutput handler_entry(const NodeContext& ctx) {
    if (ctx.entry_input) return NodeOutput{ clone_value(*ctx.entry_input) };
    const YAML::Node& P = ctx.node.parameters;
    if (P && P.IsMap() && P["output"]) return NodeOutput{ clone_value(P["output"]) };
    return NodeOutput{ StateValue() };
}

static NodeOutput handler_error(const NodeContext& ctx) {
    throw std::runtime_error(as_str(ctx.node.parameters, "message", "node failed"));
}

void register_builtin() {
    auto& R = HandlerRegistry::instance();
    R.register_handler("emit", "constant", handler_constant);
    R.register_handler("emit", "text", handler_text);
    R.register_handler("emit", "sequence", handler_sequence);
    R.register_handler("emit", "entry", handler_entry);
    R.register_handler("emit", "error", handler_error);
}

}} // namespace sg::handlers
