#pragma once
#include "stategraph/sg_types.hpp"

namespace sg {

/**
 * @class Node
 * @brief One computation step of a graph.
 *
 * - id: stable identifier, unique within a graph; also the prefix of the
 *   reserved state keys `{id}_result` and `{id}_user_input`.
 * - name: display name, defaults to the id.
 * - type / subtype: registry key of the handler for nodes declared in YAML;
 *   empty for nodes built in code.
 * - parameters: static parameters from YAML, handed to the handler through
 *   NodeContext::node.
 * - handler: the opaque unit of work.
 *
 * from_yaml reads everything except the handler; GraphIOService binds the
 * handler through HandlerRegistry.
 */
class Node {
public:
    std::string id;
    std::string name;
    std::string type;
    std::string subtype;

    YAML::Node parameters;

    NodeHandler handler;

    static Node from_yaml(const YAML::Node& n);
    YAML::Node to_yaml() const;
};

} // namespace sg
