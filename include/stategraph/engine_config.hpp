// Engine configuration definition and YAML I/O declarations
#pragma once

#include <memory>
#include <string>

#include "stategraph/execution_types.hpp"
#include "stategraph/kernel/services/session_store.hpp"

namespace sg {

struct EngineConfig {
    std::string loaded_config_path;
    std::string session_backend = "memory";  // memory | file
    std::string session_root = "sessions";
    std::size_t max_steps = 0;
    std::string malformed_output_policy = "warn";  // warn | fatal | fallback
    std::string user_input_consumption = "persist";  // persist | clear
    std::string interaction_options_field = "options";
    bool quiet = true;
    std::string history_export_dir = "out/history";

    // Throws GraphError(InvalidParameter) for unknown enum strings.
    EngineOptions engine_options() const;
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const EngineConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "stategraph.yaml" and does not exist, create it with defaults.
void load_or_create_config(const std::string& config_path, EngineConfig& config);

// MemorySessionStore or FileSessionStore rooted at `session_root`.
std::shared_ptr<SessionStore> make_session_store(const EngineConfig& config);

} // namespace sg
