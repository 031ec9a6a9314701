// Engine configuration YAML read/write implementation
#include "stategraph/engine_config.hpp"

#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

namespace sg {

EngineOptions EngineConfig::engine_options() const {
    EngineOptions opts;
    opts.max_steps = max_steps;
    opts.options_field = interaction_options_field;
    opts.quiet = quiet;

    auto policy = malformed_output_policy_from_string(malformed_output_policy);
    if (!policy) {
        throw GraphError(GraphErrc::InvalidParameter,
                         "Unknown malformed_output_policy '" + malformed_output_policy +
                             "' (expected warn, fatal or fallback).");
    }
    opts.malformed_output = *policy;

    auto consumption = user_input_consumption_from_string(user_input_consumption);
    if (!consumption) {
        throw GraphError(GraphErrc::InvalidParameter,
                         "Unknown user_input_consumption '" + user_input_consumption +
                             "' (expected persist or clear).");
    }
    opts.user_input_consumption = *consumption;
    return opts;
}

bool write_config_to_file(const EngineConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "Stategraph engine configuration.";
    root["session_backend"] = config.session_backend;
    root["session_root"] = config.session_root;
    root["max_steps"] = config.max_steps;
    root["malformed_output_policy"] = config.malformed_output_policy;
    root["user_input_consumption"] = config.user_input_consumption;
    root["interaction_options_field"] = config.interaction_options_field;
    root["quiet"] = config.quiet;
    root["history_export_dir"] = config.history_export_dir;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, EngineConfig& config) {
    if (fs::exists(config_path)) {
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            EngineConfig parsed = config;
            if (root["session_backend"]) parsed.session_backend = root["session_backend"].as<std::string>();
            if (root["session_root"]) parsed.session_root = root["session_root"].as<std::string>();
            if (root["max_steps"]) parsed.max_steps = root["max_steps"].as<std::size_t>();
            if (root["malformed_output_policy"]) parsed.malformed_output_policy = root["malformed_output_policy"].as<std::string>();
            if (root["user_input_consumption"]) parsed.user_input_consumption = root["user_input_consumption"].as<std::string>();
            if (root["interaction_options_field"]) parsed.interaction_options_field = root["interaction_options_field"].as<std::string>();
            if (root["quiet"]) parsed.quiet = root["quiet"].as<bool>();
            if (root["history_export_dir"]) parsed.history_export_dir = root["history_export_dir"].as<std::string>();
            parsed.loaded_config_path = fs::absolute(config_path).string();
            config = parsed;
            if (!config.quiet) std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else if (config_path == "stategraph.yaml") {
        std::cout << "Configuration file 'stategraph.yaml' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, "stategraph.yaml")) {
            config.loaded_config_path = fs::absolute("stategraph.yaml").string();
        }
    }
}

std::shared_ptr<SessionStore> make_session_store(const EngineConfig& config) {
    if (config.session_backend == "memory") return std::make_shared<MemorySessionStore>();
    if (config.session_backend == "file") return std::make_shared<FileSessionStore>(config.session_root);
    throw GraphError(GraphErrc::InvalidParameter,
                     "Unknown session_backend '" + config.session_backend + "' (expected memory or file).");
}

} // namespace sg
