// include/cx/core/util/config_loader.hpp
#pragma once

#include <functional>
#include <optional>
#include <string>

#include "cx/core/config.hpp"
#include "cx/core/model/rotation_context.hpp"
#include "cx/core/status.hpp"

namespace cx {

// Environment variables consulted for job identity fields missing from YAML.
inline constexpr const char* kEnvJob = "CX_JOB";
inline constexpr const char* kEnvProject = "CX_PROJECT";
inline constexpr const char* kEnvProjectId = "CX_PROJECT_ID";

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Reads the process environment (empty values count as unset).
std::optional<std::string> process_env(const std::string& name);

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

// YAML value, else environment, else the sentinel ("nojob", ...).
JobIdentity resolve_job_identity(const JobConfig& job, const EnvLookup& env = process_env);

}  // namespace cx
