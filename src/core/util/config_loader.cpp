// src/core/util/config_loader.cpp
#include "cx/core/util/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

#include <yaml-cpp/yaml.h>

namespace cx {
namespace fs = std::filesystem;

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth) {
  if (depth > 16) {
    return Result<YAML::Node>::err(Status::invalid_argument("includes nested too deeply at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, depth + 1);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  // Finally override with this file's contents (excluding includes itself).
  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static Status parse_into(const YAML::Node& y, Config& cfg) {
  // --- feed
  if (is_map(y["feed"])) {
    const auto f = y["feed"];
    maybe_set(f, "uri", cfg.feed.uri);
    if (f["format"]) cfg.feed.format = to_lower(f["format"].as<std::string>());
    if (f["items_per_chunk"] && !f["items_per_chunk"].IsNull()) {
      cfg.feed.items_per_chunk = f["items_per_chunk"].as<std::int64_t>();
    }
    maybe_set(f, "timestamp_format", cfg.feed.timestamp_format);
  } else if (y["feed"]) {
    return Status::invalid_argument("feed must be a YAML map");
  }

  // --- job
  if (is_map(y["job"])) {
    const auto j = y["job"];
    maybe_set(j, "job_id", cfg.job.job_id);
    maybe_set(j, "project", cfg.job.project);
    maybe_set(j, "project_id", cfg.job.project_id);
  }

  // --- input
  if (is_map(y["input"])) {
    const auto in = y["input"];
    if (in["type"]) cfg.input.type = to_lower(in["type"].as<std::string>());
    if (is_map(in["synth"])) maybe_set(in["synth"], "count", cfg.input.synth.count);
    if (is_map(in["lines"])) maybe_set(in["lines"], "path", cfg.input.lines.path);
  }

  // --- output
  if (is_map(y["output"])) {
    maybe_set(y["output"], "events_dir", cfg.output.events_dir);
  }

  return Status::ok_status();
}

std::optional<std::string> process_env(const std::string& name) {
  const char* v = std::getenv(name.c_str());
  if (!v || !*v) return std::nullopt;
  return std::string(v);
}

JobIdentity resolve_job_identity(const JobConfig& job, const EnvLookup& env) {
  auto pick = [&env](const std::string& configured, const char* env_name, const char* fallback) {
    if (!configured.empty()) return configured;
    if (env) {
      if (auto v = env(env_name)) return *v;
    }
    return std::string(fallback);
  };

  JobIdentity id;
  id.job_id = pick(job.job_id, kEnvJob, kNoJob);
  id.project = pick(job.project, kEnvProject, kNoProject);
  id.project_id = pick(job.project_id, kEnvProjectId, kNoProjectId);
  return id;
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  auto yaml_r = load_with_includes(path, 0);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  const YAML::Node y = yaml_r.take_value();

  Config cfg;  // defaults

  try {
    const Status s = parse_into(y, cfg);
    if (!s.ok()) return Result<Config>::err(s);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error("invalid value in " + path_str + ": " + e.what()));
  }

  // Identity is resolved once here; nothing downstream reads the environment.
  const JobIdentity id = resolve_job_identity(cfg.job);
  cfg.job.job_id = id.job_id;
  cfg.job.project = id.project;
  cfg.job.project_id = id.project_id;

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

}  // namespace cx
