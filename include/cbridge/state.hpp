#pragma once

#include <boost/json.hpp>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbridge {

namespace fs = std::filesystem;

enum class phase { planning, implementing, awaiting_review };

std::string_view to_string(phase p);
std::optional<phase> phase_from_string(std::string_view s);

struct bridge_state {
  phase current_phase{phase::planning};
  bool paused{};
  std::int64_t cycle_count{};
  std::string last_updated;
  std::optional<std::string> current_task;
  std::optional<std::string> error;

  // Tolerant: fields that are missing or of the wrong kind keep their
  // defaults.
  static bridge_state from_json(const boost::json::object& obj);
  boost::json::object to_json() const;
};

struct event {
  std::string type;
  boost::json::object payload;
  std::string timestamp;

  static event from_json(const boost::json::object& obj);
  boost::json::object to_json() const;
};

// ISO-8601 UTC with microseconds, e.g. "2026-10-19T12:00:00.123456".
std::string utc_timestamp();

// Throws std::invalid_argument unless name is a bare filename matching
// [A-Za-z0-9][A-Za-z0-9._-]*.
const std::string& validate_artifact_name(const std::string& name);

// Write content to a temp file next to path, then rename over path.  On
// failure the temp file is removed and std::system_error propagates.
void atomic_write(const fs::path& path, std::string_view content);

/// Durable bridge state: state.json, events.jsonl and artifacts/ under one
/// root directory.  Instances are cheap handles; several of them (or several
/// processes) may share a directory.
class state_store {
 public:
  explicit state_store(fs::path state_dir);

  const fs::path& state_dir() const { return state_dir_; }
  const fs::path& artifacts_dir() const { return artifacts_dir_; }

  bridge_state get() const;
  bridge_state set(const boost::json::object& partial_update);
  // Read-modify-write under the store lock: fn maps the current state to a
  // partial update, which is then applied as by set().
  bridge_state update(
      const std::function<boost::json::object(const bridge_state&)>& fn);

  event append_event(
      std::string_view type, boost::json::object payload = {});
  std::vector<event> get_events(std::size_t limit = 100) const;

  void write_artifact(const std::string& name, std::string_view content);
  std::optional<std::string> read_artifact(const std::string& name) const;

  // Same discipline, rooted at a caller-chosen directory.
  static void write_artifact_to(
      const fs::path& dir, const std::string& name, std::string_view content);
  static std::optional<std::string> read_artifact_from(
      const fs::path& dir, const std::string& name);

 private:
  bridge_state read_unlocked() const;

  fs::path state_dir_;
  fs::path state_file_;
  fs::path lock_file_;
  fs::path events_file_;
  fs::path artifacts_dir_;
};

}  // namespace cbridge
