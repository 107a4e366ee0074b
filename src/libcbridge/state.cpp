#include "cbridge/state.hpp"

#include <fcntl.h>
#include <re2/re2.h>
#include <sys/file.h>
#include <unistd.h>

#include <boost/json.hpp>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>

#include "json_helpers.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace cbridge {

namespace json = boost::json;

namespace {

using usec_time =
    std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

std::string format_timestamp(usec_time t) {
  using namespace std::chrono;
  auto secs = time_point_cast<seconds>(t);
  auto frac = (t - secs).count();
  std::time_t tt = system_clock::to_time_t(secs);
  std::tm tm{};
  ::gmtime_r(&tt, &tm);
  return fmt::format(
      "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}", tm.tm_year + 1900,
      tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
}

std::optional<usec_time> parse_timestamp(const std::string& s) {
  std::tm tm{};
  int usec{0};
  int n = std::sscanf(
      s.c_str(), "%d-%d-%dT%d:%d:%d.%6d", &tm.tm_year, &tm.tm_mon,
      &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &usec);
  if (n < 6) return std::nullopt;
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  std::time_t tt = ::timegm(&tm);
  if (tt == -1) return std::nullopt;
  return std::chrono::time_point_cast<std::chrono::microseconds>(
             std::chrono::system_clock::from_time_t(tt)) +
         std::chrono::microseconds{usec};
}

usec_time now_usec() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(
      std::chrono::system_clock::now());
}

// Advisory flock(2) on a side file.  Best effort: when the lock cannot be
// taken the caller proceeds unsynchronized.
class file_lock {
 public:
  file_lock(const fs::path& path, bool exclusive) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      LOG_DEBUG("lock: cannot open {}: {}", path.string(), std::strerror(errno));
      return;
    }
    int rc{};
    do {
      rc = ::flock(fd_, exclusive ? LOCK_EX : LOCK_SH);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0)
      LOG_DEBUG("lock: flock failed on {}: {}", path.string(), std::strerror(errno));
  }
  file_lock(const file_lock&) = delete;
  file_lock(file_lock&&) = delete;
  file_lock& operator=(const file_lock&) = delete;
  file_lock& operator=(file_lock&&) = delete;
  ~file_lock() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }

 private:
  int fd_{-1};
};

[[noreturn]] void throw_errno(const std::string& what) {
  throw std::system_error{errno, std::generic_category(), what};
}

std::optional<std::string> slurp(const fs::path& path) {
  std::ifstream f{path, std::ios::binary};
  if (!f) return std::nullopt;
  return std::string{
    std::istreambuf_iterator<char>{f}, std::istreambuf_iterator<char>{}};
}

void apply_partial(bridge_state& st, const json::object& partial) {
  if (const auto* v = partial.if_contains("phase")) {
    const auto* s = v->if_string();
    auto p = s ? phase_from_string(*s) : std::nullopt;
    if (!p)
      throw std::invalid_argument{
        "'phase' must be one of planning, implementing, awaiting_review"};
    st.current_phase = *p;
  }
  if (const auto* v = partial.if_contains("paused")) {
    const auto* b = v->if_bool();
    if (!b) throw std::invalid_argument{"'paused' must be a boolean"};
    st.paused = *b;
  }
  if (partial.contains("cycle_count")) {
    auto n = get_int(partial, "cycle_count");
    if (!n || *n < 0)
      throw std::invalid_argument{
        "'cycle_count' must be a non-negative integer"};
    st.cycle_count = *n;
  }
  if (partial.contains("current_task"))
    st.current_task = get_string(partial, "current_task");
  if (partial.contains("error")) st.error = get_string(partial, "error");
}

}  // namespace

/// Free functions

std::string_view to_string(phase p) {
  switch (p) {
    case phase::planning:
      return "planning";
    case phase::implementing:
      return "implementing";
    case phase::awaiting_review:
      return "awaiting_review";
  }
  return "planning";
}

std::optional<phase> phase_from_string(std::string_view s) {
  if (s == "planning") return phase::planning;
  if (s == "implementing") return phase::implementing;
  if (s == "awaiting_review") return phase::awaiting_review;
  return std::nullopt;
}

std::string utc_timestamp() { return format_timestamp(now_usec()); }

const std::string& validate_artifact_name(const std::string& name) {
  static const RE2 valid_re{R"([A-Za-z0-9][A-Za-z0-9._-]*)"};
  if (name.empty())
    throw std::invalid_argument{"Artifact name must be a non-empty string"};
  if (name.find('/') != std::string::npos ||
      name.find('\\') != std::string::npos)
    throw std::invalid_argument{
      "Artifact name must be a filename (no directories)"};
  if (!RE2::FullMatch(name, valid_re))
    throw std::invalid_argument{"Artifact name contains invalid characters"};
  return name;
}

void atomic_write(const fs::path& path, std::string_view content) {
  fs::path dir = path.parent_path();
  if (dir.empty()) dir = ".";
  fs::create_directories(dir);

  std::string tmpl = (dir / (path.filename().string() + ".XXXXXX.tmp")).string();
  int fd = ::mkstemps(tmpl.data(), 4);
  if (fd < 0) throw_errno(fmt::format("mkstemps in {}", dir.string()));

  auto fail = [&](const std::string& what) {
    int saved = errno;
    if (fd >= 0) ::close(fd);
    ::unlink(tmpl.c_str());
    errno = saved;
    throw_errno(what);
  };

  const char* p = content.data();
  std::size_t left = content.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      fail(fmt::format("write {}", tmpl));
    }
    p += n;
    left -= static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) fail(fmt::format("fsync {}", tmpl));
  if (::close(fd) != 0) {
    fd = -1;
    fail(fmt::format("close {}", tmpl));
  }
  fd = -1;
  if (::rename(tmpl.c_str(), path.c_str()) != 0)
    fail(fmt::format("rename {} -> {}", tmpl, path.string()));
}

/// bridge_state / event

bridge_state bridge_state::from_json(const json::object& obj) {
  bridge_state st{};
  if (const auto* v = obj.if_contains("phase"))
    if (const auto* s = v->if_string())
      st.current_phase = phase_from_string(*s).value_or(phase::planning);
  if (const auto* v = obj.if_contains("paused"))
    if (const auto* b = v->if_bool()) st.paused = *b;
  if (const auto* v = obj.if_contains("cycle_count"))
    if (const auto* i = v->if_int64(); i && *i >= 0) st.cycle_count = *i;
  if (const auto* v = obj.if_contains("last_updated"))
    if (const auto* s = v->if_string()) st.last_updated = std::string{*s};
  if (st.last_updated.empty()) st.last_updated = utc_timestamp();
  if (const auto* v = obj.if_contains("current_task"))
    if (const auto* s = v->if_string()) st.current_task = std::string{*s};
  if (const auto* v = obj.if_contains("error"))
    if (const auto* s = v->if_string()) st.error = std::string{*s};
  return st;
}

json::object bridge_state::to_json() const {
  json::object obj;
  obj["phase"] = to_string(current_phase);
  obj["paused"] = paused;
  obj["cycle_count"] = cycle_count;
  obj["last_updated"] = last_updated;
  obj["current_task"] = optional_to_json(current_task);
  obj["error"] = optional_to_json(error);
  return obj;
}

event event::from_json(const json::object& obj) {
  event ev{};
  ev.type = "unknown";
  if (const auto* v = obj.if_contains("type"))
    if (const auto* s = v->if_string()) ev.type = std::string{*s};
  if (const auto* v = obj.if_contains("payload"))
    if (const auto* o = v->if_object()) ev.payload = *o;
  if (const auto* v = obj.if_contains("timestamp"))
    if (const auto* s = v->if_string()) ev.timestamp = std::string{*s};
  if (ev.timestamp.empty()) ev.timestamp = utc_timestamp();
  return ev;
}

json::object event::to_json() const {
  json::object obj;
  obj["type"] = type;
  obj["payload"] = payload;
  obj["timestamp"] = timestamp;
  return obj;
}

/// state_store

state_store::state_store(fs::path state_dir)
    : state_dir_{std::move(state_dir)},
      state_file_{state_dir_ / "state.json"},
      lock_file_{state_dir_ / "state.json.lock"},
      events_file_{state_dir_ / "events.jsonl"},
      artifacts_dir_{state_dir_ / "artifacts"} {
  fs::create_directories(state_dir_);
  fs::create_directories(artifacts_dir_);
}

bridge_state state_store::read_unlocked() const {
  auto text = slurp(state_file_);
  if (!text) return bridge_state::from_json({});

  std::error_code ec;
  auto parsed = json::parse(*text, ec);
  if (ec || !parsed.is_object()) {
    LOG_WARN("state: {} is unreadable, using defaults", state_file_.string());
    return bridge_state::from_json({});
  }
  return bridge_state::from_json(parsed.get_object());
}

bridge_state state_store::get() const {
  file_lock lock{lock_file_, false};
  return read_unlocked();
}

bridge_state state_store::set(const json::object& partial_update) {
  return update([&](const bridge_state&) { return partial_update; });
}

bridge_state state_store::update(
    const std::function<json::object(const bridge_state&)>& fn) {
  file_lock lock{lock_file_, true};
  auto st = read_unlocked();
  auto previous = parse_timestamp(st.last_updated);

  apply_partial(st, fn(st));

  auto stamp = now_usec();
  if (previous && stamp <= *previous)
    stamp = *previous + std::chrono::microseconds{1};
  st.last_updated = format_timestamp(stamp);

  atomic_write(state_file_, pretty_print(st.to_json()) + "\n");
  LOG_DEBUG(
      "state: phase={} paused={} cycle_count={}", to_string(st.current_phase),
      st.paused, st.cycle_count);
  return st;
}

event state_store::append_event(std::string_view type, json::object payload) {
  event ev{std::string{type}, std::move(payload), utc_timestamp()};
  std::string line = json::serialize(ev.to_json()) + "\n";

  int fd = ::open(
      events_file_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) throw_errno(fmt::format("open {}", events_file_.string()));

  // One write(2) per line keeps O_APPEND lines whole.
  ssize_t n{};
  do {
    n = ::write(fd, line.data(), line.size());
  } while (n < 0 && errno == EINTR);
  int saved = errno;
  ::close(fd);
  if (n < 0) {
    errno = saved;
    throw_errno(fmt::format("append {}", events_file_.string()));
  }
  if (static_cast<std::size_t>(n) != line.size())
    utils::throwf("short append to {}", events_file_.string());

  LOG_DEBUG("event: {}", ev.type);
  return ev;
}

std::vector<event> state_store::get_events(std::size_t limit) const {
  std::vector<event> events;
  std::ifstream f{events_file_};
  if (!f) return events;

  for (std::string line; std::getline(f, line);) {
    auto text = utils::trim(line);
    if (text.empty()) continue;
    std::error_code ec;
    auto parsed = json::parse(text, ec);
    if (ec || !parsed.is_object()) continue;
    events.push_back(event::from_json(parsed.get_object()));
  }
  if (events.size() > limit)
    events.erase(events.begin(), events.end() - static_cast<long>(limit));
  return events;
}

void state_store::write_artifact(
    const std::string& name, std::string_view content) {
  write_artifact_to(artifacts_dir_, name, content);
}

std::optional<std::string> state_store::read_artifact(
    const std::string& name) const {
  return read_artifact_from(artifacts_dir_, name);
}

void state_store::write_artifact_to(
    const fs::path& dir, const std::string& name, std::string_view content) {
  atomic_write(dir / validate_artifact_name(name), content);
}

std::optional<std::string> state_store::read_artifact_from(
    const fs::path& dir, const std::string& name) {
  return slurp(dir / validate_artifact_name(name));
}

}  // namespace cbridge
