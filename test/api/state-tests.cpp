#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <fstream>
#include <system_error>
#include <thread>
#include <vector>

#include "cbridge/state.hpp"
#include "scratch.hpp"

namespace json = boost::json;
using cbridge::state_store;

TEST_CASE("state-defaults-without-record") {
  scratch_dir tmp;
  state_store store{tmp.path / "state"};

  auto st = store.get();
  CHECK(st.current_phase == cbridge::phase::planning);
  CHECK_FALSE(st.paused);
  CHECK(st.cycle_count == 0);
  CHECK_FALSE(st.current_task.has_value());
  CHECK_FALSE(st.error.has_value());
  CHECK(fs::is_directory(tmp.path / "state" / "artifacts"));
}

TEST_CASE("state-set-then-get") {
  scratch_dir tmp;
  state_store store{tmp.path};

  json::object update;
  update["phase"] = "implementing";
  update["cycle_count"] = 3;
  update["current_task"] = "wire it up";
  update["bogus"] = "ignored";
  auto written = store.set(update);

  auto st = store.get();
  CHECK(st.current_phase == cbridge::phase::implementing);
  CHECK(st.cycle_count == 3);
  REQUIRE(st.current_task.has_value());
  CHECK(*st.current_task == "wire it up");
  CHECK(st.last_updated == written.last_updated);

  auto on_disk = json::parse(slurp(tmp.path / "state.json")).as_object();
  CHECK_FALSE(on_disk.contains("bogus"));
  CHECK(on_disk.at("phase").as_string() == "implementing");

  json::object clear;
  clear["current_task"] = nullptr;
  CHECK_FALSE(store.set(clear).current_task.has_value());
  CHECK(store.get().cycle_count == 3);
}

TEST_CASE("state-timestamps-strictly-increase") {
  scratch_dir tmp;
  state_store store{tmp.path};
  std::string previous;
  for (int i = 0; i < 20; ++i) {
    json::object update;
    update["cycle_count"] = i;
    auto st = store.set(update);
    CHECK(st.last_updated > previous);
    previous = st.last_updated;
  }
}

TEST_CASE("state-rejects-bad-partial-update") {
  scratch_dir tmp;
  state_store store{tmp.path};

  json::object bad_phase;
  bad_phase["phase"] = "sleeping";
  CHECK_THROWS_AS(store.set(bad_phase), std::invalid_argument);

  json::object negative;
  negative["cycle_count"] = -1;
  CHECK_THROWS_AS(store.set(negative), std::invalid_argument);

  json::object huge;
  huge["cycle_count"] = 1e300;
  CHECK_THROWS_AS(store.set(huge), std::invalid_argument);
  json::object not_a_number;
  not_a_number["cycle_count"] = std::nan("");
  CHECK_THROWS_AS(store.set(not_a_number), std::invalid_argument);
  json::object too_big;
  too_big["cycle_count"] = std::uint64_t{1} << 63;
  CHECK_THROWS_AS(store.set(too_big), std::invalid_argument);

  json::object not_bool;
  not_bool["paused"] = "yes";
  CHECK_THROWS_AS(store.set(not_bool), std::invalid_argument);

  CHECK_FALSE(fs::exists(tmp.path / "state.json"));
}

TEST_CASE("state-accepts-integral-doubles") {
  scratch_dir tmp;
  state_store store{tmp.path};
  json::object partial;
  partial["cycle_count"] = 3.0;
  CHECK(store.set(partial).cycle_count == 3);
}

TEST_CASE("state-update-increments-are-not-lost") {
  scratch_dir tmp;
  state_store store{tmp.path};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&store] {
      for (int i = 0; i < 25; ++i) {
        store.update([](const cbridge::bridge_state& current) {
          json::object next;
          next["cycle_count"] = current.cycle_count + 1;
          return next;
        });
      }
    });
  }
  for (auto& t : threads) t.join();
  CHECK(store.get().cycle_count == 100);
}

TEST_CASE("state-corrupt-record-reads-as-defaults") {
  scratch_dir tmp;
  state_store store{tmp.path};
  spit(tmp.path / "state.json", "{\"phase\": \"implementing\", ");
  CHECK(store.get().current_phase == cbridge::phase::planning);

  spit(tmp.path / "state.json", R"({"phase": 42, "paused": true})");
  auto st = store.get();
  CHECK(st.current_phase == cbridge::phase::planning);
  CHECK(st.paused);
}

TEST_CASE("events-keep-append-order-and-skip-garbage") {
  scratch_dir tmp;
  state_store store{tmp.path};

  json::object payload;
  payload["n"] = 1;
  store.append_event("first", payload);
  {
    std::ofstream f{tmp.path / "events.jsonl", std::ios::app};
    f << "this is not json\n";
  }
  store.append_event("second");
  store.append_event("third");

  auto all = store.get_events(100);
  REQUIRE(all.size() == 3);
  CHECK(all[0].type == "first");
  CHECK(all[0].payload.at("n").as_int64() == 1);
  CHECK(all[1].type == "second");
  CHECK(all[2].type == "third");

  auto last_two = store.get_events(2);
  REQUIRE(last_two.size() == 2);
  CHECK(last_two[0].type == "second");
  CHECK(last_two[1].type == "third");

  CHECK(store.get_events(0).empty());
}

TEST_CASE("artifact-names-are-validated") {
  using cbridge::validate_artifact_name;
  CHECK(validate_artifact_name("plan.md") == "plan.md");
  CHECK(validate_artifact_name("a_b-c.1") == "a_b-c.1");
  CHECK_THROWS_AS(validate_artifact_name(""), std::invalid_argument);
  CHECK_THROWS_AS(validate_artifact_name("../x"), std::invalid_argument);
  CHECK_THROWS_AS(validate_artifact_name("a/b"), std::invalid_argument);
  CHECK_THROWS_AS(validate_artifact_name("a\\b"), std::invalid_argument);
  CHECK_THROWS_AS(validate_artifact_name(".hidden"), std::invalid_argument);
  CHECK_THROWS_AS(validate_artifact_name("sp ace.md"), std::invalid_argument);

  scratch_dir tmp;
  state_store store{tmp.path};
  CHECK_THROWS_AS(store.write_artifact("../escape.md", "x"), std::invalid_argument);
  CHECK_FALSE(fs::exists(tmp.path / "escape.md"));
}

TEST_CASE("artifacts-round-trip-byte-exact") {
  scratch_dir tmp;
  state_store store{tmp.path};

  CHECK_FALSE(store.read_artifact("plan.md").has_value());

  store.write_artifact("empty.md", "");
  REQUIRE(store.read_artifact("empty.md").has_value());
  CHECK(store.read_artifact("empty.md")->empty());

  std::string big;
  big.reserve(3u << 20);
  for (std::size_t i = 0; big.size() < (3u << 20); ++i)
    big += static_cast<char>(i * 31 % 256);
  store.write_artifact("big.bin", big);
  CHECK(*store.read_artifact("big.bin") == big);

  store.write_artifact("plan.md", "one");
  store.write_artifact("plan.md", "two");
  CHECK(*store.read_artifact("plan.md") == "two");

  // No temp files left behind
  int entries = 0;
  for ([[maybe_unused]] const auto& e :
       fs::directory_iterator{tmp.path / "artifacts"})
    ++entries;
  CHECK(entries == 3);
}

TEST_CASE("artifacts-in-caller-chosen-dir") {
  scratch_dir tmp;
  auto dir = tmp.path / "elsewhere";
  state_store::write_artifact_to(dir, "spec.md", "# Spec\n");
  CHECK(slurp(dir / "spec.md") == "# Spec\n");
  CHECK(*state_store::read_artifact_from(dir, "spec.md") == "# Spec\n");
}

TEST_CASE("atomic-write-failure-throws-system-error") {
  scratch_dir tmp;
  spit(tmp.path / "plain-file", "x");
  CHECK_THROWS_AS(
      cbridge::atomic_write(tmp.path / "plain-file" / "x.md", "x"),
      std::system_error);
}
