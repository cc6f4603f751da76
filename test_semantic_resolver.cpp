// test_semantic_resolver.cpp
#include "semantic_resolver.hpp"
#include "thought_crdt.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>

using namespace thought_crdt;
using json = nlohmann::json;

// Test helper macros
#define TEST(name) void test_##name()
#define RUN_TEST(name)                                                                                                 \
  do {                                                                                                                 \
    std::cout << "Running test: " << #name << "...";                                                                   \
    test_##name();                                                                                                     \
    std::cout << " PASSED" << std::endl;                                                                               \
  } while (0)

#define ASSERT_EQ(a, b)                                                                                                \
  do {                                                                                                                 \
    if ((a) != (b)) {                                                                                                  \
      std::cerr << "Assertion failed: " << #a << " == " << #b << " (got " << (a) << " and " << (b) << ")"            \
                << std::endl;                                                                                          \
      std::exit(1);                                                                                                    \
    }                                                                                                                  \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                              \
  do {                                                                                                                 \
    if (!(cond)) {                                                                                                     \
      std::cerr << "Assertion failed: " << #cond << std::endl;                                                         \
      std::exit(1);                                                                                                    \
    }                                                                                                                  \
  } while (0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

StoredVersion version_of(const std::string &topic, json payload, uint64_t ts, const std::string &writer,
                         uint64_t write_time, VectorClock::Entries clock, bool tombstone = false) {
  Thought thought;
  thought.cid = "t";
  thought.topic = topic;
  thought.payload = std::move(payload);
  thought.ts = ts;
  thought.origin = writer;
  return StoredVersion(std::move(thought), write_time, writer, VectorClock(std::move(clock)), tombstone);
}

TEST(canonical_order) {
  StoredVersion early = version_of("metric", json::object(), 100, "n2", 5, {{"n2", 1}});
  StoredVersion late = version_of("metric", json::object(), 200, "n1", 1, {{"n1", 1}});
  ASSERT_TRUE(is_older(early, late));
  ASSERT_FALSE(is_older(late, early));

  // equal producer timestamps fall back to the serialized thought
  StoredVersion high = version_of("metric", {{"H", 0.9}}, 100, "n1", 1, {{"n1", 1}});
  StoredVersion low = version_of("metric", {{"H", 0.1}}, 100, "n1", 9, {{"n2", 1}});
  ASSERT_TRUE(is_older(low, high));
  ASSERT_FALSE(is_older(high, low));

  // the writer node never decides: the same version resolved on two nodes sorts the same
  StoredVersion resolved_on_a = version_of("metric", {{"H", 0.5}}, 100, "a", 7, {{"n1", 1}, {"n3", 1}});
  StoredVersion resolved_on_z = version_of("metric", {{"H", 0.5}}, 100, "z", 7, {{"n1", 1}, {"n3", 1}});
  resolved_on_z.value.origin = resolved_on_a.value.origin;
  StoredVersion other = version_of("metric", {{"H", 0.7}}, 100, "m", 3, {{"n2", 1}});
  ASSERT_EQ(is_older(resolved_on_a, other), is_older(resolved_on_z, other));
  ASSERT_EQ(is_older(other, resolved_on_a), is_older(other, resolved_on_z));
  ASSERT_FALSE(is_older(resolved_on_a, resolved_on_z));
  ASSERT_FALSE(is_older(resolved_on_z, resolved_on_a));

  // then the clock entries, then the write time
  StoredVersion small_clock = version_of("metric", {{"H", 0.5}}, 100, "n1", 9, {{"n1", 1}});
  StoredVersion large_clock = version_of("metric", {{"H", 0.5}}, 100, "n1", 1, {{"n1", 2}});
  ASSERT_TRUE(is_older(small_clock, large_clock));
  StoredVersion later = version_of("metric", {{"H", 0.5}}, 100, "n1", 10, {{"n1", 1}});
  ASSERT_TRUE(is_older(small_clock, later));
}

TEST(resolution_ignores_resolving_node) {
  StoredVersion x1 = version_of("event", {{"type", "a"}}, 100, "n1", 10, {{"n1", 1}});
  StoredVersion x2 = version_of("event", {{"type", "b"}}, 100, "n2", 20, {{"n2", 1}});
  StoredVersion x3 = version_of("event", {{"type", "c"}}, 100, "n3", 30, {{"n3", 1}});

  // n1 and n3 both resolve x1 against x3, then each meets x2
  StoredVersion on_n1 = SemanticResolver()(x1, x3, "n1").version;
  StoredVersion on_n3 = SemanticResolver()(x3, x1, "n3").version;
  ASSERT_EQ(on_n1.value, on_n3.value);

  StoredVersion final_n1 = SemanticResolver()(on_n1, x2, "n1").version;
  StoredVersion final_n3 = SemanticResolver()(on_n3, x2, "n3").version;
  ASSERT_EQ(final_n1.value, final_n3.value);
  ASSERT_EQ(final_n1.clock, final_n3.clock);
  ASSERT_EQ(final_n1.write_time, final_n3.write_time);
}

TEST(metric_payloads) {
  json older = {{"H", 0.4}, {"tau", 0.2}, {"nodes", 3}, {"label", "calm"}, {"only_old", 1}};
  json newer = {{"H", 0.6}, {"tau", "n/a"}, {"nodes", 4}, {"label", "storm"}, {"only_new", true}};

  json merged = merge_payloads(older, newer, Topic::Metric);
  ASSERT_TRUE(std::fabs(merged["H"].get<double>() - 0.5) < 1e-9);
  ASSERT_EQ(merged["nodes"].get<double>(), 3.5);
  ASSERT_EQ(merged["tau"], "n/a"); // not numeric on both sides
  ASSERT_EQ(merged["label"], "storm");
  ASSERT_EQ(merged["only_old"], 1);
  ASSERT_EQ(merged["only_new"], true);
}

TEST(event_payloads) {
  json older = {{"type", "lion_gate"}, {"impact", 0.2}};
  json newer = {{"type", "portal"}, {"data", {{"x", 1}}}};

  json merged = merge_payloads(older, newer, Topic::Event);
  ASSERT_EQ(merged["type"], "portal");
  ASSERT_EQ(merged["impact"], 0.2);
  ASSERT_EQ(merged["data"]["x"], 1);
  ASSERT_EQ(merged["merged"], true);
  ASSERT_EQ(merged["sources"], json::array({older, newer}));
}

TEST(dream_payloads) {
  json older = {{"vision", "river"}, {"content", "a long dream"}, {"lucidity", 0.1}};
  json newer = {{"vision", "sea"}, {"symbols", {"wave"}}};

  json merged = merge_payloads(older, newer, Topic::Dream);
  ASSERT_EQ(merged["vision"], "river | sea");
  ASSERT_EQ(merged["content"], "a long dream");
  ASSERT_EQ(merged["lucidity"], 0.1);
  ASSERT_EQ(merged["symbols"], json::array({"wave"}));
  ASSERT_FALSE(merged.contains("merged"));
  ASSERT_FALSE(merged.contains("sources"));
}

TEST(newest_wins_fallbacks) {
  json older = {{"goal", "rest"}, {"extra", 1}};
  json newer = {{"goal", "wander"}};
  ASSERT_EQ(merge_payloads(older, newer, Topic::Other), newer);

  // non-object payloads cannot be merged field by field
  ASSERT_EQ(merge_payloads(json(0.3), json{{"H", 0.5}}, Topic::Metric), (json{{"H", 0.5}}));
  ASSERT_EQ(merge_payloads(json{{"H", 0.5}}, json("text"), Topic::Event), json("text"));
}

TEST(mismatched_topics) {
  StoredVersion ours = version_of("metric", {{"H", 0.2}}, 100, "n1", 1, {{"n1", 1}});
  StoredVersion theirs = version_of("event", {{"H", 0.8}}, 200, "n2", 1, {{"n2", 1}});

  Resolution resolution = SemanticResolver()(ours, theirs, "n1");
  ASSERT_EQ(resolution.version.value.topic, "event");
  ASSERT_EQ(resolution.version.value.payload, (json{{"H", 0.8}}));
}

TEST(links_union) {
  CrdtVector<ThoughtCid> links = merge_links({"c", "a", "b"}, {"b", "d", "a"});
  ASSERT_TRUE(links == (CrdtVector<ThoughtCid>{"a", "b", "c", "d"}));
  ASSERT_TRUE(merge_links({}, {}).empty());
}

TEST(resolution_metadata) {
  StoredVersion ours = version_of("metric", {{"H", 0.2}}, 100, "n1", 700, {{"n1", 3}, {"n2", 1}});
  StoredVersion theirs = version_of("metric", {{"H", 0.4}}, 100, "n2", 900, {{"n1", 1}, {"n2", 4}, {"n3", 2}});

  Resolution resolution = SemanticResolver()(ours, theirs, "n1");
  ASSERT_EQ(resolution.strategy, kSemanticMergeStrategy);
  ASSERT_EQ(resolution.version.writer_node, "n1");
  ASSERT_EQ(resolution.version.write_time, 900u);
  ASSERT_EQ(resolution.version.clock, VectorClock(VectorClock::Entries{{"n1", 3}, {"n2", 4}, {"n3", 2}}));
  ASSERT_FALSE(resolution.version.tombstone);
}

TEST(resolution_is_symmetric) {
  StoredVersion a = version_of("event", {{"type", "a"}, {"impact", 0.5}}, 300, "n1", 10, {{"n1", 1}});
  StoredVersion b = version_of("event", {{"type", "b"}}, 300, "n2", 20, {{"n2", 1}});

  Resolution from_a = SemanticResolver()(a, b, "r");
  Resolution from_b = SemanticResolver()(b, a, "r");
  ASSERT_EQ(from_a.version, from_b.version);
  ASSERT_EQ(json(from_a.version.value).dump(), json(from_b.version.value).dump());
}

TEST(tombstone_precedence) {
  StoredVersion live = version_of("event", {{"type", "a"}}, 100, "n1", 500, {{"n1", 2}});
  StoredVersion dead = version_of("event", {{"type", "a"}}, 100, "n2", 400, {{"n2", 2}}, true);

  Resolution resolution = SemanticResolver()(live, dead, "n1");
  ASSERT_EQ(resolution.strategy, kTombstoneStrategy);
  ASSERT_FALSE(resolution.version.tombstone);
  ASSERT_EQ(resolution.version.write_time, 500u);

  // equal write times go to the tombstone, whichever side resolves
  StoredVersion tied = version_of("event", {{"type", "a"}}, 100, "n2", 500, {{"n2", 2}}, true);
  ASSERT_TRUE(SemanticResolver()(live, tied, "n1").version.tombstone);
  ASSERT_TRUE(SemanticResolver()(tied, live, "n2").version.tombstone);
}

// Keeps the local payload but still produces a version that dominates both inputs
struct KeepOursResolver {
  Resolution operator()(const StoredVersion &ours, const StoredVersion &theirs, const ThoughtNodeId &node) const {
    return Resolution{StoredVersion(ours.value, std::max(ours.write_time, theirs.write_time), node,
                                    VectorClock::merged(ours.clock, theirs.clock), ours.tombstone),
                      "keep-ours"};
  }
};

TEST(custom_resolver) {
  BasicThoughtCRDT<KeepOursResolver> n1("n1");
  BasicThoughtCRDT<KeepOursResolver> n2("n2");

  Thought thought;
  thought.cid = "t";
  thought.topic = "metric";
  thought.payload = {{"H", 0.1}};
  n1.add(thought);
  thought.payload = {{"H", 0.9}};
  n2.add(thought);

  MergeReport report = n1.merge(n2);
  ASSERT_EQ(report.conflicts.size(), 1u);
  ASSERT_EQ(report.conflicts[0].strategy, "keep-ours");
  ASSERT_EQ(n1.get_thought("t")->thought.payload["H"].get<double>(), 0.1);
}

int main() {
  std::cout << "Running semantic resolver tests..." << std::endl << std::endl;

  RUN_TEST(canonical_order);
  RUN_TEST(metric_payloads);
  RUN_TEST(event_payloads);
  RUN_TEST(dream_payloads);
  RUN_TEST(newest_wins_fallbacks);
  RUN_TEST(mismatched_topics);
  RUN_TEST(links_union);
  RUN_TEST(resolution_metadata);
  RUN_TEST(resolution_is_symmetric);
  RUN_TEST(resolution_ignores_resolving_node);
  RUN_TEST(tombstone_precedence);
  RUN_TEST(custom_resolver);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
