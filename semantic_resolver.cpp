// semantic_resolver.cpp
#include "semantic_resolver.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace thought_crdt {

namespace {

// Free-text dream fields that are concatenated instead of overwritten
const std::array<const char *, 2> kDreamTextFields = {"vision", "content"};

const StoredVersion &tombstone_winner(const StoredVersion &older, const StoredVersion &newer) {
  if (older.write_time != newer.write_time) {
    return older.write_time > newer.write_time ? older : newer;
  }
  if (older.tombstone != newer.tombstone) {
    return older.tombstone ? older : newer;
  }
  return newer;
}

void join_text_field(nlohmann::json &merged, const nlohmann::json &older, const nlohmann::json &newer,
                     const char *field) {
  std::string joined;
  for (const auto *side : {&older, &newer}) {
    auto it = side->find(field);
    if (it == side->end() || !it->is_string())
      continue;
    const auto &text = it->get_ref<const std::string &>();
    if (text.empty())
      continue;
    if (!joined.empty())
      joined += kDreamTextSeparator;
    joined += text;
  }
  if (!joined.empty()) {
    merged[field] = joined;
  }
}

} // namespace

// Only inputs that every replica holding the version agrees on take part. The writer of a
// resolved version is whichever node resolved it, so it is left out.
bool is_older(const StoredVersion &a, const StoredVersion &b) {
  if (a.value.ts != b.value.ts)
    return a.value.ts < b.value.ts;
  const std::string a_dump = nlohmann::json(a.value).dump();
  const std::string b_dump = nlohmann::json(b.value).dump();
  if (a_dump != b_dump)
    return a_dump < b_dump;
  if (a.clock.entries() != b.clock.entries())
    return a.clock.entries() < b.clock.entries();
  return a.write_time < b.write_time;
}

CrdtVector<ThoughtCid> merge_links(const CrdtVector<ThoughtCid> &a, const CrdtVector<ThoughtCid> &b) {
  CrdtVector<ThoughtCid> links;
  links.reserve(a.size() + b.size());
  links.insert(links.end(), a.begin(), a.end());
  links.insert(links.end(), b.begin(), b.end());
  std::sort(links.begin(), links.end());
  links.erase(std::unique(links.begin(), links.end()), links.end());
  return links;
}

nlohmann::json merge_payloads(const nlohmann::json &older, const nlohmann::json &newer, Topic topic) {
  if (topic == Topic::Other || !older.is_object() || !newer.is_object()) {
    return newer;
  }

  nlohmann::json merged = older;
  merged.update(newer);

  switch (topic) {
  case Topic::Metric:
    for (auto it = older.begin(); it != older.end(); ++it) {
      auto other = newer.find(it.key());
      if (it->is_number() && other != newer.end() && other->is_number()) {
        merged[it.key()] = (it->get<double>() + other->get<double>()) / 2.0;
      }
    }
    break;
  case Topic::Event:
    merged["merged"] = true;
    merged["sources"] = nlohmann::json::array({older, newer});
    break;
  case Topic::Dream:
    for (const char *field : kDreamTextFields) {
      join_text_field(merged, older, newer, field);
    }
    break;
  case Topic::Other:
    break;
  }
  return merged;
}

Thought merge_thoughts(const Thought &older, const Thought &newer) {
  // Both sides must agree on the policy; a topic change falls back to newest-wins
  Topic topic = older.topic_kind() == newer.topic_kind() ? newer.topic_kind() : Topic::Other;

  Thought merged = newer;
  merged.links = merge_links(older.links, newer.links);
  merged.payload = merge_payloads(older.payload, newer.payload, topic);
  return merged;
}

Resolution SemanticResolver::operator()(const StoredVersion &ours, const StoredVersion &theirs,
                                        const ThoughtNodeId &resolver_node) const {
  const bool ours_is_older = is_older(ours, theirs);
  const StoredVersion &older = ours_is_older ? ours : theirs;
  const StoredVersion &newer = ours_is_older ? theirs : ours;

  VectorClock clock = VectorClock::merged(ours.clock, theirs.clock);
  uint64_t write_time = std::max(ours.write_time, theirs.write_time);

  if (ours.tombstone || theirs.tombstone) {
    const StoredVersion &winner = tombstone_winner(older, newer);
    return Resolution{StoredVersion(winner.value, write_time, resolver_node, std::move(clock), winner.tombstone),
                      kTombstoneStrategy};
  }

  return Resolution{
      StoredVersion(merge_thoughts(older.value, newer.value), write_time, resolver_node, std::move(clock), false),
      kSemanticMergeStrategy};
}

} // namespace thought_crdt
