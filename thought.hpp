// thought.hpp
#ifndef THOUGHT_HPP
#define THOUGHT_HPP

#include "thought_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace thought_crdt {

/// Resolution policy family of a thought, derived from its topic string.
enum class Topic { Metric, Event, Dream, Other };

Topic topic_from_string(const std::string &topic);
const char *to_string(Topic topic);

inline std::ostream &operator<<(std::ostream &os, Topic topic) { return os << to_string(topic); }

/// A content-addressed record exchanged between nodes.
struct Thought {
  ThoughtCid cid;
  uint64_t ts = 0; // producer timestamp, ms since epoch; never used for causality
  std::string topic;
  nlohmann::json payload;
  CrdtVector<ThoughtCid> links; // causal predecessors
  ThoughtNodeId origin;
  std::optional<std::string> sig; // carried, not verified

  // mesh metadata
  std::optional<uint64_t> ttl;
  std::optional<uint32_t> hops;
  CrdtVector<std::string> channels;

  Topic topic_kind() const { return topic_from_string(topic); }
};

bool operator==(const Thought &lhs, const Thought &rhs);
inline bool operator!=(const Thought &lhs, const Thought &rhs) { return !(lhs == rhs); }

/// nlohmann::json conversions using the thought schema field names.
/// `from_json` throws ThoughtCRDTException when `cid` is missing or not a string.
void to_json(nlohmann::json &j, const Thought &thought);
void from_json(const nlohmann::json &j, Thought &thought);

std::ostream &operator<<(std::ostream &os, const Thought &thought);

} // namespace thought_crdt

#endif // THOUGHT_HPP
