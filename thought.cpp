// thought.cpp
#include "thought.hpp"

namespace thought_crdt {

Topic topic_from_string(const std::string &topic) {
  if (topic == "metric")
    return Topic::Metric;
  if (topic == "event")
    return Topic::Event;
  if (topic == "dream")
    return Topic::Dream;
  return Topic::Other;
}

const char *to_string(Topic topic) {
  switch (topic) {
  case Topic::Metric:
    return "metric";
  case Topic::Event:
    return "event";
  case Topic::Dream:
    return "dream";
  case Topic::Other:
    return "other";
  }
  return "other";
}

bool operator==(const Thought &lhs, const Thought &rhs) {
  return lhs.cid == rhs.cid && lhs.ts == rhs.ts && lhs.topic == rhs.topic && lhs.payload == rhs.payload &&
         lhs.links == rhs.links && lhs.origin == rhs.origin && lhs.sig == rhs.sig && lhs.ttl == rhs.ttl &&
         lhs.hops == rhs.hops && lhs.channels == rhs.channels;
}

void to_json(nlohmann::json &j, const Thought &thought) {
  j = nlohmann::json{{"cid", thought.cid},       {"ts", thought.ts},     {"topic", thought.topic},
                     {"payload", thought.payload}, {"links", thought.links}, {"origin", thought.origin}};
  if (thought.sig)
    j["sig"] = *thought.sig;
  if (thought.ttl)
    j["ttl"] = *thought.ttl;
  if (thought.hops)
    j["hops"] = *thought.hops;
  if (!thought.channels.empty())
    j["channels"] = thought.channels;
}

void from_json(const nlohmann::json &j, Thought &thought) {
  if (!j.is_object()) {
    throw ThoughtCRDTException("Thought must be a JSON object");
  }
  auto cid = j.find("cid");
  if (cid == j.end() || !cid->is_string() || cid->get<std::string>().empty()) {
    throw ThoughtCRDTException("Thought is missing a cid");
  }

  Thought result;
  result.cid = cid->get<std::string>();
  result.ts = j.value("ts", uint64_t{0});
  result.topic = j.value("topic", std::string());
  if (auto payload = j.find("payload"); payload != j.end())
    result.payload = *payload;
  result.links = j.value("links", CrdtVector<ThoughtCid>());
  result.origin = j.value("origin", ThoughtNodeId());

  if (j.contains("sig") && !j["sig"].is_null())
    result.sig = j["sig"].get<std::string>();
  if (j.contains("ttl") && !j["ttl"].is_null())
    result.ttl = j["ttl"].get<uint64_t>();
  if (j.contains("hops") && !j["hops"].is_null())
    result.hops = j["hops"].get<uint32_t>();
  result.channels = j.value("channels", CrdtVector<std::string>());

  thought = std::move(result);
}

std::ostream &operator<<(std::ostream &os, const Thought &thought) { return os << nlohmann::json(thought).dump(); }

} // namespace thought_crdt
