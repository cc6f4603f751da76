// Example: two nodes writing the same thought concurrently and merging
#include "thought_crdt.hpp"

#include <iostream>

using namespace thought_crdt;
using json = nlohmann::json;

void print_report(const std::string &title, const MergeReport &report) {
  std::cout << title << std::endl;
  std::cout << "  Added: " << report.added.size() << " thoughts" << std::endl;
  std::cout << "  Updated: " << report.updated.size() << " thoughts" << std::endl;
  std::cout << "  Conflicts: " << report.conflicts.size() << std::endl;
  for (const auto &conflict : report.conflicts) {
    std::cout << "    " << conflict.cid << " (" << conflict.strategy << ")" << std::endl;
    std::cout << "      ours:     " << conflict.our_version.value.payload.dump() << std::endl;
    std::cout << "      theirs:   " << conflict.their_version.value.payload.dump() << std::endl;
    std::cout << "      resolved: " << conflict.resolution.value.payload.dump() << std::endl;
  }
}

int main() {
  ThoughtCRDT node1("node-001");
  ThoughtCRDT node2("node-002");

  // Thoughts arrive in the schema format used by the mesh
  node1.add(json::parse(R"({"cid": "thought-harmony", "ts": 1000, "topic": "metric",
                            "payload": {"H": 0.8, "tau": 0.2}, "sig": "sig1", "origin": "node-001"})")
                .get<Thought>());
  node2.add(json::parse(R"({"cid": "thought-dream", "ts": 1100, "topic": "dream",
                            "payload": {"vision": "Distributed consciousness"}, "origin": "node-002"})")
                .get<Thought>());

  // Both nodes write the same cid without seeing each other
  Thought shared = json::parse(R"({"cid": "thought-shared", "ts": 1200, "topic": "metric",
                                   "links": ["thought-harmony"], "origin": "both"})")
                       .get<Thought>();
  shared.payload = {{"H", 0.95}, {"tau", 0.05}, {"node", "1"}};
  node1.add(shared);
  shared.payload = {{"H", 0.85}, {"tau", 0.15}, {"node", "2"}};
  node2.add(shared);

  ReplicaState state1 = node1.get_state();
  ReplicaState state2 = node2.get_state();
  print_report("Merging node-002 into node-001", node1.merge(state2));
  print_report("Merging node-001 into node-002", node2.merge(state1));

  std::cout << std::endl << "Thoughts on node-001:" << std::endl;
  for (const auto &decorated : node1.get_thoughts()) {
    std::cout << "  " << decorated.thought.cid << " [" << decorated.thought.topic << "] "
              << decorated.thought.payload.dump() << " version " << decorated.version << " by "
              << decorated.modified_by << std::endl;
  }

  bool converged = node1.get_thought("thought-shared")->thought == node2.get_thought("thought-shared")->thought;
  std::cout << std::endl << "Replicas converged: " << (converged ? "yes" : "no") << std::endl;

  node1.print_state();
  return converged ? 0 : 1;
}
