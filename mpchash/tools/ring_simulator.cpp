/* Copyright (C) 2018-present, Facebook, Inc.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; version 2 of the License.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with this program; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <folly/container/F14Map.h>

#include "mpchash/lib/HashRing.h"
#include "mpchash/tools/RingSimulatorUtils.h"

DEFINE_int64(nodes, 100, "number of nodes on the ring");
DEFINE_int64(keys, 1000000, "number of keys to route");
DEFINE_int64(probes, 23, "number of probes per key");
DEFINE_int64(replicas, 1, "number of replicas to report for the first key");
DEFINE_int64(remove, -1, "node to remove (default: the last one)");
DEFINE_string(hash, "murmur3", "hash function to use: murmur3 or spooky");

namespace {

std::string nodeName(int64_t i) {
  return fmt::format("node-{}", i);
}

folly::F14FastMap<std::string, uint64_t> routeKeys(
    const mpchash::HashRing<std::string>& ring,
    std::vector<std::string>& owners) {
  folly::F14FastMap<std::string, uint64_t> load;
  for (int64_t key = 0; key < FLAGS_keys; key++) {
    auto owner = ring.primaryNode(static_cast<uint64_t>(key));
    if (!owner) {
      owners[key].clear();
      continue;
    }
    load[*owner]++;
    owners[key] = *owner;
  }
  return load;
}

} // namespace

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  try {
    mpchash::RingSimulatorUtils::validateOptions(mpchash::SimulatorOptions{
        FLAGS_nodes, FLAGS_keys, FLAGS_probes, FLAGS_replicas});
  } catch (const std::invalid_argument& e) {
    LOG(ERROR) << e.what();
    return 1;
  }

  mpchash::RingConfig config;
  config.probeCount = FLAGS_probes;
  try {
    config.hashFunction = mpchash::hashFunctionFromString(FLAGS_hash);
  } catch (const std::invalid_argument& e) {
    LOG(ERROR) << e.what();
    return 1;
  }

  mpchash::HashRing<std::string> ring(config);
  for (int64_t i = 0; i < FLAGS_nodes; i++) {
    ring.add(nodeName(i));
  }
  LOG(INFO) << "ring has " << ring.size() << " tokens for " << FLAGS_nodes
            << " nodes";

  std::vector<std::string> before(FLAGS_keys);
  auto load = routeKeys(ring, before);

  std::vector<uint64_t> freq;
  freq.reserve(FLAGS_nodes);
  for (int64_t i = 0; i < FLAGS_nodes; i++) {
    auto it = load.find(nodeName(i));
    freq.push_back(it == load.end() ? 0 : it->second);
  }
  std::sort(freq.begin(), freq.end());

  std::cout << "min load is " << freq[0] << " max load is "
            << freq[freq.size() - 1] << std::endl;
  std::cout << "p95 load: " << freq[(freq.size() / 20) * 19]
            << "\np75 load: " << freq[(freq.size() / 20) * 15]
            << "\np50 load: " << freq[freq.size() / 2]
            << "\np25 load: " << freq[freq.size() / 4]
            << "\np5 load: " << freq[freq.size() / 20] << std::endl;

  auto replicas = ring.replicas(uint64_t{0}, FLAGS_replicas);
  std::cout << "replicas of key 0:";
  for (const auto& replica : replicas) {
    std::cout << " " << replica;
  }
  std::cout << std::endl;

  int64_t removed = FLAGS_remove;
  if (removed < 0 || removed >= FLAGS_nodes) {
    removed = FLAGS_nodes - 1;
  }
  const auto removedNode = nodeName(removed);
  auto ranges = ring.intervals(removedNode);
  if (ranges) {
    for (const auto& range : *ranges) {
      std::cout << removedNode << " hands over " << range << " ("
                << range.size() << " positions)" << std::endl;
    }
  }
  ring.remove(removedNode);

  std::vector<std::string> after(FLAGS_keys);
  routeKeys(ring, after);

  double movedFromRemoved = 0;
  double movedOther = 0;
  for (int64_t key = 0; key < FLAGS_keys; key++) {
    if (before[key] == after[key]) {
      continue;
    }
    if (before[key] == removedNode) {
      movedFromRemoved++;
    } else {
      movedOther++;
    }
  }

  std::cout << "moved keys of removed node: " << movedFromRemoved
            << "; moved keys of other nodes: " << movedOther
            << " this is: " << movedOther / FLAGS_keys * 100 << "%\n";
  return 0;
}
