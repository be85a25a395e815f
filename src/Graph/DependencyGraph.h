/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file DependencyGraph.h
 * @brief Index-based dependency graph with cycle reporting and tiering
 *
 * Nodes are dense indices 0..N-1 (a workflow's step positions). An edge
 * from -> to means "to depends on from". Unlike an acyclic graph that refuses
 * cycle-forming edges, this graph accepts any edge so a validator can load a
 * whole definition and then report every problem, including the exact cycle.
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace MaestroEngine {
namespace Core {
namespace Graph {

    /// Incoming edges are a node's dependencies, outgoing edges its dependents
    struct EdgeList {
        std::vector<uint32_t> incoming;
        std::vector<uint32_t> outgoing;
    };

    /**
     * @brief Directed graph over dense node indices
     *
     * All traversals visit nodes in index order and edges in insertion order,
     * so results are deterministic for a given construction sequence.
     *
     * @code
     * DependencyGraph graph(3);        // fetch=0, build=1, test=2
     * graph.addEdge(0, 1);             // build depends on fetch
     * graph.addEdge(1, 2);             // test depends on build
     * auto tiers = graph.tiers();      // {{0}, {1}, {2}}
     *
     * graph.addEdge(2, 0);             // fetch depends on test
     * auto cycle = graph.findCycle();  // {0, 1, 2, 0}
     * @endcode
     */
    class DependencyGraph {
    public:
        DependencyGraph() = default;
        explicit DependencyGraph(size_t nodeCount) : _edges(nodeCount) {}

        /// Append a node and return its index
        uint32_t addNode() {
            _edges.emplace_back();
            return static_cast<uint32_t>(_edges.size() - 1);
        }

        /**
         * @brief Record that @p to depends on @p from
         *
         * Duplicate edges are ignored. Self-loops are stored and later
         * reported by findCycle() as a one-node cycle.
         *
         * @throws std::out_of_range if either index is not a node
         */
        void addEdge(uint32_t from, uint32_t to) {
            checkIndex(from);
            checkIndex(to);

            auto& outgoing = _edges[from].outgoing;
            if (std::find(outgoing.begin(), outgoing.end(), to) != outgoing.end()) {
                return;
            }
            outgoing.push_back(to);
            _edges[to].incoming.push_back(from);
        }

        size_t size() const { return _edges.size(); }
        bool empty() const { return _edges.empty(); }

        /// Dependencies of @p node
        std::span<const uint32_t> getIncoming(uint32_t node) const {
            checkIndex(node);
            return _edges[node].incoming;
        }

        /// Direct dependents of @p node
        std::span<const uint32_t> getOutgoing(uint32_t node) const {
            checkIndex(node);
            return _edges[node].outgoing;
        }

        /// Nodes without dependencies
        std::vector<uint32_t> getRoots() const {
            std::vector<uint32_t> roots;
            for (uint32_t i = 0; i < _edges.size(); ++i) {
                if (_edges[i].incoming.empty()) {
                    roots.push_back(i);
                }
            }
            return roots;
        }

        /**
         * @brief Find one cycle using depth-first search with recursion-stack marking
         *
         * @return The nodes along the cycle, with the first node repeated at the
         *         end ({a, b, a}), or an empty vector if the graph is acyclic
         */
        std::vector<uint32_t> findCycle() const {
            enum class Mark : uint8_t { Unvisited, OnStack, Done };
            std::vector<Mark> marks(_edges.size(), Mark::Unvisited);

            // Explicit stack of (node, next outgoing edge) keeps deep chains off the call stack
            std::vector<std::pair<uint32_t, size_t>> stack;

            for (uint32_t start = 0; start < _edges.size(); ++start) {
                if (marks[start] != Mark::Unvisited) {
                    continue;
                }

                stack.emplace_back(start, 0);
                marks[start] = Mark::OnStack;

                while (!stack.empty()) {
                    auto& [node, nextEdge] = stack.back();
                    const auto& outgoing = _edges[node].outgoing;

                    if (nextEdge == outgoing.size()) {
                        marks[node] = Mark::Done;
                        stack.pop_back();
                        continue;
                    }

                    uint32_t child = outgoing[nextEdge++];
                    if (marks[child] == Mark::OnStack) {
                        std::vector<uint32_t> cycle;
                        auto it = std::find_if(stack.begin(), stack.end(),
                                               [child](const auto& frame) { return frame.first == child; });
                        for (; it != stack.end(); ++it) {
                            cycle.push_back(it->first);
                        }
                        cycle.push_back(child);
                        return cycle;
                    }
                    if (marks[child] == Mark::Unvisited) {
                        marks[child] = Mark::OnStack;
                        stack.emplace_back(child, 0);
                    }
                }
            }

            return {};
        }

        bool isAcyclic() const {
            return findCycle().empty();
        }

        /**
         * @brief Kahn topological order, ties broken by lowest index
         *
         * @throws std::logic_error if the graph contains a cycle
         */
        std::vector<uint32_t> topologicalSort() const {
            std::vector<uint32_t> order;
            for (const auto& tier : tiers()) {
                order.insert(order.end(), tier.begin(), tier.end());
            }
            return order;
        }

        /**
         * @brief Group nodes by dependency depth
         *
         * Tier 0 holds the roots. A node sits in tier k when its longest chain
         * of dependencies has length k, so every node of a tier can run
         * concurrently once all earlier tiers have finished.
         *
         * @throws std::logic_error if the graph contains a cycle
         */
        std::vector<std::vector<uint32_t>> tiers() const {
            std::vector<size_t> remaining(_edges.size());
            std::vector<uint32_t> current;
            for (uint32_t i = 0; i < _edges.size(); ++i) {
                remaining[i] = _edges[i].incoming.size();
                if (remaining[i] == 0) {
                    current.push_back(i);
                }
            }

            std::vector<std::vector<uint32_t>> result;
            size_t placed = 0;
            while (!current.empty()) {
                std::vector<uint32_t> next;
                for (uint32_t node : current) {
                    for (uint32_t child : _edges[node].outgoing) {
                        if (--remaining[child] == 0) {
                            next.push_back(child);
                        }
                    }
                }
                std::sort(next.begin(), next.end());
                placed += current.size();
                result.push_back(std::move(current));
                current = std::move(next);
            }

            if (placed != _edges.size()) {
                throw std::logic_error("Dependency graph contains a cycle");
            }
            return result;
        }

        /// Every node that transitively depends on @p node, in discovery order
        std::vector<uint32_t> collectDependents(uint32_t node) const {
            checkIndex(node);
            return collectReachable(node, &EdgeList::outgoing);
        }

        /// Every node @p node transitively depends on, in discovery order
        std::vector<uint32_t> collectDependencies(uint32_t node) const {
            checkIndex(node);
            return collectReachable(node, &EdgeList::incoming);
        }

    private:
        std::vector<uint32_t> collectReachable(uint32_t node, std::vector<uint32_t> EdgeList::* direction) const {
            std::vector<bool> seen(_edges.size(), false);
            std::vector<uint32_t> result;
            const auto& first = _edges[node].*direction;
            std::vector<uint32_t> stack(first.rbegin(), first.rend());

            while (!stack.empty()) {
                uint32_t current = stack.back();
                stack.pop_back();
                if (seen[current]) {
                    continue;
                }
                seen[current] = true;
                result.push_back(current);
                const auto& next = _edges[current].*direction;
                for (auto it = next.rbegin(); it != next.rend(); ++it) {
                    if (!seen[*it]) {
                        stack.push_back(*it);
                    }
                }
            }
            return result;
        }

        void checkIndex(uint32_t node) const {
            if (node >= _edges.size()) {
                throw std::out_of_range("Dependency graph node index " + std::to_string(node) +
                                        " out of range (size " + std::to_string(_edges.size()) + ")");
            }
        }

        std::vector<EdgeList> _edges;
    };

} // namespace Graph
} // namespace Core
} // namespace MaestroEngine
