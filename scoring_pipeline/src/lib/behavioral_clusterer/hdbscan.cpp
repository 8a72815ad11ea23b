#include "hdbscan.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <map>
#include <numeric>
#include <stdexcept>

#include <userver/logging/log.hpp>

namespace wallet_scoring {

namespace {

// Lambda assigned to zero-distance merges (duplicate points).
constexpr double kMaxLambda = 1e12;

struct Edge {
    std::size_t from;
    std::size_t to;
    double weight;
};

struct LinkageNode {
    std::size_t left;
    std::size_t right;
    double distance;
    std::size_t size;
};

struct CondensedEdge {
    std::size_t parent;
    std::size_t child;
    double lambda;
    std::size_t child_size;
};

double Distance(const FeaturePoint& a, const FeaturePoint& b) {
    double sum = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const double d = a[i] - b[i];
        sum += d * d;
    }
    return std::sqrt(sum);
}

double ToLambda(double distance) {
    return distance > 0.0 ? std::min(1.0 / distance, kMaxLambda) : kMaxLambda;
}

// Distance to the min_samples-th nearest neighbour, the point itself included.
std::vector<double> CoreDistances(const std::vector<FeaturePoint>& points, std::size_t min_samples) {
    const std::size_t n = points.size();
    const std::size_t k = std::min(min_samples, n);
    std::vector<double> core(n, 0.0);
    std::vector<double> row(n);
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < n; ++j) {
            row[j] = (i == j) ? 0.0 : Distance(points[i], points[j]);
        }
        std::nth_element(row.begin(), row.begin() + (k - 1), row.end());
        core[i] = row[k - 1];
    }
    return core;
}

// Prim's algorithm over the dense mutual reachability graph.
std::vector<Edge> MutualReachabilityMst(const std::vector<FeaturePoint>& points,
                                        const std::vector<double>& core) {
    const std::size_t n = points.size();
    std::vector<bool> in_tree(n, false);
    std::vector<double> best(n, std::numeric_limits<double>::infinity());
    std::vector<std::size_t> best_from(n, 0);
    std::vector<Edge> edges;
    edges.reserve(n - 1);

    std::size_t current = 0;
    in_tree[current] = true;
    for (std::size_t step = 1; step < n; ++step) {
        std::size_t next = n;
        for (std::size_t j = 0; j < n; ++j) {
            if (in_tree[j]) continue;
            const double reach = std::max({Distance(points[current], points[j]), core[current], core[j]});
            if (reach < best[j]) {
                best[j] = reach;
                best_from[j] = current;
            }
            if (next == n || best[j] < best[next]) {
                next = j;
            }
        }
        edges.push_back({best_from[next], next, best[next]});
        in_tree[next] = true;
        current = next;
    }

    std::stable_sort(edges.begin(), edges.end(),
                     [](const Edge& lhs, const Edge& rhs) { return lhs.weight < rhs.weight; });
    return edges;
}

// Node ids: points are 0..n-1, merges are n..2n-2 in merge order.
std::vector<LinkageNode> SingleLinkage(const std::vector<Edge>& mst, std::size_t n) {
    std::vector<std::size_t> parent(2 * n - 1);
    std::iota(parent.begin(), parent.end(), 0);
    std::vector<std::size_t> size(2 * n - 1, 1);

    auto find = [&parent](std::size_t x) {
        std::size_t root = x;
        while (parent[root] != root) root = parent[root];
        while (parent[x] != root) {
            const std::size_t up = parent[x];
            parent[x] = root;
            x = up;
        }
        return root;
    };

    std::vector<LinkageNode> nodes;
    nodes.reserve(n - 1);
    std::size_t next_label = n;
    for (const auto& edge : mst) {
        const std::size_t a = find(edge.from);
        const std::size_t b = find(edge.to);
        nodes.push_back({a, b, edge.weight, size[a] + size[b]});
        parent[a] = next_label;
        parent[b] = next_label;
        size[next_label] = size[a] + size[b];
        ++next_label;
    }
    return nodes;
}

class CondensedTree {
public:
    CondensedTree(const std::vector<LinkageNode>& linkage, std::size_t n, std::size_t min_cluster_size)
        : linkage_(linkage), n_(n) {
        Build(min_cluster_size);
    }

    const std::vector<CondensedEdge>& Edges() const { return edges_; }
    std::size_t RootCluster() const { return n_; }
    std::size_t ClusterEnd() const { return next_label_; }

private:
    std::size_t NodeSize(std::size_t id) const {
        return id < n_ ? 1 : linkage_[id - n_].size;
    }

    void EmitLeaves(std::size_t parent_cluster, std::size_t node, double lambda) {
        std::vector<std::size_t> stack{node};
        while (!stack.empty()) {
            const std::size_t id = stack.back();
            stack.pop_back();
            if (id < n_) {
                edges_.push_back({parent_cluster, id, lambda, 1});
            } else {
                // Right pushed first so leaves come out left to right.
                stack.push_back(linkage_[id - n_].right);
                stack.push_back(linkage_[id - n_].left);
            }
        }
    }

    void Build(std::size_t min_cluster_size) {
        const std::size_t root = 2 * n_ - 2;
        std::vector<std::size_t> relabel(2 * n_ - 1, 0);
        relabel[root] = n_;
        next_label_ = n_ + 1;

        std::deque<std::size_t> queue{root};
        while (!queue.empty()) {
            const std::size_t node = queue.front();
            queue.pop_front();
            if (node < n_) continue;

            const auto& merge = linkage_[node - n_];
            const double lambda = ToLambda(merge.distance);
            const std::size_t cluster = relabel[node];
            const std::size_t left_count = NodeSize(merge.left);
            const std::size_t right_count = NodeSize(merge.right);

            if (left_count >= min_cluster_size && right_count >= min_cluster_size) {
                relabel[merge.left] = next_label_++;
                edges_.push_back({cluster, relabel[merge.left], lambda, left_count});
                relabel[merge.right] = next_label_++;
                edges_.push_back({cluster, relabel[merge.right], lambda, right_count});
                queue.push_back(merge.left);
                queue.push_back(merge.right);
            } else if (left_count < min_cluster_size && right_count < min_cluster_size) {
                EmitLeaves(cluster, merge.left, lambda);
                EmitLeaves(cluster, merge.right, lambda);
            } else if (left_count < min_cluster_size) {
                relabel[merge.right] = cluster;
                EmitLeaves(cluster, merge.left, lambda);
                queue.push_back(merge.right);
            } else {
                relabel[merge.left] = cluster;
                EmitLeaves(cluster, merge.right, lambda);
                queue.push_back(merge.left);
            }
        }
    }

    const std::vector<LinkageNode>& linkage_;
    const std::size_t n_;
    std::size_t next_label_ = 0;
    std::vector<CondensedEdge> edges_;
};

// Excess of mass. Returns the selection flag indexed by cluster id - root.
std::vector<bool> SelectClusters(const CondensedTree& tree) {
    const std::size_t root = tree.RootCluster();
    const std::size_t count = tree.ClusterEnd() - root;

    std::vector<double> birth(count, 0.0);
    std::vector<std::vector<std::size_t>> children(count);
    for (const auto& edge : tree.Edges()) {
        if (edge.child >= root) {
            birth[edge.child - root] = edge.lambda;
            children[edge.parent - root].push_back(edge.child - root);
        }
    }

    std::vector<double> stability(count, 0.0);
    for (const auto& edge : tree.Edges()) {
        const std::size_t p = edge.parent - root;
        stability[p] += (edge.lambda - birth[p]) * static_cast<double>(edge.child_size);
    }

    std::vector<bool> selected(count, true);
    selected[0] = false;

    auto deselect_subtree = [&](std::size_t cluster) {
        std::vector<std::size_t> stack(children[cluster].begin(), children[cluster].end());
        while (!stack.empty()) {
            const std::size_t c = stack.back();
            stack.pop_back();
            selected[c] = false;
            stack.insert(stack.end(), children[c].begin(), children[c].end());
        }
    };

    // Children always carry larger ids than their parent.
    for (std::size_t c = count; c-- > 1;) {
        double subtree = 0.0;
        for (const auto child : children[c]) {
            subtree += stability[child];
        }
        if (!children[c].empty() && subtree > stability[c]) {
            selected[c] = false;
            stability[c] = subtree;
        } else {
            deselect_subtree(c);
        }
    }
    return selected;
}

}  // namespace

std::vector<int> RunHdbscan(const std::vector<FeaturePoint>& points, const HdbscanParams& params) {
    if (params.min_cluster_size < 2) {
        throw std::invalid_argument("min_cluster_size must be at least 2");
    }
    if (params.min_samples < 1) {
        throw std::invalid_argument("min_samples must be at least 1");
    }

    const std::size_t n = points.size();
    std::vector<int> labels(n, kNoiseLabel);
    if (n < params.min_cluster_size || n < 2) {
        return labels;
    }
    for (const auto& point : points) {
        if (point.size() != points.front().size()) {
            throw std::invalid_argument("all points must have the same dimension");
        }
    }

    const auto core = CoreDistances(points, params.min_samples);
    const auto mst = MutualReachabilityMst(points, core);
    const auto linkage = SingleLinkage(mst, n);
    const CondensedTree tree(linkage, n, params.min_cluster_size);
    const auto selected = SelectClusters(tree);

    const std::size_t root = tree.RootCluster();
    std::vector<std::size_t> parent_of(tree.ClusterEnd(), root);
    for (const auto& edge : tree.Edges()) {
        parent_of[edge.child] = edge.parent;
    }

    std::map<std::size_t, int> dense_label;
    for (std::size_t c = 1; c < selected.size(); ++c) {
        if (selected[c]) {
            const int next = static_cast<int>(dense_label.size());
            dense_label.emplace(root + c, next);
        }
    }

    for (std::size_t p = 0; p < n; ++p) {
        std::size_t cluster = parent_of[p];
        while (cluster != root && !selected[cluster - root]) {
            cluster = parent_of[cluster];
        }
        if (cluster != root) {
            labels[p] = dense_label.at(cluster);
        }
    }

    LOG_DEBUG() << "HDBSCAN selected " << dense_label.size() << " clusters out of "
                << (tree.ClusterEnd() - root - 1) << " candidates";
    return labels;
}

}  // namespace wallet_scoring
