#pragma once

#include <algorithm>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "rules.cpp"

using namespace std;

// swap operator symbols for their HTML entities so names can be dropped into SVG/HTML as-is
static inline string htmlify(string s) {
    static const pair<const char*, const char*> codes[] = {
        {"<=", "&leq;"},
        {">=", "&geq;"},
    };
    for (const auto& c : codes) {
        const string plain = c.first;
        const string html  = c.second;
        size_t pos = 0;
        while ((pos = s.find(plain, pos)) != string::npos) {
            s.replace(pos, plain.size(), html);
            pos += html.size();
        }
    }
    return s;
}

static inline string term_name(const Term& t, const DatasetDescriptor* dataset) {
    return htmlify(dataset ? t.to_cat_str(*dataset) : t.to_str());
}

static inline void require_single_clause(const Rule& r) {
    if (r.premise.size() > 1) {
        throw invalid_argument(
            "Rule with " + to_string(r.premise.size()) +
            " clauses in its premise; expand disjunctions first: " + r.to_str());
    }
}

struct TermCounts {
    vector<Term> ranked;  // most used first
    map<Term, int> counts; // term -> number of rules using it
};

// usage count of every term across the ruleset. ties are broken on the rendered term and
// then on the term order itself so the same ruleset always yields the same tree
static inline TermCounts get_term_counts(const Ruleset& ruleset) {
    TermCounts tc;
    for (const auto& rule : ruleset.rules) {
        set<Term> seen; // a rule counts once per term even if several clauses share it
        for (const auto& clause : rule.premise) {
            for (const auto& t : clause.terms) {
                if (seen.insert(t).second) tc.counts[t] += 1;
            }
        }
    }

    vector<pair<string, Term>> keyed;
    keyed.reserve(tc.counts.size());
    for (const auto& kv : tc.counts) keyed.emplace_back(kv.first.to_str(), kv.first);

    stable_sort(keyed.begin(), keyed.end(),
        [&tc](const pair<string, Term>& a, const pair<string, Term>& b) {
            const int ca = tc.counts.at(a.second);
            const int cb = tc.counts.at(b.second);
            if (ca != cb) return ca > cb;
            if (a.first != b.first) return a.first < b.first;
            return a.second < b.second;
        });

    tc.ranked.reserve(keyed.size());
    for (auto& k : keyed) tc.ranked.push_back(std::move(k.second));
    return tc;
}

// first: rules whose clause uses `term`, rewritten without it. second: everything else, untouched.
// every input rule lands in exactly one of the two
static inline pair<Ruleset, Ruleset> partition_ruleset(const Ruleset& ruleset, const Term& term) {
    Ruleset contain  = ruleset.empty_copy();
    Ruleset disjoint = ruleset.empty_copy();

    for (const auto& rule : ruleset.rules) {
        require_single_clause(rule);
        if (!rule.premise.empty() && rule.premise.front().contains(term)) {
            contain.rules.push_back(Rule({rule.premise.front().without(term)}, rule.conclusion));
        } else {
            disjoint.rules.push_back(rule); // empty premises never match, they always end up here
        }
    }
    return {std::move(contain), std::move(disjoint)};
}

struct TreeNode {
    string name;
    vector<TreeNode> children;
    optional<double> score; // leaves only

    // filled in by the annotation pass
    int depth = 0;
    int num_descendants = 0;
    map<string, int> class_counts;

    // childless split nodes never happen; the only childless non-leaf is the root of an empty ruleset
    bool is_leaf() const { return children.empty() && score.has_value(); }

    int count_leaves() const {
        if (is_leaf()) return 1;
        int n = 0;
        for (const auto& c : children) n += c.count_leaves();
        return n;
    }

    int max_depth() const {
        int d = depth;
        for (const auto& c : children) d = max(d, c.max_depth());
        return d;
    }
};

class HierarchyTreeBuilder {
public:
    void set_merge(bool on) { merge = on; }
    void set_verbose(bool on) { verbose = on; }
    void set_expand_disjunctions(bool on) { expand_disjunctions = on; }
    void set_max_clause_length(int n) { max_clause_length = n; }

    bool get_merge() const { return merge; }
    bool get_verbose() const { return verbose; }
    bool get_expand_disjunctions() const { return expand_disjunctions; }
    int get_max_clause_length() const { return max_clause_length; }

    // extraction, annotation and node teardown all recurse once per tree level, and a clause
    // of n terms can put its leaf n levels down
    static constexpr int DEFAULT_MAX_CLAUSE_LENGTH = 1000;

    // extraction under a synthetic "ruleset" root followed by the annotation pass
    TreeNode build(const Ruleset& ruleset, const DatasetDescriptor* dataset = nullptr) const {
        const Ruleset* input = &ruleset;
        Ruleset expanded;
        if (!ruleset.is_single_clause()) {
            if (!expand_disjunctions) {
                for (const auto& r : ruleset.rules) require_single_clause(r);
            }
            expanded = ruleset.with_expanded_clauses();
            if (verbose) {
                cout << "Expanded " << ruleset.size() << " rules into "
                     << expanded.size() << " single-clause rules\n";
            }
            input = &expanded;
        }
        check_clause_lengths(*input);

        TreeNode root;
        root.name = "ruleset";
        root.children = extract(*input, dataset);
        annotate(root);

        if (verbose) {
            cout << "Hierarchy tree - Rules: " << input->size()
                 << ", Leaves: " << root.count_leaves()
                 << ", Nodes: " << root.num_descendants + 1
                 << ", Max depth: " << root.max_depth()
                 << ", Merge: " << (merge ? "ON" : "OFF") << "\n";
        }
        return root;
    }

    // greedy n-ary induction: split on the most used term, rules using it go below the split,
    // the rest stay at this level as later siblings
    vector<TreeNode> extract(const Ruleset& ruleset, const DatasetDescriptor* dataset = nullptr) const {
        vector<TreeNode> out;
        Ruleset rest = ruleset;

        while (!rest.empty()) {
            if (rest.size() == 1) {
                out.push_back(rule_chain(rest.rules.front(), dataset));
                break;
            }

            TermCounts tc = get_term_counts(rest);
            if (tc.ranked.empty()) {
                // nothing left to split on, each remaining rule ends right here
                for (const auto& r : rest.rules) {
                    require_single_clause(r);
                    out.push_back(conclusion_leaf(r));
                }
                break;
            }

            const Term& next_term = tc.ranked.front();
            auto parts = partition_ruleset(rest, next_term);

            TreeNode split;
            split.name = term_name(next_term, dataset);
            split.children = extract(parts.first, dataset);
            out.push_back(std::move(split));

            rest = std::move(parts.second);
        }
        return out;
    }

    // post-order: depth on the way down, descendant and class counts on the way up
    void annotate(TreeNode& node, int depth = 0) const {
        node.depth = depth;
        node.num_descendants = 0;
        node.class_counts.clear();

        if (node.children.empty()) {
            if (depth != 0) node.class_counts[node.name] = 1;
            return;
        }

        // never collapse the root, never collapse into a leaf
        if (merge && depth != 0 && node.children.size() == 1 && !node.children.front().children.empty()) {
            TreeNode old_child = std::move(node.children.front());
            node.children = std::move(old_child.children);
            node.name += " AND " + old_child.name;
        }

        for (auto& child : node.children) {
            annotate(child, depth + 1);
            node.num_descendants += child.num_descendants + 1;
            for (const auto& kv : child.class_counts) node.class_counts[kv.first] += kv.second;
        }
    }

private:
    bool merge = false;
    bool verbose = false;
    bool expand_disjunctions = false;
    int max_clause_length = DEFAULT_MAX_CLAUSE_LENGTH;

    void check_clause_lengths(const Ruleset& ruleset) const {
        for (const auto& r : ruleset.rules) {
            for (const auto& c : r.premise) {
                if ((long long)c.terms.size() > (long long)max_clause_length) {
                    throw invalid_argument(
                        "Clause with " + to_string(c.terms.size()) + " terms exceeds the maximum of " +
                        to_string(max_clause_length) + " (rule concluding '" + r.conclusion + "')");
                }
            }
        }
    }

    static TreeNode conclusion_leaf(const Rule& rule) {
        TreeNode leaf;
        leaf.name = htmlify(rule.conclusion);
        leaf.score = rule.premise.empty() ? 0.0 : rule.premise.front().score;
        return leaf;
    }

    // a lone rule: its remaining terms in front of its conclusion
    TreeNode rule_chain(const Rule& rule, const DatasetDescriptor* dataset) const {
        require_single_clause(rule);
        TreeNode leaf = conclusion_leaf(rule);
        if (rule.premise.empty() || rule.premise.front().terms.empty()) return leaf;

        const auto& terms = rule.premise.front().terms;
        if (merge) {
            string joined;
            for (const auto& t : terms) {
                if (!joined.empty()) joined += " AND ";
                joined += dataset ? t.to_cat_str(*dataset) : t.to_str();
            }
            TreeNode node;
            node.name = htmlify(joined);
            node.children.push_back(std::move(leaf));
            return node;
        }

        // built back to front so each node owns the next one by value
        TreeNode current = std::move(leaf);
        for (auto it = terms.rbegin(); it != terms.rend(); ++it) {
            TreeNode node;
            node.name = term_name(*it, dataset);
            node.children.push_back(std::move(current));
            current = std::move(node);
        }
        return current;
    }
};

static inline TreeNode ruleset_hierarchy_tree(const Ruleset& ruleset,
                                              const DatasetDescriptor* dataset = nullptr,
                                              bool merge = false) {
    HierarchyTreeBuilder builder;
    builder.set_merge(merge);
    return builder.build(ruleset, dataset);
}
