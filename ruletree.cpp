#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "src/ruletree/cpp/hierarchy_tree.cpp"
#include "ruletree_c.h"

extern "C" {
    Ruleset* create_ruleset(int regression) {
        Ruleset* rs = new Ruleset();
        rs->regression = (regression != 0);
        return rs;
    }

    void delete_ruleset(Ruleset* ruleset) {
        delete ruleset;
    }

    void add_feature_name(Ruleset* ruleset, const char* name) {
        if (!ruleset || !name) return;
        ruleset->feature_names.emplace_back(name);
    }

    void add_class_name(Ruleset* ruleset, const char* name) {
        if (!ruleset || !name) return;
        ruleset->output_class_names.emplace_back(name);
    }

    int add_rule(Ruleset* ruleset,
                 const char** variables, const char** ops, const double* thresholds, int n_terms,
                 double confidence, double score,
                 const char* conclusion) {
        if (!ruleset || !conclusion || n_terms < 0) return -1;
        if (n_terms > 0 && (!variables || !ops || !thresholds)) return -1;
        try {
            set<Term> terms;
            for (int i = 0; i < n_terms; ++i) {
                if (!variables[i] || !ops[i]) return -1;
                terms.insert(Term(variables[i], parse_op(ops[i]), thresholds[i]));
            }
            Rule r({ConjunctiveClause(std::move(terms), confidence, score)}, conclusion);
            return ruleset->add_rule(std::move(r)) ? 1 : 0;
        } catch (const exception& e) {
            cerr << "add_rule: " << e.what() << "\n";
            return -1;
        }
    }

    int get_rule_count(const Ruleset* ruleset) {
        return ruleset ? (int)ruleset->size() : 0;
    }

    TreeNode* build_tree(const Ruleset* ruleset, int merge) {
        if (!ruleset) return nullptr;
        try {
            return new TreeNode(ruleset_hierarchy_tree(*ruleset, nullptr, merge != 0));
        } catch (const exception& e) {
            cerr << "build_tree: " << e.what() << "\n";
            return nullptr;
        }
    }

    void delete_tree(TreeNode* tree) {
        delete tree;
    }

    const char* node_name(const TreeNode* node) {
        return node ? node->name.c_str() : nullptr;
    }

    int node_num_children(const TreeNode* node) {
        return node ? (int)node->children.size() : 0;
    }

    const TreeNode* node_child(const TreeNode* node, int index) {
        if (!node || index < 0 || index >= (int)node->children.size()) return nullptr;
        return &node->children[index];
    }

    int node_is_leaf(const TreeNode* node) {
        return (node && node->is_leaf()) ? 1 : 0;
    }

    double node_score(const TreeNode* node) {
        return (node && node->score) ? *node->score : 0.0;
    }

    int node_depth(const TreeNode* node) {
        return node ? node->depth : 0;
    }

    int node_num_descendants(const TreeNode* node) {
        return node ? node->num_descendants : 0;
    }

    int node_class_count(const TreeNode* node, const char* class_name) {
        if (!node || !class_name) return 0;
        auto it = node->class_counts.find(class_name);
        return it == node->class_counts.end() ? 0 : it->second;
    }
}
