/*
 * ruletree_c.h - C API for the rule set hierarchy tree
 *
 * Opaque handles over the C++ core so the tree can be built from ctypes or plain C.
 * Trees are owned by the caller and released with delete_tree(); node pointers handed
 * out by the accessors stay valid until then.
 */

#ifndef RULETREE_C_H
#define RULETREE_C_H

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Ruleset Ruleset;
typedef struct TreeNode TreeNode;

Ruleset* create_ruleset(int regression);
void delete_ruleset(Ruleset* ruleset);

void add_feature_name(Ruleset* ruleset, const char* name);
void add_class_name(Ruleset* ruleset, const char* name);

/* one single-clause rule from parallel term arrays; ops are "<", "<=", ">", ">=", "==", "!="
 * returns 1 if added, 0 if an equal rule was already present, -1 on error */
int add_rule(Ruleset* ruleset,
             const char** variables, const char** ops, const double* thresholds, int n_terms,
             double confidence, double score,
             const char* conclusion);

int get_rule_count(const Ruleset* ruleset);

/* NULL on error */
TreeNode* build_tree(const Ruleset* ruleset, int merge);
void delete_tree(TreeNode* tree);

const char* node_name(const TreeNode* node);
int node_num_children(const TreeNode* node);
const TreeNode* node_child(const TreeNode* node, int index); /* NULL if out of range */
int node_is_leaf(const TreeNode* node);
double node_score(const TreeNode* node); /* 0 for non-leaves */
int node_depth(const TreeNode* node);
int node_num_descendants(const TreeNode* node);
int node_class_count(const TreeNode* node, const char* class_name);

#ifdef __cplusplus
}
#endif

#endif /* RULETREE_C_H */
