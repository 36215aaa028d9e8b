#include <functional>

#include "test_util.hpp"

TEST(HierarchyTreeTest, TwoRuleExample) {
    Ruleset rs = make_ruleset({
        make_rule({gt("a"), gt("b")}, "X", 0.9),
        make_rule({gt("b")}, "Y", 0.5),
    });
    TreeNode root = ruleset_hierarchy_tree(rs);

    // ruleset -> (b > 0.5) -> [(a > 0.5) -> X, Y]
    EXPECT_EQ(root.name, "ruleset");
    ASSERT_EQ(root.children.size(), 1u);
    const TreeNode& b = root.children[0];
    EXPECT_EQ(b.name, "(b > 0.5)");
    ASSERT_EQ(b.children.size(), 2u);
    EXPECT_EQ(b.children[0].name, "(a > 0.5)");
    EXPECT_EQ(b.children[0].children[0].name, "X");
    EXPECT_EQ(b.children[1].name, "Y");

    EXPECT_EQ(root.count_leaves(), 2);
    EXPECT_EQ(root.num_descendants, 4);
    EXPECT_EQ(b.num_descendants, 3);
    EXPECT_EQ(b.children[0].children[0].depth, 3);
    EXPECT_EQ(b.children[1].depth, 2);
    EXPECT_EQ(root.class_counts, (std::map<std::string, int>{{"X", 1}, {"Y", 1}}));
    expect_annotation_consistent(root);
}

TEST(HierarchyTreeTest, EmptyRuleset) {
    TreeNode root = ruleset_hierarchy_tree(make_ruleset({}));
    EXPECT_EQ(root.name, "ruleset");
    EXPECT_TRUE(root.children.empty());
    EXPECT_EQ(root.num_descendants, 0);
    EXPECT_TRUE(root.class_counts.empty());
}

TEST(HierarchyTreeTest, MergeShortensSharedPrefixes) {
    Ruleset rs = make_ruleset({
        make_rule({gt("a"), gt("b"), gt("c")}, "X"),
        make_rule({gt("a"), gt("b"), gt("d")}, "Y"),
    });

    TreeNode plain = ruleset_hierarchy_tree(rs, nullptr, false);
    EXPECT_EQ(plain.num_descendants, 6);
    EXPECT_EQ(plain.children[0].name, "(a > 0.5)");
    EXPECT_EQ(plain.children[0].children[0].name, "(b > 0.5)");

    TreeNode merged = ruleset_hierarchy_tree(rs, nullptr, true);
    EXPECT_EQ(merged.num_descendants, 5);
    ASSERT_EQ(merged.children.size(), 1u);
    const TreeNode& ab = merged.children[0];
    EXPECT_EQ(ab.name, "(a > 0.5) AND (b > 0.5)");
    ASSERT_EQ(ab.children.size(), 2u);
    EXPECT_EQ(ab.children[0].name, "(c > 0.5)");
    EXPECT_EQ(ab.children[1].name, "(d > 0.5)");
    expect_annotation_consistent(merged);
}

TEST(HierarchyTreeTest, InvariantsOnRandomRulesets) {
    for (unsigned seed = 1; seed <= 40; ++seed) {
        Ruleset rs = random_ruleset(seed, 25, 6, 4);

        std::multiset<std::string> conclusions;
        for (const auto& r : rs.rules) conclusions.insert(r.conclusion);

        std::multiset<std::string> leaves[2];
        for (int merge = 0; merge < 2; ++merge) {
            TreeNode root = ruleset_hierarchy_tree(rs, nullptr, merge != 0);
            EXPECT_EQ(root.count_leaves(), (int)rs.size()) << "seed " << seed;
            collect_leaf_names(root, leaves[merge]);
            EXPECT_EQ(leaves[merge], conclusions) << "seed " << seed;
            expect_annotation_consistent(root);
        }
        EXPECT_EQ(leaves[0], leaves[1]);
    }
}

TEST(HierarchyTreeTest, Deterministic) {
    Ruleset rs = random_ruleset(7, 30, 5, 3);
    Ruleset reversed = rs.empty_copy();
    for (auto it = rs.rules.rbegin(); it != rs.rules.rend(); ++it) reversed.add_rule(*it);

    TreeNode a = ruleset_hierarchy_tree(rs);
    TreeNode b = ruleset_hierarchy_tree(rs);
    TreeNode c = ruleset_hierarchy_tree(reversed);

    std::function<void(const TreeNode&, const TreeNode&)> same_shape =
        [&](const TreeNode& x, const TreeNode& y) {
            EXPECT_EQ(x.name, y.name);
            ASSERT_EQ(x.children.size(), y.children.size());
            for (size_t i = 0; i < x.children.size(); ++i) same_shape(x.children[i], y.children[i]);
        };
    same_shape(a, b);
    // split nodes only depend on term counts, so the top level does not care about rule order
    ASSERT_FALSE(a.children.empty());
    EXPECT_EQ(a.children[0].name, c.children[0].name);
}

TEST(HierarchyTreeTest, EscapesOperators) {
    Ruleset rs = make_ruleset({
        make_rule({Term("x", Op::LEQ, 1.0)}, "X"),
        make_rule({Term("y", Op::GEQ, 2.0)}, "Y"),
    });
    TreeNode root = ruleset_hierarchy_tree(rs);
    ASSERT_EQ(root.children.size(), 2u);
    EXPECT_EQ(root.children[0].name, "(x &leq; 1)");
    EXPECT_EQ(root.children[1].name, "(y &geq; 2)");
}

TEST(HierarchyTreeTest, MultiClauseRulesRejectedUnlessExpanded) {
    Ruleset rs = make_ruleset({make_rule({gt("c")}, "Y")});
    rs.add_rule(Rule({ConjunctiveClause({gt("a")}, 1.0, 0.4), ConjunctiveClause({gt("b")}, 1.0, 0.6)}, "X"));

    EXPECT_THROW(ruleset_hierarchy_tree(rs), std::invalid_argument);

    HierarchyTreeBuilder b;
    b.set_expand_disjunctions(true);
    TreeNode root = b.build(rs);
    EXPECT_EQ(root.count_leaves(), 3);
    EXPECT_EQ(root.class_counts.at("X"), 2);
    EXPECT_EQ(root.class_counts.at("Y"), 1);
    expect_annotation_consistent(root);
}

TEST(HierarchyTreeTest, BuilderDefaults) {
    HierarchyTreeBuilder b;
    EXPECT_FALSE(b.get_merge());
    EXPECT_FALSE(b.get_verbose());
    EXPECT_FALSE(b.get_expand_disjunctions());
}

TEST(HierarchyTreeTest, VerboseSummary) {
    HierarchyTreeBuilder b;
    b.set_verbose(true);

    testing::internal::CaptureStdout();
    b.build(make_ruleset({make_rule({gt("a")}, "X"), make_rule({gt("b")}, "Y")}));
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("Rules: 2"), std::string::npos) << out;
    EXPECT_NE(out.find("Leaves: 2"), std::string::npos) << out;

    b.set_verbose(false);
    testing::internal::CaptureStdout();
    b.build(make_ruleset({make_rule({gt("a")}, "X")}));
    EXPECT_TRUE(testing::internal::GetCapturedStdout().empty());
}

TEST(HierarchyTreeTest, DatasetIsOptional) {
    DatasetDescriptor ds;
    ds.add_one_hot("sex_f", "sex", "female");
    Ruleset rs = make_ruleset({make_rule({gt("sex_f")}, "X"), make_rule({leq("sex_f")}, "Y")});

    TreeNode plain = ruleset_hierarchy_tree(rs);
    TreeNode rendered = ruleset_hierarchy_tree(rs, &ds);
    ASSERT_EQ(rendered.children.size(), 2u);
    EXPECT_EQ(plain.children[0].name, "(sex_f &leq; 0.5)");
    EXPECT_EQ(rendered.children[0].name, "(sex != female)");
    EXPECT_EQ(rendered.children[1].name, "(sex = female)");
}

namespace {

Rule long_rule(int n_terms, const std::string& conclusion) {
    std::set<Term> terms;
    for (int i = 0; i < n_terms; ++i) terms.insert(gt("x" + std::to_string(i)));
    return Rule({ConjunctiveClause(std::move(terms), 1.0, 0.5)}, conclusion);
}

}  // namespace

TEST(HierarchyTreeTest, ClauseAtLengthLimitBuilds) {
    HierarchyTreeBuilder b;
    EXPECT_EQ(b.get_max_clause_length(), HierarchyTreeBuilder::DEFAULT_MAX_CLAUSE_LENGTH);

    Ruleset rs = make_ruleset({long_rule(HierarchyTreeBuilder::DEFAULT_MAX_CLAUSE_LENGTH, "X")});
    TreeNode root = b.build(rs);
    EXPECT_EQ(root.count_leaves(), 1);
    EXPECT_EQ(root.num_descendants, HierarchyTreeBuilder::DEFAULT_MAX_CLAUSE_LENGTH + 1);
    EXPECT_EQ(root.max_depth(), HierarchyTreeBuilder::DEFAULT_MAX_CLAUSE_LENGTH + 1);
}

TEST(HierarchyTreeTest, OverlongClauseRejected) {
    Ruleset rs = make_ruleset({make_rule({gt("a")}, "Y"), long_rule(100000, "X")});
    EXPECT_THROW(ruleset_hierarchy_tree(rs), std::invalid_argument);
    EXPECT_THROW(ruleset_hierarchy_tree(rs, nullptr, true), std::invalid_argument);

    HierarchyTreeBuilder b;
    b.set_max_clause_length(5);
    EXPECT_THROW(b.build(make_ruleset({long_rule(6, "X")})), std::invalid_argument);
    EXPECT_EQ(b.build(make_ruleset({long_rule(5, "X")})).num_descendants, 6);
}
