#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "cpp/hierarchy_tree.cpp"

namespace py = pybind11;

// nested dicts in the shape the D3 hierarchy layout consumes
static py::dict tree_to_dict(const TreeNode &node) {
    py::dict d;
    d["name"] = node.name;

    py::list children;
    for (const auto &child : node.children) {
        children.append(tree_to_dict(child));
    }
    d["children"] = children;

    if (node.score) {
        d["score"] = *node.score;
    }
    d["depth"] = node.depth;
    d["num_descendants"] = node.num_descendants;

    py::dict class_counts;
    for (const auto &kv : node.class_counts) {
        class_counts[py::str(kv.first)] = kv.second;
    }
    d["class_counts"] = class_counts;
    return d;
}

static py::list terms_to_list(const std::set<Term> &terms) {
    py::list out;
    for (const auto &t : terms) {
        out.append(py::cast(t));
    }
    return out;
}

PYBIND11_MODULE(_core, m) {
    m.doc() = "Rule set hierarchy tree C++ core bindings";

    py::enum_<FeatureType>(m, "FeatureType")
        .value("REAL", FeatureType::REAL)
        .value("INTEGER", FeatureType::INTEGER)
        .value("CATEGORICAL", FeatureType::CATEGORICAL);

    py::class_<Term>(m, "Term")
        .def(py::init([](std::string variable, std::string op, double threshold) {
                 return Term(std::move(variable), parse_op(op), threshold);
             }),
             py::arg("variable"),
             py::arg("operator"),
             py::arg("threshold"))
        .def_readonly("variable", &Term::variable)
        .def_readonly("threshold", &Term::threshold)
        .def_property_readonly("operator",
             [](const Term &self) { return std::string(op_symbol(self.op)); })
        .def("to_cat_str", &Term::to_cat_str, py::arg("dataset"))
        .def("__str__", &Term::to_str)
        .def("__repr__",
             [](const Term &self) { return "Term" + self.to_str(); })
        .def("__eq__",
             [](const Term &self, const Term &other) { return self == other; })
        .def("__hash__",
             [](const Term &self) { return py::hash(py::str(self.to_str())); });

    py::class_<ConjunctiveClause>(m, "ConjunctiveClause")
        .def(py::init([](const std::vector<Term> &terms, double confidence, double score) {
                 return ConjunctiveClause(std::set<Term>(terms.begin(), terms.end()),
                                          confidence, score);
             }),
             py::arg("terms"),
             py::arg("confidence") = 1.0,
             py::arg("score") = 0.0)
        .def_property_readonly("terms",
             [](const ConjunctiveClause &self) { return terms_to_list(self.terms); })
        .def_readonly("confidence", &ConjunctiveClause::confidence)
        .def_readonly("score", &ConjunctiveClause::score)
        .def("__len__", [](const ConjunctiveClause &self) { return self.terms.size(); })
        .def("__str__", &ConjunctiveClause::to_str);

    py::class_<Rule>(m, "Rule")
        .def(py::init<std::vector<ConjunctiveClause>, std::string>(),
             py::arg("premise"),
             py::arg("conclusion"))
        .def_readonly("premise", &Rule::premise)
        .def_readonly("conclusion", &Rule::conclusion)
        .def("__str__", &Rule::to_str);

    py::class_<Ruleset>(m, "Ruleset")
        .def(py::init([](const std::vector<Rule> &rules,
                         std::vector<std::string> feature_names,
                         std::vector<std::string> output_class_names,
                         bool regression) {
                 Ruleset rs(std::move(feature_names), std::move(output_class_names), regression);
                 for (const auto &r : rules) {
                     rs.add_rule(r);
                 }
                 return rs;
             }),
             py::arg("rules") = std::vector<Rule>{},
             py::arg("feature_names") = std::vector<std::string>{},
             py::arg("output_class_names") = std::vector<std::string>{},
             py::arg("regression") = false)
        .def("add_rule", &Ruleset::add_rule, py::arg("rule"))
        .def_readonly("rules", &Ruleset::rules)
        .def_readonly("feature_names", &Ruleset::feature_names)
        .def_readonly("output_class_names", &Ruleset::output_class_names)
        .def_readonly("regression", &Ruleset::regression)
        .def("with_expanded_clauses", &Ruleset::with_expanded_clauses)
        .def("__len__", &Ruleset::size);

    py::class_<DatasetDescriptor>(m, "DatasetDescriptor")
        .def(py::init<>())
        .def("add_feature", &DatasetDescriptor::add_feature,
             py::arg("name"), py::arg("type"))
        .def("add_one_hot", &DatasetDescriptor::add_one_hot,
             py::arg("column"), py::arg("feature"), py::arg("value"))
        .def("has_feature", &DatasetDescriptor::has_feature, py::arg("name"))
        .def("describe", &DatasetDescriptor::describe, py::arg("term"));

    py::class_<HierarchyTreeBuilder>(m, "HierarchyTreeBuilder")
        .def(py::init([](bool merge, bool verbose, bool expand_disjunctions, int max_clause_length) {
                 HierarchyTreeBuilder b;
                 b.set_merge(merge);
                 b.set_verbose(verbose);
                 b.set_expand_disjunctions(expand_disjunctions);
                 b.set_max_clause_length(max_clause_length);
                 return b;
             }),
             py::arg("merge") = false,
             py::arg("verbose") = false,
             py::arg("expand_disjunctions") = false,
             py::arg("max_clause_length") = HierarchyTreeBuilder::DEFAULT_MAX_CLAUSE_LENGTH)
        .def_property("merge", &HierarchyTreeBuilder::get_merge, &HierarchyTreeBuilder::set_merge)
        .def_property("verbose", &HierarchyTreeBuilder::get_verbose, &HierarchyTreeBuilder::set_verbose)
        .def_property("expand_disjunctions",
             &HierarchyTreeBuilder::get_expand_disjunctions,
             &HierarchyTreeBuilder::set_expand_disjunctions)
        .def_property("max_clause_length",
             &HierarchyTreeBuilder::get_max_clause_length,
             &HierarchyTreeBuilder::set_max_clause_length)
        .def(
            "build",
            [](const HierarchyTreeBuilder &self,
               const Ruleset &ruleset,
               const DatasetDescriptor *dataset) {
                return tree_to_dict(self.build(ruleset, dataset));
            },
            py::arg("ruleset"),
            py::arg("dataset") = py::none()
        );

    m.def(
        "get_term_counts",
        [](const Ruleset &ruleset) {
            TermCounts tc = get_term_counts(ruleset);
            py::list ranked;
            py::dict counts;
            for (const auto &t : tc.ranked) {
                ranked.append(py::cast(t));
                counts[py::cast(t)] = tc.counts.at(t);
            }
            return py::make_tuple(ranked, counts);
        },
        py::arg("ruleset")
    );

    m.def(
        "partition_ruleset",
        [](const Ruleset &ruleset, const Term &term) {
            auto parts = partition_ruleset(ruleset, term);
            return py::make_tuple(parts.first, parts.second);
        },
        py::arg("ruleset"),
        py::arg("term")
    );

    m.def(
        "ruleset_hierarchy_tree",
        [](const Ruleset &ruleset, const DatasetDescriptor *dataset, bool merge) {
            return tree_to_dict(ruleset_hierarchy_tree(ruleset, dataset, merge));
        },
        py::arg("ruleset"),
        py::arg("dataset") = py::none(),
        py::arg("merge") = false
    );
}
