#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace std;

enum class Op { LT, LEQ, GT, GEQ, EQ, NEQ };

static inline const char* op_symbol(Op op) {
    switch (op) {
        case Op::LT:  return "<";
        case Op::LEQ: return "<=";
        case Op::GT:  return ">";
        case Op::GEQ: return ">=";
        case Op::EQ:  return "==";
        case Op::NEQ: return "!=";
    }
    return "?";
}

static inline Op parse_op(const string& s) {
    if (s == "<")  return Op::LT;
    if (s == "<=") return Op::LEQ;
    if (s == ">")  return Op::GT;
    if (s == ">=") return Op::GEQ;
    if (s == "==" || s == "=") return Op::EQ;
    if (s == "!=") return Op::NEQ;
    throw invalid_argument("Unknown term operator: '" + s + "'");
}

// thresholds are shown rounded to 4 decimals, shortest form (0.5 not 0.5000)
static inline string format_threshold(double v) {
    double r = round(v * 1e4) / 1e4;
    if (r == 0.0) r = 0.0; // no "-0"
    ostringstream os;
    os.precision(15);
    os << r;
    return os.str();
}

class DatasetDescriptor; // fwd

struct Term {
    string variable;
    Op op = Op::GT;
    double threshold = 0.0;

    Term() = default;
    Term(string variable_, Op op_, double threshold_)
        : variable(std::move(variable_)), op(op_), threshold(threshold_) {}

    bool operator==(const Term& o) const {
        return variable == o.variable && op == o.op && threshold == o.threshold;
    }
    bool operator!=(const Term& o) const { return !(*this == o); }
    bool operator<(const Term& o) const {
        if (variable != o.variable) return variable < o.variable;
        if (op != o.op) return op < o.op;
        return threshold < o.threshold;
    }

    // does a feature value of `x` satisfy this term?
    bool holds(double x) const {
        switch (op) {
            case Op::LT:  return x < threshold;
            case Op::LEQ: return x <= threshold;
            case Op::GT:  return x > threshold;
            case Op::GEQ: return x >= threshold;
            case Op::EQ:  return x == threshold;
            case Op::NEQ: return x != threshold;
        }
        return false;
    }

    string to_str() const {
        return "(" + variable + " " + op_symbol(op) + " " + format_threshold(threshold) + ")";
    }

    // rendering that knows about one-hot and integer features; defined below DatasetDescriptor
    string to_cat_str(const DatasetDescriptor& dataset) const;
};

struct ConjunctiveClause {
    set<Term> terms; // all must hold; set keeps them unique and in a stable order
    double confidence = 1.0;
    double score = 0.0;

    ConjunctiveClause() = default;
    ConjunctiveClause(set<Term> terms_, double confidence_ = 1.0, double score_ = 0.0)
        : terms(std::move(terms_)), confidence(confidence_), score(score_) {}

    bool contains(const Term& t) const { return terms.count(t) != 0; }

    // copy of this clause with `t` dropped; confidence and score carry over untouched
    ConjunctiveClause without(const Term& t) const {
        ConjunctiveClause out(terms, confidence, score);
        out.terms.erase(t);
        return out;
    }

    bool operator==(const ConjunctiveClause& o) const { return terms == o.terms; }
    bool operator!=(const ConjunctiveClause& o) const { return !(*this == o); }

    string to_str() const {
        if (terms.empty()) return "True";
        string s;
        for (const auto& t : terms) {
            if (!s.empty()) s += " AND ";
            s += t.to_str();
        }
        return s;
    }
};

struct Rule {
    vector<ConjunctiveClause> premise; // OR'd together
    string conclusion;

    Rule() = default;
    Rule(vector<ConjunctiveClause> premise_, string conclusion_)
        : premise(std::move(premise_)), conclusion(std::move(conclusion_)) {}

    bool operator==(const Rule& o) const {
        return conclusion == o.conclusion && premise == o.premise;
    }
    bool operator!=(const Rule& o) const { return !(*this == o); }

    string to_str() const {
        string s = "IF ";
        for (size_t i = 0; i < premise.size(); ++i) {
            if (i) s += " OR ";
            s += premise[i].to_str();
        }
        if (premise.empty()) s += "True";
        return s + " THEN " + conclusion;
    }
};

struct Ruleset {
    vector<Rule> rules; // insertion order, no two equal rules
    vector<string> feature_names;
    vector<string> output_class_names;
    bool regression = false;

    Ruleset() = default;
    Ruleset(vector<string> feature_names_, vector<string> output_class_names_, bool regression_ = false)
        : feature_names(std::move(feature_names_)),
          output_class_names(std::move(output_class_names_)),
          regression(regression_) {}

    size_t size() const { return rules.size(); }
    bool empty() const { return rules.empty(); }

    // returns false (and leaves the ruleset alone) if an equal rule is already in here
    bool add_rule(Rule r) {
        if (find(rules.begin(), rules.end(), r) != rules.end()) return false;
        rules.push_back(std::move(r));
        return true;
    }

    // same metadata, no rules
    Ruleset empty_copy() const {
        return Ruleset(feature_names, output_class_names, regression);
    }

    bool is_single_clause() const {
        for (const auto& r : rules) {
            if (r.premise.size() > 1) return false;
        }
        return true;
    }

    // every multi-clause rule becomes one rule per clause, all sharing its conclusion
    Ruleset with_expanded_clauses() const {
        Ruleset out = empty_copy();
        for (const auto& r : rules) {
            if (r.premise.size() <= 1) {
                out.add_rule(r);
                continue;
            }
            for (const auto& c : r.premise) {
                out.add_rule(Rule({c}, r.conclusion));
            }
        }
        return out;
    }
};

enum class FeatureType { REAL, INTEGER, CATEGORICAL };

class DatasetDescriptor {
public:
    struct OneHot {
        string feature;
        string value;
    };

    void add_feature(const string& name, FeatureType type) { features[name] = type; }

    // `column` is the binary variable rules refer to, standing for `feature == value`
    void add_one_hot(const string& column, const string& feature, const string& value) {
        one_hot[column] = OneHot{feature, value};
        if (!features.count(feature)) features[feature] = FeatureType::CATEGORICAL;
    }

    bool has_feature(const string& name) const { return features.count(name) != 0; }

    FeatureType feature_type(const string& name) const {
        auto it = features.find(name);
        if (it == features.end()) {
            throw out_of_range("Unknown feature '" + name + "' in dataset descriptor");
        }
        return it->second;
    }

    string describe(const Term& t) const {
        if (auto it = one_hot.find(t.variable); it != one_hot.end()) {
            const OneHot& oh = it->second;
            const bool on  = t.holds(1.0);
            const bool off = t.holds(0.0);
            if (on == off) return t.to_str(); // always or never true on a 0/1 column
            return "(" + oh.feature + (on ? " = " : " != ") + oh.value + ")";
        }
        if (auto it = features.find(t.variable); it != features.end() && it->second == FeatureType::INTEGER) {
            return describe_integer(t);
        }
        return t.to_str();
    }

private:
    map<string, FeatureType> features;
    map<string, OneHot> one_hot;

    // snap to the integer boundary the term actually admits
    static string describe_integer(const Term& t) {
        const double v = t.threshold;
        // past 2^53 doubles stop being exact integers and the casts below may overflow
        if (!isfinite(v) || fabs(v) >= 9007199254740992.0) return t.to_str();
        long long bound = 0;
        const char* sym = op_symbol(t.op);
        switch (t.op) {
            case Op::GT:  bound = (long long)floor(v) + 1; sym = ">="; break;
            case Op::GEQ: bound = (long long)ceil(v);      sym = ">="; break;
            case Op::LT:  bound = (long long)ceil(v) - 1;  sym = "<="; break;
            case Op::LEQ: bound = (long long)floor(v);     sym = "<="; break;
            case Op::EQ:
            case Op::NEQ:
                if (v != floor(v)) return t.to_str();
                bound = (long long)v;
                break;
        }
        return "(" + t.variable + " " + sym + " " + to_string(bound) + ")";
    }
};

inline string Term::to_cat_str(const DatasetDescriptor& dataset) const {
    return dataset.describe(*this);
}
