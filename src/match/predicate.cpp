#include <episode_title/match/predicate.hpp>

#include <algorithm>

namespace episode_title {

namespace {

struct Evaluator {
    const Match& match;

    bool operator()(const AnyMatch&) const { return true; }
    bool operator()(const NameIs& p) const { return match.name == p.name; }
    bool operator()(const NameIn& p) const {
        return std::find(p.names.begin(), p.names.end(), match.name) != p.names.end();
    }
    bool operator()(const HasTag& p) const { return match.has_tag(p.tag); }
    bool operator()(const IsMatch& p) const { return match == p.match; }
    bool operator()(const HasValue&) const { return !match.value.empty(); }
};

}  // namespace

bool evaluate(const Predicate& predicate, const Match& match) {
    return std::visit(Evaluator{match}, predicate);
}

}  // namespace episode_title
