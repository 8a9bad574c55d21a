#include "glove/data/vocabulary.hpp"

namespace glove {

Vocabulary::Vocabulary()
{
    logger_ = GloveLogger().get_logger();
}

bool Vocabulary::build(const vector<string>& terms)
{
    terms_.clear();
    index_.clear();
    if (terms.empty()) {
        error_ = "Vocabulary is empty";
        CRITICAL("{}", error_);
        return false;
    }

    index_.reserve(terms.size());
    for (const auto& t : terms) {
        int idx = (int)terms_.size();
        if (not index_.emplace(t, idx).second) {
            error_ = "Duplicated term in vocabulary: " + t;
            CRITICAL("{}", error_);
            terms_.clear();
            index_.clear();
            return false;
        }
        terms_.push_back(t);
    }
    DEBUG("Vocabulary({} terms) built", terms_.size());
    return true;
}

int Vocabulary::lookup(const string& term) const
{
    auto it = index_.find(term);
    if (it == index_.end())
        return UNKNOWN_TERM;
    return it->second;
}

}
