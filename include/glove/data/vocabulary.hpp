#pragma once
#include <string>
#include <vector>
#include <unordered_map>

#include "glove/misc/log.hpp"

using namespace std;

namespace glove {

static const int UNKNOWN_TERM = -1;

// Dense term <-> index mapping. Indices follow the order given to build().
class Vocabulary
{
public:
    Vocabulary();

    bool build(const vector<string>& terms);
    int lookup(const string& term) const;
    const string& term(int index) const { return terms_[index]; }
    int size() const { return (int)terms_.size(); }
    const string& last_error() const { return error_; }

    std::shared_ptr<spdlog::logger> logger_;

private:
    vector<string> terms_;
    unordered_map<string, int> index_;
    string error_;
};

}
