#pragma once
#include <string>
#include <vector>

#include "json11.hpp"
#include "glove/misc/log.hpp"
#include "glove/data/vocabulary.hpp"
#include "glove/data/token_stream.hpp"
#include "glove/data/cooccurrence_store.hpp"

using namespace std;
using namespace json11;

namespace glove {

enum class WindowContext { SYMMETRIC, LEFT, RIGHT };

// Sliding-window co-occurrence counter. It is the only writer of the store
// it is bound to; finish() hands the store over read-only.
//
// For a known center token at position p and a known token o positions to
// its left (1 <= o <= window), the pair receives weights[o - 1], which is
// 1 / o unless overridden. SYMMETRIC credits (t_p, t_{p-o}) and its mirror,
// LEFT only (t_p, t_{p-o}) and RIGHT only (t_{p-o}, t_p). Unknown tokens
// still occupy window positions.
class CooccurrenceBuilder
{
public:
    CooccurrenceBuilder(const Vocabulary& vocab, CooccurrenceStore& store);

    bool init(string opt_path);
    bool configure(const Json& opt);

    bool add_document(TokenStream& tokens);
    bool finish();

    int window() const { return window_; }
    WindowContext window_context() const { return context_; }
    int64_t num_tokens() const { return num_tokens_; }
    int64_t num_unknown_tokens() const { return num_unknown_tokens_; }
    const string& last_error() const { return error_; }

    std::shared_ptr<spdlog::logger> logger_;

private:
    bool fail(const string& message);
    bool emit(int center, int context, double weight);

    const Vocabulary& vocab_;
    CooccurrenceStore& store_;
    int window_;
    WindowContext context_;
    vector<double> weights_;
    int64_t num_tokens_, num_unknown_tokens_;
    int num_documents_;
    string error_;
};

}
