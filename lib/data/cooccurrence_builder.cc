#include <cmath>
#include <algorithm>

#include "glove/misc/option.hpp"
#include "glove/data/cooccurrence_builder.hpp"

namespace glove {

static const int DEFAULT_WINDOW = 5;

static vector<double> harmonic_weights(int window)
{
    vector<double> weights(window);
    for (int o=1; o <= window; ++o)
        weights[o - 1] = 1.0 / o;
    return weights;
}

CooccurrenceBuilder::CooccurrenceBuilder(const Vocabulary& vocab, CooccurrenceStore& store) :
    vocab_(vocab),
    store_(store),
    window_(DEFAULT_WINDOW),
    context_(WindowContext::SYMMETRIC),
    weights_(harmonic_weights(DEFAULT_WINDOW)),
    num_tokens_(0),
    num_unknown_tokens_(0),
    num_documents_(0)
{
    logger_ = GloveLogger().get_logger();
}

bool CooccurrenceBuilder::fail(const string& message)
{
    error_ = message;
    CRITICAL("{}", message);
    return false;
}

bool CooccurrenceBuilder::init(string opt_path)
{
    Json opt;
    string err;
    if (not read_option_file(opt_path, opt, err))
        return fail(err);
    return configure(opt);
}

bool CooccurrenceBuilder::configure(const Json& opt)
{
    const Json::object defaults = {
        {"skip_grams_window", DEFAULT_WINDOW},
        {"skip_grams_window_context", "symmetric"},
        {"weights", Json()},
    };
    Json merged;
    string err;
    if (not merge_options(opt, defaults, merged, err))
        return fail(err);

    double window = merged["skip_grams_window"].number_value();
    if (window < 1 or window != std::floor(window))
        return fail(fmt::format("skip_grams_window must be a positive integer, got {}", window));

    WindowContext context;
    const string& mode = merged["skip_grams_window_context"].string_value();
    if (mode == "symmetric") context = WindowContext::SYMMETRIC;
    else if (mode == "left") context = WindowContext::LEFT;
    else if (mode == "right") context = WindowContext::RIGHT;
    else
        return fail("skip_grams_window_context must be one of symmetric, left, right; got " + mode);

    vector<double> weights;
    if (merged["weights"].is_null()) {
        weights = harmonic_weights((int)window);
    } else {
        if (not merged["weights"].is_array() or (int)merged["weights"].array_items().size() != (int)window)
            return fail(fmt::format("weights must be an array of skip_grams_window({}) numbers", (int)window));
        for (const auto& w : merged["weights"].array_items()) {
            if (not w.is_number() or not (w.number_value() > 0.0))
                return fail("weights must be positive numbers");
            weights.push_back(w.number_value());
        }
    }

    window_ = (int)window;
    context_ = context;
    weights_.swap(weights);
    DEBUG("Window({}) Context({})", window_, mode);
    return true;
}

bool CooccurrenceBuilder::emit(int center, int context, double weight)
{
    switch (context_) {
        case WindowContext::SYMMETRIC:
            return store_.accumulate(center, context, weight)
                and store_.accumulate(context, center, weight);
        case WindowContext::LEFT:
            return store_.accumulate(center, context, weight);
        case WindowContext::RIGHT:
            return store_.accumulate(context, center, weight);
    }
    return false;
}

bool CooccurrenceBuilder::add_document(TokenStream& tokens)
{
    if (store_.is_finalized())
        return fail("Co-occurrence store is finalized; no more documents accepted");
    if (vocab_.size() != store_.num_terms())
        return fail(fmt::format("Vocabulary size({}) does not match co-occurrence store size({})",
                                vocab_.size(), store_.num_terms()));

    // ring buffer over the last window_ positions; UNKNOWN_TERM marks gaps
    vector<int> recent(window_, UNKNOWN_TERM);
    int64_t pos = 0;
    string token;
    tokens.reset();
    while (tokens.next(token)) {
        int idx = vocab_.lookup(token);
        if (idx == UNKNOWN_TERM) {
            ++num_unknown_tokens_;
        } else {
            if (idx < 0 or idx >= store_.num_terms())
                return fail(fmt::format("Vocabulary returned index {} for '{}' outside [0, {})",
                                        idx, token, store_.num_terms()));
            int reach = (int)std::min<int64_t>(window_, pos);
            for (int o=1; o <= reach; ++o) {
                int prev = recent[(pos - o) % window_];
                if (prev == UNKNOWN_TERM or prev == idx)
                    continue;
                if (not emit(idx, prev, weights_[o - 1]))
                    return fail("Co-occurrence build aborted: " + store_.last_error());
            }
        }
        recent[pos % window_] = idx;
        ++pos;
    }
    num_tokens_ += pos;
    ++num_documents_;
    TRACE("Document({}) added, {} tokens", num_documents_, pos);
    return true;
}

bool CooccurrenceBuilder::finish()
{
    if (not store_.finalize())
        return fail("Failed to finalize co-occurrence store: " + store_.last_error());
    INFO("Documents({}) Tokens({}) Unknown({}) Pairs({})",
         num_documents_, num_tokens_, num_unknown_tokens_, store_.size());
    return true;
}

}
