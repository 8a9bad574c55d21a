#pragma once
#include <string>
#include <vector>
#include <utility>

namespace glove {

// A finite, restartable sequence of tokens.
class TokenStream
{
public:
    virtual ~TokenStream() {}

    // Rewinds to the first token.
    virtual void reset() = 0;

    // Stores the next token in `token`; returns false once exhausted.
    virtual bool next(std::string& token) = 0;
};


class VectorTokenStream : public TokenStream
{
public:
    explicit VectorTokenStream(std::vector<std::string> tokens) :
        tokens_(std::move(tokens)), pos_(0) {}

    void reset() { pos_ = 0; }

    bool next(std::string& token)
    {
        if (pos_ >= tokens_.size())
            return false;
        token = tokens_[pos_++];
        return true;
    }

private:
    std::vector<std::string> tokens_;
    size_t pos_;
};

}
