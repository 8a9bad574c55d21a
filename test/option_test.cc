#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>

#include "glove/misc/option.hpp"
#include "glove/algo_impl/glove/glove.hpp"

using namespace glove;
using json11::Json;

class OptionTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "glove_option_test.json";
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void write(const std::string& content) {
        std::ofstream out(path_.c_str());
        out << content;
    }

    std::string path_;
};

TEST_F(OptionTest, MergeFillsDefaults) {
    Json out;
    std::string err;
    Json::object defaults = {{"x_max", 10.0}, {"shuffle", true}};
    ASSERT_TRUE(merge_options(Json::object{{"x_max", 100.0}}, defaults, out, err));
    EXPECT_DOUBLE_EQ(out["x_max"].number_value(), 100.0);
    EXPECT_TRUE(out["shuffle"].bool_value());
}

TEST_F(OptionTest, MergeRejectsWrongType) {
    Json out;
    std::string err;
    Json::object defaults = {{"x_max", 10.0}};
    EXPECT_FALSE(merge_options(Json::object{{"x_max", "ten"}}, defaults, out, err));
    EXPECT_NE(err.find("x_max"), std::string::npos);
}

TEST_F(OptionTest, MergeRejectsNonObject) {
    Json out;
    std::string err;
    EXPECT_FALSE(merge_options(Json(3), Json::object{}, out, err));
}

TEST_F(OptionTest, ReadsFile) {
    write("{\"word_vectors_size\": 8, \"x_max\": 50}");
    Json j;
    std::string err;
    ASSERT_TRUE(read_option_file(path_, j, err));
    EXPECT_EQ(j["word_vectors_size"].int_value(), 8);
}

TEST_F(OptionTest, MissingFileFails) {
    Json j;
    std::string err;
    EXPECT_FALSE(read_option_file(path_ + ".missing", j, err));
    EXPECT_FALSE(err.empty());
}

TEST_F(OptionTest, MalformedFileFails) {
    write("{\"word_vectors_size\": ");
    CGloVe glove;
    EXPECT_FALSE(glove.init(path_));
    EXPECT_NE(glove.last_error().find("parse"), std::string::npos);
}

TEST_F(OptionTest, SessionInitFromFile) {
    write("{\"word_vectors_size\": 4, \"learning_rate\": 0.05, \"skip_grams_window\": 3}");
    CGloVe glove;
    ASSERT_TRUE(glove.init(path_));
    EXPECT_EQ(glove.dim(), 4);
}
