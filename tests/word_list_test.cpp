#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "word_list.h"

using namespace std;

TEST(WordListTest, FormatsEmptyListAsBrackets) {
    EXPECT_EQ(FormatWords({}), "[]"s);
}

TEST(WordListTest, FormatsWordsCommaSeparated) {
    EXPECT_EQ(FormatWords({"Hello"s, "World"s, "From"s, "Kotlin"s}), "[Hello, World, From, Kotlin]"s);
}

TEST(WordListTest, FormatsSingleWordWithoutSeparator) {
    EXPECT_EQ(FormatWords({"Alone"s}), "[Alone]"s);
}

TEST(WordListTest, PrintWordsWritesLine) {
    ostringstream output;
    PrintWords({"A"s, "B"s}, output);
    EXPECT_EQ(output.str(), "[A, B]\n"s);
}

TEST(WordListTest, PrintWordsDefaultsToStdout) {
    testing::internal::CaptureStdout();
    PrintWords({"A"s, "B"s});
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "[A, B]\n"s);
}
