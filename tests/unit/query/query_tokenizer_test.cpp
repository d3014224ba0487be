#include <gtest/gtest.h>

#include <deplink/query/query_tokenizer.h>

using namespace deplink::query;

class QueryTokenizerTest : public ::testing::Test {
protected:
    QueryTokenizer tokenizer_;
};

TEST_F(QueryTokenizerTest, BasicStatement) {
    auto tokens = tokenizer_.tokenize("SELECT address FROM functions WHERE line >= 10");
    ASSERT_EQ(tokens.size(), 9u);
    EXPECT_TRUE(tokens[0].isKeyword("select"));
    EXPECT_EQ(tokens[1].type, TokenType::Identifier);
    EXPECT_EQ(tokens[6].type, TokenType::GreaterEqual);
    EXPECT_EQ(tokens[7].type, TokenType::Number);
    EXPECT_EQ(tokens[7].value, "10");
    EXPECT_EQ(tokens.back().type, TokenType::EndOfInput);
}

TEST_F(QueryTokenizerTest, QuotedStringsAndEscapes) {
    auto tokens = tokenizer_.tokenize(R"('it\'s' "double")");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::String);
    EXPECT_EQ(tokens[0].value, "it's");
    EXPECT_EQ(tokens[1].value, "double");
    EXPECT_EQ(tokens[1].position, 8u);
}

TEST_F(QueryTokenizerTest, AddressInsideQuotesIsOneToken) {
    auto tokens = tokenizer_.tokenize("FROM 'proj/src/a.ts#Function:main'");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].value, "proj/src/a.ts#Function:main");
}

TEST_F(QueryTokenizerTest, ComparisonOperators) {
    auto tokens = tokenizer_.tokenize("= == != <> < <= > >=");
    std::vector<TokenType> expected{TokenType::Equal,     TokenType::Equal,
                                    TokenType::NotEqual,  TokenType::NotEqual,
                                    TokenType::Less,      TokenType::LessEqual,
                                    TokenType::Greater,   TokenType::GreaterEqual,
                                    TokenType::EndOfInput};
    ASSERT_EQ(tokens.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(tokens[i].type, expected[i]) << "token " << i;
        if (i + 1 < expected.size())
            EXPECT_TRUE(tokens[i].isComparison());
    }
}

TEST_F(QueryTokenizerTest, NumbersAndIdentifiers) {
    auto tokens = tokenizer_.tokenize("-3 2.5 metadata.visibility imports_file $x");
    EXPECT_EQ(tokens[0].type, TokenType::Number);
    EXPECT_EQ(tokens[0].value, "-3");
    EXPECT_EQ(tokens[1].value, "2.5");
    EXPECT_EQ(tokens[2].type, TokenType::Identifier);
    EXPECT_EQ(tokens[2].value, "metadata.visibility");
    EXPECT_EQ(tokens[3].value, "imports_file");
    EXPECT_EQ(tokens[4].value, "$x");
}

TEST_F(QueryTokenizerTest, GraphQLPunctuation) {
    auto tokens = tokenizer_.tokenize("{ nodes(type: [\"Class\"]) { a: address } }");
    EXPECT_EQ(tokens[0].type, TokenType::LeftBrace);
    EXPECT_EQ(tokens[2].type, TokenType::LeftParen);
    EXPECT_EQ(tokens[4].type, TokenType::Colon);
    EXPECT_EQ(tokens[5].type, TokenType::LeftBracket);
    EXPECT_EQ(tokens[7].type, TokenType::RightBracket);
}

TEST_F(QueryTokenizerTest, StringsAreNeverKeywords) {
    auto tokens = tokenizer_.tokenize("'SELECT'");
    EXPECT_FALSE(tokens[0].isKeyword("SELECT"));
}

TEST_F(QueryTokenizerTest, Errors) {
    EXPECT_THROW(tokenizer_.tokenize("'unterminated"), TokenizerException);
    EXPECT_THROW(tokenizer_.tokenize("a ! b"), TokenizerException);
    try {
        tokenizer_.tokenize("abc @");
        FAIL() << "expected TokenizerException";
    } catch (const TokenizerException& e) {
        EXPECT_EQ(e.getPosition(), 4u);
    }
}
