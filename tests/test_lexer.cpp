#include <catch2/catch_all.hpp>
#include "../src/Lexer/Lexer.hpp"
#include "../src/Lexer/TokenCursor.hpp"
#include "../src/Runtime/TWError.hpp"

using namespace timewarp;

namespace {

LexerSpec basicLikeSpec() {
    LexerSpec spec;
    spec.keywords = {"PRINT", "LET"};
    spec.caseInsensitive = true;
    spec.operators = {"<", "<=", "=", "+", ":"};
    spec.lineComments = {"'"};
    spec.commentWords = {"REM"};
    spec.identifierSuffixes = "$";
    return spec;
}

} // namespace

TEST_CASE("Keywords fold case and identifiers keep suffixes", "[lexer]") {
    Lexer lexer(basicLikeSpec());
    auto tokens = lexer.tokenize("print name$ + 1");
    REQUIRE(tokens.size() == 5);
    REQUIRE(tokens[0].kind == TokenKind::Keyword);
    REQUIRE(tokens[0].text == "PRINT");
    REQUIRE(tokens[1].kind == TokenKind::Identifier);
    REQUIRE(tokens[1].text == "NAME$");
    REQUIRE(tokens[1].raw == "name$");
    REQUIRE(tokens[2].kind == TokenKind::Symbol);
    REQUIRE(tokens[3].kind == TokenKind::Number);
    REQUIRE(tokens[3].number == 1.0);
    REQUIRE(tokens[4].kind == TokenKind::EndOfInput);
}

TEST_CASE("Leading-point numbers are opt-in", "[lexer]") {
    LexerSpec spec = basicLikeSpec();
    spec.leadingPointNumbers = true;
    auto tokens = Lexer(spec).tokenize("LET A = .5");
    REQUIRE(tokens[3].kind == TokenKind::Number);
    REQUIRE(tokens[3].number == 0.5);
    REQUIRE_THROWS_AS(Lexer(basicLikeSpec()).tokenize("LET A = .5"), ParseError);
}

TEST_CASE("Longest operator wins", "[lexer]") {
    Lexer lexer(basicLikeSpec());
    auto tokens = lexer.tokenize("A<=B<C");
    REQUIRE(tokens[1].text == "<=");
    REQUIRE(tokens[3].text == "<");
}

TEST_CASE("Doubled quotes escape inside strings", "[lexer]") {
    Lexer lexer(basicLikeSpec());
    auto tokens = lexer.tokenize("PRINT \"say \"\"hi\"\"\"");
    REQUIRE(tokens[1].kind == TokenKind::String);
    REQUIRE(tokens[1].text == "say \"hi\"");
}

TEST_CASE("Comments are skipped", "[lexer]") {
    Lexer lexer(basicLikeSpec());
    auto tokens = lexer.tokenize("LET A = 1 ' set A\nREM nothing here\nPRINT A");
    std::vector<std::string> texts;
    for (const auto& t : tokens) texts.push_back(t.text);
    REQUIRE(texts == std::vector<std::string>{"LET", "A", "=", "1", "PRINT", "A", ""});
    // REMARK is an identifier, not a comment word.
    REQUIRE(lexer.tokenize("REMARK")[0].kind == TokenKind::Identifier);
}

TEST_CASE("Tokens record line and column", "[lexer]") {
    Lexer lexer(basicLikeSpec());
    auto tokens = lexer.tokenize("PRINT 1\n  PRINT 2");
    REQUIRE(tokens[2].line == 2);
    REQUIRE(tokens[2].column == 3);
    REQUIRE(tokens[2].spaceBefore);
}

TEST_CASE("Lexical errors are ParseErrors with a location", "[lexer]") {
    Lexer lexer(basicLikeSpec());
    try {
        lexer.tokenize("PRINT\n  \"open");
        FAIL("expected a ParseError");
    } catch (const ParseError& e) {
        REQUIRE(e.getLine() == 2);
        REQUIRE(e.getColumn() == 3);
    }
    REQUIRE_THROWS_AS(lexer.tokenize("PRINT @"), ParseError);
}

TEST_CASE("Prolog conventions: variables, quoted atoms, clause-ending dot", "[lexer]") {
    LexerSpec spec;
    spec.upperCaseVariables = true;
    spec.operators = {"(", ")", ",", "."};
    spec.atomQuotes = "'";
    Lexer lexer(spec);
    auto tokens = lexer.tokenize("likes(X, _y, 'Mary Ann', 5).");
    REQUIRE(tokens[0].kind == TokenKind::Identifier);
    REQUIRE(tokens[2].kind == TokenKind::Variable);
    REQUIRE(tokens[2].text == "X");
    REQUIRE(tokens[4].kind == TokenKind::Variable);
    REQUIRE(tokens[6].kind == TokenKind::QuotedAtom);
    REQUIRE(tokens[6].text == "Mary Ann");
    REQUIRE(tokens[8].kind == TokenKind::Number);
    REQUIRE(tokens[8].text == "5");
    REQUIRE(tokens[10].text == ".");
}

TEST_CASE("TokenCursor matching and errors", "[lexer]") {
    Lexer lexer(basicLikeSpec());
    TokenCursor c(lexer.tokenize("LET X = 1"));
    REQUIRE(c.checkKeyword("LET"));
    REQUIRE(c.matchKeyword("LET"));
    REQUIRE(c.expect(TokenKind::Identifier, "variable").text == "X");
    REQUIRE(c.checkSymbol("="));
    REQUIRE_FALSE(c.matchSymbol("+"));
    c.expectSymbol("=");
    REQUIRE(c.peek().kind == TokenKind::Number);
    c.advance();
    REQUIRE(c.atEnd());
    REQUIRE_THROWS_AS(c.expectSymbol(":"), ParseError);
}
