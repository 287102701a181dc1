#pragma once

#include "ast.hpp"
#include "../lexer/lexer.hpp"
#include "../lexer/token.hpp"
#include "../lib/errors/error.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rill
{

    struct ParserSettings
    {
        bool allowIfExpression = true;
        bool allowStatementBlock = true;
        bool allowClosures = true;
        size_t maxExprDepth = 128; // 0 = unlimited
    };

    class Parser
    {
    public:
        Parser(std::vector<TokenWithPos> tokens, const std::map<std::string, uint8_t> *customOperators = nullptr,
               ParserSettings settings = {});

        /// A whole script: statements plus function definitions
        AST parse();

        /// A single expression; anything after it is an error
        AST parseSingleExpression();

    private:
        // Per function body: locals in scope and the variables it reads from
        // outside (in first-use order).
        struct FnParseState
        {
            std::vector<std::string> locals;
            std::vector<std::string> externals;
            bool allowThis = false;
            size_t loopDepth = 0;

            void access(const std::string &name);
        };

        std::vector<TokenWithPos> tokens_;
        size_t pos_ = 0;
        const std::map<std::string, uint8_t> *customOperators_;
        ParserSettings settings_;
        std::shared_ptr<Module> lib_;
        std::vector<FnParseState> states_;
        size_t depth_ = 0;

        // Token navigation
        const Token &current() const;
        Position currentPos() const;
        const Token &peekToken(size_t offset = 1) const;
        bool check(TokenType type) const;
        bool isAtEnd() const;
        TokenWithPos advance();
        void expect(TokenType type, ParseErrorType errorType, const std::string &message);

        [[noreturn]] void unexpected() const;

        FnParseState &state() { return states_.back(); }

        // Statements
        StmtPtr parseStatement(bool global);
        bool parseStatementEnd(const Stmt *stmt, TokenType closer);
        StmtPtr parseLet(bool isConst);
        StmtPtr parseImport();
        StmtPtr parseExport();
        StmtPtr parseWhile();
        StmtPtr parseLoop();
        StmtPtr parseFor();
        StmtPtr parseExprStatement();
        void parseFnDef(FnAccess access);
        std::unique_ptr<BlockExpr> parseBlock();

        // Expressions
        ExprPtr parseExpression();
        ExprPtr parseBinary(uint8_t parentPrecedence, ExprPtr lhs);
        ExprPtr parseUnary();
        ExprPtr parsePrimary();
        ExprPtr parsePostfix(ExprPtr expr);
        ExprPtr parseIf();
        ExprPtr parseClosure();
        ExprPtr parseIdentifier();
        ExprPtr parseArrayLiteral();
        ExprPtr parseMapLiteral();
        std::vector<ExprPtr> parseArgList(const std::string &fnName);
    };

} // namespace rill
