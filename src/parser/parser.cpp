#include "parser.hpp"
#include "../interpreter/fn_ptr.hpp"
#include "../module/module.hpp"
#include <algorithm>
#include <atomic>
#include <limits>
#include <set>

namespace rill
{

    namespace
    {
        std::atomic<uint64_t> nextClosureId{0};

        /// Statements that end in a block need no ';' after them
        bool isSelfTerminated(const Stmt *stmt)
        {
            if (!stmt)
                return true;
            if (auto *es = dynamic_cast<const ExprStmt *>(stmt))
                return dynamic_cast<const BlockExpr *>(es->expr.get()) ||
                       dynamic_cast<const IfExpr *>(es->expr.get());
            return dynamic_cast<const WhileStmt *>(stmt) || dynamic_cast<const ForStmt *>(stmt);
        }

        ParseError duplicatedParam(const std::string &fnName, const std::string &param, Position pos)
        {
            return ParseError(ParseErrorType::FN_DUPLICATED_PARAM,
                              "Duplicated parameter '" + param + "' for function '" + fnName + "'", pos);
        }

        std::string assignOperator(TokenType type)
        {
            switch (type)
            {
            case TokenType::EQUALS:
                return "";
            case TokenType::PLUS_ASSIGN:
            case TokenType::MINUS_ASSIGN:
            case TokenType::MULTIPLY_ASSIGN:
            case TokenType::DIVIDE_ASSIGN:
            case TokenType::LEFT_SHIFT_ASSIGN:
            case TokenType::RIGHT_SHIFT_ASSIGN:
            case TokenType::AND_ASSIGN:
            case TokenType::OR_ASSIGN:
            case TokenType::XOR_ASSIGN:
            case TokenType::MODULO_ASSIGN:
            case TokenType::POWER_OF_ASSIGN:
                return syntax(type);
            default:
                return "=?";
            }
        }

        bool isAssignment(TokenType type)
        {
            return assignOperator(type) != "=?";
        }

        /// Nesting guard for the recursive descent
        class DepthGuard
        {
        public:
            DepthGuard(size_t &depth, size_t max, Position pos) : depth_(depth)
            {
                if (max > 0 && depth_ >= max)
                    throw ParseError(ParseErrorType::EXPR_TOO_DEEP, "Expression exceeds maximum complexity", pos);
                depth_++;
            }
            ~DepthGuard() { depth_--; }

        private:
            size_t &depth_;
        };
    } // namespace

    // ============================================================
    // Constructor
    // ============================================================

    Parser::Parser(std::vector<TokenWithPos> tokens, const std::map<std::string, uint8_t> *customOperators,
                   ParserSettings settings)
        : tokens_(std::move(tokens)), customOperators_(customOperators), settings_(settings),
          lib_(std::make_shared<Module>())
    {
        if (tokens_.empty() || !tokens_.back().first.isEof())
        {
            Position end = tokens_.empty() ? Position() : tokens_.back().second;
            tokens_.emplace_back(Token(TokenType::EOF_TOKEN), end);
        }
    }

    void Parser::FnParseState::access(const std::string &name)
    {
        if (std::find(locals.begin(), locals.end(), name) != locals.end())
            return;
        if (std::find(externals.begin(), externals.end(), name) != externals.end())
            return;
        externals.push_back(name);
    }

    // ============================================================
    // Token navigation
    // ============================================================

    const Token &Parser::current() const
    {
        return tokens_[pos_].first;
    }

    Position Parser::currentPos() const
    {
        return tokens_[pos_].second;
    }

    const Token &Parser::peekToken(size_t offset) const
    {
        size_t idx = pos_ + offset;
        if (idx >= tokens_.size())
            return tokens_.back().first;
        return tokens_[idx].first;
    }

    bool Parser::check(TokenType type) const
    {
        return current().type == type;
    }

    bool Parser::isAtEnd() const
    {
        return current().isEof();
    }

    TokenWithPos Parser::advance()
    {
        TokenWithPos tok = tokens_[pos_];
        if (!isAtEnd())
            pos_++;
        return tok;
    }

    void Parser::expect(TokenType type, ParseErrorType errorType, const std::string &message)
    {
        if (check(type))
        {
            advance();
            return;
        }
        if (check(TokenType::LEX_ERROR))
            unexpected();
        throw ParseError(errorType, message, currentPos());
    }

    void Parser::unexpected() const
    {
        const Token &tok = current();
        Position pos = currentPos();

        switch (tok.type)
        {
        case TokenType::LEX_ERROR:
            throw ParseError(ParseErrorType::BAD_INPUT, tok.error ? tok.error->message() : tok.text, pos);
        case TokenType::EOF_TOKEN:
            throw ParseError(ParseErrorType::UNEXPECTED_EOF, "Script is incomplete", pos);
        case TokenType::RESERVED:
            if (tok.text == KEYWORD_THIS)
                throw ParseError(ParseErrorType::BAD_INPUT, "'this' can only be used in functions", pos);
            if (isValidIdentifier(tok.text))
                throw ParseError(ParseErrorType::BAD_INPUT, "'" + tok.text + "' is a reserved keyword", pos);
            throw ParseError(ParseErrorType::BAD_INPUT, "'" + tok.text + "' is a reserved symbol", pos);
        default:
            throw ParseError(ParseErrorType::BAD_INPUT, "Unexpected '" + tok.syntax() + "'", pos);
        }
    }

    // ============================================================
    // Entry points
    // ============================================================

    AST Parser::parse()
    {
        states_.clear();
        states_.emplace_back();

        std::vector<std::shared_ptr<const Stmt>> statements;
        while (!isAtEnd())
        {
            StmtPtr stmt = parseStatement(true);
            bool done = parseStatementEnd(stmt.get(), TokenType::EOF_TOKEN);
            if (stmt)
                statements.push_back(std::move(stmt));
            if (done)
                break;
        }
        return AST(std::move(statements), lib_);
    }

    AST Parser::parseSingleExpression()
    {
        states_.clear();
        states_.emplace_back();

        Position pos = currentPos();
        ExprPtr expr = parseExpression();
        if (!isAtEnd())
            unexpected();

        std::vector<std::shared_ptr<const Stmt>> statements;
        statements.push_back(std::make_shared<ExprStmt>(std::move(expr), pos));
        return AST(std::move(statements), lib_);
    }

    // ============================================================
    // Statements
    // ============================================================

    // After a statement: true when the enclosing list is finished
    bool Parser::parseStatementEnd(const Stmt *stmt, TokenType closer)
    {
        if (check(closer) || isAtEnd())
            return true;
        if (check(TokenType::SEMICOLON))
        {
            advance();
            return check(closer) || isAtEnd();
        }
        if (isSelfTerminated(stmt))
            return false;
        if (check(TokenType::LEX_ERROR))
            unexpected();
        throw ParseError(ParseErrorType::MISSING_TOKEN, "Expecting ';' to terminate this statement", currentPos());
    }

    StmtPtr Parser::parseStatement(bool global)
    {
        Position pos = currentPos();

        switch (current().type)
        {
        case TokenType::SEMICOLON:
            // Empty statement
            return nullptr;

        case TokenType::LEFT_BRACE:
            return std::make_unique<ExprStmt>(parseBlock(), pos);

        case TokenType::IF:
            return std::make_unique<ExprStmt>(parseIf(), pos);

        case TokenType::WHILE:
            return parseWhile();

        case TokenType::LOOP:
            return parseLoop();

        case TokenType::FOR:
            return parseFor();

        case TokenType::BREAK:
        case TokenType::CONTINUE:
        {
            bool isBreak = check(TokenType::BREAK);
            if (state().loopDepth == 0)
                throw ParseError(ParseErrorType::LOOP_BREAK,
                                 std::string("'") + (isBreak ? "break" : "continue") +
                                     "' can only be used inside a loop",
                                 pos);
            advance();
            if (isBreak)
                return std::make_unique<BreakStmt>(pos);
            return std::make_unique<ContinueStmt>(pos);
        }

        case TokenType::RETURN:
        case TokenType::THROW:
        {
            bool isReturn = check(TokenType::RETURN);
            advance();
            ExprPtr value;
            if (!check(TokenType::SEMICOLON) && !check(TokenType::RIGHT_BRACE) && !isAtEnd())
                value = parseExpression();
            if (isReturn)
                return std::make_unique<ReturnStmt>(std::move(value), pos);
            return std::make_unique<ThrowStmt>(std::move(value), pos);
        }

        case TokenType::LET:
        case TokenType::CONST:
            return parseLet(check(TokenType::CONST));

        case TokenType::IMPORT:
            return parseImport();

        case TokenType::EXPORT:
            if (!global)
                throw ParseError(ParseErrorType::WRONG_EXPORT, "Export statement can only appear at global level",
                                 pos);
            return parseExport();

        case TokenType::FN:
        case TokenType::PRIVATE:
        {
            if (!global)
                throw ParseError(ParseErrorType::WRONG_FN_DEFINITION,
                                 "Function definitions must be at global level and cannot be inside a block or "
                                 "another function",
                                 pos);
            FnAccess access = FnAccess::PUBLIC;
            if (check(TokenType::PRIVATE))
            {
                advance();
                if (!check(TokenType::FN))
                    throw ParseError(ParseErrorType::MISSING_TOKEN, "Expecting 'fn' after 'private'",
                                     currentPos());
                access = FnAccess::PRIVATE;
            }
            parseFnDef(access);
            return nullptr;
        }

        default:
            return parseExprStatement();
        }
    }

    StmtPtr Parser::parseExprStatement()
    {
        Position pos = currentPos();
        ExprPtr expr = parseExpression();

        if (!isAssignment(current().type))
            return std::make_unique<ExprStmt>(std::move(expr), pos);

        Position opPos = currentPos();
        std::string op = assignOperator(current().type);

        bool validTarget = false;
        if (auto *var = dynamic_cast<const Variable *>(expr.get()))
            validTarget = var->namespaces.empty();
        else
            validTarget = dynamic_cast<const ThisExpr *>(expr.get()) || dynamic_cast<const IndexExpr *>(expr.get()) ||
                          dynamic_cast<const PropertyExpr *>(expr.get());
        if (!validTarget)
            throw ParseError(ParseErrorType::ASSIGNMENT_TO_INVALID_LHS, "Cannot assign to this expression", opPos);

        advance();
        ExprPtr value = parseExpression();
        return std::make_unique<AssignStmt>(std::move(op), std::move(expr), std::move(value), opPos);
    }

    StmtPtr Parser::parseLet(bool isConst)
    {
        Position pos = advance().second;

        if (!check(TokenType::IDENTIFIER))
        {
            if (check(TokenType::LEX_ERROR))
                unexpected();
            throw ParseError(ParseErrorType::VARIABLE_EXPECTED, "Expecting name of a variable", currentPos());
        }
        std::string name = advance().first.text;

        ExprPtr init;
        if (check(TokenType::EQUALS))
        {
            advance();
            init = parseExpression();
        }

        state().locals.push_back(name);
        return std::make_unique<LetStmt>(std::move(name), std::move(init), isConst, pos);
    }

    StmtPtr Parser::parseImport()
    {
        Position pos = advance().second;
        ExprPtr path = parseExpression();

        std::optional<std::string> alias;
        if (check(TokenType::AS))
        {
            advance();
            if (!check(TokenType::IDENTIFIER))
                throw ParseError(ParseErrorType::VARIABLE_EXPECTED, "Expecting name of the imported module",
                                 currentPos());
            alias = advance().first.text;
        }
        return std::make_unique<ImportStmt>(std::move(path), std::move(alias), pos);
    }

    StmtPtr Parser::parseExport()
    {
        Position pos = advance().second;
        std::vector<std::pair<std::string, std::optional<std::string>>> names;
        std::set<std::string> seen;

        while (true)
        {
            if (!check(TokenType::IDENTIFIER))
                throw ParseError(ParseErrorType::VARIABLE_EXPECTED, "Expecting name of a variable to export",
                                 currentPos());
            Position namePos = currentPos();
            std::string name = advance().first.text;
            state().access(name);

            std::optional<std::string> alias;
            if (check(TokenType::AS))
            {
                advance();
                if (!check(TokenType::IDENTIFIER))
                    throw ParseError(ParseErrorType::VARIABLE_EXPECTED, "Expecting alias of the exported variable",
                                     currentPos());
                alias = advance().first.text;
            }

            const std::string &exported = alias ? *alias : name;
            if (!seen.insert(exported).second)
                throw ParseError(ParseErrorType::DUPLICATED_EXPORT,
                                 "Duplicated variable name '" + exported + "' in export statement", namePos);
            names.emplace_back(std::move(name), std::move(alias));

            if (!check(TokenType::COMMA))
                break;
            advance();
        }
        return std::make_unique<ExportStmt>(std::move(names), pos);
    }

    StmtPtr Parser::parseWhile()
    {
        Position pos = advance().second;
        ExprPtr condition = parseExpression();

        state().loopDepth++;
        auto body = parseBlock();
        state().loopDepth--;
        return std::make_unique<WhileStmt>(std::move(condition), std::move(body), pos);
    }

    StmtPtr Parser::parseLoop()
    {
        Position pos = advance().second;

        state().loopDepth++;
        auto body = parseBlock();
        state().loopDepth--;
        return std::make_unique<WhileStmt>(nullptr, std::move(body), pos);
    }

    StmtPtr Parser::parseFor()
    {
        Position pos = advance().second;

        if (!check(TokenType::IDENTIFIER))
            throw ParseError(ParseErrorType::VARIABLE_EXPECTED, "Expecting name of the loop variable", currentPos());
        std::string varName = advance().first.text;

        expect(TokenType::IN, ParseErrorType::MISSING_TOKEN, "Expecting 'in' after the loop variable");
        ExprPtr iterable = parseExpression();

        size_t mark = state().locals.size();
        state().locals.push_back(varName);
        state().loopDepth++;
        auto body = parseBlock();
        state().loopDepth--;
        state().locals.resize(mark);

        return std::make_unique<ForStmt>(std::move(varName), std::move(iterable), std::move(body), pos);
    }

    void Parser::parseFnDef(FnAccess access)
    {
        Position pos = advance().second; // 'fn'

        // 1. Name
        std::string name;
        const Token &nameTok = current();
        if (nameTok.type == TokenType::IDENTIFIER || nameTok.isCustom() ||
            (nameTok.isReserved() && canOverrideKeyword(nameTok.text)))
            name = advance().first.text;
        else
            throw ParseError(ParseErrorType::FN_MISSING_NAME, "Expecting name in function declaration", currentPos());

        // 2. Parameters
        if (!check(TokenType::LEFT_PAREN))
            throw ParseError(ParseErrorType::FN_MISSING_PARAMS, "Expecting parameters for function '" + name + "'",
                             currentPos());
        advance();

        std::vector<std::string> params;
        while (!check(TokenType::RIGHT_PAREN))
        {
            if (!check(TokenType::IDENTIFIER))
            {
                if (check(TokenType::LEX_ERROR))
                    unexpected();
                throw ParseError(ParseErrorType::VARIABLE_EXPECTED,
                                 "Expecting a parameter name for function '" + name + "'", currentPos());
            }
            Position paramPos = currentPos();
            std::string param = advance().first.text;
            if (std::find(params.begin(), params.end(), param) != params.end())
                throw duplicatedParam(name, param, paramPos);
            params.push_back(std::move(param));

            if (check(TokenType::COMMA))
                advance();
            else if (!check(TokenType::RIGHT_PAREN))
                throw ParseError(ParseErrorType::MISSING_TOKEN,
                                 "Expecting ')' to close the parameters list of function '" + name + "'",
                                 currentPos());
        }
        advance();

        if (lib_->getScriptFn(name, params.size(), false))
            throw ParseError(ParseErrorType::FN_DUPLICATED_DEFINITION,
                             "Function '" + name + "' with " + std::to_string(params.size()) +
                                 " parameter(s) is already defined",
                             pos);

        // 3. Body, in a fresh parse state
        if (!check(TokenType::LEFT_BRACE))
            throw ParseError(ParseErrorType::FN_MISSING_BODY,
                             "Expecting body statement block for function '" + name + "'", currentPos());

        FnParseState fnState;
        fnState.locals = params;
        fnState.allowThis = true;
        states_.push_back(std::move(fnState));
        auto body = parseBlock();
        states_.pop_back();

        auto def = std::make_shared<ScriptFnDef>();
        def->name = std::move(name);
        def->access = access;
        def->params = std::move(params);
        def->body = std::move(body);
        def->pos = pos;
        lib_->setScriptFn(std::move(def));
    }

    std::unique_ptr<BlockExpr> Parser::parseBlock()
    {
        Position pos = currentPos();
        DepthGuard guard(depth_, settings_.maxExprDepth, pos);

        expect(TokenType::LEFT_BRACE, ParseErrorType::MISSING_TOKEN, "Expecting '{' to start a statement block");

        size_t mark = state().locals.size();
        std::vector<StmtPtr> statements;
        while (!check(TokenType::RIGHT_BRACE))
        {
            if (isAtEnd())
                throw ParseError(ParseErrorType::MISSING_TOKEN, "Expecting '}' to end this statement block",
                                 currentPos());

            StmtPtr stmt = parseStatement(false);
            bool done = parseStatementEnd(stmt.get(), TokenType::RIGHT_BRACE);
            if (stmt)
                statements.push_back(std::move(stmt));
            if (done)
                break;
        }
        expect(TokenType::RIGHT_BRACE, ParseErrorType::MISSING_TOKEN, "Expecting '}' to end this statement block");
        state().locals.resize(mark);

        return std::make_unique<BlockExpr>(std::move(statements), pos);
    }

    // ============================================================
    // Expressions
    // ============================================================

    ExprPtr Parser::parseExpression()
    {
        ExprPtr lhs = parseUnary();
        return parseBinary(1, std::move(lhs));
    }

    // Precedence climbing. Equal precedence folds to the left unless the
    // operator binds to the right.
    ExprPtr Parser::parseBinary(uint8_t parentPrecedence, ExprPtr lhs)
    {
        while (true)
        {
            const Token &opTok = current();
            uint8_t precedence = opTok.precedence(customOperators_);
            if (precedence == 0 || precedence < parentPrecedence || opTok.type == TokenType::PERIOD)
                return lhs;

            TokenWithPos op = advance();
            ExprPtr rhs = parseUnary();

            uint8_t nextPrecedence = current().precedence(customOperators_);
            if (current().type != TokenType::PERIOD)
            {
                if (precedence < nextPrecedence)
                    rhs = parseBinary(precedence + 1, std::move(rhs));
                else if (precedence == nextPrecedence && op.first.isBindRight())
                    rhs = parseBinary(precedence, std::move(rhs));
            }

            Position pos = op.second;
            switch (op.first.type)
            {
            case TokenType::AND:
            case TokenType::OR:
                lhs = std::make_unique<LogicalExpr>(op.first.type == TokenType::AND, std::move(lhs), std::move(rhs),
                                                    pos);
                break;
            case TokenType::IN:
                lhs = std::make_unique<InExpr>(std::move(lhs), std::move(rhs), pos);
                break;
            default:
            {
                std::vector<ExprPtr> args;
                args.push_back(std::move(lhs));
                args.push_back(std::move(rhs));
                auto call = std::make_unique<FnCallExpr>(op.first.syntax(), std::vector<std::string>{},
                                                         std::move(args), pos);
                call->isOperator = true;
                lhs = std::move(call);
                break;
            }
            }
        }
    }

    ExprPtr Parser::parseUnary()
    {
        Position pos = currentPos();
        DepthGuard guard(depth_, settings_.maxExprDepth, pos);

        switch (current().type)
        {
        case TokenType::UNARY_MINUS:
        case TokenType::MINUS:
        {
            advance();
            ExprPtr operand = parseUnary();
            if (auto *i = dynamic_cast<IntLiteral *>(operand.get()))
            {
                if (i->value != std::numeric_limits<INT>::min())
                    return std::make_unique<IntLiteral>(-i->value, pos);
            }
            else if (auto *f = dynamic_cast<FloatLiteral *>(operand.get()))
            {
                return std::make_unique<FloatLiteral>(-f->value, pos);
            }
            std::vector<ExprPtr> args;
            args.push_back(std::move(operand));
            auto call = std::make_unique<FnCallExpr>("-", std::vector<std::string>{}, std::move(args), pos);
            call->isOperator = true;
            return call;
        }

        case TokenType::UNARY_PLUS:
        case TokenType::PLUS:
        {
            advance();
            ExprPtr operand = parseUnary();
            if (dynamic_cast<IntLiteral *>(operand.get()) || dynamic_cast<FloatLiteral *>(operand.get()))
                return operand;
            std::vector<ExprPtr> args;
            args.push_back(std::move(operand));
            auto call = std::make_unique<FnCallExpr>("+", std::vector<std::string>{}, std::move(args), pos);
            call->isOperator = true;
            return call;
        }

        case TokenType::BANG:
        {
            advance();
            std::vector<ExprPtr> args;
            args.push_back(parseUnary());
            auto call = std::make_unique<FnCallExpr>("!", std::vector<std::string>{}, std::move(args), pos);
            call->isOperator = true;
            return call;
        }

        default:
            return parsePostfix(parsePrimary());
        }
    }

    ExprPtr Parser::parsePrimary()
    {
        Position pos = currentPos();
        const Token &tok = current();

        switch (tok.type)
        {
        case TokenType::INTEGER_CONSTANT:
            return std::make_unique<IntLiteral>(advance().first.intValue, pos);
        case TokenType::FLOAT_CONSTANT:
            return std::make_unique<FloatLiteral>(advance().first.floatValue, pos);
        case TokenType::CHAR_CONSTANT:
            return std::make_unique<CharLiteral>(advance().first.charValue, pos);
        case TokenType::STRING_CONSTANT:
            return std::make_unique<StringLiteral>(advance().first.text, pos);
        case TokenType::TRUE_KW:
            advance();
            return std::make_unique<BoolLiteral>(true, pos);
        case TokenType::FALSE_KW:
            advance();
            return std::make_unique<BoolLiteral>(false, pos);

        case TokenType::LEFT_PAREN:
        {
            advance();
            if (check(TokenType::RIGHT_PAREN))
            {
                advance();
                return std::make_unique<UnitLiteral>(pos);
            }
            ExprPtr inner = parseExpression();
            expect(TokenType::RIGHT_PAREN, ParseErrorType::MISSING_TOKEN,
                   "Expecting ')' for a matching '(' in this expression");
            return inner;
        }

        case TokenType::LEFT_BRACKET:
            return parseArrayLiteral();

        case TokenType::MAP_START:
            return parseMapLiteral();

        case TokenType::LEFT_BRACE:
            if (!settings_.allowStatementBlock)
                unexpected();
            return parseBlock();

        case TokenType::IF:
            if (!settings_.allowIfExpression)
                unexpected();
            return parseIf();

        case TokenType::PIPE:
        case TokenType::OR:
            if (!settings_.allowClosures)
                unexpected();
            return parseClosure();

        case TokenType::IDENTIFIER:
            return parseIdentifier();

        case TokenType::CUSTOM:
            if (peekToken().type == TokenType::LEFT_PAREN)
            {
                std::string name = advance().first.text;
                auto args = parseArgList(name);
                return std::make_unique<FnCallExpr>(std::move(name), std::vector<std::string>{}, std::move(args), pos);
            }
            unexpected();

        case TokenType::RESERVED:
            if (tok.text == KEYWORD_THIS)
            {
                if (!state().allowThis)
                    unexpected();
                advance();
                return std::make_unique<ThisExpr>(pos);
            }
            if (isKeywordFunction(tok.text) && peekToken().type == TokenType::LEFT_PAREN)
            {
                std::string name = advance().first.text;
                auto args = parseArgList(name);
                return std::make_unique<FnCallExpr>(std::move(name), std::vector<std::string>{}, std::move(args), pos);
            }
            unexpected();

        default:
            unexpected();
        }
    }

    ExprPtr Parser::parseIdentifier()
    {
        Position pos = currentPos();
        std::string name = advance().first.text;

        // Qualified path: a::b::name
        std::vector<std::string> namespaces;
        while (check(TokenType::DOUBLE_COLON))
        {
            advance();
            namespaces.push_back(std::move(name));
            const Token &next = current();
            if (next.type == TokenType::IDENTIFIER || (next.isReserved() && isKeywordFunction(next.text)))
                name = advance().first.text;
            else
                throw ParseError(ParseErrorType::VARIABLE_EXPECTED,
                                 "Expecting name of a variable or function after '::'", currentPos());
        }

        if (check(TokenType::LEFT_PAREN))
        {
            auto args = parseArgList(name);
            return std::make_unique<FnCallExpr>(std::move(name), std::move(namespaces), std::move(args), pos);
        }

        if (namespaces.empty())
            state().access(name);
        return std::make_unique<Variable>(std::move(name), std::move(namespaces), pos);
    }

    std::vector<ExprPtr> Parser::parseArgList(const std::string &fnName)
    {
        advance(); // '('
        std::vector<ExprPtr> args;

        while (!check(TokenType::RIGHT_PAREN))
        {
            if (isAtEnd())
                throw ParseError(ParseErrorType::MISSING_TOKEN,
                                 "Expecting ')' to close the arguments list of this function call '" + fnName + "'",
                                 currentPos());
            args.push_back(parseExpression());

            if (check(TokenType::COMMA))
                advance();
            else if (!check(TokenType::RIGHT_PAREN))
            {
                if (check(TokenType::LEX_ERROR))
                    unexpected();
                throw ParseError(ParseErrorType::MISSING_TOKEN,
                                 "Expecting ',' to separate the arguments to function call '" + fnName + "'",
                                 currentPos());
            }
        }
        advance();
        return args;
    }

    ExprPtr Parser::parsePostfix(ExprPtr expr)
    {
        while (true)
        {
            Position pos = currentPos();

            if (check(TokenType::LEFT_BRACKET))
            {
                advance();
                ExprPtr index = parseExpression();

                if (auto *i = dynamic_cast<const IntLiteral *>(index.get()))
                {
                    if (i->value < 0)
                        throw ParseError(ParseErrorType::MALFORMED_INDEX_EXPR,
                                         "Array access expects non-negative index: " + std::to_string(i->value) +
                                             " < 0",
                                         index->pos);
                }
                else if (dynamic_cast<const FloatLiteral *>(index.get()))
                    throw ParseError(ParseErrorType::MALFORMED_INDEX_EXPR,
                                     "Array access expects integer index, not a float", index->pos);
                else if (dynamic_cast<const BoolLiteral *>(index.get()))
                    throw ParseError(ParseErrorType::MALFORMED_INDEX_EXPR,
                                     "Array access expects integer index, not a boolean", index->pos);
                else if (dynamic_cast<const CharLiteral *>(index.get()))
                    throw ParseError(ParseErrorType::MALFORMED_INDEX_EXPR,
                                     "Array access expects integer index, not a character", index->pos);
                else if (dynamic_cast<const UnitLiteral *>(index.get()))
                    throw ParseError(ParseErrorType::MALFORMED_INDEX_EXPR,
                                     "Array access expects integer index, not ()", index->pos);

                expect(TokenType::RIGHT_BRACKET, ParseErrorType::MISSING_TOKEN,
                       "Expecting ']' to close the index expression");
                expr = std::make_unique<IndexExpr>(std::move(expr), std::move(index), pos);
                continue;
            }

            if (check(TokenType::PERIOD))
            {
                advance();
                const Token &nameTok = current();
                if (!(nameTok.type == TokenType::IDENTIFIER || nameTok.isCustom() ||
                      (nameTok.isReserved() && isKeywordFunction(nameTok.text))))
                    throw ParseError(ParseErrorType::PROPERTY_EXPECTED, "Expecting name of a property",
                                     currentPos());
                std::string name = advance().first.text;

                if (check(TokenType::LEFT_PAREN))
                {
                    auto args = parseArgList(name);
                    expr = std::make_unique<MethodCallExpr>(std::move(expr), std::move(name), std::move(args), pos);
                }
                else
                {
                    expr = std::make_unique<PropertyExpr>(std::move(expr), std::move(name), pos);
                }
                continue;
            }

            return expr;
        }
    }

    ExprPtr Parser::parseIf()
    {
        Position pos = advance().second;
        ExprPtr condition = parseExpression();
        ExprPtr thenBlock = parseBlock();

        ExprPtr elseBranch;
        if (check(TokenType::ELSE))
        {
            advance();
            if (check(TokenType::IF))
                elseBranch = parseIf();
            else
                elseBranch = parseBlock();
        }
        return std::make_unique<IfExpr>(std::move(condition), std::move(thenBlock), std::move(elseBranch), pos);
    }

    ExprPtr Parser::parseArrayLiteral()
    {
        Position pos = advance().second;
        std::vector<ExprPtr> elements;

        while (!check(TokenType::RIGHT_BRACKET))
        {
            if (isAtEnd())
                throw ParseError(ParseErrorType::MISSING_TOKEN, "Expecting ']' to end this array literal",
                                 currentPos());
            elements.push_back(parseExpression());

            if (check(TokenType::COMMA))
                advance();
            else if (!check(TokenType::RIGHT_BRACKET))
            {
                if (check(TokenType::LEX_ERROR))
                    unexpected();
                throw ParseError(ParseErrorType::MISSING_TOKEN,
                                 "Expecting ',' to separate the items of this array literal", currentPos());
            }
        }
        advance();
        return std::make_unique<ArrayLiteral>(std::move(elements), pos);
    }

    ExprPtr Parser::parseMapLiteral()
    {
        Position pos = advance().second;
        std::vector<std::pair<std::string, ExprPtr>> entries;
        std::set<std::string> keys;

        while (!check(TokenType::RIGHT_BRACE))
        {
            if (isAtEnd())
                throw ParseError(ParseErrorType::MISSING_TOKEN, "Expecting '}' to end this object map literal",
                                 currentPos());

            if (!check(TokenType::IDENTIFIER) && !check(TokenType::STRING_CONSTANT))
            {
                if (check(TokenType::LEX_ERROR))
                    unexpected();
                throw ParseError(ParseErrorType::PROPERTY_EXPECTED, "Expecting name of a property", currentPos());
            }
            Position keyPos = currentPos();
            std::string key = advance().first.text;
            if (!keys.insert(key).second)
                throw ParseError(ParseErrorType::DUPLICATED_PROPERTY,
                                 "Duplicated property '" + key + "' for object map literal", keyPos);

            expect(TokenType::COLON, ParseErrorType::MISSING_TOKEN,
                   "Expecting ':' to follow the name of the property '" + key + "'");
            entries.emplace_back(std::move(key), parseExpression());

            if (check(TokenType::COMMA))
                advance();
            else if (!check(TokenType::RIGHT_BRACE))
            {
                if (check(TokenType::LEX_ERROR))
                    unexpected();
                throw ParseError(ParseErrorType::MISSING_TOKEN,
                                 "Expecting ',' to separate the items of this object map literal", currentPos());
            }
        }
        advance();
        return std::make_unique<MapLiteral>(std::move(entries), pos);
    }

    // |a, b| body  or  || body
    ExprPtr Parser::parseClosure()
    {
        Position pos = currentPos();
        std::vector<std::string> params;

        if (check(TokenType::OR))
        {
            advance();
        }
        else
        {
            advance(); // '|'
            while (!check(TokenType::PIPE))
            {
                if (!check(TokenType::IDENTIFIER))
                {
                    if (check(TokenType::LEX_ERROR))
                        unexpected();
                    throw ParseError(ParseErrorType::VARIABLE_EXPECTED, "Expecting name of a closure parameter",
                                     currentPos());
                }
                Position paramPos = currentPos();
                std::string param = advance().first.text;
                if (std::find(params.begin(), params.end(), param) != params.end())
                    throw duplicatedParam("", param, paramPos);
                params.push_back(std::move(param));

                if (check(TokenType::COMMA))
                    advance();
                else if (!check(TokenType::PIPE))
                    throw ParseError(ParseErrorType::MISSING_TOKEN,
                                     "Expecting '|' to close the parameters list of this closure", currentPos());
            }
            advance();
        }

        // 1. Body, in its own parse state
        FnParseState closureState;
        closureState.locals = params;
        closureState.allowThis = true;
        states_.push_back(std::move(closureState));

        Position bodyPos = currentPos();
        StmtPtr bodyStmt = parseStatement(false);

        std::vector<std::string> externals = std::move(state().externals);
        states_.pop_back();

        // 2. Captured variables come first in the parameter list
        std::vector<std::string> allParams = externals;
        allParams.insert(allParams.end(), params.begin(), params.end());

        std::vector<StmtPtr> statements;
        if (bodyStmt)
            statements.push_back(std::move(bodyStmt));

        auto def = std::make_shared<ScriptFnDef>();
        def->name = std::string(ANONYMOUS_FN_PREFIX) + std::to_string(nextClosureId++);
        def->access = FnAccess::PUBLIC;
        def->params = std::move(allParams);
        def->body = std::make_unique<BlockExpr>(std::move(statements), bodyPos);
        def->pos = pos;
        std::string fnName = def->name;
        lib_->setScriptFn(std::move(def));

        // 3. What this closure captures, its enclosing function must capture
        for (const auto &name : externals)
            state().access(name);

        return std::make_unique<ClosureExpr>(std::move(fnName), std::move(externals), pos);
    }

} // namespace rill
