#pragma once

// =============================================================================
// Position: a (line, column) cursor into script source
// =============================================================================
//
// Both fields are 16-bit. Line 0 is the "none" sentinel used for errors that
// have no source location (native functions, host calls). Advancing past
// 65535 lines or columns saturates instead of wrapping.
//
// =============================================================================

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace rill
{

    class Position
    {
    public:
        /// Start of a script: line 1, before the first character.
        Position() : line_(1), column_(0) {}

        Position(uint16_t line, uint16_t column) : line_(line), column_(line == 0 ? 0 : column) {}

        static Position none() { return Position(0, 0); }

        bool isNone() const noexcept { return line_ == 0; }

        std::optional<uint16_t> line() const
        {
            if (isNone())
                return std::nullopt;
            return line_;
        }

        /// Column within the line; nullopt at the beginning of a line.
        std::optional<uint16_t> column() const
        {
            if (isNone() || column_ == 0)
                return std::nullopt;
            return column_;
        }

        void advance()
        {
            if (isNone())
                return;
            if (column_ < MAX)
                column_++;
        }

        void rewind()
        {
            if (isNone() || column_ == 0)
                return;
            column_--;
        }

        void newLine()
        {
            if (isNone())
                return;
            if (line_ < MAX)
            {
                line_++;
                column_ = 0;
            }
        }

        std::string toString() const
        {
            if (isNone())
                return "none";
            return "line " + std::to_string(line_) + ", position " + std::to_string(column_);
        }

        bool operator==(const Position &o) const { return line_ == o.line_ && column_ == o.column_; }
        bool operator!=(const Position &o) const { return !(*this == o); }
        bool operator<(const Position &o) const
        {
            return line_ < o.line_ || (line_ == o.line_ && column_ < o.column_);
        }

    private:
        static constexpr uint16_t MAX = std::numeric_limits<uint16_t>::max();

        uint16_t line_;
        uint16_t column_;
    };

} // namespace rill
