/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "finmoney/error/MoneyError.hpp"

#include <magic_enum.hpp>

#include <utility>

//-------------------------------------------------------------------------

namespace finmoney
{

//-------------------------------------------------------------------------

namespace
{

std::string withContext(std::source_location sl, std::string reason)
{
    return fmt::format("{}: {}", sl.function_name(), reason);
}

}  // namespace

//-------------------------------------------------------------------------

std::string MoneyError::toString() const
{
    switch (kind) {
        case MoneyErrorKind::CURRENCY_MISMATCH:
            return fmt::format("Currency mismatch: expected {}, got {}", expected, actual);
        case MoneyErrorKind::DIVISION_BY_ZERO:
            return "Division by zero";
        case MoneyErrorKind::INVALID_CURRENCY:
            return fmt::format("Invalid currency: {}", reason);
        case MoneyErrorKind::INVALID_TICK_SIZE:
            return fmt::format("Invalid tick size: {}", reason);
        case MoneyErrorKind::PRECISION_OVERFLOW:
            return fmt::format("Precision overflow: {}", reason);
        case MoneyErrorKind::INVALID_AMOUNT:
            return fmt::format("Invalid amount: {}", reason);
        case MoneyErrorKind::INVALID_CONFIG:
            return fmt::format("Invalid configuration: {}", reason);
        case MoneyErrorKind::ARITHMETIC_OVERFLOW:
            return fmt::format("Arithmetic overflow: {}", reason);
        default:
            return fmt::format(
                "Unknown money error {} ({})",
                magic_enum::enum_name(kind),
                std::to_underlying(kind));
    }
}

//-------------------------------------------------------------------------

MoneyError MoneyError::currencyMismatch(std::string_view expected, std::string_view actual)
{
    return MoneyError{
        .kind = MoneyErrorKind::CURRENCY_MISMATCH,
        .expected = std::string{expected},
        .actual = std::string{actual}
    };
}

//-------------------------------------------------------------------------

MoneyError MoneyError::divisionByZero() noexcept
{
    return MoneyError{.kind = MoneyErrorKind::DIVISION_BY_ZERO};
}

//-------------------------------------------------------------------------

MoneyError MoneyError::invalidCurrency(std::string reason, std::source_location sl)
{
    return MoneyError{
        .kind = MoneyErrorKind::INVALID_CURRENCY,
        .reason = withContext(sl, std::move(reason))
    };
}

//-------------------------------------------------------------------------

MoneyError MoneyError::invalidTickSize(std::string reason, std::source_location sl)
{
    return MoneyError{
        .kind = MoneyErrorKind::INVALID_TICK_SIZE,
        .reason = withContext(sl, std::move(reason))
    };
}

//-------------------------------------------------------------------------

MoneyError MoneyError::precisionOverflow(std::string reason, std::source_location sl)
{
    return MoneyError{
        .kind = MoneyErrorKind::PRECISION_OVERFLOW,
        .reason = withContext(sl, std::move(reason))
    };
}

//-------------------------------------------------------------------------

MoneyError MoneyError::invalidAmount(std::string reason, std::source_location sl)
{
    return MoneyError{
        .kind = MoneyErrorKind::INVALID_AMOUNT,
        .reason = withContext(sl, std::move(reason))
    };
}

//-------------------------------------------------------------------------

MoneyError MoneyError::invalidConfig(std::string reason, std::source_location sl)
{
    return MoneyError{
        .kind = MoneyErrorKind::INVALID_CONFIG,
        .reason = withContext(sl, std::move(reason))
    };
}

//-------------------------------------------------------------------------

MoneyError MoneyError::arithmeticOverflow(std::string reason, std::source_location sl)
{
    return MoneyError{
        .kind = MoneyErrorKind::ARITHMETIC_OVERFLOW,
        .reason = withContext(sl, std::move(reason))
    };
}

//-------------------------------------------------------------------------

std::ostream& operator<<(std::ostream& os, const MoneyError& err)
{
    return os << err.toString();
}

//-------------------------------------------------------------------------

}  // namespace finmoney

//-------------------------------------------------------------------------
