/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "finmoney/currency/Currency.hpp"

#include "finmoney/logging/Logger.hpp"
#include "finmoney/serialization/json_util.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>
#include <utility>

//-------------------------------------------------------------------------

namespace finmoney
{

//-------------------------------------------------------------------------

namespace
{

std::unexpected<MoneyError> rejected(MoneyError err)
{
    log::logger().debug("Rejected currency: {}", err.toString());
    return std::unexpected{std::move(err)};
}

// Whole attribute text as a decimal integer; "2.5", "abc" and "" are refused.
template<typename T>
std::optional<T> integerAttribute(pugi::xml_attribute attr)
{
    const std::string_view text = attr.as_string();
    T value{};
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

//-------------------------------------------------------------------------

Result<Currency> Currency::create(
    int32_t id,
    std::string_view code,
    std::optional<std::string_view> name,
    uint32_t decimalPlaces)
{
    if (decimalPlaces > kMaxDecimalPlaces) {
        return rejected(MoneyError::invalidCurrency(fmt::format(
            "decimalPlaces should be <= {}, was {}", kMaxDecimalPlaces, decimalPlaces)));
    }

    const auto parsedCode = Code::parse(code, AsciiCharset::NO_SPACE);
    if (!parsedCode.has_value()) {
        return rejected(MoneyError::invalidCurrency(fmt::format(
            "code should be 1-{} printable ASCII characters without spaces, was '{}'",
            Code::kCapacity,
            code)));
    }

    std::optional<Name> parsedName;
    if (name.has_value()) {
        parsedName = Name::parse(name.value(), AsciiCharset::WITH_SPACE);
        if (!parsedName.has_value()) {
            return rejected(MoneyError::invalidCurrency(fmt::format(
                "name should be 1-{} printable ASCII characters, was '{}'",
                Name::kCapacity,
                name.value())));
        }
    }

    return Currency{id, parsedCode->toUpper(), parsedName, decimalPlaces};
}

//-------------------------------------------------------------------------

Result<Currency> Currency::fromPrecomputed(
    int32_t id, Code code, std::optional<Name> name, uint32_t decimalPlaces)
{
    if (decimalPlaces > kMaxDecimalPlaces) {
        return rejected(MoneyError::invalidCurrency(fmt::format(
            "decimalPlaces should be <= {}, was {}", kMaxDecimalPlaces, decimalPlaces)));
    }
    if (code.empty() || !code.isValid(AsciiCharset::NO_SPACE)) {
        return rejected(MoneyError::invalidCurrency(fmt::format(
            "code should be 1-{} printable ASCII characters without spaces, was '{}'",
            Code::kCapacity,
            code)));
    }
    if (name.has_value() && (name->empty() || !name->isValid(AsciiCharset::WITH_SPACE))) {
        return rejected(MoneyError::invalidCurrency(fmt::format(
            "name should be 1-{} printable ASCII characters, was '{}'",
            Name::kCapacity,
            name.value())));
    }
    return Currency{id, code.toUpper(), name, decimalPlaces};
}

//-------------------------------------------------------------------------

Currency Currency::createSanitized(
    int32_t id,
    std::string_view code,
    std::optional<std::string_view> name,
    uint32_t decimalPlaces) noexcept
{
    const Code sanitizedCode = Code::sanitize(code, AsciiCharset::NO_SPACE).toUpper();
    const std::optional<Name> sanitizedName = name
        .transform([](std::string_view n) { return Name::sanitize(n, AsciiCharset::WITH_SPACE); })
        .and_then([](Name n) -> std::optional<Name> {
            if (n.empty()) return std::nullopt;
            return n;
        });

    return Currency{
        id,
        sanitizedCode.empty() ? Code{"INVALID"} : sanitizedCode,
        sanitizedName,
        std::min(decimalPlaces, kMaxDecimalPlaces)};
}

//-------------------------------------------------------------------------

Result<Currency> Currency::fromXML(pugi::xml_node node)
{
    if (!node.attribute("code")) {
        return rejected(MoneyError::invalidCurrency(
            fmt::format("<{}> is missing the 'code' attribute", node.name())));
    }
    if (!node.attribute("decimalPlaces")) {
        return rejected(MoneyError::invalidCurrency(fmt::format(
            "<{}> '{}' is missing the 'decimalPlaces' attribute",
            node.name(),
            node.attribute("code").as_string())));
    }

    std::optional<int32_t> id = 0;
    if (const pugi::xml_attribute idAttr = node.attribute("id")) {
        id = integerAttribute<int32_t>(idAttr);
    }
    if (!id.has_value()) {
        return rejected(MoneyError::invalidCurrency(fmt::format(
            "<{}> '{}' has a non-integer id '{}'",
            node.name(),
            node.attribute("code").as_string(),
            node.attribute("id").as_string())));
    }

    const auto decimalPlaces = integerAttribute<uint32_t>(node.attribute("decimalPlaces"));
    if (!decimalPlaces.has_value()) {
        return rejected(MoneyError::invalidCurrency(fmt::format(
            "<{}> '{}' has decimalPlaces '{}', expected a non-negative integer",
            node.name(),
            node.attribute("code").as_string(),
            node.attribute("decimalPlaces").as_string())));
    }

    const pugi::xml_attribute nameAttr = node.attribute("name");
    return create(
        id.value(),
        node.attribute("code").as_string(),
        nameAttr ? std::make_optional<std::string_view>(nameAttr.as_string()) : std::nullopt,
        decimalPlaces.value());
}

//-------------------------------------------------------------------------

Result<Currency> Currency::fromJson(const rapidjson::Value& json)
{
    if (!json.IsObject()
        || !json.HasMember("id") || !json["id"].IsInt()
        || !json.HasMember("decimalPlaces") || !json["decimalPlaces"].IsUint()) {
        return rejected(MoneyError::invalidCurrency("ill-formed currency object"));
    }
    const auto code = json::getString(json, "code");
    if (!code.has_value()) {
        return rejected(MoneyError::invalidCurrency("currency object has no string 'code'"));
    }
    return create(
        json["id"].GetInt(),
        code.value(),
        json::getString(json, "name"),
        json["decimalPlaces"].GetUint());
}

//-------------------------------------------------------------------------

std::optional<std::string_view> Currency::name() const noexcept
{
    return m_name.transform([](const Name& n) { return n.view(); });
}

//-------------------------------------------------------------------------

Result<Currency> Currency::withDecimalPlaces(uint32_t decimalPlaces) const
{
    if (decimalPlaces > kMaxDecimalPlaces) {
        return std::unexpected{MoneyError::precisionOverflow(fmt::format(
            "{} cannot carry {} decimal places, the limit is {}",
            code(),
            decimalPlaces,
            kMaxDecimalPlaces))};
    }
    return Currency{m_id, m_code, m_name, decimalPlaces};
}

//-------------------------------------------------------------------------

void Currency::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{m_id}, allocator);
        json.AddMember(
            "code",
            rapidjson::Value{m_code.view().data(), static_cast<rapidjson::SizeType>(m_code.size()), allocator},
            allocator);
        json.AddMember(
            "name",
            m_name.has_value()
                ? rapidjson::Value{
                    m_name->view().data(),
                    static_cast<rapidjson::SizeType>(m_name->size()),
                    allocator}.Move()
                : rapidjson::Value{}.SetNull(),
            allocator);
        json.AddMember("decimalPlaces", rapidjson::Value{m_decimalPlaces}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::ostream& operator<<(std::ostream& os, const Currency& currency)
{
    return os << currency.code();
}

//-------------------------------------------------------------------------

}  // namespace finmoney

//-------------------------------------------------------------------------
