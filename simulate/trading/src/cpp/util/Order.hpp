/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "OrderErrorCode.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

enum class OrderDirection : uint32_t
{
    BUY,
    SELL
};

[[nodiscard]] constexpr std::string_view OrderDirection2StrView(OrderDirection dir) noexcept
{
    return magic_enum::enum_name(dir);
}

template<>
struct fmt::formatter<OrderDirection>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(OrderDirection dir, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", OrderDirection2StrView(dir));
    }
};

[[nodiscard]] constexpr OrderDirection opposite(OrderDirection dir) noexcept
{
    return dir == OrderDirection::BUY ? OrderDirection::SELL : OrderDirection::BUY;
}

//-------------------------------------------------------------------------

using OrderTag = std::optional<std::string>;

// A limit price at this value is displayed as "MKT". It still rests and
// matches as an ordinary limit price.
inline constexpr Price MARKET_SENTINEL_PRICE = std::numeric_limits<Price>::max();

//-------------------------------------------------------------------------

/**
 * Identity, quantity and fill state shared by every order variant. Direction
 * is fixed at construction. Quantities are never reduced in place; a partially
 * filled order is represented by a new record obtained through withQuantity().
 */
class BasicOrder
{
public:
    [[nodiscard]] bool hasId() const noexcept { return m_id.has_value(); }
    [[nodiscard]] OrderID id() const;
    [[nodiscard]] AgentId agentId() const noexcept { return m_agentId; }
    [[nodiscard]] const std::string& symbol() const noexcept { return m_symbol; }
    [[nodiscard]] Timestamp timePlaced() const noexcept { return m_timePlaced; }
    [[nodiscard]] Quantity quantity() const noexcept { return m_quantity; }
    [[nodiscard]] OrderDirection direction() const noexcept { return m_direction; }
    [[nodiscard]] bool isBuyOrder() const noexcept { return m_direction == OrderDirection::BUY; }
    [[nodiscard]] const OrderTag& tag() const noexcept { return m_tag; }
    [[nodiscard]] std::optional<Price> fillPrice() const noexcept { return m_fillPrice; }

    void assignId(OrderID id);
    void setFillPrice(Price price) noexcept { m_fillPrice = price; }

protected:
    BasicOrder(
        OrderDirection direction,
        AgentId agentId,
        std::string symbol,
        Timestamp timePlaced,
        Quantity quantity,
        std::optional<OrderID> id,
        OrderTag tag) noexcept;

    std::optional<OrderID> m_id;
    AgentId m_agentId;
    std::string m_symbol;
    Timestamp m_timePlaced;
    Quantity m_quantity;
    OrderDirection m_direction;
    OrderTag m_tag;
    std::optional<Price> m_fillPrice;
};

//-------------------------------------------------------------------------

class MarketOrder : public BasicOrder
{
public:
    MarketOrder(
        OrderDirection direction,
        AgentId agentId,
        std::string symbol,
        Timestamp timePlaced,
        Quantity quantity,
        std::optional<OrderID> id = {},
        OrderTag tag = {}) noexcept;

    [[nodiscard]] MarketOrder clone() const;
    [[nodiscard]] MarketOrder withQuantity(Quantity quantity) const;
    [[nodiscard]] MarketOrder executed(Price price, Quantity quantity) const;
};

//-------------------------------------------------------------------------

class LimitOrder : public BasicOrder
{
public:
    LimitOrder(
        OrderDirection direction,
        AgentId agentId,
        std::string symbol,
        Timestamp timePlaced,
        Quantity quantity,
        Price limitPrice,
        std::optional<OrderID> id = {},
        OrderTag tag = {}) noexcept;

    [[nodiscard]] Price limitPrice() const noexcept { return m_limitPrice; }

    [[nodiscard]] LimitOrder clone() const;
    [[nodiscard]] LimitOrder withQuantity(Quantity quantity) const;
    [[nodiscard]] LimitOrder executed(Price price, Quantity quantity) const;

    // Whether other can execute against this order. Same-direction arguments
    // log a warning and yield false.
    [[nodiscard]] bool isMatch(const LimitOrder& other) const;
    [[nodiscard]] bool hasEqPrice(const LimitOrder& other) const noexcept;
    // Whether this order is priced strictly better than other. Cross-direction
    // arguments log a warning and yield false.
    [[nodiscard]] bool hasBetterPrice(const LimitOrder& other) const;

private:
    Price m_limitPrice;
};

//-------------------------------------------------------------------------

/**
 * Creation (buy) or redemption (sell) instruction. Settles immediately with
 * the fill price set by whoever submits it; never rests in a book.
 */
class BasketOrder : public BasicOrder
{
public:
    BasketOrder(
        OrderDirection direction,
        AgentId agentId,
        std::string symbol,
        Timestamp timePlaced,
        Quantity quantity,
        bool dollar = true,
        std::optional<OrderID> id = {},
        OrderTag tag = {}) noexcept;

    [[nodiscard]] bool dollar() const noexcept { return m_dollar; }

    [[nodiscard]] BasketOrder clone() const;

private:
    bool m_dollar;
};

//-------------------------------------------------------------------------

using AnyOrder = std::variant<MarketOrder, LimitOrder, BasketOrder>;

[[nodiscard]] AnyOrder cloneOrder(const AnyOrder& order);
[[nodiscard]] const BasicOrder& basicOrder(const AnyOrder& order) noexcept;
[[nodiscard]] BasicOrder& basicOrder(AnyOrder& order) noexcept;

[[nodiscard]] std::string toString(const MarketOrder& order);
[[nodiscard]] std::string toString(const LimitOrder& order);
[[nodiscard]] std::string toString(const BasketOrder& order);
[[nodiscard]] std::string toString(const AnyOrder& order);

//-------------------------------------------------------------------------

struct OrderFormatter
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename T, typename FormatContext>
    auto format(const T& order, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", toString(order));
    }
};

template<> struct fmt::formatter<MarketOrder> : OrderFormatter {};
template<> struct fmt::formatter<LimitOrder> : OrderFormatter {};
template<> struct fmt::formatter<BasketOrder> : OrderFormatter {};
template<> struct fmt::formatter<AnyOrder> : OrderFormatter {};

//-------------------------------------------------------------------------
